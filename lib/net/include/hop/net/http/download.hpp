/*
Module Name:
- download.hpp

Abstract:
- Save the content behind a URI to a local file.
- download() streams every page into "<file>.tmp" and renames it into place,
  so a reader never sees a partial file. On failure the temporary file is
  removed and the error propagates unchanged.
- When the first page maps onto the designated failure code nothing is
  written and the result is empty, as with head().
- sync() is download() that leaves an existing file alone.
*/
#pragma once

// C++ standard library
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// Project
#include <hop/net/http/http_client.hpp>

namespace hop::http_client {

// Last non-empty path segment of uri, or "index" when the path has none.
[[nodiscard]] std::string local_file_name(std::string_view uri);

// Returns the path written, or nullopt on the designated failure code. An
// empty file selects local_file_name(uri).
std::optional<std::filesystem::path> download(client& c,
                                              std::string_view uri,
                                              std::filesystem::path file = {},
                                              const RequestOptions& opts = {});

// Returns the path, downloading only when it does not exist yet.
std::optional<std::filesystem::path> sync(client& c,
                                          std::string_view uri,
                                          std::filesystem::path file = {},
                                          const RequestOptions& opts = {});

} // namespace hop::http_client
