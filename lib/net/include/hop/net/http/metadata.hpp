/*
Module Name:
- metadata.hpp

Abstract:
- One Metadata record per physical attempt (URI requested, status, normalised
  headers, wall-clock interval, protocol version).
- MetadataLog accumulates records in chronological order for one logical
  request and hands them to the caller newest first: element 0 is the final
  attempt, which is what every metadata_* helper below reads.
- to_json renders a list with Glaze for display and logging.
*/
#pragma once

// C++ Standard Library
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Project
#include <hop/net/http/headers.hpp>
#include <hop/net/http/mime.hpp>
#include <hop/utils/timer.hpp>

namespace hop::net {

struct HttpVersion {
    int major{1};
    int minor{1};
};

struct Metadata {
    std::string uri;
    int status{0};
    HeaderMap headers;
    utils::Interval timestamp;
    HttpVersion version;
};

using MetadataList = std::vector<Metadata>; // newest first

class MetadataLog {
public:
    void append(Metadata meta) { records_.push_back(std::move(meta)); }

    // Most recently appended record. Pre: !empty()
    [[nodiscard]] const Metadata& last() const;

    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

    // Newest first.
    [[nodiscard]] MetadataList release() &&;

private:
    std::vector<Metadata> records_; // oldest first
};

// The accessors below take a newest-first list. Pre: !metas.empty()

// Parsed Content-Type of the final reply; nullopt when absent or unparseable.
[[nodiscard]] std::optional<mime::media_type> metadata_content_type(const MetadataList& metas);
[[nodiscard]] std::optional<mime::media_type> metadata_content_type(const Metadata& meta);

[[nodiscard]] std::optional<std::string> metadata_file_name(const MetadataList& metas);

[[nodiscard]] const std::string& metadata_final_uri(const MetadataList& metas);

// URI advertised for relation in the final reply's Link headers.
[[nodiscard]] std::optional<std::string> metadata_link(const MetadataList& metas,
                                                       std::string_view relation);

[[nodiscard]] int metadata_status(const MetadataList& metas);

[[nodiscard]] std::string to_json(const MetadataList& metas);

} // namespace hop::net
