// C++ standard library
#include <fstream>
#include <system_error>
#include <utility>

// GSL
#include <gsl/gsl>

// Project
#include <hop/net/http/body_stream.hpp>
#include <hop/net/http/download.hpp>
#include <hop/net/http/url.hpp>

namespace hop::http_client {

std::string local_file_name(std::string_view uri)
{
    const auto url = net::parse_url(uri);
    std::string_view path = url.path;

    while (!path.empty() && path.back() == '/') path.remove_suffix(1);
    const auto slash = path.rfind('/');
    const auto last = slash == std::string_view::npos ? path : path.substr(slash + 1);
    if (last.empty()) return "index";
    return std::string{last};
}

std::optional<std::filesystem::path> download(client& c,
                                              std::string_view uri,
                                              std::filesystem::path file,
                                              const RequestOptions& opts)
{
    if (file.empty()) file = local_file_name(uri);

    auto tmp = file;
    tmp += ".tmp";

    bool committed = false;
    auto cleanup = gsl::finally([&] {
        if (!committed) {
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
        }
    });

    std::size_t pages = 0;
    {
        std::ofstream out{tmp, std::ios::trunc | std::ios::binary};
        if (!out) {
            throw std::system_error{std::make_error_code(std::errc::io_error),
                                    "cannot open " + tmp.string()};
        }

        pages = c.call(uri, [&out](net::BodyStream& page) { net::copy_stream(page, out); }, opts);

        out.flush();
        if (!out) {
            throw std::system_error{std::make_error_code(std::errc::io_error),
                                    "write failed: " + tmp.string()};
        }
    }

    // Designated failure on the first page: nothing to keep.
    if (pages == 0) return std::nullopt;

    std::filesystem::rename(tmp, file);
    committed = true;
    return file;
}

std::optional<std::filesystem::path> sync(client& c,
                                          std::string_view uri,
                                          std::filesystem::path file,
                                          const RequestOptions& opts)
{
    if (file.empty()) file = local_file_name(uri);
    if (std::filesystem::exists(file)) return file;
    return download(c, uri, std::move(file), opts);
}

} // namespace hop::http_client
