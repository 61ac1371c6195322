// C++ Standard Library
#include <algorithm>
#include <chrono>
#include <map>
#include <stdexcept>

// Glaze
#include <glaze/json.hpp>

// GSL
#include <gsl/gsl>

// Project
#include <hop/net/http/link.hpp>
#include <hop/net/http/metadata.hpp>

namespace hop::net {

namespace {
    // Flat, reflectable shape of a record for Glaze.
    struct version_view {
        int major{};
        int minor{};
    };
    struct timestamp_view {
        double start{};
        double end{};
    };
    struct metadata_view {
        std::string uri;
        int status{};
        std::map<std::string, std::vector<std::string>> headers;
        timestamp_view timestamp;
        version_view version;
    };

    double to_epoch_seconds(std::chrono::system_clock::time_point tp)
    {
        return std::chrono::duration<double>(tp.time_since_epoch()).count();
    }

    inline constexpr glz::opts json_opts{
        .prettify = true,
    };
} // namespace

const Metadata& MetadataLog::last() const
{
    Expects(!records_.empty());
    return records_.back();
}

MetadataList MetadataLog::release() &&
{
    MetadataList out{std::move(records_)};
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<mime::media_type> metadata_content_type(const Metadata& meta)
{
    const auto ct = meta.headers.first("content-type");
    if (!ct) return std::nullopt;
    std::error_code ec;
    return mime::parse(*ct, ec);
}

std::optional<mime::media_type> metadata_content_type(const MetadataList& metas)
{
    Expects(!metas.empty());
    return metadata_content_type(metas.front());
}

std::optional<std::string> metadata_file_name(const MetadataList& metas)
{
    Expects(!metas.empty());
    const auto cd = metas.front().headers.first("content-disposition");
    if (!cd) return std::nullopt;
    return disposition_filename(*cd);
}

const std::string& metadata_final_uri(const MetadataList& metas)
{
    Expects(!metas.empty());
    return metas.front().uri;
}

std::optional<std::string> metadata_link(const MetadataList& metas, std::string_view relation)
{
    Expects(!metas.empty());
    const auto* links = metas.front().headers.find("link");
    if (!links) return std::nullopt;
    return find_link(*links, relation);
}

int metadata_status(const MetadataList& metas)
{
    Expects(!metas.empty());
    return metas.front().status;
}

std::string to_json(const MetadataList& metas)
{
    std::vector<metadata_view> views;
    views.reserve(metas.size());
    for (const auto& m : metas) {
        metadata_view v;
        v.uri = m.uri;
        v.status = m.status;
        for (const auto& [name, values] : m.headers) v.headers.emplace(name, values);
        v.timestamp = {to_epoch_seconds(m.timestamp.start), to_epoch_seconds(m.timestamp.end)};
        v.version = {m.version.major, m.version.minor};
        views.push_back(std::move(v));
    }

    std::string out;
    if (auto ec = glz::write<json_opts>(views, out); ec) {
        throw std::runtime_error("metadata serialisation failed");
    }
    return out;
}

} // namespace hop::net
