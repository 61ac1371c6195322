// C++ Standard Library
#include <vector>

// Project
#include <hop/net/http/link.hpp>
#include <hop/utils/case_insensitive.hpp>

namespace hop::net {

namespace {
    // Split on sep and strip any of pad from both ends of every piece.
    std::vector<std::string_view> split_strip(std::string_view s, char sep, std::string_view pad)
    {
        std::vector<std::string_view> out;
        for (;;) {
            const auto pos = s.find(sep);
            auto piece = s.substr(0, pos);
            const auto b = piece.find_first_not_of(pad);
            if (b == std::string_view::npos) {
                piece = {};
            } else {
                piece = piece.substr(b, piece.find_last_not_of(pad) - b + 1);
            }
            out.push_back(piece);
            if (pos == std::string_view::npos) break;
            s.remove_prefix(pos + 1);
        }
        return out;
    }

    // rel may carry several space-separated relation types.
    bool rel_matches(std::string_view rel, std::string_view relation)
    {
        for (auto type : split_strip(rel, ' ', " ")) {
            if (!type.empty() && utils::iequals(type, relation)) return true;
        }
        return false;
    }
} // namespace

std::optional<std::string> find_link(std::span<const std::string> link_values, std::string_view relation)
{
    // Each header value is a ','-separated list of links of its own.
    for (const auto& value : link_values) {
        for (auto comp : split_strip(value, ',', " ")) {
            const auto parts = split_strip(comp, ';', "<> ");
            if (parts.empty() || parts.front().empty()) continue;
            for (std::size_t i = 1; i < parts.size(); ++i) {
                const auto kv = split_strip(parts[i], '=', "\"");
                if (kv.size() == 2 && utils::iequals(kv[0], "rel") && rel_matches(kv[1], relation)) {
                    return std::string{parts.front()};
                }
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> disposition_filename(std::string_view content_disposition)
{
    const auto parts = split_strip(content_disposition, ';', " ");
    if (parts.empty() || !utils::iequals(parts.front(), "attachment")) return std::nullopt;

    for (std::size_t i = 1; i < parts.size(); ++i) {
        const auto kv = split_strip(parts[i], '=', "\"");
        if (kv.size() == 2 && utils::iequals(kv[0], "filename") && !kv[1].empty()) {
            return std::string{kv[1]};
        }
    }
    return std::nullopt;
}

} // namespace hop::net
