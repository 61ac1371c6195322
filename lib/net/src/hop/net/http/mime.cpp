// C++ Standard Library
#include <algorithm>
#include <array>
#include <cctype>

// Project
#include <hop/net/http/mime.hpp>
#include <hop/utils/case_insensitive.hpp>

namespace hop::net::mime {

namespace {
    inline void trim(std::string_view& sv)
    {
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
            sv.remove_prefix(1);
        }
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
            sv.remove_suffix(1);
        }
    }
    inline std::string to_lower(std::string_view sv)
    {
        std::string s;
        s.reserve(sv.size());
        for (unsigned char c : sv)
            s.push_back(static_cast<char>(std::tolower(c)));
        return s;
    }
    inline bool is_token(std::string_view sv)
    {
        static constexpr std::string_view extra = "!#$%&'*+-.^_`|~";
        return !sv.empty() && std::all_of(sv.begin(), sv.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || extra.find(c) != std::string_view::npos;
        });
    }

    struct extension_entry {
        std::string_view ext;
        std::string_view type;
        std::string_view subtype;
    };

    // Extensions the engine knows how to ask for.
    constexpr std::array<extension_entry, 27> k_extensions{{
        {"csv", "text", "csv"},
        {"css", "text", "css"},
        {"gif", "image", "gif"},
        {"gz", "application", "gzip"},
        {"htm", "text", "html"},
        {"html", "text", "html"},
        {"jpeg", "image", "jpeg"},
        {"jpg", "image", "jpeg"},
        {"js", "application", "javascript"},
        {"json", "application", "json"},
        {"jsonld", "application", "ld+json"},
        {"md", "text", "markdown"},
        {"n3", "text", "n3"},
        {"nq", "application", "n-quads"},
        {"nt", "application", "n-triples"},
        {"pdf", "application", "pdf"},
        {"png", "image", "png"},
        {"rdf", "application", "rdf+xml"},
        {"sparql", "application", "sparql-query"},
        {"svg", "image", "svg+xml"},
        {"toml", "application", "toml"},
        {"trig", "application", "trig"},
        {"tsv", "text", "tab-separated-values"},
        {"ttl", "text", "turtle"},
        {"txt", "text", "plain"},
        {"xml", "application", "xml"},
        {"zip", "application", "zip"},
    }};
} // namespace

std::string media_type::to_string() const
{
    std::string out = essence();
    for (const auto& [key, value] : params) {
        out.push_back(';');
        out += key;
        out.push_back('=');
        if (is_token(value)) {
            out += value;
        } else {
            out.push_back('"');
            out += value;
            out.push_back('"');
        }
    }
    return out;
}

std::optional<std::string_view> media_type::param(std::string_view name) const noexcept
{
    for (const auto& [key, value] : params) {
        if (utils::iequals(key, name)) return std::string_view{value};
    }
    return std::nullopt;
}

std::string media_type::charset() const
{
    if (auto cs = param("charset")) return to_lower(*cs);
    return {};
}

std::optional<media_type> parse(std::string_view ct, std::error_code& ec)
{
    ec = {};
    trim(ct);
    if (ct.empty()) {
        ec = errc::invalid_content_type;
        return std::nullopt;
    }

    auto slash = ct.find('/');
    if (slash == std::string_view::npos) {
        ec = errc::invalid_content_type;
        return std::nullopt;
    }

    std::string_view t_sv = ct.substr(0, slash);
    std::string_view rest = ct.substr(slash + 1);
    auto semi = rest.find(';');
    std::string_view st_sv = semi == std::string_view::npos ? rest : rest.substr(0, semi);
    trim(t_sv);
    trim(st_sv);
    if (!is_token(t_sv) || !is_token(st_sv)) {
        ec = errc::invalid_content_type;
        return std::nullopt;
    }

    media_type mt{to_lower(t_sv), to_lower(st_sv), {}};

    if (semi != std::string_view::npos) {
        std::string_view params = rest.substr(semi + 1);
        while (!params.empty()) {
            auto next_semi = params.find(';');
            std::string_view kv
                = (next_semi == std::string_view::npos) ? params : params.substr(0, next_semi);
            params = (next_semi == std::string_view::npos) ? std::string_view{}
                                                           : params.substr(next_semi + 1);

            trim(kv);
            if (kv.empty())
                continue;
            auto eq = kv.find('=');
            if (eq == std::string_view::npos)
                continue; // parameter without value: ignore
            std::string_view key = kv.substr(0, eq);
            std::string_view val_sv = kv.substr(eq + 1);
            trim(key);
            trim(val_sv);
            if (!is_token(key))
                continue;

            if (!val_sv.empty() && (val_sv.front() == '"' || val_sv.front() == '\'')) {
                char q = val_sv.front();
                if (val_sv.size() >= 2 && val_sv.back() == q) {
                    val_sv = val_sv.substr(1, val_sv.size() - 2);
                }
            }
            mt.params.emplace_back(to_lower(key), std::string{val_sv});
        }
    }

    return mt;
}

media_type parse_or_throw(std::string_view content_type)
{
    std::error_code ec;
    auto mt = parse(content_type, ec);
    if (!mt) throw HttpError{errc::invalid_content_type, "invalid media type '" + std::string{content_type} + "'"};
    return *std::move(mt);
}

std::optional<media_type> from_extension(std::string_view ext)
{
    if (!ext.empty() && ext.front() == '.') ext.remove_prefix(1);
    const auto it = std::find_if(k_extensions.begin(), k_extensions.end(), [&](const extension_entry& e) {
        return utils::iequals(e.ext, ext);
    });
    if (it == k_extensions.end()) return std::nullopt;
    return media_type{std::string{it->type}, std::string{it->subtype}, {}};
}

} // namespace hop::net::mime
