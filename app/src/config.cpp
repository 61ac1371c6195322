// C++ Standard Library
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

// TOML++
#include <toml++/toml.hpp>

// Project
#include <app/config.hpp>
#include <hop/net/http/error.hpp>
#include <hop/net/http/mime.hpp>

namespace app
{

    namespace
    {
        // Node at section.key, or nullptr when either level is absent.
        const toml::node* find_node(const toml::table& root,
                                    std::string_view section,
                                    std::string_view key,
                                    const std::string& src)
        {
            const auto* sec = root.get(section);
            if (!sec)
                return nullptr;
            const auto* tbl = sec->as_table();
            if (!tbl)
                throw ConfigError("Expected table [" + std::string{ section } + "] in " + src);
            return tbl->get(key);
        }

        std::string key_name(std::string_view section, std::string_view key)
        {
            return std::string{ section } + "." + std::string{ key };
        }

        // Integer in [lo, hi] if present.
        std::optional<std::int64_t> fetch_int(const toml::table& root,
                                              std::string_view section,
                                              std::string_view key,
                                              std::int64_t lo,
                                              std::int64_t hi,
                                              const std::string& src)
        {
            const auto* node = find_node(root, section, key, src);
            if (!node)
                return std::nullopt;
            const auto* v = node->as_integer();
            if (!v)
                throw ConfigError("Expected integer for '" + key_name(section, key) + "' in " + src);
            const auto n = v->get();
            if (n < lo || n > hi)
                throw ConfigError("Value out of range for '" + key_name(section, key) + "' in " + src);
            return n;
        }

        std::optional<bool> fetch_bool(const toml::table& root,
                                       std::string_view section,
                                       std::string_view key,
                                       const std::string& src)
        {
            const auto* node = find_node(root, section, key, src);
            if (!node)
                return std::nullopt;
            if (const auto* v = node->as_boolean())
                return v->get();
            throw ConfigError("Expected boolean for '" + key_name(section, key) + "' in " + src);
        }

        // Non-empty string if present.
        std::optional<std::string> fetch_string(const toml::table& root,
                                                std::string_view section,
                                                std::string_view key,
                                                const std::string& src)
        {
            const auto* node = find_node(root, section, key, src);
            if (!node)
                return std::nullopt;
            if (auto opt = node->value<std::string>(); opt && !opt->empty())
                return opt;
            throw ConfigError("Invalid value in '" + key_name(section, key) + "' in " + src);
        }

        hop::net::mime::media_type parse_media_type(std::string_view text, const std::string& src)
        {
            std::error_code ec;
            if (auto mt = hop::net::mime::parse(text, ec))
                return *mt;
            throw ConfigError("Invalid media type '" + std::string{ text } + "' for 'http.accept' in " + src);
        }

        // Text holding '/' is a media type (or a comma-separated ranking of
        // them, most preferred first), any other text an extension.
        hop::net::AcceptOption parse_accept_text(std::string_view text, const std::string& src)
        {
            if (text.empty())
                throw ConfigError("Invalid value in 'http.accept' in " + src);
            if (text.find('/') == std::string_view::npos)
            {
                if (!hop::net::mime::from_extension(text))
                    throw ConfigError("Unknown extension '" + std::string{ text } + "' for 'http.accept' in " + src);
                return hop::net::Extension{ std::string{ text } };
            }
            if (text.find(',') == std::string_view::npos)
                return parse_media_type(text, src);

            std::vector<hop::net::mime::media_type> ranked;
            while (!text.empty())
            {
                const auto comma = text.find(',');
                ranked.push_back(parse_media_type(text.substr(0, comma), src));
                text = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);
            }
            return ranked;
        }

        std::optional<hop::net::AcceptOption> fetch_accept(const toml::table& root, const std::string& src)
        {
            const auto* node = find_node(root, "http", "accept", src);
            if (!node)
                return std::nullopt;

            if (const auto* str = node->as_string())
                return parse_accept_text(str->get(), src);

            if (const auto* arr = node->as_array())
            {
                std::vector<hop::net::mime::media_type> ranked;
                ranked.reserve(arr->size());
                for (const auto& elem : *arr)
                {
                    const auto* s = elem.as_string();
                    if (!s)
                        throw ConfigError("Expected strings in 'http.accept' in " + src);
                    ranked.push_back(parse_media_type(s->get(), src));
                }
                if (ranked.empty())
                    throw ConfigError("Empty list for 'http.accept' in " + src);
                return hop::net::AcceptOption{ std::move(ranked) };
            }

            throw ConfigError("Expected string or array for 'http.accept' in " + src);
        }

        toml::table parse_text(std::string_view text, const std::string& src)
        {
            try
            {
                return toml::parse(text, src);
            }
            catch (const toml::parse_error& e)
            {
                throw ConfigError("TOML parse error in '" + src + "': " + std::string{ e.what() });
            }
        }

        toml::table parse_path(const std::filesystem::path& path)
        {
            const auto path_str = path.string();
            try
            {
                return toml::parse_file(path_str);
            }
            catch (const toml::parse_error& e)
            {
                throw ConfigError("TOML parse error in '" + path_str + "': " + std::string{ e.what() });
            }
            catch (const std::filesystem::filesystem_error& e)
            {
                throw ConfigError("Cannot read config file '" + path_str + "': " + std::string{ e.what() });
            }
        }
    } // namespace

    Config Config::from_table(const toml::table& tbl, std::filesystem::path path, const std::string& src)
    {
        constexpr std::int64_t max_int = std::numeric_limits<int>::max();

        hop::http_client::RequestOptions request;
        if (auto accept = fetch_accept(tbl, src))
            request.accept = std::move(*accept);
        if (auto hops = fetch_int(tbl, "http", "number_of_hops", 1, max_int, src))
            request.number_of_hops = static_cast<std::size_t>(*hops);
        if (auto retries = fetch_int(tbl, "http", "number_of_retries", 0, max_int, src))
            request.number_of_retries = static_cast<int>(*retries);
        if (auto secs = fetch_int(tbl, "http", "timeout", 1, 24 * 60 * 60, src))
            request.timeout = std::chrono::seconds{ *secs };
        if (auto code = fetch_int(tbl, "http", "success", 100, 599, src))
            request.success = static_cast<int>(*code);
        if (auto code = fetch_int(tbl, "http", "failure", 100, 599, src))
            request.failure = static_cast<int>(*code);

        std::string user_agent{ k_default_user_agent };
        if (auto ua = fetch_string(tbl, "http", "user_agent", src))
            user_agent = std::move(*ua);

        hop::net::TraceOptions trace;
        if (auto on = fetch_bool(tbl, "trace", "send_request", src))
            trace.send_request = *on;
        if (auto on = fetch_bool(tbl, "trace", "receive_reply", src))
            trace.receive_reply = *on;

        JobsConfig jobs;
        if (auto n = fetch_int(tbl, "jobs", "threads", 1, 256, src))
            jobs.threads = static_cast<std::size_t>(*n);

        return Config(std::move(path), std::move(request), trace, jobs, std::move(user_agent));
    }

    Config Config::load_file(const std::filesystem::path& path)
    {
        if (path.empty())
            throw ConfigError("Config file path must not be empty");
        if (!std::filesystem::exists(path))
            throw ConfigError("Config file not found at '" + path.string() + "'");
        const auto tbl = parse_path(path);
        return from_table(tbl, path, path.string());
    }

    Config Config::load()
    {
        const auto default_path = std::filesystem::current_path() / k_default_config_file;
        if (!std::filesystem::exists(default_path))
            return Config{};
        return load_file(default_path);
    }

    Config Config::load_string(std::string_view text, std::string_view source)
    {
        const std::string src{ source };
        const auto tbl = parse_text(text, src);
        return from_table(tbl, {}, src);
    }

    Config Config::with(const Overrides& o) const
    {
        Config out = *this;
        if (o.accept)
            out.request_.accept = parse_accept_text(*o.accept, "command line");
        if (o.threads)
        {
            if (*o.threads == 0)
                throw ConfigError("Value out of range for 'jobs.threads' in command line");
            out.jobs_.threads = *o.threads;
        }
        if (o.curl)
            out.trace_ = { true, true };
        return out;
    }

    ConfigError::ConfigError(const std::string& msg) noexcept :
        std::runtime_error{ msg }
    {
    }

} // namespace app
