/*
Module Name:
- config.hpp

Abstract:
- Immutable settings for the hopper command line, loaded from one TOML file.
- Every key is optional; an absent key keeps the engine default.
- Surfaces ready-to-use request options, trace switches, the User-Agent and
  the worker count for parallel jobs.
- Fails fast with ConfigError naming the offending key and file.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

// TOML++
#include <toml++/toml.hpp>

// Project
#include <hop/net/http/http_client.hpp>
#include <hop/net/http/trace.hpp>

namespace app
{

    /// Configuration-loading failure.
    class ConfigError final : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string& msg) noexcept;
    };

    inline constexpr std::string_view k_default_config_file = "hopper.toml";
    inline constexpr std::string_view k_default_user_agent = "hopper";
    inline constexpr std::size_t k_default_threads = 4;

    /// Parallel job settings.
    struct JobsConfig
    {
        std::size_t threads{ k_default_threads }; ///< >= 1
    };

    /// Command-line values that take precedence over the file.
    struct Overrides
    {
        std::optional<std::string> accept; ///< extension, media type, or comma-separated media types
        std::optional<std::size_t> threads;
        bool curl{ false }; ///< trace both directions
    };

    class Config
    {
    public:
        /// Defaults only.
        Config() = default;

        /// Load from the file at path. The file must exist.
        static Config load_file(const std::filesystem::path& path);

        /// Load from "./hopper.toml", or defaults when there is no such file.
        static Config load();

        /// Parse TOML text; source names it in error messages.
        static Config load_string(std::string_view text, std::string_view source = "<string>");

        /// Copy with o applied. Throws ConfigError for an invalid accept value.
        [[nodiscard]] Config with(const Overrides& o) const;

        /// Defaults for every request. Output slots are left null.
        [[nodiscard]] const hop::http_client::RequestOptions& request_options() const noexcept
        {
            return request_;
        }
        [[nodiscard]] const hop::net::TraceOptions& trace() const noexcept
        {
            return trace_;
        }
        [[nodiscard]] const JobsConfig& jobs() const noexcept
        {
            return jobs_;
        }
        [[nodiscard]] const std::string& user_agent() const noexcept
        {
            return user_agent_;
        }
        /// Empty when no file was read.
        [[nodiscard]] const std::filesystem::path& path() const noexcept
        {
            return path_;
        }

    private:
        static Config from_table(const toml::table& tbl, std::filesystem::path path, const std::string& src);

        Config(std::filesystem::path path,
               hop::http_client::RequestOptions request,
               hop::net::TraceOptions trace,
               JobsConfig jobs,
               std::string user_agent) noexcept
            :
            path_{ std::move(path) },
            request_{ std::move(request) },
            trace_{ trace },
            jobs_{ jobs },
            user_agent_{ std::move(user_agent) }
        {
        }

        std::filesystem::path path_;
        hop::http_client::RequestOptions request_{};
        hop::net::TraceOptions trace_{};
        JobsConfig jobs_{};
        std::string user_agent_{ k_default_user_agent };
    };

} // namespace app
