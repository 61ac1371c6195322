/*
Module Name:
- status_policy.hpp

Abstract:
- Status code classification used by the redirect/retry loop, and the policy
  that maps a final status onto the caller-visible outcome.
- The policy only runs when the caller declared a success or failure code; the
  other takes its default. A declared failure code closes the body quietly,
  any other 4xx/5xx raises StatusError with a bounded excerpt of the body.
- A 2xx that differs from the declared success code is accepted.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <optional>
#include <string_view>

// Project
#include <hop/net/http/body_stream.hpp>

namespace hop::net
{

    enum class StatusClass
    {
        success, // 2xx
        redirect, // 3xx
        auth_failure, // 401
        retryable_failure, // 4xx/5xx other than 401
        unrecognized, // 1xx and anything outside 100-599
    };

    inline constexpr int k_default_success = 200;
    inline constexpr int k_default_failure = 400;
    inline constexpr std::size_t k_status_error_excerpt = 1000;

    inline constexpr bool is_valid_status(int s) noexcept
    {
        return s >= 100 && s <= 599;
    }

    inline constexpr StatusClass classify_status(int s) noexcept
    {
        if (s >= 200 && s <= 299)
            return StatusClass::success;
        if (s >= 300 && s <= 399)
            return StatusClass::redirect;
        if (s == 401)
            return StatusClass::auth_failure;
        if (s >= 400 && s <= 599)
            return StatusClass::retryable_failure;
        return StatusClass::unrecognized;
    }

    struct StatusPolicy
    {
        std::optional<int> success;
        std::optional<int> failure;

        [[nodiscard]] bool applies() const noexcept
        {
            return success.has_value() || failure.has_value();
        }

        // Returns false for the designated failure code (body closed).
        // Throws StatusError for other failure codes (body read and closed), and
        // HttpError(unexpected_status) for 1xx, 3xx or out-of-range codes.
        bool apply(BodyStream& body, int status, std::string_view final_uri) const;
    };

} // namespace hop::net
