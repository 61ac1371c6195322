/*
Module Name:
- request_state.hpp

Abstract:
- Mutable bookkeeping of one logical request while it redirects and retries.
- Encodes hop and retry limits: push_hop() enforces the redirect cap and loop
  detection, consume_retry() the retry cap.
- The retry counter starts at 1, so with the default cap of 1 a failing
  request is attempted exactly once. Callers depend on this; keep it.
- Loops are only reported once the cap is reached: the same URI may
  legitimately be requested twice in a chain (e.g. once more with a cookie).
- Owned by one request for the duration of one call; never shared.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <deque>
#include <string>
#include <vector>

// Project
#include <hop/net/http/metadata.hpp>

namespace hop::net
{

    inline constexpr std::size_t k_default_number_of_hops = 5;
    inline constexpr int k_default_number_of_retries = 1;

    class RequestState
    {
    public:
        explicit RequestState(std::string first_uri,
                              std::size_t max_hops = k_default_number_of_hops,
                              int max_retries = k_default_number_of_retries);

        [[nodiscard]] std::size_t max_hops() const noexcept
        {
            return max_hops_;
        }
        [[nodiscard]] int max_retries() const noexcept
        {
            return max_retries_;
        }

        // Record a redirect to uri. Throws RedirectError(redirect_loop) when the
        // cap is reached and uri was seen before, RedirectError(max_redirects)
        // when the cap is reached otherwise.
        void push_hop(std::string uri);

        // Count a failed attempt. True when the request may be re-issued.
        [[nodiscard]] bool consume_retry() noexcept;

        [[nodiscard]] std::size_t hops() const noexcept
        {
            return visited_.size() - 1;
        }
        [[nodiscard]] int retry_count() const noexcept
        {
            return retry_count_;
        }

        // Most recent first.
        [[nodiscard]] const std::deque<std::string>& visited() const noexcept
        {
            return visited_;
        }
        [[nodiscard]] const std::string& current_uri() const noexcept
        {
            return visited_.front();
        }

        void record(Metadata meta)
        {
            log_.append(std::move(meta));
        }
        [[nodiscard]] const Metadata& last_meta() const
        {
            return log_.last();
        }
        [[nodiscard]] MetadataList take_metadata() &&
        {
            return std::move(log_).release();
        }

    private:
        [[nodiscard]] std::vector<std::string> chain() const;

        std::deque<std::string> visited_;
        std::size_t max_hops_;
        int max_retries_;
        int retry_count_{ 1 };
        MetadataLog log_;
    };

} // namespace hop::net
