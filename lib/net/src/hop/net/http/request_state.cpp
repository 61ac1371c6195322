// C++ Standard Library
#include <algorithm>

// Project
#include <hop/net/http/error.hpp>
#include <hop/net/http/request_state.hpp>

namespace hop::net
{

    RequestState::RequestState(std::string first_uri, std::size_t max_hops, int max_retries) :
        max_hops_{ max_hops }, max_retries_{ max_retries }
    {
        visited_.push_front(std::move(first_uri));
    }

    void RequestState::push_hop(std::string uri)
    {
        const bool seen = std::find(visited_.begin(), visited_.end(), uri) != visited_.end();
        visited_.push_front(std::move(uri));

        if (hops() >= max_hops_)
        {
            throw RedirectError{ seen ? errc::redirect_loop : errc::max_redirects, chain() };
        }
    }

    bool RequestState::consume_retry() noexcept
    {
        ++retry_count_;
        return retry_count_ < max_retries_;
    }

    std::vector<std::string> RequestState::chain() const
    {
        return { visited_.rbegin(), visited_.rend() };
    }

} // namespace hop::net
