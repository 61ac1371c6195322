/*
Module Name:
- fake_transport.hpp

Abstract:
- Scripted in-memory Transport for driving the request engine in tests.
- Replies are queued per URI; the last queued reply for a URI is repeated
  once the queue is down to it, so a single scripted failure answers every
  retry.
- A Content-Encoding header line is undone as the real transport does.
- Every open and close is appended to a shared event log ("open <uri>",
  "close <uri>") so tests can check stream lifetimes and ordering.
*/
#pragma once

// C++ Standard Library
#include <algorithm>
#include <deque>
#include <map>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Project
#include <hop/net/http/body_stream.hpp>
#include <hop/net/http/encoding.hpp>
#include <hop/net/http/transport.hpp>
#include <hop/utils/case_insensitive.hpp>

namespace hop::test
{

    struct Reply
    {
        int status{ 200 };
        std::vector<std::string> headers{ "Content-Type: text/plain" };
        std::string body{};
    };

    using EventLog = std::vector<std::string>;

    // StringBodyStream that reports its close to the event log, once.
    class TrackedBodyStream final : public net::BodyStream
    {
    public:
        TrackedBodyStream(std::string uri, std::string data, std::shared_ptr<EventLog> events) :
            inner_{ std::move(data) }, uri_{ std::move(uri) }, events_{ std::move(events) }
        {
        }
        ~TrackedBodyStream() override
        {
            close();
        }

        std::size_t read_some(std::span<char> out) override
        {
            return inner_.read_some(out);
        }
        bool at_end() override
        {
            return inner_.at_end();
        }
        void close() noexcept override
        {
            if (!inner_.is_open())
                return;
            inner_.close();
            events_->push_back("close " + uri_);
        }
        bool is_open() const noexcept override
        {
            return inner_.is_open();
        }

    private:
        net::StringBodyStream inner_;
        std::string uri_;
        std::shared_ptr<EventLog> events_;
    };

    class FakeTransport final : public net::Transport
    {
    public:
        FakeTransport& on(const std::string& uri, Reply reply)
        {
            script_[uri].push_back(std::move(reply));
            return *this;
        }

        // 3xx with a Location header.
        FakeTransport& redirect(const std::string& uri, const std::string& location, int status = 302)
        {
            return on(uri, Reply{ .status = status, .headers = { "Location: " + location }, .body = {} });
        }

        net::TransportResponse open(const net::TransportRequest& request) override
        {
            requests_.push_back(request);
            events_->push_back("open " + request.uri);

            const auto it = script_.find(request.uri);
            if (it == script_.end() || it->second.empty())
                throw std::runtime_error("no scripted reply for " + request.uri);

            auto& queue = it->second;
            Reply reply = queue.front();
            if (queue.size() > 1)
                queue.pop_front();

            auto which = net::encoding::enc::none;
            for (const auto& line : reply.headers)
            {
                const auto colon = line.find(':');
                if (colon != std::string::npos &&
                    utils::iequals(std::string_view{ line }.substr(0, colon), "content-encoding"))
                    which = which | net::encoding::parse_content_encoding(std::string_view{ line }.substr(colon + 1));
            }

            net::TransportResponse res;
            res.status = reply.status;
            res.header_lines = std::move(reply.headers);
            res.body = net::encoding::decode(
                std::make_unique<TrackedBodyStream>(request.uri, std::move(reply.body), events_), which);
            return res;
        }

        [[nodiscard]] const std::vector<net::TransportRequest>& requests() const noexcept
        {
            return requests_;
        }

        [[nodiscard]] const EventLog& events() const noexcept
        {
            return *events_;
        }

        [[nodiscard]] std::size_t opens(const std::string& uri) const
        {
            return static_cast<std::size_t>(std::count(events_->begin(), events_->end(), "open " + uri));
        }

    private:
        std::map<std::string, std::deque<Reply>> script_;
        std::vector<net::TransportRequest> requests_;
        std::shared_ptr<EventLog> events_{ std::make_shared<EventLog>() };
    };

} // namespace hop::test
