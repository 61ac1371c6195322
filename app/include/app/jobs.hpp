/*
Module Name:
- jobs.hpp

Abstract:
- Runs independent logical requests in parallel on a bounded
  boost::asio::thread_pool.
- Every job gets its own Transport (from the factory) and its own client, so
  no request state is shared between workers.
- Failures are captured per job; one failing URI does not stop the others.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Project
#include <app/config.hpp>
#include <hop/net/http/transport.hpp>

namespace app
{

    enum class JobMode
    {
        print, ///< body of every page
        download, ///< save to file
        sync, ///< save to file unless it exists
        head, ///< HEAD request, present or absent
        metadata, ///< metadata list as JSON
    };

    struct Job
    {
        std::string uri;
        JobMode mode{ JobMode::print };
        std::filesystem::path file{}; ///< download/sync target; derived from uri when empty
    };

    struct JobResult
    {
        std::string uri;
        bool ok{ false };
        std::string output; ///< body, JSON, path, present or absent
        std::string error; ///< what() of the failure when !ok
    };

    using TransportFactory = std::function<std::unique_ptr<hop::net::Transport>()>;

    class JobRunner
    {
    public:
        /// Pre: factory is callable.
        JobRunner(const Config& cfg, TransportFactory factory);

        /// Results are in job order. Blocks until every job has finished.
        [[nodiscard]] std::vector<JobResult> run(const std::vector<Job>& jobs) const;

    private:
        JobResult execute(const Job& job) const;

        const Config* cfg_; // non-null
        TransportFactory factory_;
    };

} // namespace app
