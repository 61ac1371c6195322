// C++ Standard Library
#include <algorithm>
#include <exception>
#include <utility>

// Boost.Asio
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

// GSL
#include <gsl/gsl>

// Project
#include <app/jobs.hpp>
#include <hop/net/http/body_stream.hpp>
#include <hop/net/http/download.hpp>
#include <hop/net/http/error.hpp>
#include <hop/net/http/http_client.hpp>
#include <hop/net/http/metadata.hpp>

namespace app
{

    JobRunner::JobRunner(const Config& cfg, TransportFactory factory) :
        cfg_{ &cfg }, factory_{ std::move(factory) }
    {
        Expects(static_cast<bool>(factory_));
    }

    std::vector<JobResult> JobRunner::run(const std::vector<Job>& jobs) const
    {
        std::vector<JobResult> results(jobs.size());
        if (jobs.empty())
            return results;

        const auto threads = std::min(cfg_->jobs().threads, jobs.size());
        boost::asio::thread_pool pool{ threads };
        for (std::size_t i = 0; i < jobs.size(); ++i)
        {
            // Each worker writes only its own slot.
            boost::asio::post(pool, [this, &jobs, &results, i] { results[i] = execute(jobs[i]); });
        }
        pool.join();
        return results;
    }

    JobResult JobRunner::execute(const Job& job) const
    {
        JobResult result{ .uri = job.uri };

        try
        {
            const auto transport = factory_();
            hop::http_client::client client{ *transport, hop::net::Tracer{ cfg_->trace() } };
            auto opts = cfg_->request_options();

            switch (job.mode)
            {
            case JobMode::print:
                client.call(
                    job.uri, [&result](hop::net::BodyStream& page) { result.output += hop::net::read_string(page); }, opts);
                break;

            case JobMode::download:
                if (auto path = hop::http_client::download(client, job.uri, job.file, opts))
                    result.output = path->string();
                else
                    result.output = "absent";
                break;

            case JobMode::sync:
                if (auto path = hop::http_client::sync(client, job.uri, job.file, opts))
                    result.output = path->string();
                else
                    result.output = "absent";
                break;

            case JobMode::head:
                result.output = client.head(job.uri, opts) ? "present" : "absent";
                break;

            case JobMode::metadata: {
                hop::net::MetadataList metas;
                opts.metadata = &metas;
                if (auto body = client.open(job.uri, opts))
                    body->close();
                result.output = hop::net::to_json(metas);
                break;
            }
            }
            result.ok = true;
        }
        catch (const hop::net::StatusError& e)
        {
            result.error = std::string{ e.what() } + "\n" + e.content();
        }
        catch (const std::exception& e)
        {
            result.error = e.what();
        }
        return result;
    }

} // namespace app
