/*
Module: main.cpp

Purpose:
- Entry point of the hopper command line: fetch one or more URIs through the
  request engine and print, save, check or describe them.

Notes:
- Settings come from ./hopper.toml (or --config) with command-line overrides.
  Fails fast with ConfigError.
- Several URIs are fetched in parallel on a bounded worker pool; each failure
  is reported on stderr and turns the exit status into EXIT_FAILURE.
*/

// C++ Standard Library
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// Boost.Asio
#include <boost/asio/ssl/context.hpp>

// Boost.ProgramOptions
#include <boost/program_options.hpp>

// Project
#include <app/config.hpp>
#include <app/jobs.hpp>
#include <hop/net/http/beast_transport.hpp>

namespace po = boost::program_options;

namespace
{
    app::JobMode select_mode(const po::variables_map& vm)
    {
        int selected = 0;
        auto mode = app::JobMode::print;
        for (const auto& [flag, m] : { std::pair{ "download", app::JobMode::download },
                                       std::pair{ "sync", app::JobMode::sync },
                                       std::pair{ "head", app::JobMode::head },
                                       std::pair{ "metadata", app::JobMode::metadata } })
        {
            if (vm.count(flag))
            {
                mode = m;
                ++selected;
            }
        }
        if (selected > 1)
            throw po::error("--download, --sync, --head and --metadata are mutually exclusive");
        return mode;
    }
} // namespace

int main(int argc, char* argv[])
{
    try
    {
        po::options_description visible{ "Usage: hopper [options] <uri>...\n\nOptions" };
        visible.add_options()
            ("help,h", "show this help")
            ("config,c", po::value<std::string>(), "TOML settings file (default ./hopper.toml)")
            ("output,o", po::value<std::string>(), "target file for --download / --sync (single URI)")
            ("download,d", "save each URI to a local file")
            ("sync,s", "like --download, but keep files that already exist")
            ("head", "send HEAD; prints present or absent")
            ("metadata,m", "print the reply metadata as JSON")
            ("accept,a", po::value<std::string>(), "extension, media type, or comma-separated media types")
            ("jobs,j", po::value<std::size_t>(), "number of parallel requests")
            ("curl", "trace requests and replies on stderr");

        po::options_description hidden;
        hidden.add_options()("uri", po::value<std::vector<std::string>>(), "URI to fetch");

        po::options_description all;
        all.add(visible).add(hidden);

        po::positional_options_description positional;
        positional.add("uri", -1);

        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);

        if (vm.count("help") || !vm.count("uri"))
        {
            std::cout << visible << '\n';
            return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        // 1) Settings: file first, then command-line overrides.
        const auto base = vm.count("config") ? app::Config::load_file(vm["config"].as<std::string>())
                                             : app::Config::load();
        app::Overrides overrides;
        if (vm.count("accept"))
            overrides.accept = vm["accept"].as<std::string>();
        if (vm.count("jobs"))
            overrides.threads = vm["jobs"].as<std::size_t>();
        overrides.curl = vm.count("curl") > 0;
        const auto cfg = base.with(overrides);

        // 2) One job per URI.
        const auto mode = select_mode(vm);
        const auto& uris = vm["uri"].as<std::vector<std::string>>();
        if (vm.count("output") && uris.size() != 1)
            throw po::error("--output needs exactly one URI");

        std::vector<app::Job> jobs;
        jobs.reserve(uris.size());
        for (const auto& uri : uris)
        {
            app::Job job{ .uri = uri, .mode = mode };
            if (vm.count("output"))
                job.file = vm["output"].as<std::string>();
            jobs.push_back(std::move(job));
        }

        // 3) Run them; every job opens its own connections over one TLS context.
        auto ssl_ctx = hop::net::make_permissive_ssl_context();
        const app::JobRunner runner{ cfg, [&ssl_ctx, &cfg] {
                                        return std::make_unique<hop::net::BeastTransport>(ssl_ctx, cfg.user_agent());
                                    } };
        const auto results = runner.run(jobs);

        bool all_ok = true;
        for (const auto& r : results)
        {
            if (r.ok)
            {
                std::cout << r.output;
                if (mode != app::JobMode::print)
                    std::cout << '\n';
            }
            else
            {
                all_ok = false;
                std::cerr << "[hopper] " << r.uri << ": " << r.error << '\n';
            }
        }
        std::cout.flush();
        return all_ok ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const app::ConfigError& e)
    {
        std::cerr << "Configuration error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (const po::error& e)
    {
        std::cerr << "Usage error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
}
