#include "cli/progress_panel.hpp"

#include "parafetch/config.hpp"
#include "parafetch/download_manager.hpp"
#include "parafetch/errors.hpp"
#include "parafetch/event_channel.hpp"
#include "parafetch/http_transport.hpp"
#include "parafetch/logging.hpp"
#include "parafetch/prober.hpp"

#include <chrono>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace {

struct CliOptions {
    parafetch::FetchConfig config;
    parafetch::LoggingOptions logging;
    std::vector<parafetch::ResourceRequest> requests;
    bool probe_only{false};
    bool show_help{false};
};

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <url> [<url> ...]" << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>        Download directory (default: downloads)\n"
              << "  -c <count>            Maximum concurrent downloads (default: 5)\n"
              << "  -i <file>             Read '<url> [filename]' lines from a file\n"
              << "  -r <count>            Retries per download (default: 3)\n"
              << "  -b <seconds>          Backoff base between retries (default: 1.0)\n"
              << "  --chunk-size <bytes>  Write chunk size (default: 8192)\n"
              << "  --timeout <seconds>   Per-request timeout (default: 30)\n"
              << "  --block <domain>      Add a host suffix to the probe blocklist\n"
              << "  --probe               Only check whether each URL is downloadable\n"
              << "  --log-file <path>     Also write logs to a file\n"
              << "  --log-endpoint <url>  POST log records to a collector\n"
              << "  --log-spool <path>    Spool file for undelivered log records\n"
              << "  -v                    Verbose console logging\n"
              << "  -h, --help            Show this message" << std::endl;
}

template <typename T>
T parseNumber(const std::string& option, const std::string& value) {
    std::istringstream in(value);
    T parsed{};
    if (!(in >> parsed) || !in.eof()) {
        throw parafetch::ConfigError(fmt::format("Invalid value for {}: {}", option, value));
    }
    return parsed;
}

void readRequestFile(const std::string& path, std::vector<parafetch::ResourceRequest>& requests) {
    std::ifstream in(path);
    if (!in) {
        throw parafetch::ConfigError("Cannot open URL list: " + path);
    }

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string url;
        std::string filename;
        if (!(fields >> url) || url.front() == '#') {
            continue;
        }
        parafetch::ResourceRequest request{url, std::nullopt};
        if (fields >> filename) {
            request.filename = filename;
        }
        requests.push_back(std::move(request));
    }
}

CliOptions parseArguments(int argc, char** argv) {
    CliOptions options;
    options.config.blocklist = parafetch::defaultBlocklist();

    for (int arg_index = 1; arg_index < argc; ++arg_index) {
        const std::string option = argv[arg_index];
        const auto value = [&]() -> std::string {
            if (arg_index + 1 >= argc) {
                throw parafetch::ConfigError("Missing value for " + option);
            }
            return argv[++arg_index];
        };

        if (option == "-h" || option == "--help") {
            options.show_help = true;
        } else if (option == "-d") {
            options.config.download_dir = value();
        } else if (option == "-c") {
            const auto count = parseNumber<long>(option, value());
            if (count <= 0) {
                throw parafetch::ConfigError("Concurrency must be a positive integer");
            }
            options.config.max_concurrent = static_cast<std::size_t>(count);
        } else if (option == "-i") {
            readRequestFile(value(), options.requests);
        } else if (option == "-r") {
            options.config.max_retries = parseNumber<int>(option, value());
        } else if (option == "-b") {
            options.config.backoff_base = std::chrono::duration<double>(parseNumber<double>(option, value()));
        } else if (option == "--chunk-size") {
            const auto size = parseNumber<long>(option, value());
            if (size <= 0) {
                throw parafetch::ConfigError("Chunk size must be a positive integer");
            }
            options.config.chunk_size = static_cast<std::size_t>(size);
        } else if (option == "--timeout") {
            const auto seconds = parseNumber<double>(option, value());
            options.config.request_timeout = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
        } else if (option == "--block") {
            options.config.blocklist.push_back(value());
        } else if (option == "--probe") {
            options.probe_only = true;
        } else if (option == "--log-file") {
            options.logging.log_file = value();
        } else if (option == "--log-endpoint") {
            options.logging.endpoint = value();
        } else if (option == "--log-spool") {
            options.logging.spool_file = value();
        } else if (option == "-v") {
            options.logging.console_level = spdlog::level::debug;
        } else if (!option.empty() && option.front() == '-') {
            throw parafetch::ConfigError("Unknown option: " + option);
        } else {
            options.requests.push_back(parafetch::ResourceRequest{option, std::nullopt});
        }
    }
    return options;
}

int runProbe(const CliOptions& options) {
    parafetch::CurlTransport transport;
    const parafetch::Prober prober(transport, options.config.blocklist);

    bool all_downloadable = true;
    for (const auto& request : options.requests) {
        const auto result = prober.probe(request.url, options.config.request_timeout);
        std::cout << (result.downloadable ? "downloadable     " : "not downloadable ")
                  << request.url << " (" << result.reason << ")" << std::endl;
        all_downloadable = all_downloadable && result.downloadable;
    }
    return all_downloadable ? 0 : 1;
}

int runDownloads(const CliOptions& options) {
    auto channel = std::make_shared<parafetch::EventChannel>();
    parafetch::ChannelObserver observer(channel);
    parafetch::DownloadManager manager(options.config);

    parafetch::Summary summary;
    std::exception_ptr failure;
    std::thread worker([&] {
        try {
            summary = manager.run(options.requests, &observer);
        } catch (...) {
            failure = std::current_exception();
        }
        channel->close();
    });

    parafetch::cli::ProgressPanel panel(options.requests.size());
    panel.redraw(std::cout);
    while (!channel->drained()) {
        bool changed = false;
        for (auto event = channel->pop(std::chrono::milliseconds(200)); event; event = channel->tryPop()) {
            panel.apply(*event);
            changed = true;
        }
        if (changed) {
            panel.redraw(std::cout);
        }
    }
    worker.join();

    if (failure) {
        std::rethrow_exception(failure);
    }

    for (const auto& outcome : summary.outcomes) {
        if (outcome.succeeded()) {
            std::cout << "Downloaded: " << outcome.path.string() << std::endl;
        } else {
            std::cout << "Error downloading " << outcome.url << ": " << outcome.error << std::endl;
        }
    }
    std::cout << fmt::format("\nSummary: {} successful, {} failed downloads.", summary.successful, summary.failed)
              << std::endl;
    return summary.failed == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    try {
        const auto options = parseArguments(argc, argv);
        if (options.show_help) {
            printUsage(argv[0]);
            return 0;
        }
        if (options.requests.empty()) {
            printUsage(argv[0]);
            return 1;
        }

        parafetch::setupLogging(options.logging);
        options.config.validate();

        return options.probe_only ? runProbe(options) : runDownloads(options);
    } catch (const parafetch::ConfigError& ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
