#include "parafetch/download_manager.hpp"

#include "parafetch/admission_gate.hpp"
#include "parafetch/errors.hpp"
#include "parafetch/logging.hpp"

#include <map>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace parafetch {

DownloadManager::DownloadManager(FetchConfig config) : config_(std::move(config)) {}

DownloadManager::DownloadManager(FetchConfig config, std::shared_ptr<HttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {}

Summary DownloadManager::run(const std::vector<std::string>& urls, TransferObserver* observer) {
    std::vector<ResourceRequest> requests;
    requests.reserve(urls.size());
    for (const auto& url : urls) {
        requests.push_back(ResourceRequest{url, std::nullopt});
    }
    return run(requests, observer);
}

Summary DownloadManager::run(const std::vector<ResourceRequest>& requests, TransferObserver* observer) {
    config_.validate();
    prepareDirectory();

    // The session lives exactly as long as this run unless one was injected.
    std::shared_ptr<HttpTransport> transport = transport_;
    if (!transport) {
        transport = std::make_shared<CurlTransport>();
    }
    const TransferEngine engine(*transport, TransferOptions::fromConfig(config_));
    AdmissionGate gate(config_.max_concurrent);

    logger()->info("run started resources={} max_concurrent={} directory={}",
                   requests.size(), config_.max_concurrent, config_.download_dir.string());

    std::vector<Outcome> outcomes(requests.size());
    std::map<std::size_t, std::thread> running;
    std::mutex finished_mutex;
    std::vector<std::size_t> finished;

    const auto reap = [&](bool all) {
        std::vector<std::size_t> done;
        {
            std::lock_guard<std::mutex> lock(finished_mutex);
            done.swap(finished);
        }
        for (const auto index : done) {
            running[index].join();
            running.erase(index);
        }
        if (all) {
            for (auto& entry : running) {
                entry.second.join();
            }
            running.clear();
        }
    };

    try {
        for (std::size_t i = 0; i < requests.size(); ++i) {
            auto slot = gate.acquire();
            reap(false);

            running.emplace(i, std::thread([&, i, slot = std::move(slot)]() mutable {
                outcomes[i] = runOne(engine, requests[i], config_.download_dir, observer);
                {
                    std::lock_guard<std::mutex> lock(finished_mutex);
                    finished.push_back(i);
                }
                slot.release();
            }));
        }
    } catch (...) {
        reap(true);
        throw;
    }
    reap(true);

    Summary summary;
    for (const auto& outcome : outcomes) {
        if (outcome.succeeded()) {
            ++summary.successful;
        } else {
            ++summary.failed;
        }
    }
    summary.outcomes = std::move(outcomes);

    logger()->info("run finished successful={} failed={}", summary.successful, summary.failed);
    return summary;
}

void DownloadManager::prepareDirectory() const {
    std::error_code ec;
    std::filesystem::create_directories(config_.download_dir, ec);
    if (ec) {
        throw ConfigError(fmt::format("Failed to create download directory: {} - {}",
                                      config_.download_dir.string(), ec.message()));
    }
    if (!std::filesystem::is_directory(config_.download_dir, ec)) {
        throw ConfigError(fmt::format("Download path is not a directory: {}", config_.download_dir.string()));
    }
}

Outcome DownloadManager::runOne(const TransferEngine& engine,
                                const ResourceRequest& request,
                                const std::filesystem::path& directory,
                                TransferObserver* observer) {
    Outcome outcome;
    try {
        outcome = engine.fetch(request, directory, observer);
    } catch (const std::exception& e) {
        logger()->error("transfer aborted url={} error={}", request.url, e.what());
        outcome.url = request.url;
        outcome.filename = request.filename.value_or(request.url);
        outcome.status = TransferStatus::Failed;
        outcome.error = e.what();
    }

    notifyStatus(observer, outcome);
    return outcome;
}

void DownloadManager::notifyStatus(TransferObserver* observer, const Outcome& outcome) {
    if (!observer) {
        return;
    }
    const std::string info = outcome.succeeded() ? outcome.path.string() : outcome.error;
    try {
        observer->onStatus(outcome.filename, outcome.status, info);
    } catch (const std::exception& e) {
        logger()->debug("status observer threw filename={} error={}", outcome.filename, e.what());
    }
}

} // namespace parafetch
