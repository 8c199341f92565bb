#pragma once

#include "config.hpp"
#include "http_transport.hpp"
#include "observer.hpp"
#include "transfer_engine.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace parafetch {

struct Summary {
    std::size_t successful{0};
    std::size_t failed{0};
    // Same order as the input requests.
    std::vector<Outcome> outcomes;
};

// Runs many transfers with at most config.max_concurrent active at a time.
// One failing resource never affects the others.
class DownloadManager {
public:
    explicit DownloadManager(FetchConfig config);
    // Uses the given transport instead of a CurlTransport created per run.
    DownloadManager(FetchConfig config, std::shared_ptr<HttpTransport> transport);

    // Throws ConfigError when the configuration is invalid or the download
    // directory cannot be created; nothing is fetched in that case.
    Summary run(const std::vector<ResourceRequest>& requests, TransferObserver* observer = nullptr);
    Summary run(const std::vector<std::string>& urls, TransferObserver* observer = nullptr);

    [[nodiscard]] const FetchConfig& config() const noexcept { return config_; }

private:
    void prepareDirectory() const;
    static Outcome runOne(const TransferEngine& engine,
                          const ResourceRequest& request,
                          const std::filesystem::path& directory,
                          TransferObserver* observer);
    static void notifyStatus(TransferObserver* observer, const Outcome& outcome);

    FetchConfig config_;
    std::shared_ptr<HttpTransport> transport_;
};

} // namespace parafetch
