#pragma once

#include "progress.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace parafetch {

// Callbacks may be invoked concurrently from several transfer threads.
// Exceptions thrown from them are logged and discarded.
class TransferObserver {
public:
    virtual ~TransferObserver() = default;

    virtual void onProgress(const std::string& filename,
                            std::uint64_t downloaded_bytes,
                            std::optional<std::uint64_t> total_bytes) = 0;
    virtual void onStatus(const std::string& filename, TransferStatus status, const std::string& info) = 0;
};

} // namespace parafetch
