#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace parafetch {

enum class TransferStatus {
    Completed,
    Failed,
};

[[nodiscard]] std::string_view statusName(TransferStatus status) noexcept;

struct Progress {
    std::string filename;
    std::uint64_t downloaded_bytes{0};
    // Empty when the server did not declare a length.
    std::optional<std::uint64_t> total_bytes;
};

struct TransferEvent {
    enum class Kind {
        Progress,
        Status,
    };

    Kind kind{Kind::Progress};
    Progress progress;
    TransferStatus status{TransferStatus::Completed};
    std::string info;
};

} // namespace parafetch
