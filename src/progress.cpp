#include "parafetch/progress.hpp"

namespace parafetch {

std::string_view statusName(TransferStatus status) noexcept {
    switch (status) {
    case TransferStatus::Completed:
        return "completed";
    case TransferStatus::Failed:
        return "failed";
    }
    return "unknown";
}

} // namespace parafetch
