#pragma once

#include "parafetch/progress.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace parafetch::cli {

// Terminal panel with one line per file, redrawn in place.
class ProgressPanel {
public:
    explicit ProgressPanel(std::size_t expected_tasks);

    void apply(const TransferEvent& event);
    [[nodiscard]] std::string build() const;
    void redraw(std::ostream& out);

    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);

private:
    enum class State {
        Downloading,
        Completed,
        Failed,
    };

    struct Entry {
        std::string filename;
        std::uint64_t downloaded_bytes{0};
        std::optional<std::uint64_t> total_bytes;
        State state{State::Downloading};
        std::string info;
    };

    Entry& entry(const std::string& filename);
    [[nodiscard]] static std::string formatLine(const Entry& entry);

    std::size_t expected_tasks_;
    std::vector<Entry> entries_;
    std::map<std::string, std::size_t> index_;
    std::size_t previous_lines_{0};
};

} // namespace parafetch::cli
