#include "progress_panel.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace parafetch::cli {

ProgressPanel::ProgressPanel(std::size_t expected_tasks) : expected_tasks_(expected_tasks) {}

ProgressPanel::Entry& ProgressPanel::entry(const std::string& filename) {
    const auto it = index_.find(filename);
    if (it != index_.end()) {
        return entries_[it->second];
    }
    index_.emplace(filename, entries_.size());
    entries_.push_back(Entry{filename});
    return entries_.back();
}

void ProgressPanel::apply(const TransferEvent& event) {
    auto& target = entry(event.progress.filename);
    if (event.kind == TransferEvent::Kind::Progress) {
        target.downloaded_bytes = event.progress.downloaded_bytes;
        target.total_bytes = event.progress.total_bytes;
        return;
    }

    target.state = event.status == TransferStatus::Completed ? State::Completed : State::Failed;
    target.info = event.info;
}

std::string ProgressPanel::build() const {
    std::string panel;
    panel.reserve(entries_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("parafetch ({} tasks)\n", expected_tasks_);
    panel.append("--------------------------------------------------\n");

    std::size_t completed = 0;
    std::size_t failed = 0;
    for (const auto& item : entries_) {
        panel += formatLine(item);
        panel.push_back('\n');
        completed += item.state == State::Completed ? 1 : 0;
        failed += item.state == State::Failed ? 1 : 0;
    }

    panel.append("--------------------------------------------------\n");
    panel += fmt::format("Completed: {}, Failed: {}, Pending: {}\n",
                         completed, failed, expected_tasks_ - std::min(expected_tasks_, completed + failed));
    panel.append("==================================================\n");
    return panel;
}

std::string ProgressPanel::formatLine(const Entry& entry) {
    std::string display_name = entry.filename;
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    std::string line;
    line.reserve(256);
    if (entry.total_bytes && *entry.total_bytes > 0) {
        const double ratio = std::min(1.0, static_cast<double>(entry.downloaded_bytes) /
                                               static_cast<double>(*entry.total_bytes));
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? u8"█" : u8"░";
        }

        line += fmt::format("{:<20} [{}] {:>3}% ({}/{})",
                            display_name,
                            bar,
                            percent,
                            formatSize(entry.downloaded_bytes),
                            formatSize(*entry.total_bytes));
    } else {
        line += fmt::format("{:<20} [N/A] {}", display_name, formatSize(entry.downloaded_bytes));
    }

    if (entry.state == State::Failed) {
        line += fmt::format("  ❌ {}", entry.info);
    } else if (entry.state == State::Completed) {
        line.append("  ✅ Done");
    }
    return line;
}

std::string ProgressPanel::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

void ProgressPanel::redraw(std::ostream& out) {
    const auto panel = build();
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out << "\033[" << previous_lines_ << "F\033[J";
    }
    out << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace parafetch::cli
