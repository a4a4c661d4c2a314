#include "resumedl/console_view.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <utility>

namespace resumedl {

ConsoleView::ConsoleView(std::ostream& out, std::string name)
    : out_(out), name_(std::move(name)) {}

void ConsoleView::render(const StatusView& view) {
    const auto panel = buildPanel(view);
    std::lock_guard<std::mutex> lock(mutex_);
    redrawPanel(panel);
}

void ConsoleView::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << std::flush;
    previous_lines_ = 0;
}

std::string ConsoleView::buildPanel(const StatusView& view) const {
    std::string panel;
    panel.reserve(256);
    panel.append("==================================================\n");
    panel += formatLine(view, name_);
    panel.push_back('\n');
    panel += fmt::format("{}\n", view.status);
    panel.append("==================================================\n");
    return panel;
}

std::string ConsoleView::formatLine(const StatusView& view, const std::string& name) {
    std::string display_name = std::filesystem::path{name}.filename().string();
    if (display_name.empty()) {
        display_name = name;
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    if (view.total_bytes == 0) {
        if (view.downloaded_bytes > 0) {
            return fmt::format("{:<20} [{}]", display_name, formatSize(view.downloaded_bytes));
        }
        return fmt::format("{:<20} [Initializing...]", display_name);
    }

    const double ratio = std::clamp(view.progress, 0.0, 1.0);
    const int percent = static_cast<int>(ratio * 100.0);
    constexpr int bar_width = 30;
    const int bar_pos = static_cast<int>(ratio * bar_width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? "█" : "░";
    }

    std::string line = fmt::format("{:<20} [{}] {:>3}% ({}/{})", display_name, bar, percent,
                                   formatSize(view.downloaded_bytes), formatSize(view.total_bytes));
    if (view.state == JobState::Failed) {
        line.append("  ❌");
    } else if (view.state == JobState::Completed) {
        line.append("  ✅ Done");
    } else if (view.state == JobState::Paused || view.state == JobState::Interrupted) {
        line.append("  ⏸");
    }
    return line;
}

std::string ConsoleView::formatSize(std::uint64_t bytes) {
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

void ConsoleView::redrawPanel(const std::string& panel) {
    const std::size_t current_lines =
        static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace resumedl
