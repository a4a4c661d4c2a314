#pragma once

#include "download_job.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>

namespace resumedl {

// Terminal panel for a single download, redrawn in place.
class ConsoleView {
public:
    ConsoleView(std::ostream& out, std::string name);

    void render(const StatusView& view);
    void finish();

    [[nodiscard]] std::string buildPanel(const StatusView& view) const;
    static std::string formatLine(const StatusView& view, const std::string& name);
    static std::string formatSize(std::uint64_t bytes);

private:
    void redrawPanel(const std::string& panel);

    std::ostream& out_;
    std::string name_;
    std::size_t previous_lines_{0};
    std::mutex mutex_;
};

} // namespace resumedl
