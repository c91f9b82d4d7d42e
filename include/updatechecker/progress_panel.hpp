#pragma once

#include "progress.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace updatechecker {

/*
 * Console view of the transfers recorded in a ProgressSink: one row per destination with
 * its strategy (chunk count, single stream, or single stream after a failed chunked attempt)
 * and a footer counting active, finished and failed transfers. Redrawn in place with ANSI
 * cursor movement.
 */
class ProgressPanel {
public:
    ProgressPanel(const ProgressSink& sink, std::ostream& out);

    void redraw();

    [[nodiscard]] std::vector<std::string> render() const;
    [[nodiscard]] static std::string formatTransfer(const Progress& progress);
    [[nodiscard]] static std::string formatStrategy(const Progress& progress);
    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);

private:
    const ProgressSink& sink_;
    std::ostream& out_;
    std::size_t previous_lines_{0};
};

} // namespace updatechecker
