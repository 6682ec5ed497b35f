/**
 * @file ProgressDisplay.hpp
 * @brief Terminal progress display for CLI sanitization runs
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace cli {

/**
 * @class ProgressDisplay
 * @brief ANSI terminal progress bar display
 *
 * Displays a progress bar with percentage, speed and ETA in the terminal.
 * Fed from the progress channel's consumer thread only.
 */
class ProgressDisplay {
public:
    /**
     * @param standard_name Standard being applied (for the header)
     * @param total_passes Passes the standard requires
     */
    ProgressDisplay(std::string standard_name, size_t total_passes);

    /**
     * @brief Update the progress display
     * @param event Latest progress sample of one device
     */
    void update(const ProgressEvent& event);

    /**
     * @brief Print the final line of one session
     * @param success Whether the session completed and passed the audit
     * @param message Final status message
     */
    void complete(bool success, const std::string& message);

    /**
     * @brief Enable or disable ANSI color output
     */
    void set_color_enabled(bool enable);

    /**
     * @brief Check if stdout is a terminal
     */
    [[nodiscard]] static auto is_terminal() -> bool;

    [[nodiscard]] static auto format_bytes(uint64_t bytes) -> std::string;
    [[nodiscard]] static auto format_speed(uint64_t bytes_per_sec) -> std::string;
    [[nodiscard]] static auto format_duration(int64_t seconds) -> std::string;

private:
    [[nodiscard]] auto generate_progress_bar(double percentage) const -> std::string;

    /**
     * @brief Clear current line and move cursor to beginning
     */
    void clear_line();

    std::string standard_name_;
    size_t total_passes_;
    bool color_enabled_ = true;
    bool header_printed_ = false;
    std::map<std::string, std::chrono::steady_clock::time_point> last_line_;

    static constexpr int BAR_WIDTH = 30;
    static constexpr std::chrono::milliseconds PIPE_LINE_INTERVAL{1'000};
};

}  // namespace cli
