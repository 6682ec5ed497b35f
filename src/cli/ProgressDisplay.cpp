/**
 * @file ProgressDisplay.cpp
 * @brief Terminal progress display implementation
 */

#include "cli/ProgressDisplay.hpp"

#include <unistd.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace cli {

namespace {

// ANSI color codes
constexpr auto RESET = "\033[0m";
constexpr auto BOLD = "\033[1m";
constexpr auto GREEN = "\033[32m";
constexpr auto RED = "\033[31m";
constexpr auto CYAN = "\033[36m";

auto fixed1(double value) -> std::string {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value;
    return out.str();
}

auto two_digits(int64_t value) -> std::string {
    std::ostringstream out;
    out << std::setw(2) << std::setfill('0') << value;
    return out.str();
}

}  // namespace

ProgressDisplay::ProgressDisplay(std::string standard_name, size_t total_passes)
    : standard_name_(std::move(standard_name)), total_passes_(total_passes) {
    // Disable colors if not a terminal
    color_enabled_ = is_terminal();
}

auto ProgressDisplay::is_terminal() -> bool {
    return isatty(STDOUT_FILENO) != 0;
}

void ProgressDisplay::set_color_enabled(bool enable) {
    color_enabled_ = enable;
}

void ProgressDisplay::update(const ProgressEvent& event) {
    if (!header_printed_) {
        std::cout << "\n";
        if (color_enabled_) {
            std::cout << BOLD;
        }
        std::cout << "Standard: " << standard_name_ << " (" << total_passes_ << " pass"
                  << (total_passes_ != 1 ? "es" : "") << ")\n";
        if (color_enabled_) {
            std::cout << RESET;
        }
        std::cout << std::flush;
        header_printed_ = true;
    }

    // Without a terminal, print at most one line per device and interval
    const bool final_sample = event.bytes_done >= event.total_bytes;
    if (!is_terminal() && !final_sample) {
        auto now = std::chrono::steady_clock::now();
        auto [it, inserted] = last_line_.try_emplace(event.device_id, now);
        if (!inserted) {
            if (now - it->second < PIPE_LINE_INTERVAL) {
                return;
            }
            it->second = now;
        }
    }

    const double percentage = event.percentage();
    std::string status_line = "[" + event.device_id + "] ";
    if (color_enabled_) {
        status_line = CYAN + status_line + RESET;
    }

    status_line += (event.phase == ProgressPhase::VERIFYING ? "Verifying " : "Pass ") +
                   std::to_string(event.pass_index + 1) + "/" +
                   std::to_string(event.total_passes) + ": " +
                   generate_progress_bar(percentage) + " " + fixed1(percentage) + "%";

    if (event.throughput_bytes_per_sec > 0) {
        status_line += "  |  " + format_speed(event.throughput_bytes_per_sec);
        if (event.total_bytes > event.bytes_done) {
            const auto remaining = static_cast<int64_t>((event.total_bytes - event.bytes_done) /
                                                        event.throughput_bytes_per_sec);
            status_line += "  |  ETA: " + format_duration(remaining);
        }
    }

    clear_line();
    std::cout << status_line << std::flush;
}

void ProgressDisplay::complete(bool success, const std::string& message) {
    clear_line();

    if (color_enabled_) {
        std::cout << (success ? GREEN : RED) << BOLD;
    }

    std::cout << (success ? "[OK] " : "[FAILED] ") << message;

    if (color_enabled_) {
        std::cout << RESET;
    }

    std::cout << std::endl;
}

auto ProgressDisplay::format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;
    constexpr uint64_t TB = GB * 1024;

    if (bytes >= TB) {
        return fixed1(static_cast<double>(bytes) / static_cast<double>(TB)) + " TB";
    } else if (bytes >= GB) {
        return fixed1(static_cast<double>(bytes) / static_cast<double>(GB)) + " GB";
    } else if (bytes >= MB) {
        return fixed1(static_cast<double>(bytes) / static_cast<double>(MB)) + " MB";
    } else if (bytes >= KB) {
        return fixed1(static_cast<double>(bytes) / static_cast<double>(KB)) + " KB";
    }
    return std::to_string(bytes) + " B";
}

auto ProgressDisplay::format_speed(uint64_t bytes_per_sec) -> std::string {
    return format_bytes(bytes_per_sec) + "/s";
}

auto ProgressDisplay::format_duration(int64_t seconds) -> std::string {
    if (seconds < 0) {
        return "--:--";
    }

    int64_t hours = seconds / 3600;
    int64_t minutes = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    if (hours > 0) {
        return std::to_string(hours) + ":" + two_digits(minutes) + ":" + two_digits(secs);
    }
    return two_digits(minutes) + ":" + two_digits(secs);
}

auto ProgressDisplay::generate_progress_bar(double percentage) const -> std::string {
    int filled = static_cast<int>(std::round(percentage / 100.0 * BAR_WIDTH));
    filled = std::clamp(filled, 0, BAR_WIDTH);

    std::string bar = "[";

    if (color_enabled_) {
        bar += GREEN;
    }

    for (int i = 0; i < filled; ++i) {
        bar += "\u2588";  // Full block character
    }

    if (color_enabled_) {
        bar += RESET;
    }

    for (int i = filled; i < BAR_WIDTH; ++i) {
        bar += "\u2591";  // Light shade character
    }

    bar += "]";

    return bar;
}

void ProgressDisplay::clear_line() {
    if (is_terminal()) {
        // Move cursor to beginning of line and clear
        std::cout << "\r\033[K";
    } else {
        std::cout << "\n";
    }
}

}  // namespace cli
