/**
 * @file CliApplication.hpp
 * @brief Command-line front end of the sanitization engine
 */

#pragma once

#include "audit/SessionSerializer.hpp"
#include "devices/IDeviceAccessor.hpp"
#include "engine/WipeConfig.hpp"
#include "engine/WipeOrchestrator.hpp"
#include "models/AuditTypes.hpp"
#include "models/WipeTypes.hpp"
#include "patterns/PatternGenerator.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cli {

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool list_standards = false;
    bool json_output = false;
    bool verbose = false;
    bool invalid = false;              ///< Unknown option or malformed argument
    std::string inventory_path;
    std::vector<std::string> device_ids;
    std::string standard_id;
    std::optional<std::string> confirmation;
    std::string config_path;
    std::string output_dir = ".";
    std::optional<uint64_t> simulate_bytes;
    std::string audit_path;
};

/**
 * @class CliApplication
 * @brief Command-line application for device sanitization
 *
 * Provides command-line interface for:
 * - Listing the standards catalog
 * - Sanitizing inventory devices (or simulated in-memory devices)
 * - Re-auditing a persisted session record
 */
class CliApplication {
public:
    CliApplication() = default;

    // Non-copyable
    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @param argc Argument count
     * @param argv Argument values
     * @return Exit code (0 = every session completed and compliant)
     */
    auto run(int argc, char* argv[]) -> int;

    /**
     * @brief Parse command line arguments
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    /**
     * @brief Forward a cancellation request to the orchestrator until done is set
     *
     * The request is re-asserted on every poll, so one raised before the run
     * resets its cancel state still stops it.
     */
    static void forward_cancellation(engine::WipeOrchestrator& orchestrator,
                                     const std::atomic<bool>& requested,
                                     const std::atomic<bool>& done,
                                     std::chrono::milliseconds poll = std::chrono::milliseconds{50});

    static void print_help();
    static void print_version();

private:
    auto cmd_list_standards(bool json) -> int;
    auto cmd_wipe(const CliOptions& options) -> int;
    auto cmd_audit(const CliOptions& options) -> int;

    /**
     * @brief Inventory and accessor factory for a real or simulated run
     */
    [[nodiscard]] auto prepare_devices(const CliOptions& options, const engine::WipeConfig& config,
                                       std::vector<DeviceInfo>& inventory)
        -> std::shared_ptr<devices::IAccessorFactory>;

    /**
     * @brief Read the confirmation token interactively when none was given
     */
    [[nodiscard]] static auto prompt_confirmation(const std::vector<std::string>& device_ids,
                                                  const std::string& standard,
                                                  const std::string& phrase) -> std::string;

    static void print_standards_table(const std::vector<Standard>& standards);
    static void print_verdict(const AuditVerdict& verdict);

    [[nodiscard]] static auto record_path(const std::filesystem::path& dir,
                                          const WipeSession& session) -> std::filesystem::path;

    patterns::PatternGenerator catalog_;
};

}  // namespace cli
