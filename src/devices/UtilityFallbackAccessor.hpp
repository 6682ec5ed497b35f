/**
 * @file UtilityFallbackAccessor.hpp
 * @brief Reduced-fidelity access through an OS disk-clearing utility
 */

#pragma once

#include "devices/IDeviceAccessor.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace devices {

/**
 * @class IUtilityRunner
 * @brief Runs an external program to completion
 */
class IUtilityRunner {
public:
    virtual ~IUtilityRunner() = default;

    /**
     * @brief Run argv and wait for it to exit
     * @param argv Program and arguments (argv[0] is looked up in PATH)
     * @param cancel_flag Terminates the child when set
     * @return Exit status, DeviceIOError if it could not be spawned,
     *         CancellationRequested if it was terminated
     */
    [[nodiscard]] virtual auto run(const std::vector<std::string>& argv,
                                   const std::atomic<bool>& cancel_flag)
        -> std::expected<int, util::Error> = 0;

    [[nodiscard]] virtual auto is_available(const std::string& program) const -> bool = 0;
};

/**
 * @class ProcessUtilityRunner
 * @brief IUtilityRunner backed by GLib process spawning
 */
class ProcessUtilityRunner : public IUtilityRunner {
public:
    [[nodiscard]] auto run(const std::vector<std::string>& argv,
                           const std::atomic<bool>& cancel_flag)
        -> std::expected<int, util::Error> override;

    [[nodiscard]] auto is_available(const std::string& program) const -> bool override;
};

/**
 * @class UtilityFallbackAccessor
 * @brief Whole-device zero fill through a utility such as blkdiscard
 *
 * Not addressable: write_chunk() and read_chunk() return Unsupported, so
 * only a single zero pass without read-back is possible.
 */
class UtilityFallbackAccessor : public IDeviceAccessor {
public:
    /**
     * @param device Target device
     * @param command_template argv with "{path}" replaced by the device path
     * @param runner Process runner
     */
    UtilityFallbackAccessor(DeviceInfo device, std::vector<std::string> command_template,
                            std::shared_ptr<IUtilityRunner> runner);

    [[nodiscard]] auto detect_capability()
        -> std::expected<AccessCapabilities, util::Error> override;
    [[nodiscard]] auto open() -> std::expected<void, util::Error> override;
    [[nodiscard]] auto write_chunk(uint64_t offset, std::span<const uint8_t> data)
        -> std::expected<void, util::Error> override;
    [[nodiscard]] auto read_chunk(uint64_t offset, std::span<uint8_t> out)
        -> std::expected<void, util::Error> override;
    [[nodiscard]] auto zero_fill_device(const std::atomic<bool>& cancel_flag)
        -> std::expected<void, util::Error> override;
    [[nodiscard]] auto flush() -> std::expected<void, util::Error> override;
    void close() override;

    [[nodiscard]] auto capacity() const -> uint64_t override { return device_.capacity_bytes; }
    [[nodiscard]] auto mode() const -> AccessMode override { return AccessMode::FALLBACK; }
    [[nodiscard]] auto is_open() const -> bool override { return open_; }

    /**
     * @brief The argv that zero_fill_device() runs
     */
    [[nodiscard]] auto command() const -> std::vector<std::string>;

private:
    DeviceInfo device_;
    std::vector<std::string> command_template_;
    std::shared_ptr<IUtilityRunner> runner_;
    bool open_ = false;
};

/**
 * @class SystemAccessorFactory
 * @brief Raw pread/pwrite access with a utility fallback
 */
class SystemAccessorFactory : public IAccessorFactory {
public:
    explicit SystemAccessorFactory(std::vector<std::string> fallback_command,
                                   std::shared_ptr<IUtilityRunner> runner =
                                       std::make_shared<ProcessUtilityRunner>());

    [[nodiscard]] auto create_raw(const DeviceInfo& device)
        -> std::unique_ptr<IDeviceAccessor> override;
    [[nodiscard]] auto create_fallback(const DeviceInfo& device)
        -> std::unique_ptr<IDeviceAccessor> override;

private:
    std::vector<std::string> fallback_command_;
    std::shared_ptr<IUtilityRunner> runner_;
};

}  // namespace devices
