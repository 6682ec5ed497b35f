/**
 * @file UtilityFallbackAccessor.cpp
 * @brief Utility-based fallback access path
 */

#include "devices/UtilityFallbackAccessor.hpp"

#include "devices/RawDeviceAccessor.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <thread>
#include <utility>

#include <sys/types.h>
#include <sys/wait.h>

namespace devices {

namespace {
constexpr auto CHILD_POLL_INTERVAL = std::chrono::milliseconds{50};
constexpr std::string_view PATH_PLACEHOLDER = "{path}";

auto join(const std::vector<std::string>& argv) -> std::string {
    std::string result;
    for (const auto& arg : argv) {
        if (!result.empty()) {
            result += ' ';
        }
        result += arg;
    }
    return result;
}
}  // namespace

// ============================================================================
// ProcessUtilityRunner
// ============================================================================

auto ProcessUtilityRunner::run(const std::vector<std::string>& argv,
                               const std::atomic<bool>& cancel_flag)
    -> std::expected<int, util::Error> {
    if (argv.empty()) {
        return std::unexpected(util::Error::configuration("Utility command is empty"));
    }

    std::vector<gchar*> argv_vec;
    argv_vec.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        argv_vec.push_back(const_cast<gchar*>(arg.c_str()));
    }
    argv_vec.push_back(nullptr);

    GPid child_pid = 0;
    GError* error = nullptr;

    gboolean spawned = g_spawn_async(
        nullptr,
        argv_vec.data(),
        nullptr,
        static_cast<GSpawnFlags>(G_SPAWN_SEARCH_PATH | G_SPAWN_DO_NOT_REAP_CHILD |
                                 G_SPAWN_STDOUT_TO_DEV_NULL),
        nullptr,
        nullptr,
        &child_pid,
        &error);

    if (!spawned) {
        std::string message = "Failed to spawn " + argv.front() + ": " +
                              (error ? error->message : "Unknown error");
        if (error) {
            g_error_free(error);
        }
        return std::unexpected(util::Error::device_io(std::move(message), 0, false));
    }

    int wait_status = 0;
    bool cancelled = false;
    while (true) {
        pid_t result = waitpid(child_pid, &wait_status, WNOHANG);
        if (result == child_pid) {
            break;
        }
        if (result < 0 && errno != EINTR) {
            const int err = errno;
            g_spawn_close_pid(child_pid);
            return std::unexpected(util::Error::device_io(
                "Lost track of " + argv.front() + " (waitpid failed)", err, false));
        }
        if (!cancelled && cancel_flag.load()) {
            LOG_WARNING("ProcessUtilityRunner", "Terminating " + argv.front() + " on cancel");
            kill(child_pid, SIGTERM);
            cancelled = true;
        }
        std::this_thread::sleep_for(CHILD_POLL_INTERVAL);
    }
    g_spawn_close_pid(child_pid);

    if (cancelled) {
        return std::unexpected(util::Error::cancelled());
    }
    if (WIFEXITED(wait_status)) {
        return WEXITSTATUS(wait_status);
    }
    return std::unexpected(util::Error::device_io(
        argv.front() + " terminated by signal " + std::to_string(WTERMSIG(wait_status)), 0,
        false));
}

auto ProcessUtilityRunner::is_available(const std::string& program) const -> bool {
    gchar* found = g_find_program_in_path(program.c_str());
    if (!found) {
        return false;
    }
    g_free(found);
    return true;
}

// ============================================================================
// UtilityFallbackAccessor
// ============================================================================

UtilityFallbackAccessor::UtilityFallbackAccessor(DeviceInfo device,
                                                 std::vector<std::string> command_template,
                                                 std::shared_ptr<IUtilityRunner> runner)
    : device_(std::move(device)), command_template_(std::move(command_template)),
      runner_(std::move(runner)) {}

auto UtilityFallbackAccessor::command() const -> std::vector<std::string> {
    std::vector<std::string> argv;
    argv.reserve(command_template_.size());
    for (auto arg : command_template_) {
        for (auto pos = arg.find(PATH_PLACEHOLDER); pos != std::string::npos;
             pos = arg.find(PATH_PLACEHOLDER, pos + device_.path.size())) {
            arg.replace(pos, PATH_PLACEHOLDER.size(), device_.path);
        }
        argv.push_back(std::move(arg));
    }
    return argv;
}

auto UtilityFallbackAccessor::detect_capability()
    -> std::expected<AccessCapabilities, util::Error> {
    if (command_template_.empty()) {
        return std::unexpected(util::Error::access_denied("No fallback utility configured"));
    }
    if (!runner_->is_available(command_template_.front())) {
        return std::unexpected(
            util::Error::access_denied("Fallback utility not found: " + command_template_.front()));
    }

    AccessCapabilities caps;
    caps.mode = AccessMode::FALLBACK;
    caps.addressable = false;
    caps.can_verify = false;
    caps.capacity_bytes = device_.capacity_bytes;
    caps.description = "utility: " + join(command());
    return caps;
}

auto UtilityFallbackAccessor::open() -> std::expected<void, util::Error> {
    open_ = true;
    return {};
}

auto UtilityFallbackAccessor::write_chunk(uint64_t /*offset*/, std::span<const uint8_t> /*data*/)
    -> std::expected<void, util::Error> {
    return std::unexpected(util::Error::unsupported("Fallback access is not addressable"));
}

auto UtilityFallbackAccessor::read_chunk(uint64_t /*offset*/, std::span<uint8_t> /*out*/)
    -> std::expected<void, util::Error> {
    return std::unexpected(util::Error::unsupported("Fallback access cannot read back"));
}

auto UtilityFallbackAccessor::zero_fill_device(const std::atomic<bool>& cancel_flag)
    -> std::expected<void, util::Error> {
    if (!open_) {
        return std::unexpected(util::Error::device_io("Device is not open", EBADF, false));
    }
    if (cancel_flag.load()) {
        return std::unexpected(util::Error::cancelled());
    }

    auto argv = command();
    LOG_INFO("UtilityFallbackAccessor", "Running: " + join(argv));

    auto status = runner_->run(argv, cancel_flag);
    if (!status) {
        return std::unexpected(status.error());
    }
    if (*status != 0) {
        return std::unexpected(util::Error::device_io(
            argv.front() + " exited with status " + std::to_string(*status), *status, false));
    }
    return {};
}

auto UtilityFallbackAccessor::flush() -> std::expected<void, util::Error> {
    return {};
}

void UtilityFallbackAccessor::close() {
    open_ = false;
}

// ============================================================================
// SystemAccessorFactory
// ============================================================================

SystemAccessorFactory::SystemAccessorFactory(std::vector<std::string> fallback_command,
                                             std::shared_ptr<IUtilityRunner> runner)
    : fallback_command_(std::move(fallback_command)), runner_(std::move(runner)) {}

auto SystemAccessorFactory::create_raw(const DeviceInfo& device)
    -> std::unique_ptr<IDeviceAccessor> {
    return std::make_unique<RawDeviceAccessor>(device);
}

auto SystemAccessorFactory::create_fallback(const DeviceInfo& device)
    -> std::unique_ptr<IDeviceAccessor> {
    if (fallback_command_.empty()) {
        return nullptr;
    }
    return std::make_unique<UtilityFallbackAccessor>(device, fallback_command_, runner_);
}

}  // namespace devices
