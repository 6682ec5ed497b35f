/**
 * @file WipeOrchestrator.hpp
 * @brief Per-device sanitization state machine and multi-device runs
 */

#pragma once

#include "devices/IDeviceAccessor.hpp"
#include "engine/PassExecutor.hpp"
#include "engine/ProgressTracker.hpp"
#include "engine/SessionRecorder.hpp"
#include "engine/Verifier.hpp"
#include "engine/WipeConfig.hpp"
#include "models/WipeTypes.hpp"
#include "patterns/PatternGenerator.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace engine {

/**
 * @class WipeOrchestrator
 * @brief Drives sessions through Validating, SelectingAccessMode,
 *        Executing/Verifying per pass, Finalizing and a terminal state
 *
 * Each requested device runs as an independent session on its own thread
 * with its own accessor. Every session ends finalized, including rejected
 * and failed ones.
 *
 * Usage:
 * @code
 * engine::WipeOrchestrator orchestrator(config, inventory, factory);
 * auto sessions = orchestrator.run({{"sdb"}, "BSI_VS_A", "ERASE"}, on_progress);
 * @endcode
 */
class WipeOrchestrator {
public:
    WipeOrchestrator(WipeConfig config, std::vector<DeviceInfo> inventory,
                     std::shared_ptr<devices::IAccessorFactory> factory,
                     std::shared_ptr<const patterns::PatternGenerator> generator =
                         std::make_shared<patterns::PatternGenerator>());

    WipeOrchestrator(const WipeOrchestrator&) = delete;
    WipeOrchestrator& operator=(const WipeOrchestrator&) = delete;

    /**
     * @brief Sanitize every device of the request
     * @param request Devices, standard and confirmation token
     * @param sink Progress consumer, fed from a separate thread (may be empty)
     * @return Finalized sessions in request order (one per distinct device id)
     *
     * Blocks until all sessions are finalized. Concurrent calls are serialized.
     */
    auto run(const WipeRequest& request, ProgressSink sink = {})
        -> std::vector<std::shared_ptr<const WipeSession>>;

    /**
     * @brief Request cooperative cancellation of all running sessions
     *
     * Observed between chunks, between passes and during retry backoff.
     */
    void cancel();

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto is_cancel_requested() const -> bool;

    /**
     * @brief Every session this orchestrator finalized, oldest first
     */
    [[nodiscard]] auto history() const -> std::vector<std::shared_ptr<const WipeSession>>;

    [[nodiscard]] auto config() const -> const WipeConfig& { return config_; }
    [[nodiscard]] auto generator() const -> const patterns::PatternGenerator& { return *generator_; }

    /**
     * @brief Progress events dropped by the last run's channel
     */
    [[nodiscard]] auto dropped_progress_events() const -> uint64_t;

private:
    struct ThreadState {
        std::atomic<bool> cancel_requested{false};
        std::atomic<bool> operation_in_progress{false};
    };

    static constexpr auto BACKOFF_POLL_INTERVAL = std::chrono::milliseconds{10};

    [[nodiscard]] auto run_session(const std::string& device_id, const std::string& standard_id,
                                   const ProgressSink& sink) -> std::shared_ptr<const WipeSession>;

    [[nodiscard]] auto reject(const std::string& device_id, const std::string& standard_id,
                              const util::Error& error) -> std::shared_ptr<const WipeSession>;

    [[nodiscard]] auto fail_session(SessionRecorder& recorder, const util::Error& error)
        -> std::shared_ptr<const WipeSession>;

    [[nodiscard]] auto select_access(SessionRecorder& recorder, const DeviceInfo& device)
        -> std::expected<std::unique_ptr<devices::IDeviceAccessor>, util::Error>;

    [[nodiscard]] auto run_pass(SessionRecorder& recorder, devices::IDeviceAccessor& accessor,
                                PassSpec spec, VerificationMode mode,
                                const ProgressContext& context, const ProgressSink& sink)
        -> PassResult;

    [[nodiscard]] auto write_with_retries(SessionRecorder& recorder,
                                          devices::IDeviceAccessor& accessor,
                                          const PassSpec& spec, const ProgressContext& context,
                                          const ProgressSink& sink) -> PassResult;

    [[nodiscard]] auto verify_with_retries(SessionRecorder& recorder,
                                           devices::IDeviceAccessor& accessor,
                                           const PassSpec& spec, VerificationMode mode,
                                           const ProgressContext& context,
                                           const ProgressSink& sink) -> VerificationResult;

    /**
     * @brief Verification actually performed for a pass under the configured policy
     */
    [[nodiscard]] auto effective_mode(const PassSpec& required, size_t pass_index,
                                      size_t total_passes, bool any_required,
                                      bool addressable) const -> VerificationMode;

    [[nodiscard]] auto backoff_delay(uint32_t retry) const -> std::chrono::milliseconds;

    /**
     * @brief Sleep for delay unless cancelled first
     * @return false if cancellation was requested
     */
    [[nodiscard]] auto wait_backoff(std::chrono::milliseconds delay) const -> bool;

    [[nodiscard]] auto make_session_id(const std::string& device_id) const -> std::string;

    void remember(const std::shared_ptr<const WipeSession>& session);

    WipeConfig config_;
    std::vector<DeviceInfo> inventory_;
    std::shared_ptr<devices::IAccessorFactory> factory_;
    std::shared_ptr<const patterns::PatternGenerator> generator_;
    PassExecutor executor_;
    Verifier verifier_;

    std::shared_ptr<ThreadState> state_;
    std::mutex run_mutex_;

    mutable std::mutex history_mutex_;
    std::vector<std::shared_ptr<const WipeSession>> history_;
    std::set<std::string> completed_ids_;
    uint64_t dropped_progress_events_ = 0;
};

}  // namespace engine
