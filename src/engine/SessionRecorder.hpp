/**
 * @file SessionRecorder.hpp
 * @brief Builds a WipeSession and seals it on a terminal state
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <memory>
#include <optional>
#include <string>

namespace engine {

/**
 * @class SessionRecorder
 * @brief Sole writer of one WipeSession
 *
 * Every state change is appended to the session event log and logged.
 * finalize() hands out the session as an immutable shared_ptr; any
 * mutation afterwards throws std::logic_error.
 */
class SessionRecorder {
public:
    SessionRecorder(std::string session_id, DeviceInfo device, std::string standard_id);

    void transition(OrchestratorState state, std::optional<size_t> pass_index = std::nullopt,
                    std::string message = {});

    /**
     * @brief Append an event without changing state (retries, downgrades)
     */
    void note(std::string message, std::optional<size_t> pass_index = std::nullopt);

    void set_device(DeviceInfo device);
    void set_access_mode(AccessMode mode, std::string reason = {});
    void add_pass(PassResult pass);
    void set_failure(util::Error error);

    /**
     * @brief Seal the session with a terminal status
     * @param status COMPLETED, ABORTED or FAILED
     */
    [[nodiscard]] auto finalize(SessionStatus status) -> std::shared_ptr<const WipeSession>;

    [[nodiscard]] auto state() const -> OrchestratorState { return state_; }
    [[nodiscard]] auto is_finalized() const -> bool { return finalized_; }

    /**
     * @brief Read access to the session being built
     */
    [[nodiscard]] auto session() const -> const WipeSession&;

private:
    void ensure_mutable() const;
    void append_event(OrchestratorState state, std::optional<size_t> pass_index,
                      std::string message);

    std::string session_id_;
    std::unique_ptr<WipeSession> session_;
    OrchestratorState state_ = OrchestratorState::IDLE;
    bool finalized_ = false;
};

}  // namespace engine
