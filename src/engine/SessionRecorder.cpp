/**
 * @file SessionRecorder.cpp
 */

#include "engine/SessionRecorder.hpp"

#include "util/Logger.hpp"

#include <stdexcept>
#include <utility>

namespace engine {

SessionRecorder::SessionRecorder(std::string session_id, DeviceInfo device,
                                 std::string standard_id)
    : session_id_(session_id), session_(std::make_unique<WipeSession>()) {
    session_->session_id = std::move(session_id);
    session_->device = std::move(device);
    session_->standard_id = std::move(standard_id);
    session_->started_at = std::chrono::system_clock::now();
    append_event(OrchestratorState::IDLE, std::nullopt, "Session created");
}

void SessionRecorder::ensure_mutable() const {
    if (finalized_) {
        throw std::logic_error("Session " + session_id_ + " is finalized");
    }
}

void SessionRecorder::append_event(OrchestratorState state, std::optional<size_t> pass_index,
                                   std::string message) {
    std::string line = "[" + session_->device.id + "] " + std::string(to_string(state));
    if (pass_index) {
        line += " pass " + std::to_string(*pass_index + 1);
    }
    if (!message.empty()) {
        line += ": " + message;
    }
    LOG_INFO("WipeOrchestrator", line);

    SessionEvent event;
    event.at = std::chrono::system_clock::now();
    event.state = state;
    event.pass_index = pass_index;
    event.message = std::move(message);
    session_->events.push_back(std::move(event));
}

void SessionRecorder::transition(OrchestratorState state, std::optional<size_t> pass_index,
                                 std::string message) {
    ensure_mutable();
    state_ = state;
    append_event(state, pass_index, std::move(message));
}

void SessionRecorder::note(std::string message, std::optional<size_t> pass_index) {
    ensure_mutable();
    append_event(state_, pass_index, std::move(message));
}

void SessionRecorder::set_device(DeviceInfo device) {
    ensure_mutable();
    session_->device = std::move(device);
}

void SessionRecorder::set_access_mode(AccessMode mode, std::string reason) {
    ensure_mutable();
    session_->access_mode = mode;
    session_->downgrade_reason = std::move(reason);
}

void SessionRecorder::add_pass(PassResult pass) {
    ensure_mutable();
    session_->passes.push_back(std::move(pass));
}

void SessionRecorder::set_failure(util::Error error) {
    ensure_mutable();
    session_->failure = std::move(error);
}

auto SessionRecorder::session() const -> const WipeSession& {
    if (finalized_) {
        throw std::logic_error("Session was handed out on finalize");
    }
    return *session_;
}

auto SessionRecorder::finalize(SessionStatus status) -> std::shared_ptr<const WipeSession> {
    ensure_mutable();
    if (status == SessionStatus::PENDING) {
        throw std::logic_error("A session cannot be finalized as pending");
    }

    transition(OrchestratorState::FINALIZING);

    OrchestratorState terminal = OrchestratorState::COMPLETED;
    if (status == SessionStatus::ABORTED) {
        terminal = OrchestratorState::ABORTED;
    } else if (status == SessionStatus::FAILED) {
        terminal = OrchestratorState::FAILED;
    }

    std::string summary = std::to_string(session_->total_bytes_written()) + " bytes written";
    if (session_->failure) {
        summary += "; " + std::string(util::to_string(session_->failure->kind)) + ": " +
                   session_->failure->message;
    }
    transition(terminal, std::nullopt, std::move(summary));

    session_->status = status;
    session_->finished_at = std::chrono::system_clock::now();
    session_->finalized = true;
    finalized_ = true;

    std::shared_ptr<const WipeSession> sealed = std::move(session_);
    return sealed;
}

}  // namespace engine
