/**
 * @file WipeOrchestrator.cpp
 * @brief Sanitization state machine
 */

#include "engine/WipeOrchestrator.hpp"

#include "engine/ProgressChannel.hpp"
#include "engine/SafetyPolicy.hpp"
#include "util/Crypto.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

namespace engine {

namespace {

auto describe(const PassSpec& spec) -> std::string {
    auto text = std::string(to_string(spec.pattern));
    if (spec.is_deterministic()) {
        static constexpr char HEX[] = "0123456789ABCDEF";
        text += " 0x";
        text += HEX[spec.value >> 4];
        text += HEX[spec.value & 0x0F];
    } else if (!spec.seed_fingerprint.empty()) {
        text += " seed " + spec.seed_fingerprint;
    }
    return text;
}

auto skipped_pass(const PassSpec& spec, size_t index, uint64_t capacity, std::string note)
    -> PassResult {
    PassResult result;
    result.pass_index = index;
    result.pattern = spec.pattern;
    result.value = spec.value;
    result.total_bytes = capacity;
    result.status = PassStatus::SKIPPED;
    result.note = std::move(note);
    result.started_at = std::chrono::system_clock::now();
    result.finished_at = result.started_at;
    return result;
}

auto fallback_zero_pass() -> PassSpec {
    PassSpec spec;
    spec.pattern = PatternKind::ZERO;
    spec.value = 0x00;
    spec.verification = VerificationMode::NONE;
    return spec;
}

}  // namespace

WipeOrchestrator::WipeOrchestrator(WipeConfig config, std::vector<DeviceInfo> inventory,
                                   std::shared_ptr<devices::IAccessorFactory> factory,
                                   std::shared_ptr<const patterns::PatternGenerator> generator)
    : config_(std::move(config)), inventory_(std::move(inventory)), factory_(std::move(factory)),
      generator_(std::move(generator)), executor_(config_), verifier_(config_),
      state_(std::make_shared<ThreadState>()) {}

// ============================================================================
// Public API
// ============================================================================

auto WipeOrchestrator::run(const WipeRequest& request, ProgressSink sink)
    -> std::vector<std::shared_ptr<const WipeSession>> {
    std::lock_guard run_lock(run_mutex_);
    state_->cancel_requested.store(false);
    state_->operation_in_progress.store(true);

    // One session per distinct device id, in request order
    std::vector<std::string> device_ids;
    for (const auto& id : request.device_ids) {
        if (std::find(device_ids.begin(), device_ids.end(), id) == device_ids.end()) {
            device_ids.push_back(id);
        }
    }
    if (device_ids.empty()) {
        device_ids.emplace_back();
    }

    LOG_INFO("WipeOrchestrator", "Run requested: standard=" + request.standard_id + " devices=" +
                                     std::to_string(device_ids.size()));

    std::vector<std::shared_ptr<const WipeSession>> sessions(device_ids.size());

    if (auto valid = safety_policy::validate_request(request, config_.confirmation_phrase);
        !valid) {
        LOG_ERROR("WipeOrchestrator", "Request rejected: " + valid.error().message);
        for (size_t i = 0; i < device_ids.size(); ++i) {
            sessions[i] = reject(device_ids[i], request.standard_id, valid.error());
        }
        state_->operation_in_progress.store(false);
        return sessions;
    }

    std::unique_ptr<ProgressChannel> channel;
    ProgressSink publish;
    if (sink) {
        channel = std::make_unique<ProgressChannel>(config_.progress_queue_capacity);
        channel->subscribe(std::move(sink));
        publish = [channel_ptr = channel.get()](const ProgressEvent& event) {
            channel_ptr->publish(event);
        };
    }

    std::vector<std::exception_ptr> failures(device_ids.size());
    std::vector<std::thread> workers;
    workers.reserve(device_ids.size());
    for (size_t i = 0; i < device_ids.size(); ++i) {
        workers.emplace_back([this, i, &device_ids, &sessions, &failures, &request, &publish] {
            try {
                sessions[i] = run_session(device_ids[i], request.standard_id, publish);
            } catch (...) {
                failures[i] = std::current_exception();
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    if (channel) {
        channel->flush();
        channel->stop();
        std::lock_guard lock(history_mutex_);
        dropped_progress_events_ = channel->dropped_count();
    }
    state_->operation_in_progress.store(false);

    for (const auto& failure : failures) {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }
    return sessions;
}

void WipeOrchestrator::cancel() {
    if (!state_->cancel_requested.exchange(true)) {
        LOG_WARNING("WipeOrchestrator", "Cancellation requested");
    }
}

auto WipeOrchestrator::is_running() const -> bool {
    return state_->operation_in_progress.load();
}

auto WipeOrchestrator::is_cancel_requested() const -> bool {
    return state_->cancel_requested.load();
}

auto WipeOrchestrator::history() const -> std::vector<std::shared_ptr<const WipeSession>> {
    std::lock_guard lock(history_mutex_);
    return history_;
}

auto WipeOrchestrator::dropped_progress_events() const -> uint64_t {
    std::lock_guard lock(history_mutex_);
    return dropped_progress_events_;
}

// ============================================================================
// Session state machine
// ============================================================================

auto WipeOrchestrator::run_session(const std::string& device_id, const std::string& standard_id,
                                   const ProgressSink& sink)
    -> std::shared_ptr<const WipeSession> {
    DeviceInfo snapshot;
    snapshot.id = device_id;
    if (auto it = std::find_if(inventory_.begin(), inventory_.end(),
                               [&device_id](const DeviceInfo& d) { return d.id == device_id; });
        it != inventory_.end()) {
        snapshot = *it;
    }

    SessionRecorder recorder(make_session_id(device_id), snapshot, standard_id);

    // Validating
    recorder.transition(OrchestratorState::VALIDATING);
    std::set<std::string> completed;
    {
        std::lock_guard lock(history_mutex_);
        completed = completed_ids_;
    }
    auto target = safety_policy::validate_target(inventory_, device_id, completed);
    if (!target) {
        return fail_session(recorder, target.error());
    }
    const DeviceInfo device = *target;

    auto passes = generator_->generate(standard_id);
    if (!passes) {
        return fail_session(recorder, passes.error());
    }

    // SelectingAccessMode
    recorder.transition(OrchestratorState::SELECTING_ACCESS_MODE);
    auto access = select_access(recorder, device);
    if (!access) {
        return fail_session(recorder, access.error());
    }
    auto& accessor = **access;

    const size_t total_passes = passes->size();
    std::vector<PassSpec> plan = *passes;
    if (accessor.mode() == AccessMode::FALLBACK) {
        plan = {fallback_zero_pass()};
        recorder.note("Reduced pass set: single whole-device zero fill");
    }

    const bool any_required =
        std::any_of(passes->begin(), passes->end(),
                    [](const PassSpec& p) { return p.verification != VerificationMode::NONE; });

    SessionStatus status = SessionStatus::COMPLETED;
    for (size_t i = 0; i < total_passes; ++i) {
        const auto& required = (*passes)[i];

        if (i >= plan.size()) {
            recorder.add_pass(skipped_pass(required, i, accessor.capacity(),
                                           "Not possible through fallback access"));
            continue;
        }
        if (status != SessionStatus::COMPLETED) {
            recorder.add_pass(skipped_pass(required, i, accessor.capacity(),
                                           "Not run: session " +
                                               std::string(to_string(status))));
            continue;
        }

        ProgressContext context{device.id, i, total_passes};
        auto mode = effective_mode(required, i, total_passes, any_required,
                                   accessor.is_addressable());
        auto result = run_pass(recorder, accessor, plan[i], mode, context, sink);

        if (mode == VerificationMode::NONE && required.verification != VerificationMode::NONE &&
            result.verification.message.empty()) {
            result.verification.message = accessor.is_addressable()
                                              ? "Skipped by verification policy"
                                              : "Access path cannot read back";
        }

        if (result.status == PassStatus::ABORTED) {
            status = SessionStatus::ABORTED;
            recorder.set_failure(result.error.value_or(util::Error::cancelled()));
        } else if (result.status == PassStatus::FAILED) {
            status = SessionStatus::FAILED;
            recorder.set_failure(result.error.value_or(
                util::Error::device_io("Pass " + std::to_string(i + 1) + " failed", 0, false)));
        }
        recorder.add_pass(std::move(result));
    }

    accessor.close();

    if (status == SessionStatus::COMPLETED) {
        std::lock_guard lock(history_mutex_);
        completed_ids_.insert(device.id);
    }

    auto session = recorder.finalize(status);
    remember(session);
    return session;
}

auto WipeOrchestrator::reject(const std::string& device_id, const std::string& standard_id,
                              const util::Error& error) -> std::shared_ptr<const WipeSession> {
    DeviceInfo snapshot;
    snapshot.id = device_id;
    if (auto it = std::find_if(inventory_.begin(), inventory_.end(),
                               [&device_id](const DeviceInfo& d) { return d.id == device_id; });
        it != inventory_.end()) {
        snapshot = *it;
    }

    SessionRecorder recorder(make_session_id(device_id), std::move(snapshot), standard_id);
    recorder.transition(OrchestratorState::VALIDATING);
    return fail_session(recorder, error);
}

auto WipeOrchestrator::fail_session(SessionRecorder& recorder, const util::Error& error)
    -> std::shared_ptr<const WipeSession> {
    LOG_ERROR("WipeOrchestrator", std::string(util::to_string(error.kind)) + ": " + error.message);
    recorder.set_failure(error);
    auto session = recorder.finalize(SessionStatus::FAILED);
    remember(session);
    return session;
}

auto WipeOrchestrator::select_access(SessionRecorder& recorder, const DeviceInfo& device)
    -> std::expected<std::unique_ptr<devices::IDeviceAccessor>, util::Error> {
    std::optional<util::Error> denied;

    auto raw = factory_->create_raw(device);
    if (!raw) {
        denied = util::Error::access_denied("No direct access path for " + device.path);
    } else if (auto caps = raw->detect_capability(); !caps) {
        if (caps.error().kind != util::ErrorKind::ACCESS_DENIED) {
            return std::unexpected(caps.error());
        }
        denied = caps.error();
    } else if (auto opened = raw->open(); !opened) {
        if (opened.error().kind != util::ErrorKind::ACCESS_DENIED) {
            return std::unexpected(opened.error());
        }
        denied = opened.error();
    } else {
        recorder.set_access_mode(AccessMode::DIRECT);
        recorder.note("Direct access: " + caps->description);
        return raw;
    }

    LOG_WARNING("WipeOrchestrator",
                "Direct access to " + device.id + " denied: " + denied->message);

    auto fallback = factory_->create_fallback(device);
    if (!fallback) {
        auto error = *denied;
        error.message += "; no fallback access path available";
        return std::unexpected(std::move(error));
    }
    auto caps = fallback->detect_capability();
    if (!caps) {
        return std::unexpected(caps.error());
    }
    if (auto opened = fallback->open(); !opened) {
        return std::unexpected(opened.error());
    }

    recorder.set_access_mode(AccessMode::FALLBACK, denied->message);
    recorder.note("Access downgraded to fallback (" + caps->description + "): " +
                  denied->message);
    return fallback;
}

auto WipeOrchestrator::run_pass(SessionRecorder& recorder, devices::IDeviceAccessor& accessor,
                                PassSpec spec, VerificationMode mode,
                                const ProgressContext& context, const ProgressSink& sink)
    -> PassResult {
    const size_t index = context.pass_index;
    uint32_t reexecutions = 0;
    uint32_t attempts = 0;

    while (true) {
        recorder.transition(OrchestratorState::EXECUTING, index,
                            reexecutions == 0 ? describe(spec)
                                              : "re-execution " + std::to_string(reexecutions) +
                                                    ": " + describe(spec));

        auto result = write_with_retries(recorder, accessor, spec, context, sink);
        attempts += result.attempts;
        result.attempts = attempts;
        result.reexecutions = reexecutions;
        result.verification.mode = mode;

        if (result.status != PassStatus::SUCCEEDED || mode == VerificationMode::NONE) {
            return result;
        }

        recorder.transition(OrchestratorState::VERIFYING, index, std::string(to_string(mode)));
        result.verification = verify_with_retries(recorder, accessor, spec, mode, context, sink);
        result.finished_at = std::chrono::system_clock::now();

        switch (result.verification.outcome) {
            case VerificationOutcome::PASSED:
            case VerificationOutcome::NOT_PERFORMED:
                return result;
            case VerificationOutcome::ABORTED:
                result.status = PassStatus::ABORTED;
                result.error = util::Error::cancelled();
                return result;
            case VerificationOutcome::ERROR:
                result.status = PassStatus::FAILED;
                result.error = result.verification.error.value_or(
                    util::Error::device_io(result.verification.message, 0, false));
                return result;
            case VerificationOutcome::FAILED:
                break;
        }

        const uint64_t mismatch = result.verification.mismatch_offset.value_or(0);
        if (reexecutions < config_.max_pass_reexecutions && !is_cancel_requested()) {
            ++reexecutions;
            recorder.note("Verification failed at offset " + std::to_string(mismatch) +
                              "; rewriting pass (" + std::to_string(reexecutions) + "/" +
                              std::to_string(config_.max_pass_reexecutions) + ")",
                          index);
            if (auto seeded = patterns::PatternGenerator::reseed(spec); !seeded) {
                result.status = PassStatus::FAILED;
                result.error = seeded.error();
                return result;
            }
            continue;
        }

        result.status = PassStatus::FAILED;
        result.error = util::Error::verification_failed(mismatch);
        return result;
    }
}

auto WipeOrchestrator::write_with_retries(SessionRecorder& recorder,
                                          devices::IDeviceAccessor& accessor,
                                          const PassSpec& spec, const ProgressContext& context,
                                          const ProgressSink& sink) -> PassResult {
    PassResult merged;
    uint32_t retries = 0;
    uint64_t confirmed = 0;

    while (true) {
        auto attempt = executor_.execute_pass(accessor, spec, context, sink,
                                              state_->cancel_requested, confirmed);
        if (retries == 0) {
            merged = std::move(attempt);
        } else {
            merged.bytes_written = attempt.bytes_written;
            merged.status = attempt.status;
            merged.error = std::move(attempt.error);
            merged.note = std::move(attempt.note);
            merged.finished_at = attempt.finished_at;
            merged.throughput_samples.insert(merged.throughput_samples.end(),
                                             attempt.throughput_samples.begin(),
                                             attempt.throughput_samples.end());
        }
        merged.attempts = retries + 1;

        const bool retryable = merged.status == PassStatus::FAILED && merged.error &&
                               merged.error->kind == util::ErrorKind::DEVICE_IO &&
                               merged.error->transient;
        if (!retryable) {
            return merged;
        }
        if (retries >= config_.max_io_retries) {
            recorder.note("I/O retries exhausted after " + std::to_string(retries + 1) +
                              " attempts: " + merged.error->message,
                          context.pass_index);
            return merged;
        }

        ++retries;
        const auto delay = backoff_delay(retries);
        recorder.note("Transient I/O error at offset " +
                          std::to_string(merged.error->offset.value_or(merged.bytes_written)) +
                          ": " + merged.error->message + "; retry " + std::to_string(retries) +
                          "/" + std::to_string(config_.max_io_retries) + " in " +
                          std::to_string(delay.count()) + " ms",
                      context.pass_index);
        if (!wait_backoff(delay)) {
            merged.status = PassStatus::ABORTED;
            merged.error = util::Error::cancelled();
            return merged;
        }
        confirmed = merged.bytes_written;
    }
}

auto WipeOrchestrator::verify_with_retries(SessionRecorder& recorder,
                                           devices::IDeviceAccessor& accessor,
                                           const PassSpec& spec, VerificationMode mode,
                                           const ProgressContext& context,
                                           const ProgressSink& sink) -> VerificationResult {
    uint32_t retries = 0;
    while (true) {
        auto result = verifier_.verify(accessor, spec, mode, state_->cancel_requested, context,
                                       sink);
        const bool retryable = result.outcome == VerificationOutcome::ERROR && result.error &&
                               result.error->kind == util::ErrorKind::DEVICE_IO &&
                               result.error->transient;
        if (!retryable || retries >= config_.max_io_retries) {
            return result;
        }

        ++retries;
        const auto delay = backoff_delay(retries);
        recorder.note("Read error during verification: " + result.message + "; retry " +
                          std::to_string(retries) + "/" +
                          std::to_string(config_.max_io_retries),
                      context.pass_index);
        if (!wait_backoff(delay)) {
            result.outcome = VerificationOutcome::ABORTED;
            result.message = "Verification cancelled";
            return result;
        }
    }
}

auto WipeOrchestrator::effective_mode(const PassSpec& required, size_t pass_index,
                                      size_t total_passes, bool any_required,
                                      bool addressable) const -> VerificationMode {
    if (!addressable) {
        return VerificationMode::NONE;
    }

    VerificationMode mode = required.verification;
    switch (config_.verification_policy) {
        case VerificationPolicy::SKIP:
            return VerificationMode::NONE;
        case VerificationPolicy::ALWAYS_FULL:
            return VerificationMode::FULL_SCAN;
        case VerificationPolicy::SAMPLED_ONLY:
            if (mode != VerificationMode::NONE) {
                mode = VerificationMode::SAMPLED;
            }
            break;
        case VerificationPolicy::AS_REQUIRED:
            break;
    }

    if (mode == VerificationMode::NONE && !any_required && config_.verify_final_pass_by_default &&
        pass_index + 1 == total_passes) {
        mode = VerificationMode::SAMPLED;
    }
    return mode;
}

auto WipeOrchestrator::backoff_delay(uint32_t retry) const -> std::chrono::milliseconds {
    auto delay = config_.retry_backoff;
    for (uint32_t i = 1; i < retry && delay < config_.max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, config_.max_backoff);
}

auto WipeOrchestrator::wait_backoff(std::chrono::milliseconds delay) const -> bool {
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < deadline) {
        if (state_->cancel_requested.load()) {
            return false;
        }
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(BACKOFF_POLL_INTERVAL,
                                                          deadline - std::chrono::steady_clock::now()));
    }
    return !state_->cancel_requested.load();
}

auto WipeOrchestrator::make_session_id(const std::string& device_id) const -> std::string {
    if (auto id = util::random_hex_id(16)) {
        return *id;
    } else {
        LOG_WARNING("WipeOrchestrator", "Random session id unavailable: " + id.error().message);
    }
    const auto now = std::chrono::system_clock::now().time_since_epoch().count();
    auto digest = util::sha256(device_id + ":" + std::to_string(now));
    return util::to_hex(std::span<const uint8_t>(digest.data(), 16));
}

void WipeOrchestrator::remember(const std::shared_ptr<const WipeSession>& session) {
    std::lock_guard lock(history_mutex_);
    history_.push_back(session);
}

}  // namespace engine
