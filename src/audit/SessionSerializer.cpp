/**
 * @file SessionSerializer.cpp
 */

#include "audit/SessionSerializer.hpp"

#include "util/Crypto.hpp"
#include "util/Logger.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace audit {

namespace {

using nlohmann::json;

class RecordError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template <typename Enum, typename Parser>
auto read_enum(const json& j, const char* key, Parser parse) -> Enum {
    const auto name = j.at(key).get<std::string>();
    auto value = parse(name);
    if (!value) {
        throw RecordError(std::string("Invalid value '") + name + "' for " + key);
    }
    return *value;
}

auto to_millis(Timestamp at) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
}

auto from_millis(int64_t ms) -> Timestamp {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds{ms})};
}

auto optional_index(const std::optional<size_t>& index) -> json {
    return index ? json(*index) : json(nullptr);
}

auto read_optional_index(const json& j, const char* key) -> std::optional<size_t> {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<size_t>();
}

// ---------------------------------------------------------------------------
// Writers
// ---------------------------------------------------------------------------

auto error_json(const util::Error& error) -> json {
    return {{"kind", util::to_string(error.kind)},
            {"message", error.message},
            {"code", error.code},
            {"offset", error.offset ? json(*error.offset) : json(nullptr)},
            {"transient", error.transient}};
}

auto device_json(const DeviceInfo& device) -> json {
    return {{"id", device.id},
            {"path", device.path},
            {"capacity_bytes", device.capacity_bytes},
            {"sector_size", device.sector_size},
            {"model", device.model},
            {"serial", device.serial},
            {"is_removable", device.is_removable},
            {"is_system_disk", device.is_system_disk}};
}

auto verification_json(const VerificationResult& result) -> json {
    json j = {{"mode", to_string(result.mode)},
              {"outcome", to_string(result.outcome)},
              {"bytes_verified", result.bytes_verified},
              {"mismatch_offset",
               result.mismatch_offset ? json(*result.mismatch_offset) : json(nullptr)},
              {"sampled_ranges", result.sampled_ranges},
              {"confidence", result.confidence},
              {"message", result.message}};
    j["error"] = result.error ? error_json(*result.error) : json(nullptr);
    return j;
}

auto pass_json(const PassResult& pass) -> json {
    json samples = json::array();
    for (const auto& sample : pass.throughput_samples) {
        samples.push_back({sample.elapsed_ms, sample.bytes_done, sample.bytes_per_sec});
    }

    json j = {{"pass_index", pass.pass_index},
              {"pattern", to_string(pass.pattern)},
              {"value", pass.value},
              {"seed_fingerprint", pass.seed_fingerprint},
              {"bytes_written", pass.bytes_written},
              {"total_bytes", pass.total_bytes},
              {"attempts", pass.attempts},
              {"reexecutions", pass.reexecutions},
              {"throughput_samples", std::move(samples)},
              {"verification", verification_json(pass.verification)},
              {"status", to_string(pass.status)},
              {"note", pass.note},
              {"started_at_ms", to_millis(pass.started_at)},
              {"finished_at_ms", to_millis(pass.finished_at)}};
    j["error"] = pass.error ? error_json(*pass.error) : json(nullptr);
    return j;
}

auto session_json(const WipeSession& session) -> json {
    json passes = json::array();
    for (const auto& pass : session.passes) {
        passes.push_back(pass_json(pass));
    }

    json events = json::array();
    for (const auto& event : session.events) {
        events.push_back({{"at_ms", to_millis(event.at)},
                          {"state", to_string(event.state)},
                          {"pass_index", optional_index(event.pass_index)},
                          {"message", event.message}});
    }

    json j = {{"session_id", session.session_id},
              {"device", device_json(session.device)},
              {"standard_id", session.standard_id},
              {"access_mode", to_string(session.access_mode)},
              {"downgrade_reason", session.downgrade_reason},
              {"passes", std::move(passes)},
              {"status", to_string(session.status)},
              {"started_at_ms", to_millis(session.started_at)},
              {"finished_at_ms", to_millis(session.finished_at)},
              {"total_bytes_written", session.total_bytes_written()},
              {"events", std::move(events)},
              {"finalized", session.finalized}};
    j["failure"] = session.failure ? error_json(*session.failure) : json(nullptr);
    return j;
}

// ---------------------------------------------------------------------------
// Readers
// ---------------------------------------------------------------------------

auto read_error(const json& j) -> util::Error {
    util::Error error;
    error.kind = read_enum<util::ErrorKind>(j, "kind", util::error_kind_from_string);
    error.message = j.at("message").get<std::string>();
    error.code = j.at("code").get<int>();
    if (!j.at("offset").is_null()) {
        error.offset = j.at("offset").get<uint64_t>();
    }
    error.transient = j.at("transient").get<bool>();
    return error;
}

auto read_optional_error(const json& j, const char* key) -> std::optional<util::Error> {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return read_error(j.at(key));
}

auto read_device(const json& j) -> DeviceInfo {
    DeviceInfo device;
    device.id = j.at("id").get<std::string>();
    device.path = j.at("path").get<std::string>();
    device.capacity_bytes = j.at("capacity_bytes").get<uint64_t>();
    device.sector_size = j.at("sector_size").get<uint32_t>();
    device.model = j.at("model").get<std::string>();
    device.serial = j.at("serial").get<std::string>();
    device.is_removable = j.at("is_removable").get<bool>();
    device.is_system_disk = j.at("is_system_disk").get<bool>();
    return device;
}

auto read_verification(const json& j) -> VerificationResult {
    VerificationResult result;
    result.mode = read_enum<VerificationMode>(j, "mode", verification_mode_from_string);
    result.outcome =
        read_enum<VerificationOutcome>(j, "outcome", verification_outcome_from_string);
    result.bytes_verified = j.at("bytes_verified").get<uint64_t>();
    if (!j.at("mismatch_offset").is_null()) {
        result.mismatch_offset = j.at("mismatch_offset").get<uint64_t>();
    }
    result.sampled_ranges = j.at("sampled_ranges").get<uint64_t>();
    result.confidence = j.at("confidence").get<double>();
    result.message = j.at("message").get<std::string>();
    result.error = read_optional_error(j, "error");
    return result;
}

auto read_pass(const json& j) -> PassResult {
    PassResult pass;
    pass.pass_index = j.at("pass_index").get<size_t>();
    pass.pattern = read_enum<PatternKind>(j, "pattern", pattern_kind_from_string);
    pass.value = j.at("value").get<uint8_t>();
    pass.seed_fingerprint = j.at("seed_fingerprint").get<std::string>();
    pass.bytes_written = j.at("bytes_written").get<uint64_t>();
    pass.total_bytes = j.at("total_bytes").get<uint64_t>();
    pass.attempts = j.at("attempts").get<uint32_t>();
    pass.reexecutions = j.at("reexecutions").get<uint32_t>();
    for (const auto& sample : j.at("throughput_samples")) {
        pass.throughput_samples.push_back({sample.at(0).get<uint64_t>(),
                                           sample.at(1).get<uint64_t>(),
                                           sample.at(2).get<uint64_t>()});
    }
    pass.verification = read_verification(j.at("verification"));
    pass.status = read_enum<PassStatus>(j, "status", pass_status_from_string);
    pass.error = read_optional_error(j, "error");
    pass.note = j.at("note").get<std::string>();
    pass.started_at = from_millis(j.at("started_at_ms").get<int64_t>());
    pass.finished_at = from_millis(j.at("finished_at_ms").get<int64_t>());
    return pass;
}

auto read_session(const json& j) -> WipeSession {
    WipeSession session;
    session.session_id = j.at("session_id").get<std::string>();
    session.device = read_device(j.at("device"));
    session.standard_id = j.at("standard_id").get<std::string>();
    session.access_mode = read_enum<AccessMode>(j, "access_mode", access_mode_from_string);
    session.downgrade_reason = j.at("downgrade_reason").get<std::string>();
    for (const auto& pass : j.at("passes")) {
        session.passes.push_back(read_pass(pass));
    }
    session.status = read_enum<SessionStatus>(j, "status", session_status_from_string);
    session.failure = read_optional_error(j, "failure");
    session.started_at = from_millis(j.at("started_at_ms").get<int64_t>());
    session.finished_at = from_millis(j.at("finished_at_ms").get<int64_t>());
    for (const auto& item : j.at("events")) {
        SessionEvent event;
        event.at = from_millis(item.at("at_ms").get<int64_t>());
        event.state = read_enum<OrchestratorState>(item, "state", orchestrator_state_from_string);
        event.pass_index = read_optional_index(item, "pass_index");
        event.message = item.at("message").get<std::string>();
        session.events.push_back(std::move(event));
    }
    session.finalized = j.at("finalized").get<bool>();

    if (j.at("total_bytes_written").get<uint64_t>() != session.total_bytes_written()) {
        throw RecordError("total_bytes_written does not match the pass results");
    }
    return session;
}

auto read_verdict(const json& j) -> AuditVerdict {
    AuditVerdict verdict;
    verdict.standard_id = j.at("standard_id").get<std::string>();
    verdict.session_id = j.at("session_id").get<std::string>();
    verdict.compliant = j.at("compliant").get<bool>();
    for (const auto& item : j.at("deviations")) {
        Deviation deviation;
        deviation.kind = read_enum<DeviationKind>(item, "kind", deviation_kind_from_string);
        deviation.severity = read_enum<Severity>(item, "severity", severity_from_string);
        deviation.pass_index = read_optional_index(item, "pass_index");
        deviation.description = item.at("description").get<std::string>();
        verdict.deviations.push_back(std::move(deviation));
    }
    return verdict;
}

auto digest_of(const json& body) -> std::string {
    auto digest = util::sha256(body.dump());
    return util::to_hex(digest);
}

}  // namespace

auto SessionSerializer::verdict_to_json(const AuditVerdict& verdict) -> nlohmann::json {
    json deviations = json::array();
    for (const auto& deviation : verdict.deviations) {
        deviations.push_back({{"kind", to_string(deviation.kind)},
                              {"severity", to_string(deviation.severity)},
                              {"pass_index", optional_index(deviation.pass_index)},
                              {"description", deviation.description}});
    }
    return {{"standard_id", verdict.standard_id},
            {"session_id", verdict.session_id},
            {"compliant", verdict.compliant},
            {"deviations", std::move(deviations)}};
}

auto SessionSerializer::to_json(const WipeSession& session,
                                const std::optional<AuditVerdict>& verdict) -> nlohmann::json {
    json body = {{"session", session_json(session)}};
    body["verdict"] = verdict ? verdict_to_json(*verdict) : json(nullptr);

    json record;
    record["format"] = FORMAT;
    record["version"] = VERSION;
    record["digest"] = digest_of(body);
    record["body"] = std::move(body);
    return record;
}

auto SessionSerializer::serialize(const WipeSession& session,
                                  const std::optional<AuditVerdict>& verdict) -> std::string {
    return to_json(session, verdict).dump(2);
}

auto SessionSerializer::deserialize(std::string_view text)
    -> std::expected<SessionRecord, util::Error> {
    try {
        auto record = json::parse(text.begin(), text.end());

        if (!record.is_object() || record.value("format", std::string()) != FORMAT) {
            return std::unexpected(util::Error::configuration("Not a session record"));
        }
        const int version = record.at("version").get<int>();
        if (version != VERSION) {
            return std::unexpected(util::Error::configuration(
                "Unsupported session record version " + std::to_string(version)));
        }

        const auto& body = record.at("body");
        if (record.at("digest").get<std::string>() != digest_of(body)) {
            return std::unexpected(
                util::Error::configuration("Session record digest mismatch (record altered)"));
        }

        SessionRecord result;
        result.session = read_session(body.at("session"));
        if (body.contains("verdict") && !body.at("verdict").is_null()) {
            result.verdict = read_verdict(body.at("verdict"));
        }
        return result;
    } catch (const RecordError& e) {
        return std::unexpected(util::Error::configuration(std::string("Invalid session record: ") +
                                                          e.what()));
    } catch (const json::exception& e) {
        return std::unexpected(util::Error::configuration(std::string("Invalid session record: ") +
                                                          e.what()));
    }
}

auto SessionSerializer::save(const std::filesystem::path& path, const WipeSession& session,
                             const std::optional<AuditVerdict>& verdict)
    -> std::expected<void, util::Error> {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return std::unexpected(
            util::Error::configuration("Cannot open " + path.string() + " for writing"));
    }
    out << serialize(session, verdict) << '\n';
    out.flush();
    if (!out) {
        return std::unexpected(util::Error::configuration("Failed to write " + path.string()));
    }
    LOG_INFO("SessionSerializer", "Session " + session.session_id + " saved to " + path.string());
    return {};
}

auto SessionSerializer::load(const std::filesystem::path& path)
    -> std::expected<SessionRecord, util::Error> {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(util::Error::configuration("Cannot open " + path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto record = deserialize(buffer.str());
    if (!record) {
        LOG_WARNING("SessionSerializer", path.string() + ": " + record.error().message);
    }
    return record;
}

}  // namespace audit
