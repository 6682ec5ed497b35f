/**
 * @file SessionSerializerTest.cpp
 * @brief Unit tests for SessionSerializer
 */

#include "audit/SessionSerializer.hpp"

#include "fixtures/TestFixtures.hpp"
#include "util/Crypto.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using audit::SessionSerializer;

namespace {

auto at_ms(int64_t ms) -> Timestamp {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds{ms})};
}

}  // namespace

class SessionSerializerTest : public ::testing::Test {
protected:
    WipeSession session;
    AuditVerdict verdict;

    void SetUp() override {
        session.session_id = "5f0c9e2a7b4d4e61a0c3f1d2e3b4a596";
        session.device = {.id = "sdb",
                          .path = "/dev/sdb",
                          .capacity_bytes = 4'096,
                          .sector_size = 4'096,
                          .model = "Test Disk",
                          .serial = "SN123",
                          .is_removable = true};
        session.standard_id = "BSI_VS_A";
        session.access_mode = AccessMode::FALLBACK;
        session.downgrade_reason = "Permission denied";
        session.status = SessionStatus::FAILED;
        session.failure = util::Error::verification_failed(1'024);
        session.started_at = at_ms(1'700'000'000'000);
        session.finished_at = at_ms(1'700'000'005'000);
        session.finalized = true;

        PassResult random;
        random.pass_index = 2;
        random.pattern = PatternKind::RANDOM;
        random.seed_fingerprint = "00112233445566778899aabbccddeeff";
        random.bytes_written = 4'096;
        random.total_bytes = 4'096;
        random.attempts = 2;
        random.reexecutions = 1;
        random.throughput_samples = {{0, 0, 0}, {10, 4'096, 409'600}};
        random.verification.mode = VerificationMode::FULL_SCAN;
        random.verification.outcome = VerificationOutcome::FAILED;
        random.verification.bytes_verified = 1'024;
        random.verification.mismatch_offset = 1'024;
        random.verification.confidence = 1.0;
        random.status = PassStatus::FAILED;
        random.error = util::Error::verification_failed(1'024);
        random.note = "Verification failed at offset 1024; rewriting pass (1/1)";
        random.started_at = at_ms(1'700'000'001'000);
        random.finished_at = at_ms(1'700'000'004'000);
        session.passes.push_back(random);

        SessionEvent event;
        event.at = at_ms(1'700'000'000'500);
        event.state = OrchestratorState::EXECUTING;
        event.pass_index = 2;
        event.message = "RANDOM";
        session.events.push_back(event);

        verdict.standard_id = "BSI_VS_A";
        verdict.session_id = session.session_id;
        verdict.compliant = false;
        verdict.deviations.push_back(
            {DeviationKind::ACCESS_MODE_DOWNGRADE, Severity::MAJOR, std::nullopt, "Fallback"});
        verdict.deviations.push_back(
            {DeviationKind::VERIFICATION_FAILED, Severity::CRITICAL, 2, "Mismatch at 1024"});
    }
};

// Test: a serialized record reads back with every field intact
TEST_F(SessionSerializerTest, Deserialize_Serialized_SameSessionAndVerdict) {
    auto record = SessionSerializer::deserialize(SessionSerializer::serialize(session, verdict));

    ASSERT_TRUE(record.has_value()) << record.error().message;
    const auto& loaded = record->session;
    EXPECT_EQ(loaded.session_id, session.session_id);
    EXPECT_EQ(loaded.device, session.device);
    EXPECT_EQ(loaded.standard_id, "BSI_VS_A");
    EXPECT_EQ(loaded.access_mode, AccessMode::FALLBACK);
    EXPECT_EQ(loaded.downgrade_reason, "Permission denied");
    EXPECT_EQ(loaded.status, SessionStatus::FAILED);
    EXPECT_EQ(loaded.failure, session.failure);
    EXPECT_EQ(loaded.started_at, session.started_at);
    EXPECT_EQ(loaded.finished_at, session.finished_at);
    EXPECT_TRUE(loaded.finalized);

    ASSERT_EQ(loaded.passes.size(), 1u);
    const auto& pass = loaded.passes[0];
    EXPECT_EQ(pass.pass_index, 2u);
    EXPECT_EQ(pass.pattern, PatternKind::RANDOM);
    EXPECT_EQ(pass.seed_fingerprint, "00112233445566778899aabbccddeeff");
    EXPECT_EQ(pass.attempts, 2u);
    EXPECT_EQ(pass.reexecutions, 1u);
    EXPECT_EQ(pass.throughput_samples, session.passes[0].throughput_samples);
    EXPECT_EQ(pass.verification.mismatch_offset, 1'024u);
    EXPECT_EQ(pass.error, session.passes[0].error);
    EXPECT_EQ(pass.note, session.passes[0].note);

    ASSERT_EQ(loaded.events.size(), 1u);
    EXPECT_EQ(loaded.events[0].state, OrchestratorState::EXECUTING);
    EXPECT_EQ(loaded.events[0].pass_index, 2u);

    ASSERT_TRUE(record->verdict.has_value());
    EXPECT_EQ(*record->verdict, verdict);
}

// Test: the record carries format, version and digest around the body
TEST_F(SessionSerializerTest, ToJson_EnvelopeFields) {
    auto j = SessionSerializer::to_json(session);

    EXPECT_EQ(j.at("format").get<std::string>(), SessionSerializer::FORMAT);
    EXPECT_EQ(j.at("version").get<int>(), SessionSerializer::VERSION);
    EXPECT_EQ(j.at("digest").get<std::string>().size(), 64u);
    EXPECT_TRUE(j.at("body").at("verdict").is_null());
    EXPECT_EQ(j.at("body").at("session").at("total_bytes_written").get<uint64_t>(), 4'096u);
}

// Test: changing any body field after writing is detected
TEST_F(SessionSerializerTest, Deserialize_AlteredBody_DigestMismatch) {
    auto j = SessionSerializer::to_json(session, verdict);
    j["body"]["verdict"]["compliant"] = true;

    auto record = SessionSerializer::deserialize(j.dump());

    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().kind, util::ErrorKind::CONFIGURATION);
    EXPECT_NE(record.error().message.find("digest mismatch"), std::string::npos);
}

TEST_F(SessionSerializerTest, Deserialize_WrongFormat_Rejected) {
    auto j = SessionSerializer::to_json(session);
    j["format"] = "something-else";

    auto record = SessionSerializer::deserialize(j.dump());

    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().message, "Not a session record");
}

TEST_F(SessionSerializerTest, Deserialize_WrongVersion_Rejected) {
    auto j = SessionSerializer::to_json(session);
    j["version"] = 2;

    auto record = SessionSerializer::deserialize(j.dump());

    ASSERT_FALSE(record.has_value());
    EXPECT_NE(record.error().message.find("version 2"), std::string::npos);
}

TEST_F(SessionSerializerTest, Deserialize_MalformedJson_ConfigurationError) {
    auto record = SessionSerializer::deserialize("{\"format\": ");

    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().kind, util::ErrorKind::CONFIGURATION);
}

// Test: a body with a re-computed digest still has to be internally consistent
TEST_F(SessionSerializerTest, Deserialize_InconsistentTotal_Rejected) {
    auto j = SessionSerializer::to_json(session);
    j["body"]["session"]["total_bytes_written"] = 1;
    j["digest"] = util::to_hex(util::sha256(j["body"].dump()));

    auto record = SessionSerializer::deserialize(j.dump());

    ASSERT_FALSE(record.has_value());
    EXPECT_NE(record.error().message.find("total_bytes_written"), std::string::npos);
}

TEST_F(SessionSerializerTest, SaveLoad_File_RoundTrip) {
    TempDirectory dir;
    auto path = dir.path() / "session.json";

    ASSERT_TRUE(SessionSerializer::save(path, session, verdict).has_value());
    auto record = SessionSerializer::load(path);

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->session.session_id, session.session_id);
    EXPECT_EQ(record->verdict, verdict);
}

TEST_F(SessionSerializerTest, Load_MissingFile_ConfigurationError) {
    TempDirectory dir;

    auto record = SessionSerializer::load(dir.path() / "absent.json");

    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().kind, util::ErrorKind::CONFIGURATION);
}
