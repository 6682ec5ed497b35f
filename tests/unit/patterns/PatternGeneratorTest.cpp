/**
 * @file PatternGeneratorTest.cpp
 * @brief Unit tests for the standards catalog
 */

#include "patterns/PatternGenerator.hpp"

#include <gtest/gtest.h>

#include <set>

class PatternGeneratorTest : public ::testing::Test {
protected:
    patterns::PatternGenerator generator;
};

// Test: the built-in catalog is registered at construction
TEST_F(PatternGeneratorTest, Standards_ContainsBuiltins) {
    std::set<std::string> ids;
    for (const auto& standard : generator.standards()) {
        ids.insert(standard.id);
        EXPECT_FALSE(standard.name.empty());
        EXPECT_FALSE(standard.passes.empty());
    }
    for (const auto* id : {"NIST_800_88", "BSI_VS_A", "DOD_5220_22_M", "DOD_5220_22_M_E",
                           "VSITR", "GOST_R_50739_95"}) {
        EXPECT_TRUE(ids.contains(id)) << id;
    }
}

// Test: BSI VS-A is zeros, ones, then a verified random pass
TEST_F(PatternGeneratorTest, Generate_BsiVsA_ExpectedSequence) {
    auto passes = generator.generate("BSI_VS_A");

    ASSERT_TRUE(passes.has_value());
    ASSERT_EQ(passes->size(), 3u);
    EXPECT_EQ((*passes)[0].pattern, PatternKind::ZERO);
    EXPECT_EQ((*passes)[0].value, 0x00);
    EXPECT_EQ((*passes)[1].pattern, PatternKind::ONE);
    EXPECT_EQ((*passes)[1].value, 0xFF);
    EXPECT_EQ((*passes)[2].pattern, PatternKind::RANDOM);
    EXPECT_EQ((*passes)[2].verification, VerificationMode::FULL_SCAN);
}

// Test: complement passes resolve to the inverted byte of the referenced pass
TEST_F(PatternGeneratorTest, Generate_DodE_ComplementResolved) {
    auto passes = generator.generate("DOD_5220_22_M_E");

    ASSERT_TRUE(passes.has_value());
    ASSERT_EQ(passes->size(), 3u);
    EXPECT_EQ((*passes)[0].value, 0x55);
    EXPECT_EQ((*passes)[1].pattern, PatternKind::COMPLEMENT);
    EXPECT_EQ((*passes)[1].complement_of, 0u);
    EXPECT_EQ((*passes)[1].value, 0xAA);
    EXPECT_EQ((*passes)[2].verification, VerificationMode::SAMPLED);
}

// Test: random passes carry seeds, deterministic passes do not
TEST_F(PatternGeneratorTest, Generate_RandomPassesSeeded) {
    auto passes = generator.generate("DOD_5220_22_M");

    ASSERT_TRUE(passes.has_value());
    for (const auto& pass : *passes) {
        if (pass.pattern == PatternKind::RANDOM) {
            EXPECT_TRUE(pass.seed.has_value());
            EXPECT_EQ(pass.seed_fingerprint.size(), 32u);
        } else {
            EXPECT_FALSE(pass.seed.has_value());
            EXPECT_TRUE(pass.seed_fingerprint.empty());
        }
    }
}

// Test: every call draws fresh seeds
TEST_F(PatternGeneratorTest, Generate_TwiceSameStandard_DifferentSeeds) {
    auto first = generator.generate("GOST_R_50739_95");
    auto second = generator.generate("GOST_R_50739_95");

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE((*first)[1].seed_fingerprint, (*second)[1].seed_fingerprint);
    EXPECT_NE((*first)[1].seed->key, (*second)[1].seed->key);
}

// Test: the catalog definition itself never holds key material
TEST_F(PatternGeneratorTest, Find_ReturnsUnseededDefinition) {
    auto standard = generator.find("BSI_VS_A");

    ASSERT_TRUE(standard.has_value());
    EXPECT_EQ(standard->id, "BSI_VS_A");
    EXPECT_FALSE(standard->passes[2].seed.has_value());
}

// Test: unknown identifiers are configuration errors
TEST_F(PatternGeneratorTest, Generate_UnknownStandard_ConfigurationError) {
    auto passes = generator.generate("GUTMANN_35");

    ASSERT_FALSE(passes.has_value());
    EXPECT_EQ(passes.error().kind, util::ErrorKind::CONFIGURATION);
}

// Test: a custom standard can be registered and generated
TEST_F(PatternGeneratorTest, RegisterStandard_Custom_Generates) {
    PassSpec fixed;
    fixed.pattern = PatternKind::FIXED;
    fixed.value = 0x3C;
    PassSpec complement;
    complement.pattern = PatternKind::COMPLEMENT;
    complement.complement_of = 0;
    complement.verification = VerificationMode::FULL_SCAN;

    auto registered = generator.register_standard(
        {.id = "CUSTOM", .name = "Custom", .description = "", .passes = {fixed, complement}});
    ASSERT_TRUE(registered.has_value());

    auto passes = generator.generate("CUSTOM");
    ASSERT_TRUE(passes.has_value());
    EXPECT_EQ((*passes)[1].value, 0xC3);
}

// Test: duplicate identifiers are refused
TEST_F(PatternGeneratorTest, RegisterStandard_DuplicateId_Fails) {
    PassSpec zero;
    auto registered = generator.register_standard(
        {.id = "NIST_800_88", .name = "Again", .description = "", .passes = {zero}});

    ASSERT_FALSE(registered.has_value());
    EXPECT_EQ(registered.error().kind, util::ErrorKind::CONFIGURATION);
}

// Test: a standard without passes is refused
TEST_F(PatternGeneratorTest, RegisterStandard_NoPasses_Fails) {
    auto registered =
        generator.register_standard({.id = "EMPTY", .name = "Empty", .description = "", .passes = {}});

    EXPECT_FALSE(registered.has_value());
}

// Test: a complement must point at an earlier deterministic pass
TEST_F(PatternGeneratorTest, RegisterStandard_ComplementOfRandom_Fails) {
    PassSpec random;
    random.pattern = PatternKind::RANDOM;
    PassSpec complement;
    complement.pattern = PatternKind::COMPLEMENT;
    complement.complement_of = 0;

    auto registered = generator.register_standard(
        {.id = "BROKEN", .name = "Broken", .description = "", .passes = {random, complement}});
    EXPECT_FALSE(registered.has_value());

    PassSpec forward;
    forward.pattern = PatternKind::COMPLEMENT;
    forward.complement_of = 1;
    registered = generator.register_standard(
        {.id = "FORWARD", .name = "Forward", .description = "", .passes = {forward, random}});
    EXPECT_FALSE(registered.has_value());
}

// Test: reseeding replaces the key of a random pass and ignores others
TEST_F(PatternGeneratorTest, Reseed_ChangesRandomSeedOnly) {
    auto passes = generator.generate("BSI_VS_A");
    ASSERT_TRUE(passes.has_value());

    auto random = (*passes)[2];
    const auto before = random.seed_fingerprint;
    ASSERT_TRUE(patterns::PatternGenerator::reseed(random).has_value());
    EXPECT_NE(random.seed_fingerprint, before);

    auto zero = (*passes)[0];
    ASSERT_TRUE(patterns::PatternGenerator::reseed(zero).has_value());
    EXPECT_FALSE(zero.seed.has_value());
}
