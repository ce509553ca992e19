// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <string>

#include "gbconv/warning.hpp"

class WarningFlags : public testing::Test {
protected:
	void SetUp() override { warnings = Warnings(); }
	void TearDown() override { warnings = Warnings(); }
};

TEST_F(WarningFlags, DefaultLevels) {
	EXPECT_EQ(warnings.behavior(WARNING_UNQUANTIZED), ENABLED);
	EXPECT_EQ(warnings.behavior(WARNING_PARTIAL_TILES), DISABLED);
	EXPECT_EQ(warnings.behavior(WARNING_TRANSPARENCY), DISABLED);
}

TEST_F(WarningFlags, GroupsEnableByLevel) {
	warnings.processFlag("all");
	EXPECT_EQ(warnings.behavior(WARNING_PARTIAL_TILES), ENABLED);
	EXPECT_EQ(warnings.behavior(WARNING_TRANSPARENCY), DISABLED);

	warnings.processFlag("everything");
	EXPECT_EQ(warnings.behavior(WARNING_TRANSPARENCY), ENABLED);

	warnings.processFlag("no-all");
	EXPECT_EQ(warnings.behavior(WARNING_UNQUANTIZED), DISABLED);
	EXPECT_EQ(warnings.behavior(WARNING_TRANSPARENCY), ENABLED);
}

TEST_F(WarningFlags, SpecificFlagsOverrideGroups) {
	warnings.processFlag("everything");
	warnings.processFlag("no-partial-tiles");
	EXPECT_EQ(warnings.behavior(WARNING_PARTIAL_TILES), DISABLED);
	EXPECT_EQ(warnings.behavior(WARNING_TRANSPARENCY), ENABLED);

	warnings.processFlag("no-unquantized");
	EXPECT_EQ(warnings.behavior(WARNING_UNQUANTIZED), DISABLED);
}

TEST_F(WarningFlags, WarningsAsErrors) {
	warnings.processFlag("error");
	EXPECT_EQ(warnings.behavior(WARNING_UNQUANTIZED), ERROR);
	EXPECT_EQ(warnings.behavior(WARNING_PARTIAL_TILES), DISABLED);

	warnings.processFlag("no-error=unquantized");
	EXPECT_EQ(warnings.behavior(WARNING_UNQUANTIZED), ENABLED);

	warnings.processFlag("no-error");
	warnings.processFlag("error=transparency");
	EXPECT_EQ(warnings.behavior(WARNING_TRANSPARENCY), ERROR);
}

TEST_F(WarningFlags, ErrorGroupEnablesItsWarnings) {
	warnings.processFlag("error=all");
	EXPECT_EQ(warnings.behavior(WARNING_PARTIAL_TILES), ERROR);
	EXPECT_EQ(warnings.behavior(WARNING_UNQUANTIZED), ERROR);
	EXPECT_EQ(warnings.behavior(WARNING_TRANSPARENCY), DISABLED);
}

TEST_F(WarningFlags, DisablingAllWarnings) {
	warnings.processFlag("error=unquantized");
	warnings.enabled = false;
	EXPECT_EQ(warnings.behavior(WARNING_UNQUANTIZED), DISABLED);
}

TEST_F(WarningFlags, ErrorsAreCounted) {
	warnings.processFlag("error");
	warning(WARNING_UNQUANTIZED, "test warning promoted to an error");
	warning(WARNING_TRANSPARENCY, "disabled, so not counted");
	EXPECT_EQ(warnings.nbErrors, 1u);

	error("test error");
	EXPECT_EQ(warnings.nbErrors, 2u);
}

TEST_F(WarningFlags, UnknownFlagsAreIgnored) {
	testing::internal::CaptureStderr();
	warnings.processFlag("no-such-warning");
	EXPECT_NE(testing::internal::GetCapturedStderr().find("Unknown warning flag"), std::string::npos);
	EXPECT_EQ(warnings.behavior(WARNING_UNQUANTIZED), ENABLED);
	EXPECT_EQ(warnings.nbErrors, 0u);
}

TEST(WarningFlagsDeathTest, GivingUpExitsWithFailure) {
	EXPECT_EXIT(
	    {
		    error("something went wrong");
		    requireZeroErrors();
	    },
	    testing::ExitedWithCode(1),
	    "Conversion aborted after 1 error"
	);
}
