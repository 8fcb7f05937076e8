#include <gtest/gtest.h>
#include <blockshift/blockshift.h>

#include "infrastructure/FakeHost.h"

#include <algorithm>

using namespace blockshift;

TEST(HostCapabilitiesTest, CompleteContract_Validates) {
    test::FakeHost host;
    auto caps = host.capabilities();

    EXPECT_TRUE(caps.missingCapabilities().empty());
    EXPECT_NO_THROW(caps.validate());
}

TEST(HostCapabilitiesTest, OptionalMembersMayBeAbsent) {
    test::FakeHost host;
    auto caps = host.capabilities();
    caps.deleteNode = nullptr;
    caps.isDeletionTarget = nullptr;
    caps.setInputDeferred = nullptr;
    caps.highlightSurface = {};

    EXPECT_NO_THROW(caps.validate());
}

TEST(HostCapabilitiesTest, MissingRequired_ReportsEveryName) {
    test::FakeHost host;
    auto caps = host.capabilities();
    caps.connect = nullptr;
    caps.getViewport = nullptr;

    auto missing = caps.missingCapabilities();
    ASSERT_EQ(missing.size(), 2u);
    EXPECT_NE(std::find(missing.begin(), missing.end(), "connect"), missing.end());
    EXPECT_NE(std::find(missing.begin(), missing.end(), "getViewport"), missing.end());
}

TEST(HostCapabilitiesTest, ControllerConstruction_ThrowsOnMissingCapability) {
    test::FakeHost host;
    auto caps = host.capabilities();
    caps.disconnectAll = nullptr;

    try {
        MoveModeController controller(caps);
        FAIL() << "expected MissingHostCapabilityError";
    } catch (const MissingHostCapabilityError& e) {
        ASSERT_EQ(e.missing().size(), 1u);
        EXPECT_EQ(e.missing()[0], "disconnectAll");
        EXPECT_NE(std::string(e.what()).find("disconnectAll"), std::string::npos);
    }
}

TEST(HostCapabilitiesTest, MissingCapabilityError_IsInvalidArgument) {
    HostCapabilities empty;

    EXPECT_THROW(empty.validate(), std::invalid_argument);
    EXPECT_EQ(empty.missingCapabilities().size(), 8u);
}
