/**
 * @file test_state_machine.cpp
 * @brief Unit tests for device up/down tracking
 */

#include <gtest/gtest.h>

#include "monitor/DeviceStateMachine.hpp"

using namespace lanwatch;
using namespace lanwatch::monitor;

class DeviceStateMachineTest : public ::testing::Test {
protected:
    DeviceStateMachine machine;
};

// =============================================================================
// Transitions
// =============================================================================

TEST_F(DeviceStateMachineTest, StartsUnknown) {
    EXPECT_EQ(machine.State("dev"), common::DeviceStatus::Unknown);
}

TEST_F(DeviceStateMachineTest, FirstSuccessIsSilent) {
    EXPECT_EQ(machine.Apply("dev", true), Transition::None);
    EXPECT_EQ(machine.State("dev"), common::DeviceStatus::Up);
}

TEST_F(DeviceStateMachineTest, FirstFailureReportsDown) {
    EXPECT_EQ(machine.Apply("dev", false), Transition::WentDown);
    EXPECT_EQ(machine.State("dev"), common::DeviceStatus::Down);
}

TEST_F(DeviceStateMachineTest, FlapSequence) {
    EXPECT_EQ(machine.Apply("dev", true), Transition::None);
    EXPECT_EQ(machine.Apply("dev", true), Transition::None);
    EXPECT_EQ(machine.Apply("dev", false), Transition::WentDown);
    EXPECT_EQ(machine.Apply("dev", false), Transition::None);
    EXPECT_EQ(machine.Apply("dev", true), Transition::WentUp);
    EXPECT_EQ(machine.Apply("dev", true), Transition::None);
}

TEST_F(DeviceStateMachineTest, DevicesAreIndependent) {
    machine.Apply("a", false);
    EXPECT_EQ(machine.Apply("b", true), Transition::None);
    EXPECT_EQ(machine.State("a"), common::DeviceStatus::Down);
    EXPECT_EQ(machine.State("b"), common::DeviceStatus::Up);
}
