/**
 * @file test_platform.cpp
 * @brief Unit tests for confix platform utilities
 *
 * Tests coverage for:
 * - Thread IDs
 * - Environment variables
 * - Environment snapshot
 */

#include <confix/common/platform.hpp>

#include <string>
#include <thread>

#include <gtest/gtest.h>

using namespace confix::common::platform;

// ============================================================================
// Thread ID Tests
// ============================================================================

class ThreadIdTest : public ::testing::Test {};

TEST_F(ThreadIdTest, StableWithinThread) {
    EXPECT_EQ(get_thread_id(), get_thread_id());
}

TEST_F(ThreadIdTest, DiffersAcrossThreads) {
    uint64_t main_id  = get_thread_id();
    uint64_t other_id = 0;

    std::thread worker([&other_id]() { other_id = get_thread_id(); });
    worker.join();

    EXPECT_NE(main_id, other_id);
}

// ============================================================================
// Environment Variable Tests
// ============================================================================

class EnvironmentTest : public ::testing::Test {
protected:
    void TearDown() override {
        unset_env("CONFIX_TEST_PLATFORM_VAR");
    }
};

TEST_F(EnvironmentTest, MissingVariableIsEmpty) {
    EXPECT_TRUE(get_env("CONFIX_TEST_SURELY_UNDEFINED_VAR").empty());
}

TEST_F(EnvironmentTest, SetGetUnset) {
    ASSERT_TRUE(set_env("CONFIX_TEST_PLATFORM_VAR", "value-1"));
    EXPECT_EQ(get_env("CONFIX_TEST_PLATFORM_VAR"), "value-1");

    ASSERT_TRUE(set_env("CONFIX_TEST_PLATFORM_VAR", "value-2"));
    EXPECT_EQ(get_env("CONFIX_TEST_PLATFORM_VAR"), "value-2");

    EXPECT_TRUE(unset_env("CONFIX_TEST_PLATFORM_VAR"));
    EXPECT_TRUE(get_env("CONFIX_TEST_PLATFORM_VAR").empty());
}

TEST_F(EnvironmentTest, SnapshotContainsVariable) {
    ASSERT_TRUE(set_env("CONFIX_TEST_PLATFORM_VAR", "a=b"));

    auto environment = get_environment();
    auto it          = environment.find("CONFIX_TEST_PLATFORM_VAR");
    ASSERT_NE(it, environment.end());
    EXPECT_EQ(it->second, "a=b");
}

TEST_F(EnvironmentTest, SnapshotIsDetached) {
    auto before = get_environment();
    ASSERT_TRUE(set_env("CONFIX_TEST_PLATFORM_VAR", "late"));

    EXPECT_EQ(before.count("CONFIX_TEST_PLATFORM_VAR"), 0u);
}
