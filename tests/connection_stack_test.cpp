#include <arbiter/connection_stack.hpp>

#include <gtest/gtest.h>

namespace arbiter {
namespace {

TEST(ConnectionStackTest, PushAppendsInOrder) {
    ConnectionStack stack;
    stack.push("A");
    stack.push("B");
    stack.push("C");

    EXPECT_EQ(stack.devices(), (std::vector<DeviceId>{"A", "B", "C"}));
    EXPECT_EQ(stack.tail(), "C");
}

TEST(ConnectionStackTest, PushExistingMovesToTail) {
    ConnectionStack stack;
    stack.push("A");
    stack.push("B");
    stack.push("A");

    EXPECT_EQ(stack.devices(), (std::vector<DeviceId>{"B", "A"}));
    EXPECT_EQ(stack.size(), 2u);
}

TEST(ConnectionStackTest, RemoveReportsMembership) {
    ConnectionStack stack;
    stack.push("A");
    stack.push("B");

    EXPECT_TRUE(stack.remove("A"));
    EXPECT_FALSE(stack.remove("A"));
    EXPECT_FALSE(stack.contains("A"));
    EXPECT_EQ(stack.tail(), "B");
}

TEST(ConnectionStackTest, EmptyStackHasNoTail) {
    ConnectionStack stack;
    EXPECT_TRUE(stack.empty());
    EXPECT_EQ(stack.tail(), std::nullopt);

    stack.push("A");
    EXPECT_TRUE(stack.remove("A"));
    EXPECT_TRUE(stack.empty());
    EXPECT_EQ(stack.tail(), std::nullopt);
}

TEST(ConnectionStackTest, NewerComparesPushOrder) {
    ConnectionStack stack;
    stack.push("A");
    stack.push("B");

    EXPECT_TRUE(stack.newer("B", "A"));
    EXPECT_FALSE(stack.newer("A", "B"));

    stack.push("A");
    EXPECT_TRUE(stack.newer("A", "B"));
}

TEST(ConnectionStackTest, AbsentDeviceIsOldest) {
    ConnectionStack stack;
    stack.push("A");

    EXPECT_TRUE(stack.newer("A", "X"));
    EXPECT_FALSE(stack.newer("X", "A"));
    EXPECT_FALSE(stack.newer("X", "Y"));
}

} // namespace
} // namespace arbiter
