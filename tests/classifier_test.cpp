#include <arbiter/classifier.hpp>

#include <gtest/gtest.h>

namespace arbiter {
namespace {

using CS = ConnectionState;

TEST(ClassifierTest, ConnectedTransitionProducesConnected) {
    auto event = classify::connection_state_changed(Profile::ClassicMedia, "A", CS::Connecting,
                                                    CS::Connected);
    ASSERT_TRUE(event);
    auto* connected = std::get_if<ConnectedEvent>(&*event);
    ASSERT_NE(connected, nullptr);
    EXPECT_EQ(connected->profile, Profile::ClassicMedia);
    EXPECT_EQ(connected->device, "A");
}

TEST(ClassifierTest, AnyStateToDisconnectedProducesDisconnected) {
    for (CS prev : {CS::Connected, CS::Connecting, CS::Disconnecting}) {
        auto event = classify::connection_state_changed(Profile::HearingAid, "H", prev,
                                                        CS::Disconnected);
        ASSERT_TRUE(event);
        auto* gone = std::get_if<DisconnectedEvent>(&*event);
        ASSERT_NE(gone, nullptr);
        EXPECT_EQ(gone->profile, Profile::HearingAid);
        EXPECT_EQ(gone->device, "H");
    }
}

TEST(ClassifierTest, IntermediateStatesAreDropped) {
    EXPECT_FALSE(classify::connection_state_changed(Profile::LeAudio, "L", CS::Disconnected,
                                                    CS::Connecting));
    EXPECT_FALSE(classify::connection_state_changed(Profile::LeAudio, "L", CS::Connected,
                                                    CS::Disconnecting));
    EXPECT_FALSE(classify::connection_state_changed(Profile::LeAudio, "L", CS::Connected,
                                                    CS::Connected));
}

TEST(ClassifierTest, MissingDeviceIsDropped) {
    EXPECT_FALSE(classify::connection_state_changed(Profile::ClassicCall, std::nullopt,
                                                    CS::Disconnected, CS::Connected));
    EXPECT_FALSE(classify::connection_state_changed(Profile::ClassicCall, "",
                                                    CS::Disconnected, CS::Connected));
    EXPECT_FALSE(classify::device_available(std::nullopt));
}

TEST(ClassifierTest, LeHearingAidConnectionIsAvailability) {
    auto event = classify::connection_state_changed(Profile::LeHearingAid, "L",
                                                    CS::Disconnected, CS::Connected);
    ASSERT_TRUE(event);
    auto* available = std::get_if<AvailableEvent>(&*event);
    ASSERT_NE(available, nullptr);
    EXPECT_EQ(available->device, "L");

    auto active = classify::active_device_changed(Profile::LeHearingAid, "L");
    ASSERT_TRUE(active);
    EXPECT_TRUE(std::holds_alternative<AvailableEvent>(*active));
}

TEST(ClassifierTest, ActiveChangedKeepsNone) {
    auto event = classify::active_device_changed(Profile::ClassicMedia, std::nullopt);
    ASSERT_TRUE(event);
    auto* active = std::get_if<ActiveChangedEvent>(&*event);
    ASSERT_NE(active, nullptr);
    EXPECT_EQ(active->device, std::nullopt);
}

TEST(ClassifierTest, ProfileOfEvent) {
    EXPECT_EQ(profile_of(ConnectedEvent{Profile::LeAudio, "L"}), Profile::LeAudio);
    EXPECT_EQ(profile_of(AvailableEvent{"L"}), Profile::LeHearingAid);
    EXPECT_EQ(profile_of(classify::audio_mode_changed(AudioMode::InCall)), std::nullopt);
    EXPECT_EQ(profile_of(classify::wired_audio_connected()), std::nullopt);
}

TEST(ClassifierTest, DescribeNamesProfileAndDevice) {
    EXPECT_EQ(describe(ConnectedEvent{Profile::ClassicCall, "H"}), "classic_call connected H");
    EXPECT_EQ(describe(ActiveChangedEvent{Profile::HearingAid, std::nullopt}),
              "hearing_aid active -> none");
}

} // namespace
} // namespace arbiter
