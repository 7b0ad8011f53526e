#include <arbiter/role_assignment.hpp>

#include <gtest/gtest.h>

namespace arbiter {
namespace {

TEST(RoleAssignmentTest, ClassicMediaCarriesMediaOnly) {
    for (AudioMode mode : {AudioMode::Normal, AudioMode::InCall}) {
        auto assignment = assign_roles(capability_of(Profile::ClassicMedia), mode);
        EXPECT_TRUE(assignment.roles.media);
        EXPECT_FALSE(assignment.roles.call);
        EXPECT_EQ(assignment.primary, AudioRole::Media);
    }
}

TEST(RoleAssignmentTest, ClassicCallCarriesCallOnly) {
    for (AudioMode mode : {AudioMode::Normal, AudioMode::InCall}) {
        auto assignment = assign_roles(capability_of(Profile::ClassicCall), mode);
        EXPECT_FALSE(assignment.roles.media);
        EXPECT_TRUE(assignment.roles.call);
        EXPECT_EQ(assignment.primary, AudioRole::Call);
    }
}

TEST(RoleAssignmentTest, LeAudioPrimaryFollowsMode) {
    auto normal = assign_roles(Capability::Unified, AudioMode::Normal);
    EXPECT_EQ(normal.roles, (RoleSet{true, true}));
    EXPECT_EQ(normal.primary, AudioRole::Media);

    auto in_call = assign_roles(Capability::Unified, AudioMode::InCall);
    EXPECT_EQ(in_call.roles, (RoleSet{true, true}));
    EXPECT_EQ(in_call.primary, AudioRole::Call);
}

TEST(RoleAssignmentTest, HearingAidIgnoresMode) {
    EXPECT_EQ(assign_roles(Capability::Combined, AudioMode::Normal),
              assign_roles(Capability::Combined, AudioMode::InCall));
}

TEST(RoleAssignmentTest, PreferredRole) {
    EXPECT_EQ(preferred_role(AudioMode::Normal), AudioRole::Media);
    EXPECT_EQ(preferred_role(AudioMode::InCall), AudioRole::Call);
}

TEST(RoleAssignmentTest, ProfileForGroupRole) {
    EXPECT_EQ(profile_for(ProfileGroup::ClassicMediaCall, AudioRole::Media), Profile::ClassicMedia);
    EXPECT_EQ(profile_for(ProfileGroup::ClassicMediaCall, AudioRole::Call), Profile::ClassicCall);
    EXPECT_EQ(profile_for(ProfileGroup::LeAudio, AudioRole::Call), Profile::LeAudio);
    EXPECT_EQ(profile_for(ProfileGroup::HearingAid, AudioRole::Media), Profile::HearingAid);
}

TEST(RoleAssignmentTest, Groups) {
    EXPECT_EQ(group_of(Profile::LeHearingAid), ProfileGroup::LeAudio);
    EXPECT_EQ(group_of(Profile::HearingAid), ProfileGroup::HearingAid);
    EXPECT_EQ(group_of(Profile::ClassicCall), ProfileGroup::ClassicMediaCall);
}

} // namespace
} // namespace arbiter
