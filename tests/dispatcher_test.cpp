#include <arbiter/dispatcher.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace arbiter {
namespace {

using ::testing::MockFunction;
using ::testing::Return;
using ::testing::StrictMock;

class DispatcherTest : public ::testing::Test {
protected:
    Collaborators collaborators(bool with_le_audio = true) {
        Collaborators c;
        c.classic_media = MediaProfileOps{media_set_.AsStdFunction(), media_fallback_.AsStdFunction()};
        c.classic_call = CallProfileOps{call_set_.AsStdFunction(), call_fallback_.AsStdFunction()};
        if (with_le_audio) {
            c.le_audio = MediaProfileOps{le_set_.AsStdFunction(), nullptr};
        }
        return c;
    }

    StrictMock<MockFunction<bool(const std::optional<DeviceId>&, bool)>> media_set_;
    StrictMock<MockFunction<std::optional<DeviceId>()>> media_fallback_;
    StrictMock<MockFunction<bool(const std::optional<DeviceId>&)>> call_set_;
    StrictMock<MockFunction<std::optional<DeviceId>()>> call_fallback_;
    StrictMock<MockFunction<bool(const std::optional<DeviceId>&, bool)>> le_set_;
};

TEST_F(DispatcherTest, RoutesToProfile) {
    Dispatcher dispatcher(collaborators(), false);
    EXPECT_CALL(media_set_, Call(std::optional<DeviceId>("A"), true)).WillOnce(Return(true));
    EXPECT_CALL(call_set_, Call(std::optional<DeviceId>())).WillOnce(Return(true));
    EXPECT_CALL(le_set_, Call(std::optional<DeviceId>("L"), false)).WillOnce(Return(true));

    ActiveDeviceState current;
    EXPECT_TRUE(dispatcher.dispatch({Profile::ClassicMedia, "A", true}, current));
    EXPECT_TRUE(dispatcher.dispatch({Profile::ClassicCall, std::nullopt}, current));
    EXPECT_TRUE(dispatcher.dispatch({Profile::LeAudio, "L"}, current));
}

TEST_F(DispatcherTest, PropagatesRejection) {
    Dispatcher dispatcher(collaborators(), false);
    EXPECT_CALL(media_set_, Call(std::optional<DeviceId>("A"), false)).WillOnce(Return(false));

    EXPECT_FALSE(dispatcher.dispatch({Profile::ClassicMedia, "A"}, ActiveDeviceState{}));
}

TEST_F(DispatcherTest, MissingProfileFails) {
    Dispatcher dispatcher(collaborators(false), false);

    EXPECT_FALSE(dispatcher.has_profile(Profile::HearingAid));
    EXPECT_FALSE(dispatcher.has_profile(Profile::LeAudio));
    EXPECT_FALSE(dispatcher.dispatch({Profile::HearingAid, "H"}, ActiveDeviceState{}));
    EXPECT_FALSE(dispatcher.dispatch({Profile::LeHearingAid, "H"}, ActiveDeviceState{}));
}

TEST_F(DispatcherTest, RecordOnlyNeverCallsProfile) {
    Dispatcher dispatcher(collaborators(), false);

    Command command{Profile::ClassicMedia, "A", false, false};
    EXPECT_TRUE(dispatcher.dispatch(command, ActiveDeviceState{}));
}

TEST_F(DispatcherTest, RepeatsAreSentWithoutDedupe) {
    Dispatcher dispatcher(collaborators(), false);
    ActiveDeviceState current;
    current.classic_media = "A";

    EXPECT_CALL(media_set_, Call(std::optional<DeviceId>("A"), false)).WillOnce(Return(true));
    EXPECT_TRUE(dispatcher.dispatch({Profile::ClassicMedia, "A"}, current));
}

TEST_F(DispatcherTest, DedupeSkipsRepeats) {
    Dispatcher dispatcher(collaborators(), true);
    ActiveDeviceState current;
    current.classic_media = "A";
    current.le_audio_media = "L";
    current.le_audio_call = "L";

    EXPECT_TRUE(dispatcher.dispatch({Profile::ClassicMedia, "A"}, current));
    EXPECT_TRUE(dispatcher.dispatch({Profile::LeAudio, "L"}, current));
    EXPECT_TRUE(dispatcher.dispatch({Profile::ClassicCall, std::nullopt}, current));

    EXPECT_CALL(media_set_, Call(std::optional<DeviceId>("B"), false)).WillOnce(Return(true));
    EXPECT_TRUE(dispatcher.dispatch({Profile::ClassicMedia, "B"}, current));
}

TEST_F(DispatcherTest, ReportsWhetherProfileWasCalled) {
    Dispatcher dispatcher(collaborators(), true);
    ActiveDeviceState current;
    current.classic_media = "A";
    bool sent = true;

    EXPECT_TRUE(dispatcher.dispatch({Profile::ClassicMedia, "A"}, current, &sent));
    EXPECT_FALSE(sent);
    EXPECT_TRUE(dispatcher.dispatch({Profile::ClassicMedia, "B", false, false}, current, &sent));
    EXPECT_FALSE(sent);

    EXPECT_CALL(media_set_, Call(std::optional<DeviceId>("B"), false)).WillOnce(Return(true));
    EXPECT_TRUE(dispatcher.dispatch({Profile::ClassicMedia, "B"}, current, &sent));
    EXPECT_TRUE(sent);

    EXPECT_CALL(call_set_, Call(std::optional<DeviceId>("H"))).WillOnce(Return(false));
    EXPECT_FALSE(dispatcher.dispatch({Profile::ClassicCall, "H"}, current, &sent));
    EXPECT_FALSE(sent);
}

TEST_F(DispatcherTest, FallbackDevice) {
    Dispatcher dispatcher(collaborators(), false);
    EXPECT_CALL(media_fallback_, Call()).WillOnce(Return(std::optional<DeviceId>("A")));
    EXPECT_CALL(call_fallback_, Call()).WillOnce(Return(std::optional<DeviceId>("")));

    EXPECT_EQ(dispatcher.fallback_device(Profile::ClassicMedia), "A");
    EXPECT_EQ(dispatcher.fallback_device(Profile::ClassicCall), std::nullopt);
    // LE audio registered no fallback query
    EXPECT_EQ(dispatcher.fallback_device(Profile::LeAudio), std::nullopt);
    EXPECT_EQ(dispatcher.fallback_device(Profile::HearingAid), std::nullopt);
}

TEST(CommandTest, Describe) {
    EXPECT_EQ(describe(Command{Profile::ClassicMedia, "A", true}), "classic_media -> A (suppress noise)");
    EXPECT_EQ(describe(Command{Profile::ClassicCall, std::nullopt, true}), "classic_call -> none");
    EXPECT_EQ(describe(Command{Profile::LeAudio, "L", false, false}), "le_audio -> L [record only]");
}

} // namespace
} // namespace arbiter
