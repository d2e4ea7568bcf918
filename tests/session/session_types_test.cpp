#include "gesu/session/scrcpy_command.hpp"
#include "gesu/session/types.hpp"

#include <gtest/gtest.h>

using gesu::session::build_scrcpy_args;
using gesu::session::can_transition;
using gesu::session::make_scrcpy_command;
using gesu::session::Mode;
using gesu::session::parse_mode;
using gesu::session::SessionOptions;
using gesu::session::SessionState;

using Args = std::vector<std::string>;

TEST(SessionStateTest, EnforcesTransitionTable) {
    EXPECT_TRUE(can_transition(SessionState::Starting, SessionState::Running));
    EXPECT_TRUE(can_transition(SessionState::Running, SessionState::Stopping));
    EXPECT_TRUE(can_transition(SessionState::Running, SessionState::Crashed));
    EXPECT_TRUE(can_transition(SessionState::Stopping, SessionState::Terminated));

    EXPECT_FALSE(can_transition(SessionState::Terminated, SessionState::Running));
    EXPECT_FALSE(can_transition(SessionState::Crashed, SessionState::Running));
    EXPECT_FALSE(can_transition(SessionState::Stopping, SessionState::Crashed));
    EXPECT_FALSE(can_transition(SessionState::Starting, SessionState::Crashed));
}

TEST(SessionStateTest, ParsesModes) {
    EXPECT_EQ(parse_mode("mirror"), Mode::Mirror);
    EXPECT_EQ(parse_mode("camera"), Mode::Camera);
    EXPECT_FALSE(parse_mode("webcam").has_value());
    EXPECT_STREQ(gesu::session::to_string(Mode::Camera), "camera");
}

TEST(ScrcpyArgsTest, MirrorDefaultsAndScreenOff) {
    EXPECT_EQ(build_scrcpy_args("DEV1", Mode::Mirror, {}), (Args{"-s", "DEV1"}));

    SessionOptions options;
    options.turn_screen_off = true;
    options.no_audio = true;  // camera-only option
    EXPECT_EQ(build_scrcpy_args("DEV1", Mode::Mirror, options), (Args{"-s", "DEV1", "--turn-screen-off"}));
}

TEST(ScrcpyArgsTest, CameraLandscapeBack) {
    EXPECT_EQ(build_scrcpy_args("DEV1", Mode::Camera, {}),
              (Args{"-s", "DEV1", "--video-source=camera", "--camera-facing=back"}));
}

TEST(ScrcpyArgsTest, CameraPortraitRotatesPerFacing) {
    SessionOptions back;
    back.orientation = "portrait";
    back.no_audio = true;
    EXPECT_EQ(build_scrcpy_args("DEV1", Mode::Camera, back),
              (Args{"-s", "DEV1", "--video-source=camera", "--camera-facing=back", "--no-audio",
                    "--orientation=90"}));

    SessionOptions front;
    front.orientation = "portrait";
    front.camera_facing = "front";
    front.camera_size = "1920x1080";
    EXPECT_EQ(build_scrcpy_args("DEV1", Mode::Camera, front),
              (Args{"-s", "DEV1", "--video-source=camera", "--camera-facing=front", "--camera-size=1920x1080",
                    "--orientation=270"}));
}

TEST(ScrcpyArgsTest, CommandDoesNotCaptureOutput) {
    const auto command = make_scrcpy_command("/usr/bin/scrcpy", "DEV1", Mode::Mirror, {});
    EXPECT_EQ(command.executable, "/usr/bin/scrcpy");
    EXPECT_FALSE(command.capture_output);
}
