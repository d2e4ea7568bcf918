#include "gesu/transfer/adb_command.hpp"
#include "gesu/transfer/types.hpp"

#include <gtest/gtest.h>

using namespace gesu::transfer;

TEST(TransferStatusTest, TransitionsAndTerminalStates) {
    EXPECT_TRUE(can_transition(TransferStatus::Queued, TransferStatus::Transferring));
    EXPECT_TRUE(can_transition(TransferStatus::Queued, TransferStatus::Cancelled));
    EXPECT_TRUE(can_transition(TransferStatus::Transferring, TransferStatus::Complete));
    EXPECT_TRUE(can_transition(TransferStatus::Transferring, TransferStatus::Failed));
    EXPECT_TRUE(can_transition(TransferStatus::Transferring, TransferStatus::Cancelled));

    EXPECT_FALSE(can_transition(TransferStatus::Queued, TransferStatus::Complete));
    EXPECT_FALSE(can_transition(TransferStatus::Cancelled, TransferStatus::Cancelled));
    EXPECT_FALSE(can_transition(TransferStatus::Complete, TransferStatus::Transferring));

    EXPECT_FALSE(is_terminal(TransferStatus::Transferring));
    EXPECT_TRUE(is_terminal(TransferStatus::Failed));
}

TEST(TransferStatusTest, ParsesDirection) {
    EXPECT_EQ(parse_direction("push"), Direction::Push);
    EXPECT_EQ(parse_direction("pull"), Direction::Pull);
    EXPECT_FALSE(parse_direction("sync").has_value());
}

TEST(AdbCommandTest, FileNameOfPaths) {
    EXPECT_EQ(file_name_of("/home/user/Pictures/cat.jpg"), "cat.jpg");
    EXPECT_EQ(file_name_of("/sdcard/DCIM/Camera/"), "Camera");
    EXPECT_EQ(file_name_of("notes.txt"), "notes.txt");
    EXPECT_EQ(file_name_of(""), "unknown");
}

TEST(AdbCommandTest, PushDestinationUnderSdcard) {
    EXPECT_EQ(resolve_push_destination("Download/GesuBridge", "/tmp/a.jpg"), "/sdcard/Download/GesuBridge/a.jpg");
    EXPECT_EQ(resolve_push_destination("Music/", "/tmp/song.mp3"), "/sdcard/Music/song.mp3");
    EXPECT_EQ(resolve_push_destination("/data/local/tmp", "/tmp/tool"), "/data/local/tmp/tool");
    EXPECT_EQ(resolve_push_destination("/", "/tmp/x.bin"), "/x.bin");
}

TEST(AdbCommandTest, PullDestinationInLocalDirectory) {
    EXPECT_EQ(resolve_pull_destination("/home/user/Downloads", "/sdcard/DCIM/photo.jpg"),
              "/home/user/Downloads/photo.jpg");
}

TEST(AdbCommandTest, BuildsStructuredInvocation) {
    const auto command = make_adb_transfer_command("adb", "R58M", Direction::Pull, "/sdcard/a b.jpg", "/tmp/a b.jpg");
    EXPECT_EQ(command.executable, "adb");
    EXPECT_TRUE(command.capture_output);
    EXPECT_EQ(command.args, (std::vector<std::string>{"-s", "R58M", "pull", "/sdcard/a b.jpg", "/tmp/a b.jpg"}));
}
