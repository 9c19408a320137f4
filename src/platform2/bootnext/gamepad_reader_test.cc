// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/gamepad_reader.h"

#include <linux/input.h>
#include <unistd.h>

#include <optional>
#include <string_view>

#include <base/files/file_util.h>
#include <base/files/scoped_file.h>
#include <base/files/scoped_temp_dir.h>
#include <base/no_destructor.h>
#include <gtest/gtest.h>

namespace bootnext {

class GamepadReaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(temp_dir_.CreateUniqueTempDir());
    ev_ = {};
  }

  std::optional<NavigationEvent> Translate(int type, int code, int value) {
    ev_.type = type;
    ev_.code = code;
    ev_.value = value;
    return TranslateGamepadEvent(ev_);
  }

  struct input_event ev_;
  base::ScopedTempDir temp_dir_;
  EventQueue queue_;
};

TEST_F(GamepadReaderTest, Buttons) {
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kSouth, true}),
            Translate(EV_KEY, BTN_SOUTH, 1));
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kSouth, false}),
            Translate(EV_KEY, BTN_SOUTH, 0));
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kEast, true}),
            Translate(EV_KEY, BTN_EAST, 1));
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kNorth, true}),
            Translate(EV_KEY, BTN_NORTH, 1));
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kWest, true}),
            Translate(EV_KEY, BTN_WEST, 1));
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kStart, false}),
            Translate(EV_KEY, BTN_START, 0));
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kSelect, true}),
            Translate(EV_KEY, BTN_SELECT, 1));
}

TEST_F(GamepadReaderTest, IgnoresAutoRepeat) {
  EXPECT_FALSE(Translate(EV_KEY, BTN_SOUTH, 2));
  EXPECT_FALSE(Translate(EV_KEY, BTN_DPAD_DOWN, 2));
}

TEST_F(GamepadReaderTest, Dpad) {
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kDirectionUp, true}),
            Translate(EV_KEY, BTN_DPAD_UP, 1));
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kDirectionDown, true}),
            Translate(EV_KEY, BTN_DPAD_DOWN, 1));
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kDirectionLeft, true}),
            Translate(EV_KEY, BTN_DPAD_LEFT, 1));
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kDirectionRight, true}),
            Translate(EV_KEY, BTN_DPAD_RIGHT, 1));
  // Releasing a direction reports nothing.
  EXPECT_FALSE(Translate(EV_KEY, BTN_DPAD_UP, 0));
}

TEST_F(GamepadReaderTest, Hat) {
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kDirectionUp, true}),
            Translate(EV_ABS, ABS_HAT0Y, -1));
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kDirectionDown, true}),
            Translate(EV_ABS, ABS_HAT0Y, 1));
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kDirectionLeft, true}),
            Translate(EV_ABS, ABS_HAT0X, -1));
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kDirectionRight, true}),
            Translate(EV_ABS, ABS_HAT0X, 1));
  // Back to center.
  EXPECT_FALSE(Translate(EV_ABS, ABS_HAT0Y, 0));
}

TEST_F(GamepadReaderTest, IgnoresOtherEvents) {
  EXPECT_FALSE(Translate(EV_KEY, KEY_ENTER, 1));
  EXPECT_FALSE(Translate(EV_KEY, BTN_TL, 1));
  EXPECT_FALSE(Translate(EV_ABS, ABS_X, 128));
  EXPECT_FALSE(Translate(EV_SYN, SYN_REPORT, 0));
}

TEST_F(GamepadReaderTest, FindNoDevices) {
  EXPECT_FALSE(FindGamepadDevice(temp_dir_.GetPath()));
}

TEST_F(GamepadReaderTest, FindSkipsNonDevices) {
  // Regular files don't answer the evdev ioctls.
  ASSERT_TRUE(base::WriteFile(temp_dir_.GetPath().Append("event0"), ""));
  ASSERT_TRUE(base::WriteFile(temp_dir_.GetPath().Append("event1"), "x"));

  EXPECT_FALSE(FindGamepadDevice(temp_dir_.GetPath()));
}

TEST_F(GamepadReaderTest, OpenMissingDevice) {
  EXPECT_EQ(nullptr,
            GamepadReader::Open(temp_dir_.GetPath().Append("event7"), &queue_));
}

TEST_F(GamepadReaderTest, OpenNonDevice) {
  const base::FilePath path = temp_dir_.GetPath().Append("event0");
  ASSERT_TRUE(base::WriteFile(path, ""));

  EXPECT_EQ(nullptr, GamepadReader::Open(path, &queue_));
}

TEST_F(GamepadReaderTest, ReadsFromFd) {
  int fds[2];
  ASSERT_EQ(0, pipe(fds));

  // The reader thread can't be stopped and a short read is fatal, so the
  // queue, the reader and the write end stay alive for the rest of the run.
  static base::NoDestructor<EventQueue> queue;
  static base::NoDestructor<GamepadReader> reader(base::ScopedFD(fds[0]),
                                                  queue.get());
  reader->StartThread();

  auto write_event = [&](int type, int code, int value) {
    struct input_event ev = {};
    ev.type = type;
    ev.code = code;
    ev.value = value;
    return base::WriteFileDescriptor(
        fds[1],
        std::string_view(reinterpret_cast<const char*>(&ev), sizeof(ev)));
  };
  ASSERT_TRUE(write_event(EV_KEY, BTN_DPAD_DOWN, 1));
  ASSERT_TRUE(write_event(EV_SYN, SYN_REPORT, 0));
  ASSERT_TRUE(write_event(EV_KEY, BTN_SOUTH, 1));
  ASSERT_TRUE(write_event(EV_KEY, BTN_SOUTH, 0));

  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kDirectionDown, true}),
            queue->Pop());
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kSouth, true}),
            queue->Pop());
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kSouth, false}),
            queue->Pop());
}

}  // namespace bootnext
