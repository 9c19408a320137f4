// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/gamepad_reader.h"

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <utility>
#include <vector>

#include <base/check.h>
#include <base/files/file_enumerator.h>
#include <base/logging.h>
#include <base/posix/eintr_wrapper.h>

namespace bootnext {

const char kDevInputPath[] = "/dev/input";

namespace {
constexpr char kEventDevName[] = "event*";

// Key event values.
constexpr int kKeyReleased = 0;
constexpr int kKeyRepeated = 2;

// Determines if the given `bit` is set in the `bitmask` array.
bool TestBit(const int bit, const uint8_t* bitmask) {
  return (bitmask[bit / 8] >> (bit % 8)) & 1;
}

std::optional<NavigationEvent::Type> ButtonType(int code) {
  switch (code) {
    case BTN_SOUTH:
      return NavigationEvent::Type::kSouth;
    case BTN_EAST:
      return NavigationEvent::Type::kEast;
    case BTN_NORTH:
      return NavigationEvent::Type::kNorth;
    case BTN_WEST:
      return NavigationEvent::Type::kWest;
    case BTN_START:
      return NavigationEvent::Type::kStart;
    case BTN_SELECT:
      return NavigationEvent::Type::kSelect;
    default:
      return std::nullopt;
  }
}

std::optional<NavigationEvent::Type> DpadType(int code) {
  switch (code) {
    case BTN_DPAD_UP:
      return NavigationEvent::Type::kDirectionUp;
    case BTN_DPAD_DOWN:
      return NavigationEvent::Type::kDirectionDown;
    case BTN_DPAD_LEFT:
      return NavigationEvent::Type::kDirectionLeft;
    case BTN_DPAD_RIGHT:
      return NavigationEvent::Type::kDirectionRight;
    default:
      return std::nullopt;
  }
}

std::optional<NavigationEvent> TranslateKey(const struct input_event& ev) {
  if (ev.value == kKeyRepeated) {
    return std::nullopt;
  }

  if (std::optional<NavigationEvent::Type> type = ButtonType(ev.code)) {
    return NavigationEvent{type.value(), ev.value != kKeyReleased};
  }

  std::optional<NavigationEvent::Type> type = DpadType(ev.code);
  if (type && ev.value != kKeyReleased) {
    return NavigationEvent{type.value(), true};
  }
  return std::nullopt;
}

// Hats report -1/1 while held and 0 on release.
std::optional<NavigationEvent> TranslateHat(const struct input_event& ev) {
  if (ev.value == 0) {
    return std::nullopt;
  }

  switch (ev.code) {
    case ABS_HAT0Y:
      return NavigationEvent{ev.value < 0
                                 ? NavigationEvent::Type::kDirectionUp
                                 : NavigationEvent::Type::kDirectionDown,
                             true};
    case ABS_HAT0X:
      return NavigationEvent{ev.value < 0
                                 ? NavigationEvent::Type::kDirectionLeft
                                 : NavigationEvent::Type::kDirectionRight,
                             true};
    default:
      return std::nullopt;
  }
}

}  // namespace

std::optional<NavigationEvent> TranslateGamepadEvent(
    const struct input_event& ev) {
  switch (ev.type) {
    case EV_KEY:
      return TranslateKey(ev);
    case EV_ABS:
      return TranslateHat(ev);
    default:
      return std::nullopt;
  }
}

bool IsGamepadDevice(int fd) {
  uint8_t evtype_bitmask[EV_MAX / 8 + 1] = {};
  if (ioctl(fd, EVIOCGBIT(0, sizeof(evtype_bitmask)), evtype_bitmask) == -1) {
    return false;
  }
  if (!TestBit(EV_KEY, evtype_bitmask)) {
    return false;
  }

  uint8_t key_bitmask[KEY_MAX / 8 + 1] = {};
  if (ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(key_bitmask)), key_bitmask) == -1) {
    PLOG(WARNING) << "Failed to ioctl to determine supported key events";
    return false;
  }
  return TestBit(BTN_SOUTH, key_bitmask);
}

std::optional<base::FilePath> FindGamepadDevice(
    const base::FilePath& input_dir) {
  base::FileEnumerator file_enumerator(input_dir, /*recursive=*/false,
                                       base::FileEnumerator::FILES,
                                       FILE_PATH_LITERAL(kEventDevName));

  std::vector<base::FilePath> candidates;
  for (base::FilePath path = file_enumerator.Next(); !path.empty();
       path = file_enumerator.Next()) {
    candidates.push_back(path);
  }
  // Enumeration order is arbitrary; prefer the lowest numbered node.
  std::sort(candidates.begin(), candidates.end());

  for (const auto& path : candidates) {
    base::ScopedFD fd(open(path.value().c_str(), O_RDONLY | O_CLOEXEC));
    if (fd.is_valid() && IsGamepadDevice(fd.get())) {
      return path;
    }
  }
  return std::nullopt;
}

GamepadReader::GamepadReader(base::ScopedFD fd, EventQueue* queue)
    : fd_(std::move(fd)), queue_(queue) {
  CHECK(queue_);
}

// static
std::unique_ptr<GamepadReader> GamepadReader::Open(const base::FilePath& device,
                                                   EventQueue* queue) {
  base::ScopedFD fd(open(device.value().c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd.is_valid()) {
    PLOG(ERROR) << "Failed to open " << device.value();
    return nullptr;
  }
  if (!IsGamepadDevice(fd.get())) {
    LOG(ERROR) << device.value() << " is not a game controller";
    return nullptr;
  }
  return std::make_unique<GamepadReader>(std::move(fd), queue);
}

void GamepadReader::StartThread() {
  CHECK(base::PlatformThread::CreateNonJoinable(0, this));
}

void GamepadReader::ThreadMain() {
  base::PlatformThread::SetName("bootnext_pad");
  RunLoop();
}

void GamepadReader::RunLoop() {
  CHECK(fd_.is_valid());

  struct input_event ev;
  while (true) {
    if (HANDLE_EINTR(read(fd_.get(), &ev, sizeof(ev))) != sizeof(ev)) {
      PLOG(FATAL) << "Reading game controller input failed";
    }

    std::optional<NavigationEvent> event = TranslateGamepadEvent(ev);
    if (event) {
      queue_->Push(event.value());
    }
  }
}

}  // namespace bootnext
