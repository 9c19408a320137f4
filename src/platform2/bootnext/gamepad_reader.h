// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_GAMEPAD_READER_H_
#define BOOTNEXT_GAMEPAD_READER_H_

#include <linux/input.h>

#include <memory>
#include <optional>

#include <base/files/file_path.h>
#include <base/files/scoped_file.h>
#include <base/threading/platform_thread.h>

#include "bootnext/event_queue.h"
#include "bootnext/navigation_event.h"

namespace bootnext {

extern const char kDevInputPath[];

// Maps a raw evdev event from a game controller to a navigation event. Face
// buttons report both press and release, the d-pad (as buttons or as a hat)
// only reports presses. Everything else, including key repeats, is dropped.
std::optional<NavigationEvent> TranslateGamepadEvent(
    const struct input_event& ev);

// Returns true if the evdev node behind `fd` looks like a game controller,
// i.e. it has a South button.
bool IsGamepadDevice(int fd);

// Returns the first game controller under `input_dir`, if any.
std::optional<base::FilePath> FindGamepadDevice(
    const base::FilePath& input_dir = base::FilePath(kDevInputPath));

// Reads a game controller on its own thread and pushes translated events
// into a queue. Runs until the process exits; a failed read is fatal.
class GamepadReader : public base::PlatformThread::Delegate {
 public:
  // `queue` must outlive the thread, i.e. the process.
  GamepadReader(base::ScopedFD fd, EventQueue* queue);
  GamepadReader(const GamepadReader&) = delete;
  GamepadReader& operator=(const GamepadReader&) = delete;
  ~GamepadReader() override = default;

  // Opens `device`. Returns nullptr if it can't be opened or isn't a game
  // controller.
  static std::unique_ptr<GamepadReader> Open(const base::FilePath& device,
                                             EventQueue* queue);

  void StartThread();

 private:
  // base::PlatformThread::Delegate overrides:
  void ThreadMain() override;

  void RunLoop();

  base::ScopedFD fd_;
  EventQueue* const queue_;
};

}  // namespace bootnext

#endif  // BOOTNEXT_GAMEPAD_READER_H_
