// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_INPUT_AGGREGATOR_H_
#define BOOTNEXT_INPUT_AGGREGATOR_H_

#include <memory>

#include <base/files/file_path.h>

#include "bootnext/event_queue.h"
#include "bootnext/gamepad_reader.h"
#include "bootnext/terminal_key_reader.h"

namespace bootnext {

// Merges the keyboard and the game controller into one event queue. Each
// source runs on its own thread for the rest of the process lifetime; there
// is no way to stop them, so instances must never be destroyed while
// started (hold them in a base::NoDestructor).
class InputAggregator {
 public:
  explicit InputAggregator(int terminal_fd);
  InputAggregator(const InputAggregator&) = delete;
  InputAggregator& operator=(const InputAggregator&) = delete;

  // Starts reading the terminal and, if `use_gamepad`, a game controller:
  // `gamepad_device` when not empty, otherwise the first one found. Returns
  // false only if an explicitly requested controller can't be used. A
  // missing autodetected controller just leaves the keyboard.
  bool Start(bool use_gamepad, const base::FilePath& gamepad_device);

  EventQueue* queue() { return &queue_; }

  bool has_gamepad() const { return gamepad_reader_ != nullptr; }

 private:
  EventQueue queue_;
  TerminalKeyReader key_reader_;
  std::unique_ptr<GamepadReader> gamepad_reader_;
};

}  // namespace bootnext

#endif  // BOOTNEXT_INPUT_AGGREGATOR_H_
