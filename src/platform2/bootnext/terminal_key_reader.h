// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_TERMINAL_KEY_READER_H_
#define BOOTNEXT_TERMINAL_KEY_READER_H_

#include <cstdint>
#include <optional>

#include <base/threading/platform_thread.h>

#include "bootnext/event_queue.h"
#include "bootnext/navigation_event.h"

namespace bootnext {

// Turns the byte stream of a terminal in raw mode into navigation events.
// Enter becomes a South press, the up and down arrows become directions.
// Every other key, including the rest of the arrow keys, is dropped.
class TerminalKeyParser {
 public:
  TerminalKeyParser() = default;
  TerminalKeyParser(const TerminalKeyParser&) = delete;
  TerminalKeyParser& operator=(const TerminalKeyParser&) = delete;

  // Consumes one byte and returns the event it completes, if any.
  std::optional<NavigationEvent> Feed(uint8_t byte);

 private:
  enum class State {
    kGround,    // Plain characters.
    kEscape,    // After ESC.
    kSequence,  // After "ESC [" or "ESC O", waiting for the final byte.
  };

  State state_ = State::kGround;
};

// Reads the terminal on its own thread and pushes what it parses into a
// queue. Runs until the process exits. A failed read is fatal: without it
// the menu would wait for input forever.
class TerminalKeyReader : public base::PlatformThread::Delegate {
 public:
  // `queue` must outlive the thread, i.e. the process.
  TerminalKeyReader(int fd, EventQueue* queue);
  TerminalKeyReader(const TerminalKeyReader&) = delete;
  TerminalKeyReader& operator=(const TerminalKeyReader&) = delete;
  ~TerminalKeyReader() override = default;

  void StartThread();

 private:
  // base::PlatformThread::Delegate overrides:
  void ThreadMain() override;

  void RunLoop();

  const int fd_;
  EventQueue* const queue_;
  TerminalKeyParser parser_;
};

}  // namespace bootnext

#endif  // BOOTNEXT_TERMINAL_KEY_READER_H_
