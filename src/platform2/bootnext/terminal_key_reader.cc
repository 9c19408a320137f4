// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/terminal_key_reader.h"

#include <unistd.h>

#include <base/check.h>
#include <base/logging.h>
#include <base/posix/eintr_wrapper.h>

namespace bootnext {

namespace {
constexpr uint8_t kEscape = 0x1B;
constexpr uint8_t kCarriageReturn = '\r';
constexpr uint8_t kLineFeed = '\n';

// Parameter and intermediate bytes of a control sequence, ECMA-48 5.4.
bool IsSequenceContinuation(uint8_t byte) {
  return byte >= 0x20 && byte <= 0x3F;
}

bool IsSequenceFinal(uint8_t byte) {
  return byte >= 0x40 && byte <= 0x7E;
}
}  // namespace

std::optional<NavigationEvent> TerminalKeyParser::Feed(uint8_t byte) {
  switch (state_) {
    case State::kGround:
      if (byte == kEscape) {
        state_ = State::kEscape;
      } else if (byte == kCarriageReturn || byte == kLineFeed) {
        return NavigationEvent{NavigationEvent::Type::kSouth, true};
      }
      return std::nullopt;

    case State::kEscape:
      if (byte == '[' || byte == 'O') {
        state_ = State::kSequence;
      } else if (byte != kEscape) {
        // Alt+key or a bare Escape followed by a key; neither matters.
        state_ = State::kGround;
      }
      return std::nullopt;

    case State::kSequence:
      if (IsSequenceContinuation(byte)) {
        // Modifier parameters, e.g. "ESC [ 1 ; 2 A" for Shift+Up.
        return std::nullopt;
      }
      state_ = State::kGround;
      if (!IsSequenceFinal(byte)) {
        return std::nullopt;
      }
      if (byte == 'A') {
        return NavigationEvent{NavigationEvent::Type::kDirectionUp, true};
      }
      if (byte == 'B') {
        return NavigationEvent{NavigationEvent::Type::kDirectionDown, true};
      }
      return std::nullopt;
  }
  return std::nullopt;
}

TerminalKeyReader::TerminalKeyReader(int fd, EventQueue* queue)
    : fd_(fd), queue_(queue) {
  CHECK(queue_);
}

void TerminalKeyReader::StartThread() {
  CHECK(base::PlatformThread::CreateNonJoinable(0, this));
}

void TerminalKeyReader::ThreadMain() {
  base::PlatformThread::SetName("bootnext_keys");
  RunLoop();
}

void TerminalKeyReader::RunLoop() {
  CHECK_LE(0, fd_);

  uint8_t buffer[32];
  while (true) {
    const ssize_t bytes_read = HANDLE_EINTR(read(fd_, buffer, sizeof(buffer)));
    if (bytes_read < 0) {
      PLOG(FATAL) << "Reading keyboard input failed";
    }
    if (bytes_read == 0) {
      LOG(FATAL) << "Keyboard input closed";
    }

    for (ssize_t i = 0; i < bytes_read; ++i) {
      std::optional<NavigationEvent> event = parser_.Feed(buffer[i]);
      if (event) {
        queue_->Push(event.value());
      }
    }
  }
}

}  // namespace bootnext
