// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/terminal_renderer.h"

#include <utility>

#include <base/files/file_util.h>
#include <base/logging.h>
#include <base/strings/stringprintf.h>

namespace bootnext {

const char kMenuTitle[] = "Choose boot selection";

namespace {
constexpr char kEnterAlternateScreen[] = "\x1b[?1049h";
constexpr char kLeaveAlternateScreen[] = "\x1b[?1049l";
constexpr char kHideCursor[] = "\x1b[?25l";
constexpr char kShowCursor[] = "\x1b[?25h";
constexpr char kClearScreen[] = "\x1b[2J";
constexpr char kSelectionMarker[] = "=>";

// Zero-based screen positions.
constexpr int kTitleColumn = 1;
constexpr int kTitleLine = 1;
constexpr int kMarkerColumn = 1;
constexpr int kRowsColumn = 4;
constexpr int kFirstRowLine = 3;

// CUP is one-based.
std::string MoveTo(size_t column, size_t line) {
  return base::StringPrintf("\x1b[%zu;%zuH", line + 1, column + 1);
}

}  // namespace

TerminalRenderer::TerminalRenderer(base::File terminal, int input_fd)
    : terminal_(std::move(terminal)), input_fd_(input_fd) {}

TerminalRenderer::~TerminalRenderer() {
  if (initialized_) {
    Restore();
  }
}

bool TerminalRenderer::Init() {
  if (!terminal_.IsValid()) {
    LOG(ERROR) << "No terminal to draw on.";
    return false;
  }

  struct termios terminal_properties;
  if (tcgetattr(input_fd_, &terminal_properties) != 0) {
    PLOG(WARNING) << "Getting properties of the input terminal failed";
  } else {
    saved_termios_ = terminal_properties;
    cfmakeraw(&terminal_properties);
    if (tcsetattr(input_fd_, TCSANOW, &terminal_properties) != 0) {
      PLOG(WARNING) << "Setting the input terminal to raw mode failed";
      saved_termios_.reset();
    }
  }

  initialized_ = true;
  return Write(std::string(kEnterAlternateScreen) + kHideCursor);
}

bool TerminalRenderer::ShowMenu(const std::vector<std::string>& rows,
                                size_t cursor) {
  if (!Write(BuildMenuString(rows, cursor))) {
    LOG(ERROR) << "Failed to draw the menu.";
    return false;
  }
  return true;
}

// static
std::string TerminalRenderer::BuildMenuString(
    const std::vector<std::string>& rows, size_t cursor) {
  std::string frame = kClearScreen;
  frame += MoveTo(kTitleColumn, kTitleLine);
  frame += kMenuTitle;

  for (size_t i = 0; i < rows.size(); ++i) {
    frame += MoveTo(kRowsColumn, kFirstRowLine + i);
    frame += rows[i];
  }

  frame += MoveTo(kMarkerColumn, kFirstRowLine + cursor);
  frame += kSelectionMarker;
  return frame;
}

bool TerminalRenderer::Write(const std::string& data) {
  // A single write of the whole buffer; nothing is left pending afterwards.
  if (!base::WriteFileDescriptor(terminal_.GetPlatformFile(), data)) {
    PLOG(ERROR) << "Writing to the terminal failed";
    return false;
  }
  return true;
}

void TerminalRenderer::Restore() {
  if (!Write(std::string(kShowCursor) + kLeaveAlternateScreen)) {
    LOG(WARNING) << "Terminal may be left in menu mode.";
  }
  if (saved_termios_ &&
      tcsetattr(input_fd_, TCSANOW, &saved_termios_.value()) != 0) {
    PLOG(WARNING) << "Restoring terminal settings failed";
  }
  initialized_ = false;
}

}  // namespace bootnext
