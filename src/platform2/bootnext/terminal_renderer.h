// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_TERMINAL_RENDERER_H_
#define BOOTNEXT_TERMINAL_RENDERER_H_

#include <termios.h>

#include <optional>
#include <string>
#include <vector>

#include <base/files/file.h>

#include "bootnext/menu_renderer_interface.h"

namespace bootnext {

extern const char kMenuTitle[];

// Draws the menu on a text terminal with ANSI escape sequences. While
// initialized the output terminal shows the alternate screen and has its
// cursor hidden, and the input terminal is in raw mode; all of it is undone on
// destruction.
class TerminalRenderer : public MenuRendererInterface {
 public:
  // `input_fd` is the terminal keys are read from. It isn't owned.
  TerminalRenderer(base::File terminal, int input_fd);
  TerminalRenderer(const TerminalRenderer&) = delete;
  TerminalRenderer& operator=(const TerminalRenderer&) = delete;
  ~TerminalRenderer() override;

  // Switches the terminals into menu mode. Returns false if the output can't
  // be written to. Failing to enter raw mode is only logged. Input readers
  // should be started afterwards so no keystroke is line buffered.
  bool Init();

  // MenuRendererInterface overrides.
  bool ShowMenu(const std::vector<std::string>& rows, size_t cursor) override;

  // The escape sequences and text making up one frame.
  static std::string BuildMenuString(const std::vector<std::string>& rows,
                                     size_t cursor);

 private:
  bool Write(const std::string& data);

  // Leaves menu mode, best effort.
  void Restore();

  base::File terminal_;
  const int input_fd_;
  bool initialized_ = false;
  // Input terminal settings from before Init(), if they could be changed.
  std::optional<struct termios> saved_termios_;
};

}  // namespace bootnext

#endif  // BOOTNEXT_TERMINAL_RENDERER_H_
