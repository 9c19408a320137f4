// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//
// bootnext - pick the EFI boot entry to boot next from a menu driven by the
// keyboard or a game controller, then set BootNext and reboot.

#include <sys/reboot.h>
#include <sysexits.h>
#include <unistd.h>

#include <cstring>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

#include <base/files/file.h>
#include <base/files/file_path.h>
#include <base/logging.h>
#include <base/no_destructor.h>
#include <brillo/flag_helper.h>
#include <brillo/syslog_logging.h>

#include "bootnext/boot_entry.h"
#include "bootnext/boot_entry_loader.h"
#include "bootnext/boot_next.h"
#include "bootnext/efivar.h"
#include "bootnext/input_aggregator.h"
#include "bootnext/menu_controller.h"
#include "bootnext/terminal_renderer.h"

namespace {

// Shows the menu on stdout, reading keys from stdin and optionally a game
// controller, and stores the selection in `choice`. Returns a sysexits.h
// status.
int ChooseEntry(const std::vector<bootnext::BootEntry>& entries,
                bool use_gamepad,
                const base::FilePath& gamepad_device,
                bootnext::BootEntry* choice) {
  bootnext::TerminalRenderer renderer(base::File(dup(STDOUT_FILENO)),
                                      STDIN_FILENO);
  if (!renderer.Init()) {
    LOG(ERROR) << "Can't show the boot menu.";
    return EX_IOERR;
  }

  // Started only once stdin is in raw mode. The reader threads can't be
  // stopped, so what they use must never be destroyed.
  static base::NoDestructor<bootnext::InputAggregator> input(STDIN_FILENO);
  if (!input->Start(use_gamepad, gamepad_device)) {
    return EX_NOINPUT;
  }

  bootnext::MenuController menu(entries, &renderer);
  std::optional<bootnext::BootEntry> selected = menu.Run(input->queue());
  if (!selected) {
    LOG(ERROR) << "Drawing the boot menu failed.";
    return EX_IOERR;
  }

  *choice = std::move(selected.value());
  return EX_OK;
}

}  // namespace

int main(int argc, char* argv[]) {
  DEFINE_bool(actually_boot, false,
              "Write BootNext and reboot into the chosen entry. Without it "
              "the choice is only printed.");
  DEFINE_bool(use_gamepad, true, "Also take input from a game controller.");
  DEFINE_string(gamepad_device, "",
                "evdev node of the game controller, e.g. "
                "/dev/input/event5. Autodetected when empty.");
  brillo::FlagHelper::Init(argc, argv, "Choose the EFI boot entry to boot next");
  brillo::OpenLog("bootnext", /*log_pid=*/true);
  brillo::InitLog(brillo::kLogToSyslog | brillo::kLogHeader |
                  brillo::kLogToStderrIfTty);

  bootnext::EfiVarImpl efivar;
  if (!efivar.EfiVariablesSupported()) {
    LOG(ERROR) << "EFI variables are not available on this system.";
    return EX_UNAVAILABLE;
  }

  bootnext::BootEntryLoader loader(&efivar);
  const std::vector<bootnext::BootEntry> entries = loader.LoadBootEntries();
  if (entries.empty()) {
    LOG(WARNING) << "No usable boot entries, the menu will be empty.";
  }

  // The renderer has restored the terminal by the time this returns.
  bootnext::BootEntry choice;
  const int status = ChooseEntry(entries, FLAGS_use_gamepad,
                                 base::FilePath(FLAGS_gamepad_device), &choice);
  if (status != EX_OK) {
    return status;
  }

  if (!FLAGS_actually_boot) {
    std::cout << choice.DebugString() << std::endl;
    std::cout << "NOT rebooting into it. To boot, pass --actually_boot."
              << std::endl;
    return EX_OK;
  }

  const std::optional<bootnext::EfiVarError> error =
      bootnext::SetBootNext(efivar, choice.id);
  if (error) {
    LOG(ERROR) << "Failed to set " << bootnext::kBootNextVariable << ": "
               << std::strerror(error.value());
    return EX_OSERR;
  }

  LOG(INFO) << "Rebooting into Boot" << choice.id_text << ".";
  sync();
  if (reboot(RB_AUTOBOOT) != 0) {
    PLOG(ERROR) << "Reboot failed";
    return EX_OSERR;
  }
  return EX_OK;
}
