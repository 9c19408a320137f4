// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_MENU_CONTROLLER_H_
#define BOOTNEXT_MENU_CONTROLLER_H_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "bootnext/boot_entry.h"
#include "bootnext/event_queue.h"
#include "bootnext/menu_renderer_interface.h"
#include "bootnext/navigation_event.h"

namespace bootnext {

extern const char kAdvancedMenuLabel[];

// A menu row: either a boot entry or the row that opens the advanced view.
class MenuChoice {
 public:
  static MenuChoice ForEntry(const BootEntry& entry);
  static MenuChoice AdvancedMenu();

  bool is_advanced_menu() const { return !entry_.has_value(); }

  // Only valid when !is_advanced_menu().
  const BootEntry& entry() const { return entry_.value(); }

  bool operator==(const MenuChoice& other) const {
    return entry_ == other.entry_;
  }
  bool operator!=(const MenuChoice& other) const { return !(*this == other); }

 private:
  MenuChoice() = default;

  std::optional<BootEntry> entry_;
};

enum class MenuView {
  // Default candidates followed by the advanced menu row.
  kDefault,
  // Every entry, with its device path.
  kAdvanced,
};

// The boot selection state machine. Starts in the default view; up/down move
// the cursor within the active view without wrapping; a South press on the
// advanced menu row switches to the advanced view and on an entry ends the
// session with that entry. Nothing leads back from the advanced view.
//
// The cursor and the tracked choice survive the switch to the advanced view
// as they are, so right after switching the marker is on whatever advanced
// row has the same index while the tracked choice is still the advanced menu
// row. The next move re-syncs them.
class MenuController {
 public:
  // `renderer` must outlive this object.
  MenuController(const std::vector<BootEntry>& entries,
                 MenuRendererInterface* renderer);
  MenuController(const MenuController&) = delete;
  MenuController& operator=(const MenuController&) = delete;

  // Draws the menu, then handles events from `queue` until an entry is
  // chosen. Returns nullopt if drawing fails.
  std::optional<BootEntry> Run(EventQueue* queue);

  // Draws the active view.
  bool Show();

  // Applies one event and redraws unless the session ended. Returns false if
  // drawing fails.
  bool HandleEvent(const NavigationEvent& event);

  MenuView view() const { return view_; }
  size_t cursor() const { return cursor_; }
  const MenuChoice& current() const { return current_; }
  // Set once an entry has been chosen.
  const std::optional<BootEntry>& result() const { return result_; }

  // The rows of the active view.
  const std::vector<MenuChoice>& ActiveRows() const;

  // The text shown for each row of the active view.
  std::vector<std::string> ActiveRowLabels() const;

 private:
  void MoveDown();
  void MoveUp();
  void Confirm();

  MenuRendererInterface* renderer_;

  std::vector<MenuChoice> default_rows_;
  std::vector<MenuChoice> advanced_rows_;

  MenuView view_ = MenuView::kDefault;
  size_t cursor_ = 0;
  MenuChoice current_;
  std::optional<BootEntry> result_;
};

}  // namespace bootnext

#endif  // BOOTNEXT_MENU_CONTROLLER_H_
