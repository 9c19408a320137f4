// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/menu_controller.h"

#include <base/check.h>
#include <base/logging.h>

namespace bootnext {

const char kAdvancedMenuLabel[] = "Advanced Boot Menu";

// static
MenuChoice MenuChoice::ForEntry(const BootEntry& entry) {
  MenuChoice choice;
  choice.entry_ = entry;
  return choice;
}

// static
MenuChoice MenuChoice::AdvancedMenu() {
  return MenuChoice();
}

MenuController::MenuController(const std::vector<BootEntry>& entries,
                               MenuRendererInterface* renderer)
    : renderer_(renderer), current_(MenuChoice::AdvancedMenu()) {
  CHECK(renderer_);

  for (const auto& entry : entries) {
    if (entry.is_default_candidate) {
      default_rows_.push_back(MenuChoice::ForEntry(entry));
    }
    advanced_rows_.push_back(MenuChoice::ForEntry(entry));
  }
  default_rows_.push_back(MenuChoice::AdvancedMenu());

  // The first default candidate, or the advanced menu row if there is none.
  current_ = default_rows_.front();
}

const std::vector<MenuChoice>& MenuController::ActiveRows() const {
  return view_ == MenuView::kDefault ? default_rows_ : advanced_rows_;
}

std::vector<std::string> MenuController::ActiveRowLabels() const {
  std::vector<std::string> labels;
  for (const auto& row : ActiveRows()) {
    if (row.is_advanced_menu()) {
      labels.push_back(kAdvancedMenuLabel);
    } else if (view_ == MenuView::kDefault) {
      labels.push_back(row.entry().description);
    } else {
      labels.push_back(row.entry().ToString());
    }
  }
  return labels;
}

bool MenuController::Show() {
  return renderer_->ShowMenu(ActiveRowLabels(), cursor_);
}

void MenuController::MoveDown() {
  const std::vector<MenuChoice>& rows = ActiveRows();
  if (cursor_ + 1 < rows.size()) {
    ++cursor_;
    current_ = rows[cursor_];
  }
}

void MenuController::MoveUp() {
  const std::vector<MenuChoice>& rows = ActiveRows();
  // The cursor may sit past the end of the advanced view right after the
  // switch, so check the target row too.
  if (cursor_ > 0 && cursor_ - 1 < rows.size()) {
    --cursor_;
    current_ = rows[cursor_];
  }
}

void MenuController::Confirm() {
  if (current_.is_advanced_menu()) {
    if (view_ == MenuView::kDefault) {
      LOG(INFO) << "Switching to the advanced boot menu.";
    }
    view_ = MenuView::kAdvanced;
    return;
  }
  result_ = current_.entry();
}

bool MenuController::HandleEvent(const NavigationEvent& event) {
  if (result_) {
    return true;
  }

  switch (event.type) {
    case NavigationEvent::Type::kDirectionDown:
      MoveDown();
      break;
    case NavigationEvent::Type::kDirectionUp:
      MoveUp();
      break;
    case NavigationEvent::Type::kSouth:
      if (event.pressed) {
        Confirm();
      }
      break;
    default:
      VLOG(1) << "Ignoring " << event.ToString();
      break;
  }

  if (result_) {
    return true;
  }
  return Show();
}

std::optional<BootEntry> MenuController::Run(EventQueue* queue) {
  CHECK(queue);

  if (!Show()) {
    return std::nullopt;
  }
  while (!result_) {
    if (!HandleEvent(queue->Pop())) {
      return std::nullopt;
    }
  }

  LOG(INFO) << "Selected Boot" << result_->id_text << ": "
            << result_->description;
  return result_;
}

}  // namespace bootnext
