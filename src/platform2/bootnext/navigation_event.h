// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_NAVIGATION_EVENT_H_
#define BOOTNEXT_NAVIGATION_EVENT_H_

#include <string>

namespace bootnext {

// Input normalized from the keyboard and the game controller. Buttons are
// named after their position on the controller face.
struct NavigationEvent {
  enum class Type {
    kDirectionUp,
    kDirectionDown,
    kDirectionLeft,
    kDirectionRight,
    kSouth,
    kEast,
    kNorth,
    kWest,
    kStart,
    kSelect,
  };

  Type type = Type::kSouth;
  // For buttons, whether the button went down. Directions are only reported
  // when pressed.
  bool pressed = true;

  bool operator==(const NavigationEvent& other) const {
    return type == other.type && pressed == other.pressed;
  }

  std::string ToString() const;
};

}  // namespace bootnext

#endif  // BOOTNEXT_NAVIGATION_EVENT_H_
