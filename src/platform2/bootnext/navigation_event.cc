// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/navigation_event.h"

#include <base/strings/stringprintf.h>

namespace bootnext {

namespace {
const char* TypeName(NavigationEvent::Type type) {
  switch (type) {
    case NavigationEvent::Type::kDirectionUp:
      return "DirectionUp";
    case NavigationEvent::Type::kDirectionDown:
      return "DirectionDown";
    case NavigationEvent::Type::kDirectionLeft:
      return "DirectionLeft";
    case NavigationEvent::Type::kDirectionRight:
      return "DirectionRight";
    case NavigationEvent::Type::kSouth:
      return "South";
    case NavigationEvent::Type::kEast:
      return "East";
    case NavigationEvent::Type::kNorth:
      return "North";
    case NavigationEvent::Type::kWest:
      return "West";
    case NavigationEvent::Type::kStart:
      return "Start";
    case NavigationEvent::Type::kSelect:
      return "Select";
  }
  return "Unknown";
}
}  // namespace

std::string NavigationEvent::ToString() const {
  return base::StringPrintf("%s(%s)", TypeName(type),
                            pressed ? "pressed" : "released");
}

}  // namespace bootnext
