// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_BOOT_ENTRY_H_
#define BOOTNEXT_BOOT_ENTRY_H_

#include <cstdint>
#include <string>
#include <vector>

namespace bootnext {

// One decoded Boot#### variable.
struct BootEntry {
  // Numeric part of the variable name, e.g. 3 for "Boot0003". Zero when the
  // suffix isn't valid hex.
  uint16_t id = 0;
  // The four characters following "Boot", as found in the variable name.
  std::string id_text;
  // The user-friendly label, with anything non-ASCII replaced by spaces.
  std::string description;
  // One element per device path node. File paths are lowercased, other nodes
  // are represented by the name of their type.
  std::vector<std::string> path_segments;
  // Whether the entry shows up in the short menu, i.e. it doesn't point at
  // the firmware's fallback loader.
  bool is_default_candidate = false;

  bool operator==(const BootEntry& other) const;
  bool operator!=(const BootEntry& other) const { return !(*this == other); }

  // "<description>, at: '<segment> <segment>'".
  std::string ToString() const;

  // Multi-line dump of every field.
  std::string DebugString() const;
};

}  // namespace bootnext

#endif  // BOOTNEXT_BOOT_ENTRY_H_
