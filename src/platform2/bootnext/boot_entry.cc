// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/boot_entry.h"

#include <base/strings/string_util.h>
#include <base/strings/stringprintf.h>

namespace bootnext {

bool BootEntry::operator==(const BootEntry& other) const {
  return id == other.id && id_text == other.id_text &&
         description == other.description &&
         path_segments == other.path_segments &&
         is_default_candidate == other.is_default_candidate;
}

std::string BootEntry::ToString() const {
  return base::StringPrintf("%s, at: '%s'", description.c_str(),
                            base::JoinString(path_segments, " ").c_str());
}

std::string BootEntry::DebugString() const {
  std::string str = base::StringPrintf(
      "id: %u (Boot%s)\ndescription: '%s'\ndefault candidate: %s\npath:",
      id, id_text.c_str(), description.c_str(),
      is_default_candidate ? "true" : "false");
  for (const auto& segment : path_segments) {
    base::StringAppendF(&str, "\n  %s", segment.c_str());
  }
  return str;
}

}  // namespace bootnext
