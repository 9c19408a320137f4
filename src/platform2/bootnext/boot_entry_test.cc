// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/boot_entry.h"

#include <gtest/gtest.h>

#include "bootnext/test_utils.h"

namespace bootnext {

TEST(BootEntryTest, ToString) {
  BootEntry entry = MakeEntry(
      1, "0001", "ubuntu", {"MEDIA", "\\efi\\ubuntu\\shimx64.efi"}, true);
  EXPECT_EQ("ubuntu, at: 'MEDIA \\efi\\ubuntu\\shimx64.efi'", entry.ToString());
}

TEST(BootEntryTest, ToStringNoPath) {
  BootEntry entry = MakeEntry(7, "0007", "Empty", {}, false);
  EXPECT_EQ("Empty, at: ''", entry.ToString());
}

TEST(BootEntryTest, DebugString) {
  BootEntry entry =
      MakeEntry(26, "001A", "PXE", {"ACPI", "HARDWARE", "MESSAGING"}, false);
  EXPECT_EQ(
      "id: 26 (Boot001A)\n"
      "description: 'PXE'\n"
      "default candidate: false\n"
      "path:\n"
      "  ACPI\n"
      "  HARDWARE\n"
      "  MESSAGING",
      entry.DebugString());
}

TEST(BootEntryTest, Equality) {
  BootEntry a = MakeEntry(1, "0001", "Linux", {"MEDIA"}, true);
  BootEntry b = a;
  EXPECT_EQ(a, b);

  b.is_default_candidate = false;
  EXPECT_NE(a, b);
}

}  // namespace bootnext
