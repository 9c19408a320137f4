// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_BOOT_ENTRY_LOADER_H_
#define BOOTNEXT_BOOT_ENTRY_LOADER_H_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "bootnext/boot_entry.h"
#include "bootnext/efivar.h"

namespace bootnext {

// At most this many bytes of a boot variable are decoded. Entries whose
// device path doesn't fit are skipped.
inline constexpr size_t kMaxBootEntrySize = 1024;

// Builds the list of boot entries from the current EFI variables.
class BootEntryLoader {
 public:
  // `efivar` must outlive this object.
  explicit BootEntryLoader(EfiVarInterface* efivar);

  BootEntryLoader(const BootEntryLoader&) = delete;
  BootEntryLoader& operator=(const BootEntryLoader&) = delete;

  // Reads and decodes every Boot#### variable, in enumeration order.
  // Variables that can't be read or decoded are logged and skipped.
  std::vector<BootEntry> LoadBootEntries();

  // Number of Boot#### variables skipped by the last LoadBootEntries().
  int skipped() const { return skipped_; }

 private:
  // Returns the next Boot#### variable name, nullopt once all are seen.
  std::optional<std::string> GetNextBootVariable();

  // Reads and decodes a single variable. Logs and returns nullopt on error.
  std::optional<BootEntry> LoadEntry(const std::string& name);

  EfiVarInterface* efivar_;
  int skipped_ = 0;
};

}  // namespace bootnext

#endif  // BOOTNEXT_BOOT_ENTRY_LOADER_H_
