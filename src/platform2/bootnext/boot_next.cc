// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/boot_next.h"

#include <vector>

#include <base/logging.h>
#include <base/strings/stringprintf.h>

namespace bootnext {

const char kBootNextVariable[] = "BootNext";

std::optional<EfiVarError> SetBootNext(EfiVarInterface& efivar,
                                       uint16_t boot_num) {
  // A single UINT16, little-endian like everything else in UEFI.
  std::vector<uint8_t> data = {static_cast<uint8_t>(boot_num & 0xFF),
                               static_cast<uint8_t>(boot_num >> 8)};

  LOG(INFO) << "Setting " << kBootNextVariable << " to "
            << base::StringPrintf("Boot%04X", boot_num);
  return efivar.SetVariable(kBootNextVariable, kBootVariableAttributes, data);
}

}  // namespace bootnext
