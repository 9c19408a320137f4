// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_BOOT_ENTRY_DECODER_H_
#define BOOTNEXT_BOOT_ENTRY_DECODER_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include <base/containers/span.h>
#include <base/types/expected.h>

#include "bootnext/boot_entry.h"

namespace bootnext {

// Prefix of all boot entry variable names.
extern const char kBootVariablePrefix[];

// Returns true if `name` is "Boot" followed by exactly four hex digits.
bool IsBootVariableName(const std::string& name);

// Decodes a NUL-terminated UTF-16LE string from the start of `data`. Every
// character that isn't ASCII, and every unit that doesn't decode to a valid
// character, comes out as a single space. `consumed` receives the number of
// bytes read, terminator included.
std::string DecodeDescription(base::span<const uint8_t> data,
                              size_t* consumed);

// Decodes the contents of an EFI_LOAD_OPTION (UEFI spec v2.9 section 3.1.3)
// read from `variable_name`:
//   uint32 attributes
//   uint16 file path list length
//   char16 description[] (NUL-terminated)
//   device path (file path list length bytes)
//   optional data (ignored)
// Returns an error message when the buffer is too short for what it claims
// to contain or the device path is malformed.
base::expected<BootEntry, std::string> DecodeBootEntry(
    const std::string& variable_name, base::span<const uint8_t> data);

}  // namespace bootnext

#endif  // BOOTNEXT_BOOT_ENTRY_DECODER_H_
