// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_BOOT_NEXT_H_
#define BOOTNEXT_BOOT_NEXT_H_

#include <cstdint>
#include <optional>

#include "bootnext/efivar.h"

namespace bootnext {

// Name of the variable telling the firmware which entry to boot once.
extern const char kBootNextVariable[];

// Points BootNext at Boot`boot_num`. Returns the errno on failure.
std::optional<EfiVarError> SetBootNext(EfiVarInterface& efivar,
                                       uint16_t boot_num);

}  // namespace bootnext

#endif  // BOOTNEXT_BOOT_NEXT_H_
