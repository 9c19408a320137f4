// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/utf16_le.h"

namespace bootnext {

uint16_t ReadLe16(base::span<const uint8_t> data, size_t offset) {
  return static_cast<uint16_t>(data[offset]) |
         static_cast<uint16_t>(data[offset + 1]) << 8;
}

std::u16string ReadUtf16LeString(base::span<const uint8_t> data,
                                 size_t* consumed) {
  std::u16string units;
  size_t offset = 0;
  while (offset + 1 < data.size()) {
    const uint16_t unit = ReadLe16(data, offset);
    offset += 2;
    if (unit == 0) {
      break;
    }
    units.push_back(static_cast<char16_t>(unit));
  }

  *consumed = offset;
  return units;
}

}  // namespace bootnext
