// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_UTF16_LE_H_
#define BOOTNEXT_UTF16_LE_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include <base/containers/span.h>

namespace bootnext {

// Reads the little-endian 16-bit value at `offset`. The caller must ensure
// `offset + 1 < data.size()`.
uint16_t ReadLe16(base::span<const uint8_t> data, size_t offset);

// Collects UTF-16LE code units from the start of `data` up to a zero unit or
// the end of the buffer, whichever comes first. A trailing odd byte is
// ignored. `consumed` receives the number of bytes covered, including the
// terminator when one was found.
std::u16string ReadUtf16LeString(base::span<const uint8_t> data,
                                 size_t* consumed);

}  // namespace bootnext

#endif  // BOOTNEXT_UTF16_LE_H_
