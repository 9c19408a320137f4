// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_DEVICE_PATH_H_
#define BOOTNEXT_DEVICE_PATH_H_

#include <cstdint>
#include <string>
#include <vector>

#include <base/containers/span.h>
#include <base/types/expected.h>

namespace bootnext {

// Generic device path node types, UEFI spec v2.9 section 10.3.1.
enum class DevicePathType : uint8_t {
  kHardware = 0x01,
  kAcpi = 0x02,
  kMessaging = 0x03,
  kMedia = 0x04,
  kBiosBootSpec = 0x05,
  kEnd = 0x7F,
};

// Subtype of a kMedia node that carries a file path.
inline constexpr uint8_t kMediaFilePathSubType = 0x04;
// Subtype of a kEnd node that terminates the whole device path.
inline constexpr uint8_t kEndEntireSubType = 0xFF;

// What the menu needs to know about a device path.
struct DevicePathSummary {
  std::vector<std::string> segments;
  bool is_default_candidate = false;
};

// Walks the nodes of `data` up to the End Entire node (or the end of the
// buffer). File path nodes contribute their lowercased path and decide
// whether the entry is a default candidate; the last one seen wins. Other
// nodes contribute the name of their type.
// Returns an error message if a node header is truncated or a node length
// doesn't fit.
base::expected<DevicePathSummary, std::string> ClassifyDevicePath(
    base::span<const uint8_t> data);

// "HARDWARE", "ACPI", ... or "DeviceType(<n>)" for unknown types.
std::string DeviceTypeName(uint8_t type);

// Returns true if the lowercased `path` names one of the firmware's fallback
// loaders, /efi/boot/boot{x64,ia32,aa64}.efi.
bool IsFallbackLoaderPath(const std::string& path);

}  // namespace bootnext

#endif  // BOOTNEXT_DEVICE_PATH_H_
