// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/device_path.h"

#include <utility>

#include <base/logging.h>
#include <base/strings/string_util.h>
#include <base/strings/stringprintf.h>
#include <base/strings/utf_string_conversions.h>

#include "bootnext/utf16_le.h"

namespace bootnext {

namespace {
// Each node starts with type, subtype and a 16-bit length that includes
// these four bytes.
constexpr size_t kNodeHeaderSize = 4;

// Paths the firmware falls back to when no boot entry is usable. Entries
// pointing at them are usually created by the firmware itself.
constexpr const char* kFallbackLoaders[] = {
    "\\efi\\boot\\bootx64.efi",
    "\\efi\\boot\\bootia32.efi",
    "\\efi\\boot\\bootaa64.efi",
};

std::string FilePathNodeText(base::span<const uint8_t> payload) {
  size_t consumed = 0;
  const std::u16string path = ReadUtf16LeString(payload, &consumed);
  return base::ToLowerASCII(base::UTF16ToUTF8(path));
}

}  // namespace

std::string DeviceTypeName(uint8_t type) {
  switch (static_cast<DevicePathType>(type)) {
    case DevicePathType::kHardware:
      return "HARDWARE";
    case DevicePathType::kAcpi:
      return "ACPI";
    case DevicePathType::kMessaging:
      return "MESSAGING";
    case DevicePathType::kMedia:
      return "MEDIA";
    case DevicePathType::kBiosBootSpec:
      return "BIOS_BOOT_SPEC";
    case DevicePathType::kEnd:
      return "END";
  }
  return base::StringPrintf("DeviceType(%u)", type);
}

bool IsFallbackLoaderPath(const std::string& path) {
  for (const char* loader : kFallbackLoaders) {
    if (path.find(loader) != std::string::npos) {
      return true;
    }
  }
  return false;
}

base::expected<DevicePathSummary, std::string> ClassifyDevicePath(
    base::span<const uint8_t> data) {
  DevicePathSummary summary;

  size_t offset = 0;
  while (offset < data.size()) {
    if (data.size() - offset < kNodeHeaderSize) {
      return base::unexpected(base::StringPrintf(
          "truncated device path node header at offset %zu", offset));
    }

    const uint8_t type = data[offset];
    const uint8_t sub_type = data[offset + 1];
    const uint16_t length = ReadLe16(data, offset + 2);
    if (length < kNodeHeaderSize || length > data.size() - offset) {
      return base::unexpected(base::StringPrintf(
          "device path node at offset %zu has invalid length %u", offset,
          length));
    }

    if (type == static_cast<uint8_t>(DevicePathType::kEnd) &&
        sub_type == kEndEntireSubType) {
      break;
    }

    if (type == static_cast<uint8_t>(DevicePathType::kMedia) &&
        sub_type == kMediaFilePathSubType) {
      std::string path = FilePathNodeText(data.subspan(
          offset + kNodeHeaderSize, length - kNodeHeaderSize));
      // Only the last file path decides.
      summary.is_default_candidate = !IsFallbackLoaderPath(path);
      summary.segments.push_back(std::move(path));
    } else {
      summary.segments.push_back(DeviceTypeName(type));
    }

    offset += length;
  }

  if (offset >= data.size() && !data.empty()) {
    VLOG(1) << "Device path has no End Entire node";
  }

  return summary;
}

}  // namespace bootnext
