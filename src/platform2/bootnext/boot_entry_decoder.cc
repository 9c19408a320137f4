// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/boot_entry_decoder.h"

#include <limits>
#include <utility>

#include <base/strings/string_number_conversions.h>
#include <base/strings/string_util.h>
#include <base/strings/stringprintf.h>
#include <base/strings/utf_string_conversion_utils.h>

#include "bootnext/device_path.h"
#include "bootnext/utf16_le.h"

namespace bootnext {

const char kBootVariablePrefix[] = "Boot";

namespace {
constexpr size_t kBootVariablePrefixLength = sizeof(kBootVariablePrefix) - 1;

// Offsets into EFI_LOAD_OPTION.
constexpr size_t kFilePathListLengthOffset = 4;
constexpr size_t kDescriptionOffset = 6;

// Parses the hex suffix of a variable name, falling back to 0.
uint16_t ParseBootNumber(const std::string& hex_part) {
  uint32_t num = 0;
  if (!base::HexStringToUInt(hex_part, &num) ||
      num > std::numeric_limits<uint16_t>::max()) {
    return 0;
  }
  return static_cast<uint16_t>(num);
}

bool IsAscii(base_icu::UChar32 code_point) {
  return code_point >= 0 && code_point < 0x80;
}

}  // namespace

bool IsBootVariableName(const std::string& name) {
  return (name.size() == 8 &&
          base::StartsWith(name, kBootVariablePrefix,
                           base::CompareCase::SENSITIVE) &&
          // Safe because of the size() check.
          base::IsHexDigit(name[4]) && base::IsHexDigit(name[5]) &&
          base::IsHexDigit(name[6]) && base::IsHexDigit(name[7]));
}

std::string DecodeDescription(base::span<const uint8_t> data,
                              size_t* consumed) {
  const std::u16string units = ReadUtf16LeString(data, consumed);

  std::string description;
  description.reserve(units.size());
  for (size_t i = 0; i < units.size(); ++i) {
    base_icu::UChar32 code_point;
    // On success `i` is left on the last unit of the character, so a valid
    // surrogate pair turns into one space. On failure only the offending
    // unit is skipped.
    if (base::ReadUnicodeCharacter(units.data(), units.size(), &i,
                                   &code_point) &&
        IsAscii(code_point)) {
      description.push_back(static_cast<char>(code_point));
    } else {
      description.push_back(' ');
    }
  }
  return description;
}

base::expected<BootEntry, std::string> DecodeBootEntry(
    const std::string& variable_name, base::span<const uint8_t> data) {
  if (variable_name.size() < kBootVariablePrefixLength) {
    return base::unexpected(base::StringPrintf(
        "'%s' is too short to be a boot entry name", variable_name.c_str()));
  }

  if (data.size() < kDescriptionOffset) {
    return base::unexpected(
        base::StringPrintf("load option too short (%zu bytes)", data.size()));
  }

  BootEntry entry;
  entry.id_text = variable_name.substr(kBootVariablePrefixLength);
  entry.id = ParseBootNumber(entry.id_text);

  const uint16_t path_length = ReadLe16(data, kFilePathListLengthOffset);

  size_t consumed = 0;
  entry.description =
      DecodeDescription(data.subspan(kDescriptionOffset), &consumed);

  const size_t path_offset = kDescriptionOffset + consumed;
  if (path_length > data.size() - path_offset) {
    return base::unexpected(base::StringPrintf(
        "device path of %u bytes at offset %zu exceeds the %zu bytes read",
        path_length, path_offset, data.size()));
  }

  base::expected<DevicePathSummary, std::string> summary =
      ClassifyDevicePath(data.subspan(path_offset, path_length));
  if (!summary.has_value()) {
    return base::unexpected(std::move(summary.error()));
  }

  entry.path_segments = std::move(summary->segments);
  entry.is_default_candidate = summary->is_default_candidate;
  return entry;
}

}  // namespace bootnext
