// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/boot_entry_loader.h"

#include <algorithm>
#include <utility>

#include <base/check.h>
#include <base/containers/span.h>
#include <base/logging.h>

#include "bootnext/boot_entry_decoder.h"

namespace bootnext {

BootEntryLoader::BootEntryLoader(EfiVarInterface* efivar) : efivar_(efivar) {
  CHECK(efivar_);
}

std::optional<std::string> BootEntryLoader::GetNextBootVariable() {
  std::optional<std::string> name;
  while ((name = efivar_->GetNextVariableName())) {
    if (IsBootVariableName(name.value())) {
      return name;
    }
  }
  return std::nullopt;
}

std::optional<BootEntry> BootEntryLoader::LoadEntry(const std::string& name) {
  EfiVarInterface::Bytes data;
  size_t data_size = 0;
  if (!efivar_->GetVariable(name, data, &data_size)) {
    LOG(WARNING) << "Skipping " << name << ": can't read variable";
    return std::nullopt;
  }

  if (data_size > kMaxBootEntrySize) {
    VLOG(1) << name << " is " << data_size << " bytes, decoding the first "
            << kMaxBootEntrySize;
  }
  const base::span<const uint8_t> bytes(
      data.get(), std::min(data_size, kMaxBootEntrySize));

  base::expected<BootEntry, std::string> entry = DecodeBootEntry(name, bytes);
  if (!entry.has_value()) {
    LOG(WARNING) << "Skipping " << name << ": " << entry.error();
    return std::nullopt;
  }

  return std::move(entry.value());
}

std::vector<BootEntry> BootEntryLoader::LoadBootEntries() {
  std::vector<BootEntry> entries;
  skipped_ = 0;

  std::optional<std::string> name;
  while ((name = GetNextBootVariable())) {
    std::optional<BootEntry> entry = LoadEntry(name.value());
    if (entry) {
      entries.push_back(std::move(entry.value()));
    } else {
      ++skipped_;
    }
  }

  LOG(INFO) << "Loaded " << entries.size() << " boot entries, skipped "
            << skipped_;
  return entries;
}

}  // namespace bootnext
