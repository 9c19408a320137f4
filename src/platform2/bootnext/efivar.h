// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_EFIVAR_H_
#define BOOTNEXT_EFIVAR_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <base/memory/free_deleter.h>

namespace bootnext {

// Attributes of the global boot variables we write, UEFI spec v2.9
// section 3.3, Table 3-1 "Global Variables".
extern const uint32_t kBootVariableAttributes;

// An errno reported by libefivar.
using EfiVarError = int;

// Access to EFI variables in the global namespace. Abstract so tests can
// substitute an in-memory store.
class EfiVarInterface {
 public:
  using Bytes = std::unique_ptr<uint8_t, base::FreeDeleter>;

  virtual ~EfiVarInterface() = default;

  // False when the kernel doesn't expose EFI runtime services.
  virtual bool EfiVariablesSupported() = 0;

  // Iterates over variable names in the global GUID, returning nullopt once
  // all of them have been seen.
  virtual std::optional<std::string> GetNextVariableName() = 0;

  // Reads `name` into `data`. Returns false if it can't be read.
  virtual bool GetVariable(const std::string& name,
                           Bytes& data,
                           size_t* data_size) = 0;

  // Writes `data` to `name`. Returns the errno on failure, nullopt on
  // success.
  virtual std::optional<EfiVarError> SetVariable(
      const std::string& name,
      uint32_t attributes,
      std::vector<uint8_t>& data) = 0;
};

// libefivar backed implementation.
class EfiVarImpl : public EfiVarInterface {
 public:
  bool EfiVariablesSupported() override;

  std::optional<std::string> GetNextVariableName() override;

  bool GetVariable(const std::string& name,
                   Bytes& data,
                   size_t* data_size) override;

  std::optional<EfiVarError> SetVariable(const std::string& name,
                                         uint32_t attributes,
                                         std::vector<uint8_t>& data) override;
};

}  // namespace bootnext

#endif  // BOOTNEXT_EFIVAR_H_
