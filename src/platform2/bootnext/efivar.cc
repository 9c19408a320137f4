// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/efivar.h"

#include <cerrno>
#include <cstring>
#include <optional>

#include <base/logging.h>
#include <base/strings/string_number_conversions.h>

// libefivar's headers lack extern "C" guards.
extern "C" {
#include "efivar/efiboot.h"
}

namespace bootnext {

namespace {
bool IsEfiGlobalGUID(const efi_guid_t* guid) {
  const efi_guid_t global = EFI_GLOBAL_GUID;
  return memcmp(guid, &global, sizeof(global)) == 0;
}

// libefivar keeps a stack of errors that is only cleared by some successful
// calls, so stale entries from one call can show up after another. Scope one
// of these around every libefivar call: it starts from an empty stack and on
// destruction logs whatever accumulated and clears it again.
class ScopedEfiErrorLog {
 public:
  explicit ScopedEfiErrorLog(const char* caller) : caller_(caller) {
    efi_error_clear();
  }

  ScopedEfiErrorLog(const ScopedEfiErrorLog&) = delete;
  ScopedEfiErrorLog& operator=(const ScopedEfiErrorLog&) = delete;

  ~ScopedEfiErrorLog() {
    LogErrors();
    efi_error_clear();
  }

  // The errno of the first recorded error, which is usually the relevant one.
  std::optional<EfiVarError> FirstErrno() const {
    char* file = nullptr;
    char* func = nullptr;
    int line = 0;
    char* message = nullptr;
    int error_num = 0;

    if (efi_error_get(0, &file, &func, &line, &message, &error_num) == 1) {
      return error_num;
    }
    return std::nullopt;
  }

 private:
  void LogErrors() const {
    char* file = nullptr;
    char* func = nullptr;
    int line = 0;
    char* message = nullptr;
    int error_num = 0;

    for (uint32_t index = 0;; ++index) {
      const int rc =
          efi_error_get(index, &file, &func, &line, &message, &error_num);
      if (rc == -1) {
        LOG(ERROR) << "efi_error_get rejected its arguments.";
        return;
      }
      if (rc == 0) {
        return;
      }
      // Severity is decided by the caller's own logging.
      LOG(WARNING) << caller_ << ": efi error " << index << ": " << file << ":"
                   << line << ":" << func << " " << message << ": "
                   << std::strerror(error_num);
    }
  }

  const char* caller_;
};

}  // namespace

const uint32_t kBootVariableAttributes = EFI_VARIABLE_NON_VOLATILE |
                                         EFI_VARIABLE_BOOTSERVICE_ACCESS |
                                         EFI_VARIABLE_RUNTIME_ACCESS;

bool EfiVarImpl::EfiVariablesSupported() {
  return efi_variables_supported();
}

std::optional<std::string> EfiVarImpl::GetNextVariableName() {
  ScopedEfiErrorLog error_log(__func__);

  efi_guid_t* guid = nullptr;
  char* name = nullptr;

  // Returns 1 while there are entries left; `name` points at static storage
  // that is overwritten by the next call.
  while (efi_get_next_variable_name(&guid, &name) > 0) {
    if (!name || !guid) {
      return std::nullopt;
    }
    if (!IsEfiGlobalGUID(guid)) {
      continue;
    }
    return std::string(name);
  }

  return std::nullopt;
}

bool EfiVarImpl::GetVariable(const std::string& name,
                             Bytes& data,
                             size_t* data_size) {
  ScopedEfiErrorLog error_log(__func__);

  // Allocated by libefivar with malloc, released by `data`.
  uint8_t* data_ptr = nullptr;
  // Boot entries always carry the same attributes; nothing to check here.
  uint32_t attributes = 0;

  if (efi_get_variable(EFI_GLOBAL_GUID, name.c_str(), &data_ptr, data_size,
                       &attributes) < 0) {
    LOG(ERROR) << "Error reading '" << name << "'";
    return false;
  }

  data.reset(data_ptr);
  return true;
}

std::optional<EfiVarError> EfiVarImpl::SetVariable(const std::string& name,
                                                   uint32_t attributes,
                                                   std::vector<uint8_t>& data) {
  ScopedEfiErrorLog error_log(__func__);

  if (efi_set_variable(EFI_GLOBAL_GUID, name.c_str(), data.data(), data.size(),
                       attributes,
                       // mode
                       0644) < 0) {
    LOG(ERROR) << "Error writing '" << name
               << "' data: " << base::HexEncode(data.data(), data.size());
    // libefivar doesn't always record an errno.
    return error_log.FirstErrno().value_or(EIO);
  }

  return std::nullopt;
}

}  // namespace bootnext
