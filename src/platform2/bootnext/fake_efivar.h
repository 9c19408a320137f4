// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_FAKE_EFIVAR_H_
#define BOOTNEXT_FAKE_EFIVAR_H_

#include <stdlib.h>

#include <algorithm>
#include <cstdint>
#include <deque>
#include <list>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "bootnext/efivar.h"

namespace bootnext {

// In-memory EFI variables. Names are enumerated in the order they were given
// to SetData().
class EfiVarFake : public EfiVarInterface {
 public:
  bool EfiVariablesSupported() override { return supported_; }

  std::optional<std::string> GetNextVariableName() override {
    if (variable_names_.empty()) {
      return std::nullopt;
    }

    std::optional<std::string> result(variable_names_.front());
    variable_names_.pop_front();
    return result;
  }

  bool GetVariable(const std::string& name,
                   Bytes& output_data,
                   size_t* data_size) override {
    auto pair = data_.find(name);

    if (pair == data_.end()) {
      return false;
    }

    const std::vector<uint8_t>& value = pair->second;

    *data_size = value.size();
    // malloc(0) may return nullptr; keep the buffer non-null.
    uint8_t* data_ptr =
        reinterpret_cast<uint8_t*>(malloc(std::max<size_t>(value.size(), 1)));
    std::copy(value.begin(), value.end(), data_ptr);
    output_data.reset(data_ptr);

    return true;
  }

  std::optional<EfiVarError> SetVariable(const std::string& name,
                                         uint32_t attributes,
                                         std::vector<uint8_t>& data) override {
    if (!set_variable_result_.empty()) {
      std::optional<EfiVarError> result = set_variable_result_.front();
      set_variable_result_.pop_front();
      if (result) {
        return result;
      }
    }

    data_[name] = data;
    attributes_[name] = attributes;
    return std::nullopt;
  }

  // Replaces every variable. Names listed here but absent from `data_` are
  // enumerated but can't be read.
  void SetData(
      const std::vector<std::pair<std::string, std::vector<uint8_t>>>& data) {
    data_.clear();
    variable_names_.clear();
    for (const auto& [name, value] : data) {
      data_[name] = value;
      variable_names_.push_back(name);
    }
  }

  bool supported_ = true;
  std::map<std::string, std::vector<uint8_t>> data_;
  std::map<std::string, uint32_t> attributes_;
  std::deque<std::string> variable_names_;
  // Results returned by successive SetVariable() calls. Success once empty.
  std::list<std::optional<EfiVarError>> set_variable_result_;
};

}  // namespace bootnext

#endif  // BOOTNEXT_FAKE_EFIVAR_H_
