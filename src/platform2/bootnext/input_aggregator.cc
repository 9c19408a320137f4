// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/input_aggregator.h"

#include <optional>

#include <base/logging.h>

namespace bootnext {

InputAggregator::InputAggregator(int terminal_fd)
    : key_reader_(terminal_fd, &queue_) {}

bool InputAggregator::Start(bool use_gamepad,
                            const base::FilePath& gamepad_device) {
  if (use_gamepad) {
    if (!gamepad_device.empty()) {
      gamepad_reader_ = GamepadReader::Open(gamepad_device, &queue_);
      if (!gamepad_reader_) {
        LOG(ERROR) << "Can't use game controller " << gamepad_device.value();
        return false;
      }
    } else {
      std::optional<base::FilePath> found = FindGamepadDevice();
      if (found) {
        gamepad_reader_ = GamepadReader::Open(found.value(), &queue_);
      }
      if (!gamepad_reader_) {
        LOG(WARNING) << "No game controller found, using the keyboard only.";
      }
    }
  }

  key_reader_.StartThread();
  if (gamepad_reader_) {
    LOG(INFO) << "Reading game controller input.";
    gamepad_reader_->StartThread();
  }
  return true;
}

}  // namespace bootnext
