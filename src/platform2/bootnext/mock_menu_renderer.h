// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_MOCK_MENU_RENDERER_H_
#define BOOTNEXT_MOCK_MENU_RENDERER_H_

#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "bootnext/menu_renderer_interface.h"

namespace bootnext {

class MockMenuRenderer : public MenuRendererInterface {
 public:
  MockMenuRenderer() = default;
  ~MockMenuRenderer() override = default;

  MockMenuRenderer(const MockMenuRenderer&) = delete;
  MockMenuRenderer& operator=(const MockMenuRenderer&) = delete;

  MOCK_METHOD(bool,
              ShowMenu,
              (const std::vector<std::string>& rows, size_t cursor),
              (override));
};

}  // namespace bootnext

#endif  // BOOTNEXT_MOCK_MENU_RENDERER_H_
