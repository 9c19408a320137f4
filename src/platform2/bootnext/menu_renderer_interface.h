// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_MENU_RENDERER_INTERFACE_H_
#define BOOTNEXT_MENU_RENDERER_INTERFACE_H_

#include <cstddef>
#include <string>
#include <vector>

namespace bootnext {

class MenuRendererInterface {
 public:
  virtual ~MenuRendererInterface() = default;

  // Redraws the whole menu: `rows` top to bottom, with the selection marker
  // on row `cursor`. `cursor` may point past the last row. The frame is
  // fully flushed before returning. Returns false if the output can't be
  // written.
  virtual bool ShowMenu(const std::vector<std::string>& rows,
                        size_t cursor) = 0;
};

}  // namespace bootnext

#endif  // BOOTNEXT_MENU_RENDERER_INTERFACE_H_
