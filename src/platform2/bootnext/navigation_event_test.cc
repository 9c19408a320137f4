// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/navigation_event.h"

#include <gtest/gtest.h>

namespace bootnext {

TEST(NavigationEventTest, DefaultIsPressedSouth) {
  NavigationEvent event;

  EXPECT_EQ(NavigationEvent::Type::kSouth, event.type);
  EXPECT_TRUE(event.pressed);
  EXPECT_EQ((NavigationEvent{NavigationEvent::Type::kSouth, true}), event);
}

TEST(NavigationEventTest, ToString) {
  EXPECT_EQ("South(pressed)", NavigationEvent().ToString());
  EXPECT_EQ("DirectionUp(pressed)",
            (NavigationEvent{NavigationEvent::Type::kDirectionUp, true})
                .ToString());
  EXPECT_EQ("East(released)",
            (NavigationEvent{NavigationEvent::Type::kEast, false}).ToString());
}

}  // namespace bootnext
