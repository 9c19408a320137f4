// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BOOTNEXT_EVENT_QUEUE_H_
#define BOOTNEXT_EVENT_QUEUE_H_

#include <cstddef>

#include <base/containers/queue.h>
#include <base/synchronization/condition_variable.h>
#include <base/synchronization/lock.h>

#include "bootnext/navigation_event.h"

namespace bootnext {

// Unbounded queue fed by any number of input threads and drained by the menu.
// Events from one producer keep their order; events from different producers
// are interleaved in arrival order.
class EventQueue {
 public:
  EventQueue();
  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  // Never blocks. Safe to call from any thread.
  void Push(const NavigationEvent& event);

  // Blocks, without timeout, until an event is available and removes it.
  // Only one thread may consume.
  NavigationEvent Pop();

  size_t size() const;

 private:
  mutable base::Lock lock_;
  base::ConditionVariable event_available_;
  base::queue<NavigationEvent> events_;  // Protected by lock_.
};

}  // namespace bootnext

#endif  // BOOTNEXT_EVENT_QUEUE_H_
