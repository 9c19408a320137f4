// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/event_queue.h"

namespace bootnext {

EventQueue::EventQueue() : event_available_(&lock_) {}

void EventQueue::Push(const NavigationEvent& event) {
  base::AutoLock auto_lock(lock_);
  events_.push(event);
  event_available_.Signal();
}

NavigationEvent EventQueue::Pop() {
  base::AutoLock auto_lock(lock_);
  while (events_.empty()) {
    event_available_.Wait();
  }
  NavigationEvent event = events_.front();
  events_.pop();
  return event;
}

size_t EventQueue::size() const {
  base::AutoLock auto_lock(lock_);
  return events_.size();
}

}  // namespace bootnext
