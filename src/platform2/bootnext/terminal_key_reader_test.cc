// Copyright 2023 The ChromiumOS Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "bootnext/terminal_key_reader.h"

#include <unistd.h>

#include <optional>
#include <string>
#include <vector>

#include <base/files/file_util.h>
#include <base/no_destructor.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using testing::ElementsAre;
using testing::IsEmpty;

namespace bootnext {

namespace {

const NavigationEvent kUp{NavigationEvent::Type::kDirectionUp, true};
const NavigationEvent kDown{NavigationEvent::Type::kDirectionDown, true};
const NavigationEvent kConfirm{NavigationEvent::Type::kSouth, true};

}  // namespace

class TerminalKeyParserTest : public ::testing::Test {
 protected:
  std::vector<NavigationEvent> FeedAll(const std::string& input) {
    std::vector<NavigationEvent> events;
    for (char c : input) {
      std::optional<NavigationEvent> event =
          parser_.Feed(static_cast<uint8_t>(c));
      if (event) {
        events.push_back(event.value());
      }
    }
    return events;
  }

  TerminalKeyParser parser_;
};

TEST_F(TerminalKeyParserTest, Arrows) {
  EXPECT_THAT(FeedAll("\x1b[A"), ElementsAre(kUp));
  EXPECT_THAT(FeedAll("\x1b[B"), ElementsAre(kDown));
}

TEST_F(TerminalKeyParserTest, ApplicationModeArrows) {
  EXPECT_THAT(FeedAll("\x1bOA\x1bOB"), ElementsAre(kUp, kDown));
}

TEST_F(TerminalKeyParserTest, Enter) {
  EXPECT_THAT(FeedAll("\r"), ElementsAre(kConfirm));
  EXPECT_THAT(FeedAll("\n"), ElementsAre(kConfirm));
}

TEST_F(TerminalKeyParserTest, ModifiedArrows) {
  EXPECT_THAT(FeedAll("\x1b[1;2A\x1b[1;5B"), ElementsAre(kUp, kDown));
}

TEST_F(TerminalKeyParserTest, IgnoresOtherKeys) {
  EXPECT_THAT(FeedAll("q j k \t"), IsEmpty());
  // Left, Right, Home, Page Down.
  EXPECT_THAT(FeedAll("\x1b[D\x1b[C\x1b[H\x1b[6~"), IsEmpty());
  // Alt+A.
  EXPECT_THAT(FeedAll("\x1b" "A"), IsEmpty());
}

TEST_F(TerminalKeyParserTest, RecoversAfterUnknownSequence) {
  EXPECT_THAT(FeedAll("\x1b[C\x1b[B\r"), ElementsAre(kDown, kConfirm));
  EXPECT_THAT(FeedAll("\x1b\x1b[A"), ElementsAre(kUp));
}

TEST_F(TerminalKeyParserTest, SplitAcrossFeeds) {
  EXPECT_THAT(FeedAll("\x1b"), IsEmpty());
  EXPECT_THAT(FeedAll("["), IsEmpty());
  EXPECT_THAT(FeedAll("A"), ElementsAre(kUp));
}

TEST(TerminalKeyReaderTest, ReadsFromFd) {
  int fds[2];
  ASSERT_EQ(0, pipe(fds));

  // The reader thread can't be stopped and treats end of input as fatal, so
  // the queue and both ends of the pipe stay alive for the rest of the run.
  static base::NoDestructor<EventQueue> queue;
  static base::NoDestructor<TerminalKeyReader> reader(fds[0], queue.get());
  reader->StartThread();

  ASSERT_TRUE(base::WriteFileDescriptor(fds[1], "x\x1b[B\x1b[A\r"));

  EXPECT_EQ(kDown, queue->Pop());
  EXPECT_EQ(kUp, queue->Pop());
  EXPECT_EQ(kConfirm, queue->Pop());
}

}  // namespace bootnext
