// Copyright (c) 2025 R.J. (kencube@hotmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#include "cancel-watch.h"
#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>

using namespace adb_link;

TEST(CancelWatch, FinishedCommandIsNotCancelled) {
  CancelWatch watch;
  watch.cancel();
  watch.finish();
  ASSERT_FALSE(watch.wait_for_cancel());
}

TEST(CancelWatch, CancelWakesWatcher) {
  CancelWatch watch;
  std::atomic<bool> acted{false};
  std::thread watcher([&] { acted = watch.wait_for_cancel(); });

  watch.cancel();
  watcher.join();
  ASSERT_TRUE(acted);
  ASSERT_FALSE(watch.finished());
}

TEST(CancelWatch, FinishBeforeCancel) {
  CancelWatch watch;
  watch.finish();
  watch.cancel();
  ASSERT_FALSE(watch.wait_for_cancel());
  ASSERT_TRUE(watch.finished());
}

TEST(CancelWatch, GuardReleasesWatcherOnException) {
  CancelWatch watch;
  std::atomic<bool> acted{true};
  std::thread watcher([&] { acted = watch.wait_for_cancel(); });

  try {
    WatcherGuard guard(watch, watcher);
    throw std::runtime_error("read failed");
  } catch (const std::runtime_error &e) {
    ASSERT_STREQ(e.what(), "read failed");
  }

  ASSERT_FALSE(watcher.joinable());
  ASSERT_FALSE(acted);
  ASSERT_TRUE(watch.finished());
}

TEST(CancelWatch, GuardToleratesJoinedWatcher) {
  CancelWatch watch;
  std::thread watcher([&] { watch.wait_for_cancel(); });
  watch.cancel();
  watcher.join();

  {
    WatcherGuard guard(watch, watcher);
  }
  ASSERT_TRUE(watch.finished());
}
