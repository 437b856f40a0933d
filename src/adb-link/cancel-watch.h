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

#pragma once
#include <condition_variable>
#include <mutex>
#include <thread>

namespace adb_link {

// Shared between a cancellable command and its watcher thread. Whichever of
// finish() and cancel() comes first decides whether the watcher acts.
class CancelWatch {
public:
  void cancel() {
    {
      std::lock_guard lk(mutex_);
      cancelled_ = true;
    }
    cond_.notify_all();
  }

  void finish() {
    {
      std::lock_guard lk(mutex_);
      finished_ = true;
    }
    cond_.notify_all();
  }

  // Blocks until cancel() or finish(). True only if cancelled before the
  // command finished.
  bool wait_for_cancel() {
    std::unique_lock lk(mutex_);
    cond_.wait(lk, [this] { return cancelled_ || finished_; });
    return cancelled_ && !finished_;
  }

  bool finished() {
    std::lock_guard lk(mutex_);
    return finished_;
  }

private:
  std::mutex mutex_;
  std::condition_variable cond_;
  bool cancelled_{false};
  bool finished_{false};
};

// Marks the command finished and joins its watcher on every way out of the
// primary read, exceptions included.
class WatcherGuard {
public:
  WatcherGuard(CancelWatch &watch, std::thread &watcher)
    : watch_(watch), watcher_(watcher) {}

  ~WatcherGuard() {
    watch_.finish();
    if (watcher_.joinable()) {
      watcher_.join();
    }
  }

  WatcherGuard(const WatcherGuard&) = delete;
  WatcherGuard& operator=(const WatcherGuard&) = delete;

private:
  CancelWatch &watch_;
  std::thread &watcher_;
};

} // namespace adb_link
