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
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <atomic>
#include <cstddef>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace adb_link {

struct ServerConfig {
  std::string host{"localhost"};
  std::string port{"5037"};
};

// The largest payload a 4 hex digit length prefix can describe.
constexpr size_t kMaxMessageLength = 0xffff;

// One stream to the host daemon. Every call blocks until it completes; the
// connection is owned and used by one thread, except cancel().
class WireConn {
public:
  WireConn();
  ~WireConn();

  WireConn(const WireConn&) = delete;
  WireConn& operator=(const WireConn&) = delete;

  void connect(const ServerConfig& config, std::stop_token stop = {});

  // Writes <4 hex digit length><payload>.
  void send_message(std::string_view payload);

  // Reads OKAY, or FAIL followed by a length-prefixed message, which is
  // thrown as ErrorKind::Connection naming the request.
  void read_status(std::string_view request);

  // Reads one <4 hex digit length><bytes> message.
  std::string read_message();

  std::vector<char> read_until_eof();

  // Appends to out as data arrives, so out keeps whatever was read when an
  // error is thrown.
  void read_until_eof(std::vector<char>& out);

  std::string round_trip_single_response(std::string_view request);

  // Raw access for the binary sync protocol.
  void write(const void *data, size_t size);
  void read(void *data, size_t size);

  // Aborts the blocking operation in progress, and any started later.
  // The only member that may be called from another thread.
  void cancel();

  void close() noexcept;

  bool is_closed() const noexcept { return closed_; }

private:
  void check_open() const;
  void co_spawn_run(asio::awaitable<void> op);

  template <class T>
  T co_spawn_run_ret(asio::awaitable<T> op);

  asio::awaitable<void> co_connect(ServerConfig config);
  asio::awaitable<void> co_read_until_eof(std::vector<char>& out);

  asio::io_context ctx_;
  asio::ip::tcp::socket socket_;
  std::atomic<bool> cancel_requested_{false};
  bool closed_{true};
};

std::unique_ptr<WireConn> dial(const ServerConfig& config);

// A stop request while connecting aborts the dial with ErrorKind::Cancelled.
std::unique_ptr<WireConn> dial(const ServerConfig& config, std::stop_token stop);

} // namespace adb_link
