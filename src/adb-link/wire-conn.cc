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

#include "wire-conn.h"
#include "adb-error.h"
#include <asio.hpp>
#include <charconv>
#include <format>
#include <optional>
#include <system_error>

namespace adb_link {

using asio::awaitable;
using asio::use_awaitable;
using asio::ip::tcp;

namespace this_coro = asio::this_coro;

namespace {

constexpr std::string_view kStatusOkay = "OKAY";
constexpr std::string_view kStatusFail = "FAIL";

size_t parse_hex_length(std::string_view s) {
  unsigned int length = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), length, 16);
  if (ec != std::errc() || ptr != s.data() + s.size()) {
    throw make_error(ErrorKind::Protocol, "invalid length prefix '{}'", s);
  }
  return length;
}

awaitable<void>
send_protocol_string(tcp::socket &socket, std::string_view s) {
  if (s.size() > kMaxMessageLength) {
    throw make_error(ErrorKind::Assertion,
        "message length {} exceeds maximum {}", s.size(), kMaxMessageLength);
  }

  auto str = std::format("{:04x}{}", s.size(), s);
  co_await async_write(socket, asio::buffer(str), use_awaitable);
}

awaitable<std::string>
read_protocol_string(tcp::socket &socket) {
  std::string msg;
  co_await async_read(socket,
            asio::dynamic_buffer(msg, 4), use_awaitable);

  auto len = parse_hex_length(msg);
  msg.clear();
  if (len) {
    co_await async_read(socket,
              asio::dynamic_buffer(msg, len), use_awaitable);
  }

  co_return msg;
}

awaitable<void>
adb_status(tcp::socket &socket, std::string request) {
  std::string msg;
  co_await async_read(socket,
            asio::dynamic_buffer(msg, 4), use_awaitable);

  if (msg == kStatusOkay) {
    co_return;
  }

  if (msg != kStatusFail) {
    throw make_error(ErrorKind::Protocol,
        "protocol fault (status {:02x} {:02x} {:02x} {:02x}?!)",
        static_cast<uint8_t>(msg[0]), static_cast<uint8_t>(msg[1]),
        static_cast<uint8_t>(msg[2]), static_cast<uint8_t>(msg[3]));
  }

  msg = co_await read_protocol_string(socket);
  throw make_error(ErrorKind::Connection, "server error for {} request: {}", request, msg);
}

awaitable<void>
write_bytes(tcp::socket &socket, const void *data, size_t size) {
  co_await async_write(socket, asio::buffer(data, size), use_awaitable);
}

awaitable<void>
read_bytes(tcp::socket &socket, void *data, size_t size) {
  co_await async_read(socket, asio::buffer(data, size), use_awaitable);
}

void rethrow_as_adb_error(std::exception_ptr e) {
  if (!e) {
    return;
  }

  try {
    std::rethrow_exception(e);
  } catch (const adb_error &) {
    throw;
  } catch (const std::system_error &se) {
    throw make_error(ErrorKind::Network, "{}", se.what());
  }
}

} // namespace

WireConn::WireConn() : socket_(ctx_) {}

WireConn::~WireConn() {
  close();
}

void WireConn::co_spawn_run(awaitable<void> op) {
  std::exception_ptr error;

  asio::co_spawn(
    ctx_,
    std::move(op),
    [&error](std::exception_ptr e) {
      error = e;
    });

  ctx_.restart();
  ctx_.run();

  rethrow_as_adb_error(error);
}

template <class T>
T WireConn::co_spawn_run_ret(awaitable<T> op) {
  std::exception_ptr error;
  std::optional<T> result;

  asio::co_spawn(
    ctx_,
    std::move(op),
    [&error, &result](std::exception_ptr e, T value) {
      error = e;
      if (!e) {
        result = std::move(value);
      }
    });

  ctx_.restart();
  ctx_.run();

  rethrow_as_adb_error(error);
  return std::move(*result);
}

void WireConn::check_open() const {
  if (closed_) {
    throw adb_error(ErrorKind::Network, "use of closed connection");
  }
}

awaitable<void> WireConn::co_connect(ServerConfig config) {
  auto ex = co_await this_coro::executor;

  auto resolver = use_awaitable.as_default_on(tcp::resolver(ex));
  auto endpoints = co_await resolver.async_resolve(tcp::v4(), config.host, config.port);

  if (cancel_requested_) {
    throw asio::system_error(asio::error::operation_aborted);
  }

  co_await asio::async_connect(socket_, endpoints, use_awaitable);
}

void WireConn::connect(const ServerConfig& config, std::stop_token stop) {
  if (stop.stop_requested()) {
    throw adb_error(ErrorKind::Cancelled, "dial cancelled");
  }

  {
    std::stop_callback on_stop(stop, [this] { cancel(); });
    try {
      co_spawn_run(co_connect(config));
    } catch (const adb_error &e) {
      if (stop.stop_requested()) {
        throw adb_error(ErrorKind::Cancelled, "dial cancelled", e);
      }
      throw;
    }
  }

  // A stop that lands after the connect completed must not poison the
  // connection for the caller.
  cancel_requested_ = false;
  closed_ = false;
}

void WireConn::send_message(std::string_view payload) {
  check_open();
  co_spawn_run(send_protocol_string(socket_, payload));
}

void WireConn::read_status(std::string_view request) {
  check_open();
  co_spawn_run(adb_status(socket_, std::string(request)));
}

std::string WireConn::read_message() {
  check_open();
  return co_spawn_run_ret<std::string>(read_protocol_string(socket_));
}

awaitable<void> WireConn::co_read_until_eof(std::vector<char>& out) {
  constexpr auto kBufferSize = 40960;
  char buffer[kBufferSize];

  for (;;) {
    if (cancel_requested_) {
      throw asio::system_error(asio::error::operation_aborted);
    }

    try {
      std::size_t n = co_await socket_.async_read_some(asio::buffer(buffer), use_awaitable);
      out.insert(out.end(), buffer, buffer + n);
    } catch (asio::system_error& e) {
      if (e.code() == asio::error::eof) {
        break;
      }
      throw;
    }
  }
}

void WireConn::read_until_eof(std::vector<char>& out) {
  check_open();
  co_spawn_run(co_read_until_eof(out));
}

std::vector<char> WireConn::read_until_eof() {
  std::vector<char> out;
  read_until_eof(out);
  return out;
}

std::string WireConn::round_trip_single_response(std::string_view request) {
  send_message(request);
  read_status(request);
  return read_message();
}

void WireConn::write(const void *data, size_t size) {
  check_open();
  co_spawn_run(write_bytes(socket_, data, size));
}

void WireConn::read(void *data, size_t size) {
  check_open();
  co_spawn_run(read_bytes(socket_, data, size));
}

void WireConn::cancel() {
  cancel_requested_ = true;
  asio::post(ctx_, [this] {
    std::error_code ec;
    socket_.cancel(ec);
  });
}

void WireConn::close() noexcept {
  if (closed_) {
    return;
  }
  closed_ = true;

  std::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_both, ec);
  socket_.close(ec);
}

std::unique_ptr<WireConn> dial(const ServerConfig& config) {
  return dial(config, std::stop_token{});
}

std::unique_ptr<WireConn> dial(const ServerConfig& config, std::stop_token stop) {
  auto conn = std::make_unique<WireConn>();
  conn->connect(config, stop);
  return conn;
}

} // namespace adb_link
