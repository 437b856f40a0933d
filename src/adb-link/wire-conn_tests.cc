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
#include "testing/fake-adb-server.h"
#include <gtest/gtest.h>

using namespace adb_link;
using adb_link::testing::FakeAdbServer;
using adb_link::testing::FakeSession;

TEST(WireConn, SendsLengthPrefixedRequest) {
  FakeAdbServer server([](FakeSession &s) -> asio::awaitable<void> {
    auto header = co_await s.read_exact(4);
    auto payload = co_await s.read_exact(std::stoul(header, nullptr, 16));
    co_await s.okay();
    co_await s.write_message(header + payload);
  });

  auto conn = dial(server.config());
  auto echoed = conn->round_trip_single_response("host:version");
  ASSERT_EQ(echoed, "000chost:version");
}

TEST(WireConn, RoundTripSingleResponse) {
  FakeAdbServer server([](FakeSession &s) -> asio::awaitable<void> {
    co_await s.read_request();
    co_await s.okay();
    co_await s.write_message("0029");
  });

  auto conn = dial(server.config());
  ASSERT_EQ(conn->round_trip_single_response("host:version"), "0029");
  ASSERT_EQ(server.requests(), std::vector<std::string>{"host:version"});
}

TEST(WireConn, FailStatusIsConnectionError) {
  FakeAdbServer server([](FakeSession &s) -> asio::awaitable<void> {
    co_await s.read_request();
    co_await s.fail("device 'abc' not found");
  });

  auto conn = dial(server.config());
  conn->send_message("host:serial:abc");
  try {
    conn->read_status("host:serial:abc");
    FAIL();
  } catch (const adb_error &e) {
    ASSERT_EQ(e.kind(), ErrorKind::Connection);
    ASSERT_EQ(e.message(), "server error for host:serial:abc request: device 'abc' not found");
  }
}

TEST(WireConn, UnknownStatusIsProtocolError) {
  FakeAdbServer server([](FakeSession &s) -> asio::awaitable<void> {
    co_await s.read_request();
    co_await s.write("WHAT");
  });

  auto conn = dial(server.config());
  conn->send_message("host:devices");
  try {
    conn->read_status("host:devices");
    FAIL();
  } catch (const adb_error &e) {
    ASSERT_EQ(e.kind(), ErrorKind::Protocol);
  }
}

TEST(WireConn, BadLengthPrefixIsProtocolError) {
  FakeAdbServer server([](FakeSession &s) -> asio::awaitable<void> {
    co_await s.read_request();
    co_await s.okay();
    co_await s.write("zz12abcd");
  });

  auto conn = dial(server.config());
  try {
    conn->round_trip_single_response("host:version");
    FAIL();
  } catch (const adb_error &e) {
    ASSERT_EQ(e.kind(), ErrorKind::Protocol);
  }
}

TEST(WireConn, ReadUntilEof) {
  FakeAdbServer server([](FakeSession &s) -> asio::awaitable<void> {
    co_await s.read_request();
    co_await s.okay();
    co_await s.write("line 1\n");
    co_await s.write("line 2\n");
    s.close();
  });

  auto conn = dial(server.config());
  conn->send_message("shell:cat");
  conn->read_status("shell:cat");
  auto out = conn->read_until_eof();
  ASSERT_EQ(std::string(out.begin(), out.end()), "line 1\nline 2\n");
}

TEST(WireConn, EofDuringMessageIsNetworkError) {
  FakeAdbServer server([](FakeSession &s) -> asio::awaitable<void> {
    co_await s.read_request();
    co_await s.okay();
    co_await s.write("0010abc");
    s.close();
  });

  auto conn = dial(server.config());
  try {
    conn->round_trip_single_response("host:version");
    FAIL();
  } catch (const adb_error &e) {
    ASSERT_EQ(e.kind(), ErrorKind::Network);
  }
}

TEST(WireConn, RejectsOversizedPayload) {
  FakeAdbServer server([](FakeSession &s) -> asio::awaitable<void> {
    co_await s.read_exact(1);
  });

  auto conn = dial(server.config());
  try {
    conn->send_message(std::string(kMaxMessageLength + 1, 'x'));
    FAIL();
  } catch (const adb_error &e) {
    ASSERT_EQ(e.kind(), ErrorKind::Assertion);
  }

  conn->send_message(std::string(10, 'x'));
}

TEST(WireConn, UseAfterCloseIsNetworkError) {
  FakeAdbServer server([](FakeSession &s) -> asio::awaitable<void> {
    co_await s.read_exact(1);
  });

  auto conn = dial(server.config());
  conn->close();
  conn->close();
  ASSERT_TRUE(conn->is_closed());

  try {
    conn->send_message("host:version");
    FAIL();
  } catch (const adb_error &e) {
    ASSERT_EQ(e.kind(), ErrorKind::Network);
    ASSERT_EQ(e.message(), "use of closed connection");
  }
}

TEST(WireConn, DialWithStoppedTokenIsCancelled) {
  std::stop_source stop;
  stop.request_stop();

  try {
    dial(ServerConfig{}, stop.get_token());
    FAIL();
  } catch (const adb_error &e) {
    ASSERT_EQ(e.kind(), ErrorKind::Cancelled);
  }
}
