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

#include "sync-conn.h"
#include "adb-error.h"
#include "device.h"
#include "testing/fake-adb-server.h"
#include <gtest/gtest.h>

using namespace adb_link;
using adb_link::testing::FakeAdbServer;
using adb_link::testing::FakeFile;
using adb_link::testing::FakeFileStore;
using adb_link::testing::FakeSession;

namespace {

// Big enough to need several DATA frames each way.
std::string make_payload(size_t size) {
  std::string data(size, '\0');
  for (size_t i = 0; i < size; i++) {
    data[i] = static_cast<char>(i * 31 + 7);
  }
  return data;
}

class SyncTest : public ::testing::Test {
protected:
  SyncTest()
    : server_([this](FakeSession &s) -> asio::awaitable<void> {
        co_await s.accept_transport();
        co_await s.accept_transport();
        co_await adb_link::testing::serve_sync(s, store_);
      }),
      device_(server_.config(), DeviceDescriptor::with_serial("abc"), nullptr) {}

  FakeFileStore store_;
  FakeAdbServer server_;
  Device device_;
};

} // namespace

TEST_F(SyncTest, SwitchesConnectionToSync) {
  store_.put("/data/a", FakeFile{"x", 0100644, 1});
  device_.stat("/data/a");

  ASSERT_EQ(server_.requests(), (std::vector<std::string>{"host:serial:abc", "sync:"}));
}

TEST_F(SyncTest, Stat) {
  store_.put("/sdcard/notes.txt", FakeFile{"hello", 0100640, 1700000000});

  auto entry = device_.stat("/sdcard/notes.txt");
  ASSERT_EQ(entry.name, "/sdcard/notes.txt");
  ASSERT_EQ(entry.mode, 0100640u);
  ASSERT_EQ(entry.size, 5u);
  ASSERT_EQ(entry.mtime, 1700000000u);
  ASSERT_TRUE(entry.is_regular());
  ASSERT_FALSE(entry.is_dir());
}

TEST_F(SyncTest, StatMissingFile) {
  try {
    device_.stat("/sdcard/missing");
    FAIL();
  } catch (const adb_error &e) {
    ASSERT_EQ(e.kind(), ErrorKind::Connection);
    ASSERT_NE(std::string(e.what()).find("Stat(/sdcard/missing)"), std::string::npos);
  }
}

TEST_F(SyncTest, ListDirEntries) {
  store_.put("/sdcard/a.txt", FakeFile{"aaa", 0100644, 10});
  store_.put("/sdcard/b", FakeFile{"", 040755, 20});
  store_.put("/sdcard/b/nested", FakeFile{"n", 0100644, 30});
  store_.put("/sdcard/link", FakeFile{"target", 0120777, 40});

  auto entries = device_.list_dir_entries("/sdcard").read_all();
  ASSERT_EQ(entries.size(), 3u);

  ASSERT_EQ(entries[0].name, "a.txt");
  ASSERT_EQ(entries[0].size, 3u);
  ASSERT_TRUE(entries[0].is_regular());
  ASSERT_EQ(entries[1].name, "b");
  ASSERT_TRUE(entries[1].is_dir());
  ASSERT_EQ(entries[2].name, "link");
  ASSERT_TRUE(entries[2].is_symlink());
  ASSERT_EQ(entries[2].mtime, 40u);
}

TEST_F(SyncTest, ListEmptyDir) {
  auto entries = device_.list_dir_entries("/empty");
  ASSERT_FALSE(entries.next().has_value());
  ASSERT_FALSE(entries.next().has_value());
}

TEST_F(SyncTest, ReadMultiChunkFile) {
  auto data = make_payload(3 * kSyncMaxChunkSize + 123);
  store_.put("/sdcard/big.bin", FakeFile{data, 0100644, 1});

  auto reader = device_.open_read("/sdcard/big.bin");
  auto out = reader.read_all();
  ASSERT_TRUE(reader.eof());
  ASSERT_EQ(std::string(out.begin(), out.end()), data);

  char c;
  ASSERT_EQ(reader.read(&c, 1), 0u);
}

TEST_F(SyncTest, ReadEmptyFile) {
  store_.put("/sdcard/empty", FakeFile{"", 0100644, 1});

  auto reader = device_.open_read("/sdcard/empty");
  ASSERT_TRUE(reader.read_all().empty());
}

TEST_F(SyncTest, ReadMissingFileFailsOnOpen) {
  try {
    device_.open_read("/sdcard/missing");
    FAIL();
  } catch (const adb_error &e) {
    ASSERT_EQ(e.kind(), ErrorKind::Connection);
    ASSERT_NE(std::string(e.what()).find("No such file or directory"), std::string::npos);
  }
}

TEST_F(SyncTest, WriteThenReadBack) {
  auto data = make_payload(2 * kSyncMaxChunkSize + 1);
  auto mtime = std::chrono::system_clock::time_point(std::chrono::seconds(1600000000));

  auto writer = device_.open_write("/sdcard/up.bin", 0644, mtime);
  writer.write(data.data(), 10);
  writer.write(data.data() + 10, data.size() - 10);
  writer.close();
  writer.close();

  auto file = store_.get("/sdcard/up.bin");
  ASSERT_TRUE(file.has_value());
  ASSERT_EQ(file->data, data);
  ASSERT_EQ(file->mode, 0644u);
  ASSERT_EQ(file->mtime, 1600000000u);

  auto out = device_.open_read("/sdcard/up.bin").read_all();
  ASSERT_EQ(std::string(out.begin(), out.end()), data);
}

TEST_F(SyncTest, WriteWithoutMtimeUsesCloseTime) {
  using namespace std::chrono;
  auto writer = device_.open_write("/sdcard/now.txt", 0600);
  writer.write("contents");

  auto before = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
  writer.close();
  auto after = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();

  auto file = store_.get("/sdcard/now.txt");
  ASSERT_TRUE(file.has_value());
  ASSERT_EQ(file->data, "contents");
  ASSERT_GE(static_cast<int64_t>(file->mtime), before);
  ASSERT_LE(static_cast<int64_t>(file->mtime), after);
}

TEST_F(SyncTest, WriteAfterCloseIsAssertion) {
  auto writer = device_.open_write("/sdcard/x", 0644);
  writer.close();
  try {
    writer.write("late");
    FAIL();
  } catch (const adb_error &e) {
    ASSERT_EQ(e.kind(), ErrorKind::Assertion);
  }
}

TEST_F(SyncTest, UnclosedWriterDoesNotCommit) {
  {
    auto writer = device_.open_write("/sdcard/dropped", 0644);
    writer.write("partial");
  }
  ASSERT_FALSE(store_.get("/sdcard/dropped").has_value());
}

TEST_F(SyncTest, PathTooLong) {
  std::string path = "/sdcard/" + std::string(kSyncMaxPathLength, 'p');

  try {
    device_.open_write(path, 0644);
    FAIL();
  } catch (const adb_error &e) {
    ASSERT_EQ(e.kind(), ErrorKind::Assertion);
  }

  try {
    device_.list_dir_entries(path);
    FAIL();
  } catch (const adb_error &e) {
    ASSERT_EQ(e.kind(), ErrorKind::Assertion);
  }

  try {
    device_.stat(path);
    FAIL();
  } catch (const adb_error &e) {
    ASSERT_EQ(e.kind(), ErrorKind::Assertion);
    ASSERT_NE(std::string(e.what()).find("Stat("), std::string::npos);
  }

  // Rejected before any connection is made.
  ASSERT_TRUE(server_.requests().empty());
}

TEST_F(SyncTest, CommitFailureCarriesDeviceContext) {
  store_.set_read_only(true);

  auto writer = device_.open_write("/system/x", 0644);
  writer.write("data");
  try {
    writer.close();
    FAIL();
  } catch (const adb_error &e) {
    ASSERT_EQ(e.kind(), ErrorKind::Connection);
    std::string what = e.what();
    ASSERT_NE(what.find("device: error performing OpenWrite(/system/x) on Device[serial=abc]"), std::string::npos);
    ASSERT_NE(what.find("Read-only file system"), std::string::npos);
  }
  ASSERT_FALSE(store_.get("/system/x").has_value());
}

TEST_F(SyncTest, ListAfterConnectionLossCarriesDeviceContext) {
  FakeAdbServer server([](FakeSession &s) -> asio::awaitable<void> {
    co_await s.accept_transport();
    co_await s.accept_transport();
    auto header = co_await s.read_exact(8);
    co_await s.read_exact(adb_link::testing::from_le32(header.data() + 4));
    co_await s.write("DENT" + adb_link::testing::le32(0100644) + adb_link::testing::le32(1) +
                     adb_link::testing::le32(1) + adb_link::testing::le32(1) + "a");
    s.close();
  });
  Device device(server.config(), DeviceDescriptor::with_serial("abc"), nullptr);

  auto entries = device.list_dir_entries("/sdcard");
  ASSERT_EQ(entries.next()->name, "a");
  try {
    entries.next();
    FAIL();
  } catch (const adb_error &e) {
    ASSERT_NE(std::string(e.what()).find("ListDirEntries(/sdcard) on Device[serial=abc]"), std::string::npos);
  }
}
