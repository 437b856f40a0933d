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
#include "adb-error.h"
#include "wire-conn.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adb_link {

constexpr size_t kSyncMaxChunkSize = 64 * 1024;

// adbd rejects longer sync paths.
constexpr size_t kSyncMaxPathLength = 1024;

// Throws ErrorKind::Assertion for a path longer than kSyncMaxPathLength.
void check_sync_path(std::string_view path);

// The "<path>,<mode>" argument of a SEND request, length checked.
std::string sync_send_argument(std::string_view path, uint32_t mode);

struct DirEntry {
  std::string name;
  uint32_t mode{0};
  uint32_t size{0};
  uint32_t mtime{0};

  bool is_dir() const;
  bool is_regular() const;
  bool is_symlink() const;
};

// A connection switched to the binary sync sub-protocol. Owns the underlying
// WireConn; closing either closes the stream once.
class SyncConn {
public:
  explicit SyncConn(std::unique_ptr<WireConn> conn);

  // Sends "sync:" on a device-pinned connection and takes it over.
  static SyncConn open(std::unique_ptr<WireConn> conn);

  SyncConn(SyncConn&&) noexcept = default;
  SyncConn& operator=(SyncConn&&) noexcept = default;

  // <id><le32 length><arg>. Throws ErrorKind::Assertion before writing
  // anything when arg is longer than kSyncMaxPathLength.
  void send_request(uint32_t id, std::string_view arg);

  // DATA frames of at most kSyncMaxChunkSize each; nothing for size 0.
  void send_data(const char *data, size_t size);
  void send_done(uint32_t mtime);

  uint32_t read_u32();
  void read(void *data, size_t size);
  std::string read_string(size_t length);

  // Reads the <le32 length><message> following a FAIL id and throws it as
  // ErrorKind::Connection.
  [[noreturn]] void throw_fail_message(std::string_view operation);

  void close() noexcept;

  // Streams built on this connection wrap the errors they raise after the
  // opening call returned with this context.
  void set_error_context(ErrorContext context) { context_ = std::move(context); }
  adb_error contextual_error(const adb_error& e) const;

private:
  WireConn &conn();

  std::unique_ptr<WireConn> conn_;
  std::optional<ErrorContext> context_;
};

// Directory listing; entries are read lazily and cannot be restarted.
class DirEntries {
public:
  explicit DirEntries(SyncConn conn);

  // Returns std::nullopt once the listing is exhausted.
  std::optional<DirEntry> next();
  std::vector<DirEntry> read_all();

  void close() noexcept;

private:
  SyncConn conn_;
  bool done_{false};
};

// Streams the DATA frames of a RECV. The first frame header is read on
// construction, so a failing transfer is reported when the file is opened.
class SyncReader {
public:
  explicit SyncReader(SyncConn conn);

  // Returns 0 at end of file.
  size_t read(char *buffer, size_t size);
  std::vector<char> read_all();

  void close() noexcept;
  bool eof() const noexcept { return eof_; }

private:
  void read_chunk_header();

  SyncConn conn_;
  uint32_t chunk_remaining_{0};
  bool eof_{false};
};

// Streams a SEND. close() commits the file: it sends DONE with the
// modification time and reads the daemon's verdict. Destroying a writer that
// was never closed drops the connection without committing.
class SyncWriter {
public:
  using time_point = std::chrono::system_clock::time_point;

  SyncWriter(SyncConn conn, std::optional<time_point> mtime);
  ~SyncWriter();

  SyncWriter(SyncWriter&&) noexcept = default;
  SyncWriter& operator=(SyncWriter&&) noexcept = default;

  void write(const char *data, size_t size);
  void write(std::string_view data) { write(data.data(), data.size()); }

  // Only the first call has an effect. Without an explicit mtime the time of
  // this call is used.
  void close();

private:
  SyncConn conn_;
  std::optional<time_point> mtime_;
  bool closed_{false};
};

DirEntry sync_stat(SyncConn &conn, std::string_view path);

DirEntries sync_list(SyncConn conn, std::string_view path);

SyncReader sync_receive(SyncConn conn, std::string_view path);

SyncWriter sync_send(
    SyncConn conn,
    std::string_view path,
    uint32_t mode,
    std::optional<SyncWriter::time_point> mtime = std::nullopt);

} // namespace adb_link
