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
#include <algorithm>
#include <cstring>
#include <format>
#include <sys/stat.h>

namespace adb_link {

namespace {

#define MKID(a, b, c, d) ((a) | ((b) << 8) | ((c) << 16) | ((d) << 24))

#define ID_STAT MKID('S', 'T', 'A', 'T')
#define ID_LIST MKID('L', 'I', 'S', 'T')
#define ID_DENT MKID('D', 'E', 'N', 'T')
#define ID_SEND MKID('S', 'E', 'N', 'D')
#define ID_RECV MKID('R', 'E', 'C', 'V')
#define ID_DONE MKID('D', 'O', 'N', 'E')
#define ID_DATA MKID('D', 'A', 'T', 'A')
#define ID_OKAY MKID('O', 'K', 'A', 'Y')
#define ID_FAIL MKID('F', 'A', 'I', 'L')

// The wire is little-endian regardless of the host.
void put_le32(char *p, uint32_t v) {
  p[0] = static_cast<char>(v & 0xff);
  p[1] = static_cast<char>((v >> 8) & 0xff);
  p[2] = static_cast<char>((v >> 16) & 0xff);
  p[3] = static_cast<char>((v >> 24) & 0xff);
}

uint32_t get_le32(const char *p) {
  auto b = reinterpret_cast<const unsigned char *>(p);
  return static_cast<uint32_t>(b[0]) |
         (static_cast<uint32_t>(b[1]) << 8) |
         (static_cast<uint32_t>(b[2]) << 16) |
         (static_cast<uint32_t>(b[3]) << 24);
}

std::string id_to_string(uint32_t id) {
  char s[4];
  put_le32(s, id);
  return std::string(s, 4);
}

} // namespace

void check_sync_path(std::string_view path) {
  if (path.size() > kSyncMaxPathLength) {
    throw make_error(ErrorKind::Assertion,
        "sync path length {} exceeds maximum {}", path.size(), kSyncMaxPathLength);
  }
}

std::string sync_send_argument(std::string_view path, uint32_t mode) {
  auto arg = std::format("{},{}", path, mode);
  check_sync_path(arg);
  return arg;
}

bool DirEntry::is_dir() const {
  return S_ISDIR(mode);
}

bool DirEntry::is_regular() const {
  return S_ISREG(mode);
}

bool DirEntry::is_symlink() const {
  return S_ISLNK(mode);
}

SyncConn::SyncConn(std::unique_ptr<WireConn> conn) : conn_(std::move(conn)) {}

SyncConn SyncConn::open(std::unique_ptr<WireConn> conn) {
  conn->send_message("sync:");
  conn->read_status("sync");
  return SyncConn(std::move(conn));
}

WireConn &SyncConn::conn() {
  if (!conn_) {
    throw adb_error(ErrorKind::Network, "use of closed connection");
  }
  return *conn_;
}

void SyncConn::send_request(uint32_t id, std::string_view arg) {
  check_sync_path(arg);

  std::vector<char> buf(8 + arg.size());
  put_le32(&buf[0], id);
  put_le32(&buf[4], static_cast<uint32_t>(arg.size()));
  std::memcpy(buf.data() + 8, arg.data(), arg.size());
  conn().write(buf.data(), buf.size());
}

void SyncConn::send_data(const char *data, size_t size) {
  std::vector<char> buf;

  while (size > 0) {
    size_t n = std::min(size, kSyncMaxChunkSize);
    buf.resize(8 + n);
    put_le32(&buf[0], ID_DATA);
    put_le32(&buf[4], static_cast<uint32_t>(n));
    std::memcpy(buf.data() + 8, data, n);
    conn().write(buf.data(), buf.size());

    data += n;
    size -= n;
  }
}

void SyncConn::send_done(uint32_t mtime) {
  char buf[8];
  put_le32(&buf[0], ID_DONE);
  put_le32(&buf[4], mtime);
  conn().write(buf, sizeof(buf));
}

uint32_t SyncConn::read_u32() {
  char buf[4];
  conn().read(buf, sizeof(buf));
  return get_le32(buf);
}

void SyncConn::read(void *data, size_t size) {
  conn().read(data, size);
}

std::string SyncConn::read_string(size_t length) {
  std::string s(length, '\0');
  if (length) {
    conn().read(s.data(), length);
  }
  return s;
}

void SyncConn::throw_fail_message(std::string_view operation) {
  uint32_t length = read_u32();
  if (length > kSyncMaxChunkSize) {
    throw make_error(ErrorKind::Protocol,
        "too-long message length from daemon: msglen = {}", length);
  }
  throw make_error(ErrorKind::Connection, "{} failed: {}", operation, read_string(length));
}

void SyncConn::close() noexcept {
  if (conn_) {
    conn_->close();
  }
}

adb_error SyncConn::contextual_error(const adb_error& e) const {
  return context_ ? wrap_error(e, *context_) : e;
}

DirEntry sync_stat(SyncConn &conn, std::string_view path) {
  conn.send_request(ID_STAT, path);

  uint32_t id = conn.read_u32();
  if (id == ID_FAIL) {
    conn.throw_fail_message("stat");
  }
  if (id != ID_STAT) {
    throw make_error(ErrorKind::Protocol,
        "protocol fault: stat response has wrong message id '{}'", id_to_string(id));
  }

  char buf[12];
  conn.read(buf, sizeof(buf));

  DirEntry entry;
  entry.name = std::string(path);
  entry.mode = get_le32(&buf[0]);
  entry.size = get_le32(&buf[4]);
  entry.mtime = get_le32(&buf[8]);

  // adbd answers a failed lstat with an all-zero record.
  if (entry.mode == 0 && entry.size == 0 && entry.mtime == 0) {
    throw make_error(ErrorKind::Connection, "stat failed: no such file or directory: {}", path);
  }

  return entry;
}

DirEntries::DirEntries(SyncConn conn) : conn_(std::move(conn)) {}

std::optional<DirEntry> DirEntries::next() {
  if (done_) {
    return std::nullopt;
  }

  try {
    uint32_t id = conn_.read_u32();
    if (id == ID_FAIL) {
      conn_.throw_fail_message("list");
    }

    // DENT and DONE are both followed by mode, size, mtime and namelen.
    char buf[16];
    conn_.read(buf, sizeof(buf));

    if (id == ID_DONE) {
      close();
      return std::nullopt;
    }

    if (id != ID_DENT) {
      throw make_error(ErrorKind::Protocol, "unexpected dent id '{}'", id_to_string(id));
    }

    uint32_t namelen = get_le32(&buf[12]);
    if (namelen > kSyncMaxPathLength) {
      throw make_error(ErrorKind::Protocol, "dent namelen {} too long", namelen);
    }

    DirEntry entry;
    entry.mode = get_le32(&buf[0]);
    entry.size = get_le32(&buf[4]);
    entry.mtime = get_le32(&buf[8]);
    entry.name = conn_.read_string(namelen);
    return entry;
  } catch (const adb_error &e) {
    close();
    throw conn_.contextual_error(e);
  }
}

std::vector<DirEntry> DirEntries::read_all() {
  std::vector<DirEntry> out;
  while (auto entry = next()) {
    out.push_back(std::move(*entry));
  }
  return out;
}

void DirEntries::close() noexcept {
  done_ = true;
  conn_.close();
}

DirEntries sync_list(SyncConn conn, std::string_view path) {
  conn.send_request(ID_LIST, path);
  return DirEntries(std::move(conn));
}

SyncReader::SyncReader(SyncConn conn) : conn_(std::move(conn)) {
  read_chunk_header();
}

void SyncReader::read_chunk_header() {
  try {
    uint32_t id = conn_.read_u32();
    if (id == ID_FAIL) {
      conn_.throw_fail_message("recv");
    }

    uint32_t length = conn_.read_u32();

    if (id == ID_DONE) {
      close();
      return;
    }

    if (id != ID_DATA) {
      throw make_error(ErrorKind::Protocol, "bad sync recv id '{}'", id_to_string(id));
    }

    if (length == 0) {
      throw adb_error(ErrorKind::Protocol, "empty sync data chunk");
    }

    if (length > kSyncMaxChunkSize) {
      throw make_error(ErrorKind::Protocol, "sync recv size {} too large", length);
    }

    chunk_remaining_ = length;
  } catch (const adb_error &) {
    close();
    throw;
  }
}

size_t SyncReader::read(char *buffer, size_t size) {
  if (eof_ || size == 0) {
    return 0;
  }

  try {
    if (chunk_remaining_ == 0) {
      read_chunk_header();
      if (eof_) {
        return 0;
      }
    }

    size_t n = std::min<size_t>(size, chunk_remaining_);
    conn_.read(buffer, n);
    chunk_remaining_ -= static_cast<uint32_t>(n);
    return n;
  } catch (const adb_error &e) {
    close();
    throw conn_.contextual_error(e);
  }
}

std::vector<char> SyncReader::read_all() {
  std::vector<char> out;
  char buffer[8192];
  while (size_t n = read(buffer, sizeof(buffer))) {
    out.insert(out.end(), buffer, buffer + n);
  }
  return out;
}

void SyncReader::close() noexcept {
  eof_ = true;
  chunk_remaining_ = 0;
  conn_.close();
}

SyncReader sync_receive(SyncConn conn, std::string_view path) {
  conn.send_request(ID_RECV, path);
  return SyncReader(std::move(conn));
}

SyncWriter::SyncWriter(SyncConn conn, std::optional<time_point> mtime)
  : conn_(std::move(conn)), mtime_(mtime) {}

SyncWriter::~SyncWriter() {
  conn_.close();
}

void SyncWriter::write(const char *data, size_t size) {
  if (closed_) {
    throw adb_error(ErrorKind::Assertion, "write to closed sync writer");
  }

  try {
    conn_.send_data(data, size);
  } catch (const adb_error &e) {
    conn_.close();
    throw conn_.contextual_error(e);
  }
}

void SyncWriter::close() {
  if (closed_) {
    return;
  }
  closed_ = true;

  auto mtime = mtime_.value_or(std::chrono::system_clock::now());
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(mtime.time_since_epoch()).count();

  try {
    conn_.send_done(static_cast<uint32_t>(seconds));

    uint32_t id = conn_.read_u32();
    if (id == ID_FAIL) {
      conn_.throw_fail_message("send");
    }

    uint32_t length = conn_.read_u32();
    if (id != ID_OKAY) {
      throw make_error(ErrorKind::Protocol,
          "unexpected response from daemon: id = '{}'", id_to_string(id));
    }
    if (length != 0) {
      throw make_error(ErrorKind::Protocol, "received OKAY with msg_len {} != 0", length);
    }
  } catch (const adb_error &e) {
    conn_.close();
    throw conn_.contextual_error(e);
  }

  conn_.close();
}

SyncWriter sync_send(
    SyncConn conn,
    std::string_view path,
    uint32_t mode,
    std::optional<SyncWriter::time_point> mtime) {
  conn.send_request(ID_SEND, sync_send_argument(path, mode));
  return SyncWriter(std::move(conn), mtime);
}

} // namespace adb_link
