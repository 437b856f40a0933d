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
#include "device-descriptor.h"
#include "sync-conn.h"
#include "wire-conn.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace adb_link {

struct DeviceInfo {
  std::string serial;
  std::string state;
  std::string product;
  std::string model;
  std::string device;
  std::string usb;
  int64_t transportId{0};
};

using DeviceListFunc = std::function<std::vector<DeviceInfo>()>;

enum class DeviceState {
  Invalid,
  Unauthorized,
  Disconnected,
  Offline,
  Online,
  Bootloader,
  Recovery,
  Sideload,
  Host,
};

// Throws ErrorKind::Parse for text the daemon is not known to report.
DeviceState parse_device_state(std::string_view state);
const char *device_state_name(DeviceState state) noexcept;

enum class ConnectionState {
  Device,
  Disconnected,
};

// Result of root/unroot/remount. NoOp means the device already was in the
// requested state.
enum class StateChange {
  Changed,
  NoOp,
};

struct CommandResult {
  // Valid up to the point of failure when error is set.
  std::string output;
  std::optional<adb_error> error;

  bool ok() const noexcept { return !error.has_value(); }
  bool cancelled() const noexcept { return error && error->is(ErrorKind::Cancelled); }
};

// Talks to one device through the host daemon. Every call dials a fresh
// connection and closes it before returning, except the streaming sync
// objects, which own their connection.
class Device {
public:
  Device(ServerConfig server, DeviceDescriptor descriptor, DeviceListFunc list_devices);

  const DeviceDescriptor& descriptor() const noexcept { return descriptor_; }
  std::string to_string() const { return descriptor_.to_string(); }

  std::string product() const;
  std::string serial() const;
  std::string device_path() const;
  DeviceState state() const;

  // The daemon has no per-device query for this; the serial is looked up in
  // the device list.
  DeviceInfo device_info() const;

  // Runs "command args..." in a non-interactive shell and returns everything
  // it printed.
  std::string run_command(std::string_view command, const std::vector<std::string>& args = {}) const;

  // Same request, but a stop request kills the remote process and the result
  // carries ErrorKind::Cancelled with the output read so far. Never throws
  // adb_error.
  CommandResult run_command(
      std::stop_token stop,
      std::string_view command,
      const std::vector<std::string>& args = {}) const;

  StateChange remount() const;
  StateChange root() const;
  StateChange unroot() const;

  void wait_for(ConnectionState state) const;

  DirEntries list_dir_entries(std::string_view path) const;
  DirEntry stat(std::string_view path) const;
  SyncReader open_read(std::string_view path) const;

  // The file gets perms and, once the writer is closed, mtime; without mtime
  // the time of close is used.
  SyncWriter open_write(
      std::string_view path,
      uint32_t perms,
      std::optional<SyncWriter::time_point> mtime = std::nullopt) const;

private:
  template <class F>
  auto with_context(std::string_view operation, F &&f) const -> decltype(f());

  std::string get_attribute(std::string_view attr) const;
  std::unique_ptr<WireConn> dial_device(std::stop_token stop = {}) const;
  SyncConn get_sync_conn(std::string_view operation) const;
  std::string round_trip_until_eof(std::string_view request) const;
  void kill_remote_process(
      std::string_view command,
      const std::vector<std::string>& args,
      const std::function<bool()>& finished) const;

  ServerConfig server_;
  DeviceDescriptor descriptor_;
  DeviceListFunc list_devices_;
};

} // namespace adb_link
