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

#include "device.h"
#include "cancel-watch.h"
#include "shell-command.h"
#include "string-utils.h"
#include <format>
#include <iostream>
#include <thread>

namespace adb_link {

namespace {

constexpr std::string_view kComponent = "device";

StateChange match_response(
    std::string_view response,
    std::string_view changed,
    std::string_view no_op,
    std::string_view request) {
  if (contains(response, changed)) {
    return StateChange::Changed;
  }
  if (!no_op.empty() && contains(response, no_op)) {
    return StateChange::NoOp;
  }
  throw make_error(ErrorKind::Connection,
      "unexpected {} response: {}", request, trim(response));
}

} // namespace

DeviceState parse_device_state(std::string_view state) {
  state = trim(state);

  if (state.empty()) return DeviceState::Disconnected;
  if (state == "offline") return DeviceState::Offline;
  if (state == "device") return DeviceState::Online;
  if (state == "unauthorized") return DeviceState::Unauthorized;
  if (state == "bootloader") return DeviceState::Bootloader;
  if (state == "recovery") return DeviceState::Recovery;
  if (state == "sideload") return DeviceState::Sideload;
  if (state == "host") return DeviceState::Host;

  throw make_error(ErrorKind::Parse, "invalid device state: {}", state);
}

const char *device_state_name(DeviceState state) noexcept {
  switch (state) {
    case DeviceState::Invalid:
      return "invalid";
    case DeviceState::Unauthorized:
      return "unauthorized";
    case DeviceState::Disconnected:
      return "disconnected";
    case DeviceState::Offline:
      return "offline";
    case DeviceState::Online:
      return "device";
    case DeviceState::Bootloader:
      return "bootloader";
    case DeviceState::Recovery:
      return "recovery";
    case DeviceState::Sideload:
      return "sideload";
    case DeviceState::Host:
      return "host";
  }
  return "invalid";
}

Device::Device(ServerConfig server, DeviceDescriptor descriptor, DeviceListFunc list_devices)
  : server_(std::move(server)),
    descriptor_(std::move(descriptor)),
    list_devices_(std::move(list_devices)) {}

template <class F>
auto Device::with_context(std::string_view operation, F &&f) const -> decltype(f()) {
  try {
    return f();
  } catch (const adb_error &e) {
    throw wrap_error(e, kComponent, operation, descriptor_.to_string());
  }
}

// get-product is documented for the host protocol but most daemons answer
// it with an error.
std::string Device::product() const {
  return with_context("Product", [this] { return get_attribute("get-product"); });
}

std::string Device::serial() const {
  return with_context("Serial", [this] { return get_attribute("get-serialno"); });
}

std::string Device::device_path() const {
  return with_context("DevicePath", [this] { return get_attribute("get-devpath"); });
}

DeviceState Device::state() const {
  return with_context("State", [this] {
    std::string attr;
    try {
      attr = get_attribute("get-state");
    } catch (const adb_error &e) {
      if (contains(e.what(), "unauthorized")) {
        return DeviceState::Unauthorized;
      }
      throw;
    }
    return parse_device_state(attr);
  });
}

DeviceInfo Device::device_info() const {
  auto serial = with_context("DeviceInfo(Serial)", [this] { return this->serial(); });

  auto devices = with_context("DeviceInfo(ListDevices)", [this] {
    if (!list_devices_) {
      throw adb_error(ErrorKind::Assertion, "no device list function");
    }
    return list_devices_();
  });

  for (auto &info : devices) {
    if (info.serial == serial) {
      return info;
    }
  }

  throw wrap_error(
      make_error(ErrorKind::DeviceNotFound, "device list doesn't contain serial {}", serial),
      kComponent, "DeviceInfo", descriptor_.to_string());
}

std::string Device::run_command(std::string_view command, const std::vector<std::string>& args) const {
  return with_context("RunCommand", [&] {
    auto line = prepare_command_line(command, args);
    auto conn = dial_device();

    // Shell responses carry no length header; the body ends when the
    // daemon closes the stream.
    auto req = std::format("shell:{}", line);
    conn->send_message(req);
    conn->read_status(req);

    auto resp = conn->read_until_eof();
    return std::string(resp.begin(), resp.end());
  });
}

CommandResult Device::run_command(
    std::stop_token stop,
    std::string_view command,
    const std::vector<std::string>& args) const {
  CommandResult result;
  std::unique_ptr<WireConn> conn;

  try {
    auto line = prepare_command_line(command, args);
    conn = dial_device(stop);

    auto req = std::format("shell:{}", line);
    conn->send_message(req);
    conn->read_status(req);
  } catch (const adb_error &e) {
    if (e.is(ErrorKind::Cancelled)) {
      result.error = adb_error(ErrorKind::Cancelled, "command cancelled");
    } else {
      result.error = wrap_error(e, kComponent, "RunCommand", descriptor_.to_string());
    }
    return result;
  }

  CancelWatch watch;

  // Only acts if the stop request arrives before the read completes. Once
  // the remote process is gone, or could not be found, the primary read is
  // aborted so the call cannot outlive the cancellation.
  std::thread watcher([&] {
    if (!watch.wait_for_cancel()) {
      return;
    }
    kill_remote_process(command, args, [&watch] { return watch.finished(); });
    conn->cancel();
  });

  std::vector<char> output;
  std::optional<adb_error> read_error;
  {
    WatcherGuard guard(watch, watcher);
    std::stop_callback on_stop(stop, [&watch] { watch.cancel(); });
    try {
      conn->read_until_eof(output);
    } catch (const adb_error &e) {
      read_error = e;
    }
  }

  result.output.assign(output.begin(), output.end());
  if (stop.stop_requested()) {
    result.error = adb_error(ErrorKind::Cancelled, "command cancelled");
  } else if (read_error) {
    result.error = wrap_error(*read_error, kComponent, "RunCommand", descriptor_.to_string());
  }
  return result;
}

void Device::kill_remote_process(
    std::string_view command,
    const std::vector<std::string>& args,
    const std::function<bool()>& finished) const {
  auto pattern = process_match_pattern(command, args);

  std::string pid;
  try {
    pid = std::string(trim(run_command(find_pid_command(pattern))));
  } catch (const adb_error &e) {
    std::cerr << "failed to fetch matching processes: " << e.what() << std::endl;
    return;
  }

  if (pid.empty()) {
    std::cerr << "no process matching '" << pattern << "' to kill" << std::endl;
    return;
  }

  // The pid may already belong to another process once the command has
  // finished on its own.
  if (finished()) {
    return;
  }

  try {
    run_command(std::format("kill {}", pid));
  } catch (const adb_error &e) {
    std::cerr << "failed to kill pid " << pid << ": " << e.what() << std::endl;
  }
}

StateChange Device::remount() const {
  return with_context("Remount", [this] {
    auto resp = round_trip_until_eof("remount");
    return match_response(resp, "remount succeeded", {}, "remount");
  });
}

StateChange Device::root() const {
  return with_context("Root", [this] {
    auto resp = round_trip_until_eof("root:");
    return match_response(resp, "restarting adbd as root", "adbd is already running as root", "root");
  });
}

StateChange Device::unroot() const {
  return with_context("Unroot", [this] {
    auto resp = round_trip_until_eof("unroot:");
    return match_response(resp, "restarting adbd as non root", "adbd not running as root", "unroot");
  });
}

void Device::wait_for(ConnectionState state) const {
  auto target = state == ConnectionState::Device ? "device" : "disconnect";

  with_context(std::format("WaitFor({})", target), [&] {
    auto conn = dial(server_);

    auto req = std::format("{}:wait-for-any-{}", descriptor_.host_prefix(), target);
    conn->send_message(req);
    conn->read_status(req);

    // The daemon repeats OKAY once the state is reached.
    auto resp = conn->read_until_eof();
    auto text = trim(std::string_view(resp.data(), resp.size()));
    if (!text.empty() && text != "OKAY") {
      std::cerr << "unexpected wait-for response: " << text << std::endl;
    }
  });
}

DirEntries Device::list_dir_entries(std::string_view path) const {
  auto op = std::format("ListDirEntries({})", path);
  return with_context(op, [&] {
    check_sync_path(path);
    return sync_list(get_sync_conn(op), path);
  });
}

DirEntry Device::stat(std::string_view path) const {
  auto op = std::format("Stat({})", path);
  return with_context(op, [&] {
    check_sync_path(path);
    auto conn = get_sync_conn(op);
    return sync_stat(conn, path);
  });
}

SyncReader Device::open_read(std::string_view path) const {
  auto op = std::format("OpenRead({})", path);
  return with_context(op, [&] {
    check_sync_path(path);
    return sync_receive(get_sync_conn(op), path);
  });
}

SyncWriter Device::open_write(
    std::string_view path,
    uint32_t perms,
    std::optional<SyncWriter::time_point> mtime) const {
  auto op = std::format("OpenWrite({})", path);
  return with_context(op, [&] {
    sync_send_argument(path, perms);
    return sync_send(get_sync_conn(op), path, perms, mtime);
  });
}

// Returns the first message the daemon sends for <host-prefix>:<attr>.
std::string Device::get_attribute(std::string_view attr) const {
  auto conn = dial(server_);
  return conn->round_trip_single_response(std::format("{}:{}", descriptor_.host_prefix(), attr));
}

// Pins a new connection to the device named by the descriptor.
std::unique_ptr<WireConn> Device::dial_device(std::stop_token stop) const {
  auto conn = dial(server_, stop);

  auto req = std::format("host:{}", descriptor_.transport_descriptor());
  try {
    conn->send_message(req);
  } catch (const adb_error &e) {
    throw adb_error(e.kind(), std::format("error connecting to device '{}'", descriptor_.to_string()), e);
  }
  conn->read_status(req);

  return conn;
}

// Sync streams outlive the call that opens them; their later errors carry
// the opening operation.
SyncConn Device::get_sync_conn(std::string_view operation) const {
  auto conn = SyncConn::open(dial_device());
  conn.set_error_context({std::string(kComponent), std::string(operation), descriptor_.to_string()});
  return conn;
}

std::string Device::round_trip_until_eof(std::string_view request) const {
  auto conn = dial_device();
  conn->send_message(request);
  conn->read_status(request);

  auto resp = conn->read_until_eof();
  return std::string(resp.begin(), resp.end());
}

} // namespace adb_link
