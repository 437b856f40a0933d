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

#include "adb-link/adb.h"
#include "adb-link/adb-error.h"
#include <gflags/gflags.h>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stop_token>
#include <thread>
#include <nlohmann/json.hpp>

#ifndef ADB_LINK_VERSION
#define ADB_LINK_VERSION "0.0.0"
#endif

using namespace adb_link;

using json = nlohmann::json;

DEFINE_string(host, "localhost",
                  "adb server host.");

DEFINE_string(port, "5037",
                  "adb server port.");

// the following flags select the target device

DEFINE_string(serial, "",
                  "target the device with this serial.");

DEFINE_bool(usb, false,
                  "target the only usb device.");

DEFINE_bool(local, false,
                  "target the only local (tcp/emulator) device.");

DEFINE_int64(transport_id, -1,
                  "target the device with this transport id.");

DEFINE_bool(pretty, false,
                  "pretty json output.");

DEFINE_int64(timeout_ms, 0,
                  "cancel shell commands after this many milliseconds. 0 waits forever.");

namespace {

json
deviceInfoToJsonObject(const DeviceInfo &dev) {
  json jdev;

  jdev["serial"] = dev.serial;
  jdev["state"] = dev.state;
  if (!dev.product.empty()) jdev["product"] = dev.product;
  if (!dev.model.empty()) jdev["model"] = dev.model;
  if (!dev.device.empty()) jdev["device"] = dev.device;
  if (!dev.usb.empty()) jdev["usb"] = dev.usb;
  if (dev.transportId) jdev["transportId"] = dev.transportId;

  return jdev;
}

json
dirEntryToJsonObject(const DirEntry &entry) {
  json jentry;

  jentry["name"] = entry.name;
  jentry["mode"] = entry.mode;
  jentry["size"] = entry.size;
  jentry["mtime"] = entry.mtime;
  if (entry.is_dir()) jentry["type"] = "dir";
  else if (entry.is_symlink()) jentry["type"] = "symlink";
  else if (entry.is_regular()) jentry["type"] = "file";

  return jentry;
}

void print_json(const json &j) {
  std::cout << j.dump(FLAGS_pretty ? 4 : -1) << std::endl;
}

DeviceDescriptor selected_descriptor() {
  if (!FLAGS_serial.empty()) {
    return DeviceDescriptor::with_serial(FLAGS_serial);
  }
  if (FLAGS_transport_id >= 0) {
    return DeviceDescriptor::with_transport_id(FLAGS_transport_id);
  }
  if (FLAGS_usb) {
    return DeviceDescriptor::usb();
  }
  if (FLAGS_local) {
    return DeviceDescriptor::local();
  }
  return DeviceDescriptor::any();
}

// Requests a stop on source unless disarmed first.
class Deadline {
public:
  Deadline(std::stop_source source, std::chrono::milliseconds timeout)
    : thread_([this, source, timeout](std::stop_token disarm) mutable {
        std::unique_lock lk(mutex_);
        if (!cond_.wait_for(lk, disarm, timeout, [] { return false; })) {
          if (!disarm.stop_requested()) {
            source.request_stop();
          }
        }
      }) {}

private:
  std::mutex mutex_;
  std::condition_variable_any cond_;
  std::jthread thread_;
};

int run_shell(const Device &device, const std::vector<std::string> &words) {
  std::string command = words[0];
  std::vector<std::string> args(words.begin() + 1, words.end());

  if (FLAGS_timeout_ms <= 0) {
    std::cout << device.run_command(command, args);
    return 0;
  }

  std::stop_source stop;
  CommandResult result;
  {
    Deadline deadline(stop, std::chrono::milliseconds(FLAGS_timeout_ms));
    result = device.run_command(stop.get_token(), command, args);
  }

  std::cout << result.output;
  if (result.cancelled()) {
    std::cerr << "command timed out after " << FLAGS_timeout_ms << "ms" << std::endl;
    return 124;
  }
  if (result.error) {
    throw *result.error;
  }
  return 0;
}

int pull(const Device &device, const std::string &remote, const std::string &local) {
  auto reader = device.open_read(remote);

  std::ofstream out(local, std::ios::binary);
  if (!out) {
    std::cerr << "cannot open " << local << " for writing" << std::endl;
    return 1;
  }

  char buffer[kSyncMaxChunkSize];
  while (size_t n = reader.read(buffer, sizeof(buffer))) {
    out.write(buffer, static_cast<std::streamsize>(n));
  }
  return 0;
}

int push(const Device &device, const std::string &local, const std::string &remote) {
  std::ifstream in(local, std::ios::binary);
  if (!in) {
    std::cerr << "cannot open " << local << std::endl;
    return 1;
  }

  namespace fs = std::filesystem;
  auto perms = static_cast<uint32_t>(fs::status(local).permissions() & fs::perms::mask);
  auto mtime = std::chrono::file_clock::to_sys(fs::last_write_time(local));

  auto writer = device.open_write(remote, perms,
      std::chrono::time_point_cast<std::chrono::system_clock::duration>(mtime));

  char buffer[kSyncMaxChunkSize];
  while (in) {
    in.read(buffer, sizeof(buffer));
    if (auto n = in.gcount()) {
      writer.write(buffer, static_cast<size_t>(n));
    }
  }
  writer.close();
  return 0;
}

const char *state_change_name(StateChange change) {
  return change == StateChange::Changed ? "changed" : "unchanged";
}

int run(const Adb &adb, const std::vector<std::string> &words) {
  const auto &cmd = words[0];
  auto argc = words.size();

  if (cmd == "devices") {
    auto jdevs = json::array();
    for (const auto &dev : adb.list_devices()) {
      jdevs.push_back(deviceInfoToJsonObject(dev));
    }
    print_json(jdevs);
    return 0;
  }

  if (cmd == "version") {
    std::cout << adb.server_version() << std::endl;
    return 0;
  }

  if (cmd == "kill-server") {
    adb.kill_server();
    return 0;
  }

  auto device = adb.device(selected_descriptor());

  if (cmd == "info") {
    print_json(deviceInfoToJsonObject(device.device_info()));
  } else if (cmd == "state") {
    std::cout << device_state_name(device.state()) << std::endl;
  } else if (cmd == "shell" && argc >= 2) {
    return run_shell(device, std::vector<std::string>(words.begin() + 1, words.end()));
  } else if (cmd == "ls" && argc == 2) {
    auto jentries = json::array();
    auto entries = device.list_dir_entries(words[1]);
    while (auto entry = entries.next()) {
      jentries.push_back(dirEntryToJsonObject(*entry));
    }
    print_json(jentries);
  } else if (cmd == "stat" && argc == 2) {
    print_json(dirEntryToJsonObject(device.stat(words[1])));
  } else if (cmd == "pull" && argc == 3) {
    return pull(device, words[1], words[2]);
  } else if (cmd == "push" && argc == 3) {
    return push(device, words[1], words[2]);
  } else if (cmd == "root") {
    std::cout << state_change_name(device.root()) << std::endl;
  } else if (cmd == "unroot") {
    std::cout << state_change_name(device.unroot()) << std::endl;
  } else if (cmd == "remount") {
    std::cout << state_change_name(device.remount()) << std::endl;
  } else {
    std::cerr << "unknown or incomplete command: " << cmd << std::endl;
    return 2;
  }

  return 0;
}

} // namespace


int main(int argc, char *argv[]) {
  gflags::SetVersionString(ADB_LINK_VERSION);
  gflags::SetUsageMessage(
    "Sample usage:\n adb-link-cli devices --pretty\n"
    " adb-link-cli --serial=emulator-5554 shell ls -l /sdcard\n"
    " adb-link-cli --usb --timeout_ms=5000 shell logcat -d\n"
    " adb-link-cli --serial=abc pull /sdcard/a.txt a.txt\n"
    "commands: devices version kill-server info state shell ls stat pull push root unroot remount");

  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (argc < 2) {
    gflags::ShowUsageWithFlags(argv[0]);
    return 2;
  }

  std::vector<std::string> words(argv + 1, argv + argc);

  try {
    Adb adb(ServerConfig{FLAGS_host, FLAGS_port});
    return run(adb, words);
  } catch (const adb_error &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
}
