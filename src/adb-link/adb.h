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
#include "device.h"
#include "wire-conn.h"
#include <string_view>
#include <vector>

namespace adb_link {

// Entry point: a host daemon endpoint and the devices behind it.
class Adb {
public:
  explicit Adb(ServerConfig config = {});

  const ServerConfig& config() const noexcept { return config_; }

  // The device's DeviceInfo comes from list_devices().
  Device device(DeviceDescriptor descriptor) const;

  std::vector<DeviceInfo> list_devices() const;

  int server_version() const;

  // Asks the daemon to exit. A daemon that drops the connection without
  // answering has still been killed.
  void kill_server() const;

private:
  ServerConfig config_;
};

// Parses the reply to host:devices-l.
std::vector<DeviceInfo> parse_device_list(std::string_view text);

} // namespace adb_link
