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

#include "adb.h"
#include "adb-error.h"
#include <charconv>
#include <cstdlib>
#include <format>
#include <ranges>
#include <regex>

namespace {

template<typename T>
inline const typename T::value_type* value_of_starts_with(
    const T& arg,
    const typename T::value_type* name) {
  std::basic_string_view<typename T::value_type> arg_view(arg);
  std::basic_string_view<typename T::value_type> name_view(name);

  if (arg_view.starts_with(name_view)) {
    return arg.data() + name_view.length();
  }

  return nullptr;
}

} // namespace

namespace adb_link {

namespace {

constexpr std::string_view kComponent = "adb";

template <class F>
auto with_context(const ServerConfig& config, std::string_view operation, F &&f) -> decltype(f()) {
  try {
    return f();
  } catch (const adb_error &e) {
    throw wrap_error(e, kComponent, operation, std::format("server {}:{}", config.host, config.port));
  }
}

} // namespace

Adb::Adb(ServerConfig config) : config_(std::move(config)) {}

Device Adb::device(DeviceDescriptor descriptor) const {
  return Device(config_, std::move(descriptor), [*this] { return list_devices(); });
}

std::vector<DeviceInfo> Adb::list_devices() const {
  return with_context(config_, "ListDevices", [this] {
    auto conn = dial(config_);
    return parse_device_list(conn->round_trip_single_response("host:devices-l"));
  });
}

int Adb::server_version() const {
  return with_context(config_, "ServerVersion", [this] {
    auto conn = dial(config_);
    auto resp = conn->round_trip_single_response("host:version");

    int version = 0;
    auto [ptr, ec] = std::from_chars(resp.data(), resp.data() + resp.size(), version, 16);
    if (ec != std::errc() || ptr != resp.data() + resp.size()) {
      throw make_error(ErrorKind::Parse, "invalid server version: {}", resp);
    }
    return version;
  });
}

void Adb::kill_server() const {
  with_context(config_, "KillServer", [this] {
    auto conn = dial(config_);
    conn->send_message("host:kill");

    // The server might send OKAY, or just go away.
    try {
      conn->read_status("host:kill");
    } catch (const adb_error &e) {
      if (!e.is(ErrorKind::Network)) {
        throw;
      }
    }
  });
}

std::vector<DeviceInfo> parse_device_list(std::string_view text) {
  auto v = text
           | std::views::split('\n')
           | std::views::transform([](auto word) {
               return std::string_view(word.begin(), word.end());
             });

  auto lines = std::vector<std::string_view>(v.begin(), v.end());

  std::regex ws_re("\\s+");

  std::vector<DeviceInfo> out;

  for (auto line : lines) {
    if (line.empty()) {
      continue;
    }

    std::regex_token_iterator<std::string_view::const_iterator> first {line.begin(), line.end(), ws_re, -1}, last;
    auto items = std::vector<std::string>(first, last);
    if (items.size() < 2) {
      throw make_error(ErrorKind::Parse, "invalid device list line: {}", line);
    }

    DeviceInfo dev;
    dev.serial = std::move(items[0]);
    dev.state = std::move(items[1]);

    for (size_t i = 2; i < items.size(); i++) {
      if (auto *val = value_of_starts_with(items[i], "product:")) {
        dev.product = val;
      } else if (auto *val = value_of_starts_with(items[i], "model:")) {
        dev.model = val;
      } else if (auto *val = value_of_starts_with(items[i], "device:")) {
        dev.device = val;
      } else if (auto *val = value_of_starts_with(items[i], "usb:")) {
        dev.usb = val;
      } else if (auto *val = value_of_starts_with(items[i], "transport_id:")) {
        dev.transportId = strtoll(val, nullptr, 10);
      }
    }

    out.push_back(std::move(dev));
  }

  return out;
}

} // namespace adb_link
