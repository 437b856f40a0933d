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
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace adb_link {

// Selects which attached device a request targets.
class DeviceDescriptor {
public:
  struct Serial {
    std::string serial;
  };
  struct UsbAny {};
  struct LocalAny {};
  struct TransportId {
    int64_t id;
  };
  struct Any {};

  using Variant = std::variant<Serial, UsbAny, LocalAny, TransportId, Any>;

  // Throws adb_error(Assertion) for a blank serial or a negative transport id.
  static DeviceDescriptor with_serial(std::string_view serial);
  static DeviceDescriptor with_transport_id(int64_t id);
  static DeviceDescriptor usb();
  static DeviceDescriptor local();
  static DeviceDescriptor any();

  // e.g. "host-serial:<serial>", used for host attribute queries.
  std::string host_prefix() const;

  // e.g. "serial:<serial>", sent as "host:<descriptor>" to pin a connection.
  std::string transport_descriptor() const;

  std::string to_string() const;

private:
  explicit DeviceDescriptor(Variant value) : value_(std::move(value)) {}

  Variant value_;
};

} // namespace adb_link
