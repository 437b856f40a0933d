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

#include "device-descriptor.h"
#include "adb-error.h"
#include "string-utils.h"
#include <format>

namespace adb_link {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

} // namespace

DeviceDescriptor DeviceDescriptor::with_serial(std::string_view serial) {
  if (is_blank(serial)) {
    throw adb_error(ErrorKind::Assertion, "device serial cannot be empty");
  }
  return DeviceDescriptor(Serial{std::string(serial)});
}

DeviceDescriptor DeviceDescriptor::with_transport_id(int64_t id) {
  if (id < 0) {
    throw make_error(ErrorKind::Assertion, "invalid transport id {}", id);
  }
  return DeviceDescriptor(TransportId{id});
}

DeviceDescriptor DeviceDescriptor::usb() {
  return DeviceDescriptor(UsbAny{});
}

DeviceDescriptor DeviceDescriptor::local() {
  return DeviceDescriptor(LocalAny{});
}

DeviceDescriptor DeviceDescriptor::any() {
  return DeviceDescriptor(Any{});
}

std::string DeviceDescriptor::host_prefix() const {
  return std::visit(overloaded {
    [](const Serial& d) { return std::format("host-serial:{}", d.serial); },
    [](const UsbAny&) { return std::string("host-usb"); },
    [](const LocalAny&) { return std::string("host-local"); },
    [](const TransportId& d) { return std::format("host-transport-id:{}", d.id); },
    [](const Any&) { return std::string("host"); },
  }, value_);
}

std::string DeviceDescriptor::transport_descriptor() const {
  return std::visit(overloaded {
    [](const Serial& d) { return std::format("serial:{}", d.serial); },
    [](const UsbAny&) { return std::string("usb:"); },
    [](const LocalAny&) { return std::string("local:"); },
    [](const TransportId& d) { return std::format("transport-id:{}", d.id); },
    [](const Any&) { return std::string("transport-any"); },
  }, value_);
}

std::string DeviceDescriptor::to_string() const {
  return std::visit(overloaded {
    [](const Serial& d) { return std::format("Device[serial={}]", d.serial); },
    [](const UsbAny&) { return std::string("Device[usb]"); },
    [](const LocalAny&) { return std::string("Device[local]"); },
    [](const TransportId& d) { return std::format("Device[transport-id={}]", d.id); },
    [](const Any&) { return std::string("Device[any]"); },
  }, value_);
}

} // namespace adb_link
