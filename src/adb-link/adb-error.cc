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

#include "adb-error.h"

namespace adb_link {

namespace {

std::string render(ErrorKind kind, const std::string& message, const adb_error *cause) {
  if (cause) {
    return std::format("{}: {}", message, cause->what());
  }
  return std::format("{}: {}", error_kind_name(kind), message);
}

} // namespace

const char *error_kind_name(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::Assertion:
      return "AssertionError";
    case ErrorKind::Parse:
      return "ParseError";
    case ErrorKind::DeviceNotFound:
      return "DeviceNotFound";
    case ErrorKind::Connection:
      return "ConnectionError";
    case ErrorKind::Network:
      return "NetworkError";
    case ErrorKind::Protocol:
      return "ProtocolError";
    case ErrorKind::Cancelled:
      return "Cancelled";
  }
  return "UnknownError";
}

adb_error::adb_error(ErrorKind kind, const std::string& message)
  : std::runtime_error(render(kind, message, nullptr)),
    kind_(kind),
    message_(message) {}

adb_error::adb_error(ErrorKind kind, const std::string& message, const adb_error& cause)
  : std::runtime_error(render(kind, message, &cause)),
    kind_(kind),
    message_(message),
    cause_(std::make_shared<const adb_error>(cause)) {}

const adb_error& adb_error::root_cause() const noexcept {
  const adb_error *e = this;
  while (e->cause_) {
    e = e->cause_.get();
  }
  return *e;
}

bool adb_error::is(ErrorKind kind) const noexcept {
  for (const adb_error *e = this; e; e = e->cause_.get()) {
    if (e->kind_ == kind) {
      return true;
    }
  }
  return false;
}

adb_error wrap_error(
    const adb_error& inner,
    std::string_view component,
    std::string_view operation,
    std::string_view descriptor) {
  return adb_error(
      inner.kind(),
      std::format("{}: error performing {} on {}", component, operation, descriptor),
      inner);
}

adb_error wrap_error(const adb_error& inner, const ErrorContext& context) {
  return wrap_error(inner, context.component, context.operation, context.descriptor);
}

} // namespace adb_link
