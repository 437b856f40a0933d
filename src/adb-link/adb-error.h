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
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace adb_link {

enum class ErrorKind {
  // caller misuse: empty command, malformed descriptor, oversized path
  Assertion,
  // malformed argument or unparsable server reply
  Parse,
  DeviceNotFound,
  // the remote side answered FAIL
  Connection,
  // socket level I/O failure
  Network,
  // unexpected bytes on the wire
  Protocol,
  Cancelled,
};

const char *error_kind_name(ErrorKind kind) noexcept;

class adb_error : public std::runtime_error {
public:
  adb_error(ErrorKind kind, const std::string& message);
  adb_error(ErrorKind kind, const std::string& message, const adb_error& cause);

  ErrorKind kind() const noexcept { return kind_; }

  // Text attached by this layer only; what() renders the whole chain.
  const std::string& message() const noexcept { return message_; }

  const adb_error *cause() const noexcept { return cause_.get(); }

  const adb_error& root_cause() const noexcept;

  // True if this error or any error it wraps is of the given kind.
  bool is(ErrorKind kind) const noexcept;

private:
  ErrorKind kind_;
  std::string message_;
  std::shared_ptr<const adb_error> cause_;
};

template <class... Args>
adb_error make_error(ErrorKind kind, std::format_string<Args...> fmt, Args&&... args) {
  return adb_error(kind, std::format(fmt, std::forward<Args>(args)...));
}

// Attaches the component, operation and device descriptor to an inner error.
// The kind of the inner error is kept.
adb_error wrap_error(
    const adb_error& inner,
    std::string_view component,
    std::string_view operation,
    std::string_view descriptor);

// The same attachment, kept by objects that outlive the call that made them.
struct ErrorContext {
  std::string component;
  std::string operation;
  std::string descriptor;
};

adb_error wrap_error(const adb_error& inner, const ErrorContext& context);

} // namespace adb_link
