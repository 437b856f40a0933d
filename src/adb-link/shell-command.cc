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

#include "shell-command.h"
#include "adb-error.h"
#include "string-utils.h"
#include <format>

namespace adb_link {

std::string prepare_command_line(std::string_view command, const std::vector<std::string>& args) {
  if (is_blank(command)) {
    throw adb_error(ErrorKind::Assertion, "command cannot be empty");
  }

  std::string line(command);

  for (size_t i = 0; i < args.size(); i++) {
    const auto &arg = args[i];
    if (arg.find('"') != std::string::npos) {
      throw make_error(ErrorKind::Parse,
          "arg at index {} contains an invalid double quote: {}", i, arg);
    }

    line += ' ';
    if (contains_whitespace(arg)) {
      line += std::format("\"{}\"", arg);
    } else {
      line += arg;
    }
  }

  return line;
}

std::string process_match_pattern(std::string_view command, const std::vector<std::string>& args) {
  auto pos = command.rfind('/');
  std::string pattern(pos == command.npos ? command : command.substr(pos + 1));

  for (const auto &arg : args) {
    pattern += ' ';
    pattern += arg;
  }

  return pattern;
}

std::string find_pid_command(std::string_view pattern) {
  return std::format(
      "ps -f -A | grep '{}' | sed 's/   */ /g' | cut -d ' ' -f 2 | head -n 1", pattern);
}

} // namespace adb_link
