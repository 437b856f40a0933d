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
#include <string>
#include <string_view>
#include <vector>

namespace adb_link {

// Joins command and arguments into one shell line. Arguments containing
// whitespace are wrapped in double quotes.
// Throws ErrorKind::Assertion for a blank command and ErrorKind::Parse for an
// argument that contains a double quote.
std::string prepare_command_line(std::string_view command, const std::vector<std::string>& args);

// Last path segment of the command followed by the unquoted arguments, the
// text a process listing shows for the running command.
std::string process_match_pattern(std::string_view command, const std::vector<std::string>& args);

// Shell line printing the pid of the first process whose listing line
// contains pattern.
std::string find_pid_command(std::string_view pattern);

} // namespace adb_link
