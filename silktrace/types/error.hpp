/*
   Copyright 2022 The Silktrace Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#ifndef SILKTRACE_TYPES_ERROR_HPP_
#define SILKTRACE_TYPES_ERROR_HPP_

#include <iostream>
#include <string>
#include <system_error>
#include <utility>

namespace silktrace {

enum class TraceError {
    // value 0 reserved for no error
    schema_violation = 100,
    depth_exceeded,
    encoding_error,
};

std::error_code make_error_code(TraceError errc);

//! Failure of a single decode or encode call, carrying the path of the offending field
class CodecError : public std::system_error {
  public:
    CodecError(TraceError errc, std::string path, const std::string& what)
        : std::system_error{make_error_code(errc), what + (path.empty() ? "" : " at " + path)}, path_{std::move(path)} {}

    //! RFC 6901 JSON pointer to the offending field, e.g. /trace/0/action/from
    const std::string& path() const noexcept { return path_; }

  private:
    std::string path_;
};

std::ostream& operator<<(std::ostream& out, const CodecError& error);

} // namespace silktrace

namespace std {

template<>
struct is_error_code_enum<silktrace::TraceError> : true_type {};

} // namespace std

#endif  // SILKTRACE_TYPES_ERROR_HPP_
