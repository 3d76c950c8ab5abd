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

#ifndef SILKTRACE_COMMON_CONSTANTS_HPP_
#define SILKTRACE_COMMON_CONSTANTS_HPP_

#include <cstddef>

namespace silktrace {

constexpr const char* kHexPrefix{"0x"};

constexpr const std::size_t kAddressLength{20};
constexpr const std::size_t kHashLength{32};

// Maximum number of hex digits in a 256-bit quantity
constexpr const std::size_t kMaxQuantityDigits{64};

// EVM call depth limit, frames beyond the outermost one
constexpr const std::size_t kMaxCallDepth{1024};

// The root VmTrace counts as depth 1, so the deepest legal sub-trace sits at kMaxCallDepth + 1
constexpr const std::size_t kDefaultMaxVmTraceDepth{kMaxCallDepth + 1};

constexpr const char* kDefaultTraceFile{""};

} // namespace silktrace

#endif  // SILKTRACE_COMMON_CONSTANTS_HPP_
