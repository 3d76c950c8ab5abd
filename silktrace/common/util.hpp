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

#ifndef SILKTRACE_COMMON_UTIL_HPP_
#define SILKTRACE_COMMON_UTIL_HPP_

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <silkworm/common/base.hpp>

namespace silktrace {

using silkworm::Bytes;
using silkworm::ByteView;

// Lowercase hex digits of bytes, without prefix
std::string to_hex(ByteView bytes);

// Lowercase 0x-prefixed hex digits of bytes, "0x" for empty input
std::string to_prefixed_hex(ByteView bytes);

std::string to_hex(const evmc::address& address);
std::string to_hex(const evmc::bytes32& b32);

bool is_hex_digit(char c) noexcept;

// Decode hex digits with or without 0x prefix. Odd digit count or non-hex characters yield nullopt,
// no implicit zero nibble is added.
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

// Decode a 0x-prefixed hex string of exactly kAddressLength bytes, never cropped or padded
std::optional<evmc::address> address_from_hex(std::string_view hex) noexcept;

// Decode a 0x-prefixed hex string of exactly kHashLength bytes
std::optional<evmc::bytes32> bytes32_from_hex(std::string_view hex) noexcept;

// Hex quantities as produced by the trace API: 0x-prefixed, no leading zeros, "0x0" for zero
std::string to_quantity(uint64_t number);
std::string to_quantity(const intx::uint256& number);

// Parse a 0x-prefixed hex quantity. Leading zeros are tolerated, an empty digit string is not.
std::optional<uint64_t> uint64_from_quantity(std::string_view quantity) noexcept;
std::optional<intx::uint256> uint256_from_quantity(std::string_view quantity);

} // namespace silktrace

namespace evmc {

inline std::ostream& operator<<(std::ostream& out, const address& addr) {
    out << silktrace::to_hex(addr);
    return out;
}

inline std::ostream& operator<<(std::ostream& out, const bytes32& b32) {
    out << silktrace::to_hex(b32);
    return out;
}

} // namespace evmc

#endif // SILKTRACE_COMMON_UTIL_HPP_
