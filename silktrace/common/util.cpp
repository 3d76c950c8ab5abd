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

#include "util.hpp"

#include <charconv>
#include <cstring>

#include <silkworm/common/util.hpp>

#include <silktrace/common/constants.hpp>

namespace silktrace {

namespace {

// Digits of a 0x-prefixed quantity with leading zeros removed, nullopt if malformed
std::optional<std::string_view> quantity_digits(std::string_view quantity) noexcept {
    if (!silkworm::has_hex_prefix(quantity)) {
        return std::nullopt;
    }
    auto digits = quantity.substr(2);
    if (digits.empty()) {
        return std::nullopt;
    }
    for (const auto c : digits) {
        if (!is_hex_digit(c)) {
            return std::nullopt;
        }
    }
    const auto first_non_zero = digits.find_first_not_of('0');
    if (first_non_zero == std::string_view::npos) {
        return std::string_view{"0"};
    }
    return digits.substr(first_non_zero);
}

template <typename T, std::size_t N>
std::optional<T> fixed_from_hex(std::string_view hex) noexcept {
    if (!silkworm::has_hex_prefix(hex)) {
        return std::nullopt;
    }
    const auto bytes = from_hex(hex);
    if (!bytes || bytes->length() != N) {
        return std::nullopt;
    }
    T value{};
    std::memcpy(value.bytes, bytes->data(), N);
    return value;
}

} // namespace

std::string to_hex(ByteView bytes) {
    return silkworm::to_hex(bytes, /*with_prefix=*/false);
}

std::string to_prefixed_hex(ByteView bytes) {
    return silkworm::to_hex(bytes, /*with_prefix=*/true);
}

std::string to_hex(const evmc::address& address) {
    return silkworm::to_hex(ByteView{address}, /*with_prefix=*/false);
}

std::string to_hex(const evmc::bytes32& b32) {
    return silkworm::to_hex(ByteView{b32}, /*with_prefix=*/false);
}

bool is_hex_digit(char c) noexcept {
    return silkworm::decode_hex_digit(c).has_value();
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    const auto digits = silkworm::has_hex_prefix(hex) ? hex.length() - 2 : hex.length();
    if (digits % 2 != 0) {
        return std::nullopt;
    }
    return silkworm::from_hex(hex);
}

std::optional<evmc::address> address_from_hex(std::string_view hex) noexcept {
    return fixed_from_hex<evmc::address, kAddressLength>(hex);
}

std::optional<evmc::bytes32> bytes32_from_hex(std::string_view hex) noexcept {
    return fixed_from_hex<evmc::bytes32, kHashLength>(hex);
}

std::string to_quantity(uint64_t number) {
    char buffer[2 + 16];
    buffer[0] = '0';
    buffer[1] = 'x';
    const auto [end, ec] = std::to_chars(buffer + 2, buffer + sizeof(buffer), number, 16);
    return std::string(buffer, static_cast<std::size_t>(end - buffer));
}

std::string to_quantity(const intx::uint256& number) {
    return kHexPrefix + intx::hex(number);
}

std::optional<uint64_t> uint64_from_quantity(std::string_view quantity) noexcept {
    const auto digits = quantity_digits(quantity);
    if (!digits || digits->length() > 16) {
        return std::nullopt;
    }
    uint64_t number{0};
    const auto [ptr, ec] = std::from_chars(digits->data(), digits->data() + digits->length(), number, 16);
    if (ec != std::errc{} || ptr != digits->data() + digits->length()) {
        return std::nullopt;
    }
    return number;
}

std::optional<intx::uint256> uint256_from_quantity(std::string_view quantity) {
    const auto digits = quantity_digits(quantity);
    if (!digits || digits->length() > kMaxQuantityDigits) {
        return std::nullopt;
    }
    // digits are hex only and at most 64 of them
    const std::string normalized = kHexPrefix + std::string{*digits};
    return intx::from_string<intx::uint256>(normalized.c_str());
}

} // namespace silktrace
