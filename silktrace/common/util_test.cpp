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

#include <catch2/catch.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <silkworm/common/util.hpp>

namespace silktrace {

using evmc::literals::operator""_address, evmc::literals::operator""_bytes32;

TEST_CASE("to_hex", "[silktrace][common][util]") {
    CHECK(to_hex(Bytes{}).empty());
    CHECK(to_hex(Bytes{0x00, 0x0f, 0xab, 0xff}) == "000fabff");
    CHECK(to_prefixed_hex(Bytes{}) == "0x");
    CHECK(to_prefixed_hex(Bytes{0xde, 0xad}) == "0xdead");
    CHECK(to_hex(0x0715a7794a1dc8e42615f059dd6e406a6594651a_address) == "0715a7794a1dc8e42615f059dd6e406a6594651a");
}

TEST_CASE("from_hex", "[silktrace][common][util]") {
    SECTION("empty") {
        CHECK(from_hex("") == Bytes{});
        CHECK(from_hex("0x") == Bytes{});
    }
    SECTION("with and without prefix") {
        CHECK(from_hex("0xdeadBEEF") == Bytes{0xde, 0xad, 0xbe, 0xef});
        CHECK(from_hex("deadbeef") == Bytes{0xde, 0xad, 0xbe, 0xef});
    }
    SECTION("odd length") {
        CHECK(!from_hex("0x123"));
        CHECK(!from_hex("0x1"));
        CHECK(!from_hex("1"));
        CHECK(silkworm::from_hex("0x1") == Bytes{0x01});
    }
    SECTION("invalid digit") {
        CHECK(!from_hex("0x12zz"));
    }
}

TEST_CASE("address_from_hex", "[silktrace][common][util]") {
    CHECK(address_from_hex("0x0715a7794a1dc8e42615f059dd6e406a6594651a") == 0x0715a7794a1dc8e42615f059dd6e406a6594651a_address);
    CHECK(address_from_hex("0x0715A7794A1DC8E42615F059DD6E406A6594651A") == 0x0715a7794a1dc8e42615f059dd6e406a6594651a_address);
    CHECK(!address_from_hex("0715a7794a1dc8e42615f059dd6e406a6594651a"));
    CHECK(!address_from_hex("0x0715a7794a1dc8e42615f059dd6e406a659465"));
    CHECK(!address_from_hex("0x0715a7794a1dc8e42615f059dd6e406a6594651a00"));
}

TEST_CASE("address_from_hex neither pads nor crops", "[silktrace][common][util]") {
    const auto short_hex = "0x" + std::string(38, 'a');
    const auto long_hex = "0x" + std::string(42, 'a');
    CHECK(silkworm::to_evmc_address(*silkworm::from_hex(short_hex)) != evmc::address{});
    CHECK(!address_from_hex(short_hex));
    CHECK(!address_from_hex(long_hex));
    CHECK(!address_from_hex("0x" + std::string(39, 'a')));
    CHECK(!bytes32_from_hex("0x" + std::string(63, 'b')));
    CHECK(!bytes32_from_hex("0x" + std::string(66, 'b')));
}

TEST_CASE("bytes32_from_hex", "[silktrace][common][util]") {
    CHECK(bytes32_from_hex("0x374f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126c") ==
        0x374f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126c_bytes32);
    CHECK(!bytes32_from_hex("0x374f"));
    CHECK(!bytes32_from_hex("374f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126c"));
}

TEST_CASE("to_quantity", "[silktrace][common][util]") {
    CHECK(to_quantity(uint64_t{0}) == "0x0");
    CHECK(to_quantity(uint64_t{1000}) == "0x3e8");
    CHECK(to_quantity(intx::uint256{0}) == "0x0");
    CHECK(to_quantity(intx::uint256{100}) == "0x64");
    CHECK(to_quantity(~intx::uint256{0}) == "0x" + std::string(64, 'f'));
}

TEST_CASE("uint64_from_quantity", "[silktrace][common][util]") {
    CHECK(uint64_from_quantity("0x0") == 0u);
    CHECK(uint64_from_quantity("0x3e8") == 1000u);
    CHECK(uint64_from_quantity("0x00003e8") == 1000u);
    CHECK(uint64_from_quantity("0xffffffffffffffff") == UINT64_MAX);
    CHECK(!uint64_from_quantity("0x10000000000000000"));
    CHECK(!uint64_from_quantity("0x"));
    CHECK(!uint64_from_quantity("1000"));
    CHECK(!uint64_from_quantity("0x3g"));
}

TEST_CASE("uint256_from_quantity", "[silktrace][common][util]") {
    CHECK(uint256_from_quantity("0x0") == intx::uint256{0});
    CHECK(uint256_from_quantity("0xdeadbeaf") == intx::uint256{0xdeadbeaf});
    CHECK(uint256_from_quantity("0x" + std::string(64, 'f')) == ~intx::uint256{0});
    CHECK(!uint256_from_quantity("0x1" + std::string(64, '0')));
    CHECK(!uint256_from_quantity("0x"));
    CHECK(!uint256_from_quantity("deadbeaf"));
}

} // namespace silktrace
