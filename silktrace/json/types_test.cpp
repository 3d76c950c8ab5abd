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

#include "types.hpp"

#include <functional>
#include <string>

#include <catch2/catch.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

namespace silktrace {

using evmc::literals::operator""_address, evmc::literals::operator""_bytes32;

TEST_CASE("serialize empty address", "[silktrace][json][to_json]") {
    evmc::address address{};
    nlohmann::json j = address;
    CHECK(j == R"("0x0000000000000000000000000000000000000000")"_json);
}

TEST_CASE("serialize address", "[silktrace][json][to_json]") {
    evmc::address address{0x0715a7794a1dc8e42615f059dd6e406a6594651a_address};
    nlohmann::json j = address;
    CHECK(j == R"("0x0715a7794a1dc8e42615f059dd6e406a6594651a")"_json);
}

TEST_CASE("deserialize address", "[silktrace][json][from_json]") {
    SECTION("lowercase") {
        auto j = R"("0x0715a7794a1dc8e42615f059dd6e406a6594651a")"_json;
        CHECK(j.get<evmc::address>() == 0x0715a7794a1dc8e42615f059dd6e406a6594651a_address);
    }
    SECTION("mixed case") {
        auto j = R"("0x0715A7794a1dc8e42615f059dd6e406a6594651A")"_json;
        CHECK(j.get<evmc::address>() == 0x0715a7794a1dc8e42615f059dd6e406a6594651a_address);
    }
    SECTION("missing prefix") {
        auto j = R"("0715a7794a1dc8e42615f059dd6e406a6594651a")"_json;
        CHECK_THROWS_AS(j.get<evmc::address>(), CodecError);
    }
    SECTION("wrong length") {
        auto j = R"("0x0715a7794a1dc8e42615f059dd6e406a659465")"_json;
        CHECK_THROWS_AS(j.get<evmc::address>(), CodecError);
    }
    SECTION("not a string") {
        auto j = R"(42)"_json;
        CHECK_THROWS_AS(j.get<evmc::address>(), CodecError);
    }
}

TEST_CASE("serialize bytes32", "[silktrace][json][to_json]") {
    evmc::bytes32 b32{0x374f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126c_bytes32};
    nlohmann::json j = b32;
    CHECK(j == R"("0x374f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126c")"_json);
}

TEST_CASE("deserialize bytes32", "[silktrace][json][from_json]") {
    auto j1 = R"("0x374f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126c")"_json;
    CHECK(j1.get<evmc::bytes32>() == 0x374f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126c_bytes32);

    auto j2 = R"("0x374f")"_json;
    CHECK_THROWS_AS(j2.get<evmc::bytes32>(), CodecError);
}

TEST_CASE("serialize uint256 as quantity", "[silktrace][json][to_json]") {
    CHECK(nlohmann::json(intx::uint256{0}) == "0x0");
    CHECK(nlohmann::json(intx::uint256{100}) == "0x64");
    CHECK(nlohmann::json(intx::from_string<intx::uint256>("0xde0b6b3a7640000")) == "0xde0b6b3a7640000");
}

TEST_CASE("deserialize uint256 quantity", "[silktrace][json][from_json]") {
    CHECK(R"("0x0")"_json.get<intx::uint256>() == 0);
    CHECK(R"("0x00ff")"_json.get<intx::uint256>() == 255);
    CHECK(R"("0xffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff")"_json.get<intx::uint256>() ==
        ~intx::uint256{0});
    CHECK_THROWS_AS(R"("0x")"_json.get<intx::uint256>(), CodecError);
    CHECK_THROWS_AS(R"("64")"_json.get<intx::uint256>(), CodecError);
    CHECK_THROWS_AS(R"("0xg1")"_json.get<intx::uint256>(), CodecError);
    CHECK_THROWS_AS(R"(100)"_json.get<intx::uint256>(), CodecError);
}

TEST_CASE("strict decoders report the given path", "[silktrace][json][from_json]") {
    const auto check_path = [](const std::function<void()>& decode, const std::string& path) {
        try {
            decode();
            FAIL("expected CodecError");
        } catch (const CodecError& e) {
            CHECK(e.code() == TraceError::schema_violation);
            CHECK(e.path() == path);
        }
    };
    const auto short_address = R"("0x0715a7794a1dc8e42615f059dd6e406a659465")"_json;
    check_path([&]() { decode_address(short_address, "/trace/0/action/from"); }, "/trace/0/action/from");
    check_path([&]() { short_address.get<evmc::address>(); }, "");
    check_path([&]() { decode_hash(R"(12)"_json, "/transactionHash"); }, "/transactionHash");
    check_path([&]() { decode_uint256(R"("0x")"_json, "/stateDiff/balance"); }, "/stateDiff/balance");

    const auto address = R"("0x0715a7794a1dc8e42615f059dd6e406a6594651a")"_json;
    CHECK(decode_address(address, "/from") == address.get<evmc::address>());
}

TEST_CASE("serialize action enums", "[silktrace][json][to_json]") {
    CHECK(nlohmann::json(ActionType::kCall) == "call");
    CHECK(nlohmann::json(ActionType::kSuicide) == "suicide");
    CHECK(nlohmann::json(CallType::kDelegateCall) == "delegatecall");
    CHECK(nlohmann::json(RewardType::kEmptyStep) == "emptyStep");
}

TEST_CASE("deserialize action enums", "[silktrace][json][from_json]") {
    CHECK(R"("create")"_json.get<ActionType>() == ActionType::kCreate);
    CHECK(R"("staticcall")"_json.get<CallType>() == CallType::kStaticCall);
    CHECK(R"("uncle")"_json.get<RewardType>() == RewardType::kUncle);
    CHECK_THROWS_AS(R"("selfdestruct")"_json.get<ActionType>(), CodecError);
    CHECK_THROWS_AS(R"("Call")"_json.get<CallType>(), CodecError);
    CHECK_THROWS_AS(R"(0)"_json.get<RewardType>(), CodecError);
}

TEST_CASE("serialize codec error", "[silktrace][json][to_json]") {
    SECTION("with path") {
        nlohmann::json j = CodecError{TraceError::schema_violation, "/trace/0/type", "unknown action type: foo"};
        CHECK(j == R"({
            "code": 100,
            "message": "unknown action type: foo at /trace/0/type",
            "path": "/trace/0/type"
        })"_json);
    }
    SECTION("without path") {
        nlohmann::json j = CodecError{TraceError::encoding_error, "", "both result and error set"};
        CHECK(j == R"({"code": 102, "message": "both result and error set"})"_json);
    }
}

} // namespace silktrace
