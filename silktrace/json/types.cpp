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

#include <string>

#include <silktrace/common/constants.hpp>
#include <silktrace/common/util.hpp>

namespace {

const std::string& string_of(const nlohmann::json& json, const char* expected, const std::string& path = "") {
    if (!json.is_string()) {
        throw silktrace::CodecError{silktrace::TraceError::schema_violation, path, std::string{expected} + " expected, got " + json.type_name()};
    }
    return json.get_ref<const std::string&>();
}

} // namespace

namespace evmc {

void to_json(nlohmann::json& json, const address& addr) {
    json = silktrace::kHexPrefix + silktrace::to_hex(addr);
}

void from_json(const nlohmann::json& json, address& addr) {
    addr = silktrace::decode_address(json, "");
}

void to_json(nlohmann::json& json, const bytes32& b32) {
    json = silktrace::kHexPrefix + silktrace::to_hex(b32);
}

void from_json(const nlohmann::json& json, bytes32& b32) {
    b32 = silktrace::decode_hash(json, "");
}

} // namespace evmc

namespace intx {

void to_json(nlohmann::json& json, const uint256& ui256) {
    json = silktrace::to_quantity(ui256);
}

void from_json(const nlohmann::json& json, uint256& ui256) {
    ui256 = silktrace::decode_uint256(json, "");
}

} // namespace intx

namespace silktrace {

evmc::address decode_address(const nlohmann::json& json, const std::string& path) {
    const auto& hex = string_of(json, "address", path);
    const auto decoded = address_from_hex(hex);
    if (!decoded) {
        throw CodecError{TraceError::schema_violation, path, "malformed address: " + hex};
    }
    return *decoded;
}

evmc::bytes32 decode_hash(const nlohmann::json& json, const std::string& path) {
    const auto& hex = string_of(json, "hash", path);
    const auto decoded = bytes32_from_hex(hex);
    if (!decoded) {
        throw CodecError{TraceError::schema_violation, path, "malformed 32-byte hash: " + hex};
    }
    return *decoded;
}

intx::uint256 decode_uint256(const nlohmann::json& json, const std::string& path) {
    const auto& quantity = string_of(json, "quantity", path);
    const auto decoded = uint256_from_quantity(quantity);
    if (!decoded) {
        throw CodecError{TraceError::schema_violation, path, "malformed 256-bit quantity: " + quantity};
    }
    return *decoded;
}

void to_json(nlohmann::json& json, ActionType action_type) {
    json = std::string{to_string(action_type)};
}

void from_json(const nlohmann::json& json, ActionType& action_type) {
    const auto& tag = string_of(json, "action type");
    const auto decoded = action_type_from_string(tag);
    if (!decoded) {
        throw CodecError{TraceError::schema_violation, "", "unknown action type: " + tag};
    }
    action_type = *decoded;
}

void to_json(nlohmann::json& json, CallType call_type) {
    json = std::string{to_string(call_type)};
}

void from_json(const nlohmann::json& json, CallType& call_type) {
    const auto& tag = string_of(json, "call type");
    const auto decoded = call_type_from_string(tag);
    if (!decoded) {
        throw CodecError{TraceError::schema_violation, "", "unknown call type: " + tag};
    }
    call_type = *decoded;
}

void to_json(nlohmann::json& json, RewardType reward_type) {
    json = std::string{to_string(reward_type)};
}

void from_json(const nlohmann::json& json, RewardType& reward_type) {
    const auto& tag = string_of(json, "reward type");
    const auto decoded = reward_type_from_string(tag);
    if (!decoded) {
        throw CodecError{TraceError::schema_violation, "", "unknown reward type: " + tag};
    }
    reward_type = *decoded;
}

void to_json(nlohmann::json& json, const CodecError& error) {
    json = {{"code", error.code().value()}, {"message", error.what()}};
    if (!error.path().empty()) {
        json["path"] = error.path();
    }
}

} // namespace silktrace
