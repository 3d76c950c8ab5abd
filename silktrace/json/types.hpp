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

#ifndef SILKTRACE_JSON_TYPES_HPP_
#define SILKTRACE_JSON_TYPES_HPP_

#include <string>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <silktrace/types/action.hpp>
#include <silktrace/types/error.hpp>

namespace evmc {

void to_json(nlohmann::json& json, const address& addr);
void from_json(const nlohmann::json& json, address& addr);

void to_json(nlohmann::json& json, const bytes32& b32);
void from_json(const nlohmann::json& json, bytes32& b32);

} // namespace evmc

namespace intx {

void to_json(nlohmann::json& json, const uint256& ui256);
void from_json(const nlohmann::json& json, uint256& ui256);

} // namespace intx

namespace silktrace {

// Strict decoders shared by the ADL overloads and the trace codec; failures carry the given path
evmc::address decode_address(const nlohmann::json& json, const std::string& path);
evmc::bytes32 decode_hash(const nlohmann::json& json, const std::string& path);
intx::uint256 decode_uint256(const nlohmann::json& json, const std::string& path);

void to_json(nlohmann::json& json, ActionType action_type);
void from_json(const nlohmann::json& json, ActionType& action_type);

void to_json(nlohmann::json& json, CallType call_type);
void from_json(const nlohmann::json& json, CallType& call_type);

void to_json(nlohmann::json& json, RewardType reward_type);
void from_json(const nlohmann::json& json, RewardType& reward_type);

void to_json(nlohmann::json& json, const CodecError& error);

} // namespace silktrace

#endif  // SILKTRACE_JSON_TYPES_HPP_
