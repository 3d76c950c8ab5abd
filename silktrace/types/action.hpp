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

#ifndef SILKTRACE_TYPES_ACTION_HPP_
#define SILKTRACE_TYPES_ACTION_HPP_

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <silktrace/common/util.hpp>

namespace silktrace {

//! Kind of call-tree node, wire field "type"
enum class ActionType {
    kCall,
    kCreate,
    kSuicide,
    kReward,
};

enum class CallType {
    kNone,
    kCall,
    kCallCode,
    kDelegateCall,
    kStaticCall,
};

enum class RewardType {
    kBlock,
    kUncle,
    kEmptyStep,
    kExternal,
};

std::string_view to_string(ActionType action_type);
std::string_view to_string(CallType call_type);
std::string_view to_string(RewardType reward_type);

std::optional<ActionType> action_type_from_string(std::string_view tag);
std::optional<CallType> call_type_from_string(std::string_view tag);
std::optional<RewardType> reward_type_from_string(std::string_view tag);

struct CallAction {
    evmc::address from;
    evmc::address to;
    intx::uint256 value{0};
    uint64_t gas{0};
    Bytes input;
    CallType call_type{CallType::kCall};

    bool operator==(const CallAction&) const = default;
};

struct CreateAction {
    evmc::address from;
    intx::uint256 value{0};
    uint64_t gas{0};
    Bytes init;

    bool operator==(const CreateAction&) const = default;
};

struct SuicideAction {
    evmc::address address;
    evmc::address refund_address;
    intx::uint256 balance{0};

    bool operator==(const SuicideAction&) const = default;
};

struct RewardAction {
    evmc::address author;
    intx::uint256 value{0};
    RewardType reward_type{RewardType::kBlock};

    bool operator==(const RewardAction&) const = default;
};

using Action = std::variant<CallAction, CreateAction, SuicideAction, RewardAction>;

//! The action type an action variant is tagged with on the wire
ActionType action_type_of(const Action& action);

struct CallOutput {
    uint64_t gas_used{0};
    Bytes output;

    bool operator==(const CallOutput&) const = default;
};

struct CreateOutput {
    uint64_t gas_used{0};
    Bytes code;
    evmc::address address;

    bool operator==(const CreateOutput&) const = default;
};

//! Successful outcome of a call-tree node
using TraceOutput = std::variant<CallOutput, CreateOutput>;

std::ostream& operator<<(std::ostream& out, ActionType action_type);
std::ostream& operator<<(std::ostream& out, const Action& action);

} // namespace silktrace

#endif  // SILKTRACE_TYPES_ACTION_HPP_
