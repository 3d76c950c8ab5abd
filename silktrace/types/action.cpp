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

#include "action.hpp"

#include <array>
#include <type_traits>
#include <utility>
#include <variant>

namespace silktrace {

namespace {

constexpr std::array<std::pair<ActionType, std::string_view>, 4> kActionTypeTags{{
    {ActionType::kCall, "call"},
    {ActionType::kCreate, "create"},
    {ActionType::kSuicide, "suicide"},
    {ActionType::kReward, "reward"},
}};

constexpr std::array<std::pair<CallType, std::string_view>, 5> kCallTypeTags{{
    {CallType::kNone, "none"},
    {CallType::kCall, "call"},
    {CallType::kCallCode, "callcode"},
    {CallType::kDelegateCall, "delegatecall"},
    {CallType::kStaticCall, "staticcall"},
}};

constexpr std::array<std::pair<RewardType, std::string_view>, 4> kRewardTypeTags{{
    {RewardType::kBlock, "block"},
    {RewardType::kUncle, "uncle"},
    {RewardType::kEmptyStep, "emptyStep"},
    {RewardType::kExternal, "external"},
}};

template <typename E, std::size_t N>
std::string_view tag_of(const std::array<std::pair<E, std::string_view>, N>& tags, E value) {
    for (const auto& [e, tag] : tags) {
        if (e == value) {
            return tag;
        }
    }
    return "unknown";
}

template <typename E, std::size_t N>
std::optional<E> value_of(const std::array<std::pair<E, std::string_view>, N>& tags, std::string_view tag) {
    for (const auto& [e, t] : tags) {
        if (t == tag) {
            return e;
        }
    }
    return std::nullopt;
}

} // namespace

std::string_view to_string(ActionType action_type) { return tag_of(kActionTypeTags, action_type); }
std::string_view to_string(CallType call_type) { return tag_of(kCallTypeTags, call_type); }
std::string_view to_string(RewardType reward_type) { return tag_of(kRewardTypeTags, reward_type); }

std::optional<ActionType> action_type_from_string(std::string_view tag) { return value_of(kActionTypeTags, tag); }
std::optional<CallType> call_type_from_string(std::string_view tag) { return value_of(kCallTypeTags, tag); }
std::optional<RewardType> reward_type_from_string(std::string_view tag) { return value_of(kRewardTypeTags, tag); }

ActionType action_type_of(const Action& action) {
    return std::visit([](const auto& alternative) {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, CallAction>) {
            return ActionType::kCall;
        } else if constexpr (std::is_same_v<T, CreateAction>) {
            return ActionType::kCreate;
        } else if constexpr (std::is_same_v<T, SuicideAction>) {
            return ActionType::kSuicide;
        } else {
            static_assert(std::is_same_v<T, RewardAction>, "action alternative without action type");
            return ActionType::kReward;
        }
    }, action);
}

std::ostream& operator<<(std::ostream& out, ActionType action_type) {
    out << to_string(action_type);
    return out;
}

std::ostream& operator<<(std::ostream& out, const Action& action) {
    out << "type: " << action_type_of(action);
    if (const auto* call = std::get_if<CallAction>(&action)) {
        out << " call_type: " << to_string(call->call_type) << " from: " << call->from << " to: " << call->to;
        out << " value: " << intx::to_string(call->value) << " gas: " << call->gas << " #input: " << call->input.size();
    } else if (const auto* create = std::get_if<CreateAction>(&action)) {
        out << " from: " << create->from << " value: " << intx::to_string(create->value);
        out << " gas: " << create->gas << " #init: " << create->init.size();
    } else if (const auto* suicide = std::get_if<SuicideAction>(&action)) {
        out << " address: " << suicide->address << " refund_address: " << suicide->refund_address;
        out << " balance: " << intx::to_string(suicide->balance);
    } else if (const auto* reward = std::get_if<RewardAction>(&action)) {
        out << " author: " << reward->author << " value: " << intx::to_string(reward->value);
        out << " reward_type: " << to_string(reward->reward_type);
    }
    return out;
}

} // namespace silktrace
