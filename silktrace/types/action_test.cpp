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

#include <set>
#include <sstream>
#include <utility>
#include <variant>

#include <catch2/catch.hpp>
#include <evmc/evmc.hpp>

namespace silktrace {

using evmc::literals::operator""_address;

TEST_CASE("action type tags", "[silktrace][types][action]") {
    CHECK(to_string(ActionType::kCall) == "call");
    CHECK(to_string(ActionType::kCreate) == "create");
    CHECK(to_string(ActionType::kSuicide) == "suicide");
    CHECK(to_string(ActionType::kReward) == "reward");
    CHECK(action_type_from_string("suicide") == ActionType::kSuicide);
    CHECK(!action_type_from_string("SUICIDE"));
    CHECK(!action_type_from_string(""));
}

TEST_CASE("call type tags", "[silktrace][types][action]") {
    CHECK(to_string(CallType::kNone) == "none");
    CHECK(to_string(CallType::kCallCode) == "callcode");
    CHECK(call_type_from_string("staticcall") == CallType::kStaticCall);
    CHECK(call_type_from_string("delegatecall") == CallType::kDelegateCall);
    CHECK(!call_type_from_string("create"));
}

TEST_CASE("reward type tags", "[silktrace][types][action]") {
    CHECK(to_string(RewardType::kBlock) == "block");
    CHECK(to_string(RewardType::kExternal) == "external");
    CHECK(reward_type_from_string("emptyStep") == RewardType::kEmptyStep);
    CHECK(!reward_type_from_string("emptystep"));
}

TEST_CASE("action type of action", "[silktrace][types][action]") {
    CHECK(action_type_of(CallAction{}) == ActionType::kCall);
    CHECK(action_type_of(CreateAction{}) == ActionType::kCreate);
    CHECK(action_type_of(SuicideAction{}) == ActionType::kSuicide);
    CHECK(action_type_of(RewardAction{}) == ActionType::kReward);
}

TEST_CASE("action type of every alternative is distinct", "[silktrace][types][action]") {
    const auto action_types = []<std::size_t... I>(std::index_sequence<I...>) {
        return std::set<ActionType>{action_type_of(Action{std::in_place_index<I>})...};
    }(std::make_index_sequence<std::variant_size_v<Action>>{});
    CHECK(action_types.size() == std::variant_size_v<Action>);
    for (const auto action_type : action_types) {
        CHECK(action_type_from_string(to_string(action_type)) == action_type);
    }
}

TEST_CASE("print action", "[silktrace][types][action]") {
    SECTION("call") {
        CallAction call;
        call.from = 0xe0a2bd4258d2768837baa26a28fe71dc079f84c7_address;
        call.to = 0x52bc44d5378309ee2abf1539bf71de1b7d7be3b5_address;
        call.value = 1000;
        call.gas = 21000;
        call.input = Bytes{0x01, 0x02};
        call.call_type = CallType::kStaticCall;
        std::ostringstream oss;
        oss << Action{call};
        CHECK(oss.str() == "type: call call_type: staticcall from: e0a2bd4258d2768837baa26a28fe71dc079f84c7 "
                           "to: 52bc44d5378309ee2abf1539bf71de1b7d7be3b5 value: 1000 gas: 21000 #input: 2");
    }
    SECTION("reward") {
        RewardAction reward;
        reward.value = 2;
        reward.reward_type = RewardType::kUncle;
        std::ostringstream oss;
        oss << Action{reward};
        CHECK(oss.str() == "type: reward author: 0000000000000000000000000000000000000000 value: 2 reward_type: uncle");
    }
}

} // namespace silktrace
