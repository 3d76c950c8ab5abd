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

#ifndef SILKTRACE_TYPES_TRANSACTION_TRACE_HPP_
#define SILKTRACE_TYPES_TRANSACTION_TRACE_HPP_

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <silktrace/types/action.hpp>

namespace silktrace {

//! One node of a call tree, flattened: siblings are correlated through their trace_address prefix
struct TransactionTrace {
    std::vector<uint64_t> trace_address;
    uint64_t subtraces{0};
    Action action;
    ActionType action_type{ActionType::kCall};
    // result and error are mutually exclusive, neither present means the outcome is unknown
    std::optional<TraceOutput> result;
    std::optional<std::string> error;

    bool operator==(const TransactionTrace&) const = default;
};

std::ostream& operator<<(std::ostream& out, const TransactionTrace& trace);

} // namespace silktrace

#endif  // SILKTRACE_TYPES_TRANSACTION_TRACE_HPP_
