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

#ifndef SILKTRACE_TYPES_BLOCK_TRACE_HPP_
#define SILKTRACE_TYPES_BLOCK_TRACE_HPP_

#include <iostream>
#include <optional>
#include <string_view>
#include <vector>

#include <evmc/evmc.hpp>

#include <silktrace/common/util.hpp>
#include <silktrace/types/state_diff.hpp>
#include <silktrace/types/transaction_trace.hpp>
#include <silktrace/types/vm_trace.hpp>

namespace silktrace {

//! Trace view requested from the producer
enum class TraceType {
    kTrace,
    kVmTrace,
    kStateDiff,
};

std::string_view to_string(TraceType trace_type);
std::optional<TraceType> trace_type_from_string(std::string_view tag);

std::ostream& operator<<(std::ostream& out, TraceType trace_type);

struct TraceConfig {
    bool vm_trace{false};
    bool trace{false};
    bool state_diff{false};

    bool operator==(const TraceConfig&) const = default;
};

TraceConfig make_trace_config(const std::vector<TraceType>& trace_types);
std::vector<TraceType> make_trace_types(const TraceConfig& config);

std::ostream& operator<<(std::ostream& out, const TraceConfig& tc);

//! Ad-hoc trace API response envelope, each view present only when the producer populated it
struct BlockTrace {
    Bytes output;
    std::optional<std::vector<TransactionTrace>> trace;
    std::optional<VmTrace> vm_trace;
    std::optional<StateDiff> state_diff;
    std::optional<evmc::bytes32> transaction_hash;

    bool operator==(const BlockTrace&) const = default;
};

std::ostream& operator<<(std::ostream& out, const BlockTrace& block_trace);

} // namespace silktrace

#endif  // SILKTRACE_TYPES_BLOCK_TRACE_HPP_
