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

#ifndef SILKTRACE_JSON_TRACE_HPP_
#define SILKTRACE_JSON_TRACE_HPP_

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <silktrace/common/constants.hpp>
#include <silktrace/types/block_trace.hpp>
#include <silktrace/types/error.hpp>

namespace silktrace {

//! Wire representation of machine-word fields (pc, cost, used, off, subtraces, traceAddress)
enum class WordFormat {
    kDecimal,  // JSON numbers
    kHex,      // 0x-prefixed hex quantities
};

struct CodecConfig {
    //! Deepest VmTrace nesting accepted by the decoder, the root trace being at depth 1
    std::size_t max_vm_trace_depth{kDefaultMaxVmTraceDepth};

    //! Missing code, ops, cost, used and push decode as empty/zero instead of failing
    bool default_missing_vm_fields{true};

    //! A trace carrying both result and error keeps the error instead of failing
    bool lenient_outcome{false};

    //! Absent optional fields are encoded as null instead of being omitted
    bool emit_nulls{false};

    WordFormat word_format{WordFormat::kDecimal};
};

std::ostream& operator<<(std::ostream& out, const CodecConfig& config);

//! Typed decoding of trace API payloads. Stateless apart from its configuration, safe to share between threads.
class TraceDecoder {
  public:
    explicit TraceDecoder(const CodecConfig& config = {}) : config_{config} {}

    BlockTrace decode_block_trace(const nlohmann::json& json) const;

    //! Decode a batch keeping the wire order, all-or-nothing
    std::vector<BlockTrace> decode_block_traces(const nlohmann::json& json) const;

    std::vector<TraceType> decode_trace_types(const nlohmann::json& json) const;
    StateDiff decode_state_diff(const nlohmann::json& json) const;
    AccountDiff decode_account_diff(const nlohmann::json& json) const;
    std::vector<TransactionTrace> decode_transaction_traces(const nlohmann::json& json) const;
    TransactionTrace decode_transaction_trace(const nlohmann::json& json) const;
    VmTrace decode_vm_trace(const nlohmann::json& json) const;

  private:
    BlockTrace decode_block_trace(const nlohmann::json& json, const std::string& path) const;
    StateDiff decode_state_diff(const nlohmann::json& json, const std::string& path) const;
    AccountDiff decode_account_diff(const nlohmann::json& json, const std::string& path) const;
    std::vector<TransactionTrace> decode_transaction_traces(const nlohmann::json& json, const std::string& path) const;
    TransactionTrace decode_transaction_trace(const nlohmann::json& json, const std::string& path) const;
    Action decode_action(const nlohmann::json& json, ActionType action_type, const std::string& path) const;
    TraceOutput decode_trace_output(const nlohmann::json& json, ActionType action_type, const std::string& path) const;
    VmTrace decode_vm_trace(const nlohmann::json& json, const std::string& path, std::size_t depth) const;
    VmOperation decode_vm_operation(const nlohmann::json& json, const std::string& path, std::size_t depth) const;
    VmExecutedOperation decode_vm_executed_operation(const nlohmann::json& json, const std::string& path) const;

    CodecConfig config_;
};

//! Wire encoding of the typed trace model, rejecting values that break the model invariants
class TraceEncoder {
  public:
    explicit TraceEncoder(const CodecConfig& config = {}) : config_{config} {}

    nlohmann::json encode(const BlockTrace& block_trace) const;
    nlohmann::json encode(const std::vector<BlockTrace>& block_traces) const;
    nlohmann::json encode(const std::vector<TraceType>& trace_types) const;
    nlohmann::json encode(const StateDiff& state_diff) const;
    nlohmann::json encode(const AccountDiff& account_diff) const;
    nlohmann::json encode(const std::vector<TransactionTrace>& traces) const;
    nlohmann::json encode(const TransactionTrace& trace) const;
    nlohmann::json encode(const VmTrace& vm_trace) const;

  private:
    nlohmann::json encode(const BlockTrace& block_trace, const std::string& path) const;
    nlohmann::json encode(const std::vector<TransactionTrace>& traces, const std::string& path) const;
    nlohmann::json encode(const TransactionTrace& trace, const std::string& path) const;
    nlohmann::json encode_action(const Action& action) const;
    nlohmann::json encode_trace_output(const TraceOutput& output) const;
    nlohmann::json encode_vm_operation(const VmOperation& op) const;
    nlohmann::json encode_vm_executed_operation(const VmExecutedOperation& ex) const;
    nlohmann::json encode_word(uint64_t word) const;
    void encode_absent(nlohmann::json& json, const char* key) const;

    CodecConfig config_;
};

// Conversions with the default codec configuration

void to_json(nlohmann::json& json, TraceType trace_type);
void from_json(const nlohmann::json& json, TraceType& trace_type);

void to_json(nlohmann::json& json, const AccountDiff& account_diff);
void from_json(const nlohmann::json& json, AccountDiff& account_diff);

void to_json(nlohmann::json& json, const TransactionTrace& trace);
void from_json(const nlohmann::json& json, TransactionTrace& trace);

void to_json(nlohmann::json& json, const VmTrace& vm_trace);
void from_json(const nlohmann::json& json, VmTrace& vm_trace);

void to_json(nlohmann::json& json, const BlockTrace& block_trace);
void from_json(const nlohmann::json& json, BlockTrace& block_trace);

} // namespace silktrace

#endif  // SILKTRACE_JSON_TRACE_HPP_
