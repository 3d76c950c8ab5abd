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

#include "trace.hpp"

#include <memory>
#include <string>
#include <utility>
#include <variant>

#include <silkworm/common/util.hpp>

#include <silktrace/common/log.hpp>
#include <silktrace/common/util.hpp>
#include <silktrace/json/types.hpp>

namespace silktrace {

namespace {

// Reference token escaping as in RFC 6901: '~' becomes "~0" and '/' becomes "~1"
std::string child_path(const std::string& path, const std::string& key) {
    std::string child{path};
    child.reserve(path.length() + key.length() + 1);
    child.push_back('/');
    for (const auto c : key) {
        if (c == '~') {
            child.append("~0");
        } else if (c == '/') {
            child.append("~1");
        } else {
            child.push_back(c);
        }
    }
    return child;
}

std::string child_path(const std::string& path, std::size_t index) {
    return path + "/" + std::to_string(index);
}

[[noreturn]] void throw_schema_violation(const std::string& path, const std::string& what) {
    throw CodecError{TraceError::schema_violation, path, what};
}

[[noreturn]] void throw_encoding_error(const std::string& path, const std::string& what) {
    throw CodecError{TraceError::encoding_error, path, what};
}

void expect_object(const nlohmann::json& json, const std::string& path) {
    if (!json.is_object()) {
        throw_schema_violation(path, std::string{"object expected, got "} + json.type_name());
    }
}

void expect_array(const nlohmann::json& json, const std::string& path) {
    if (!json.is_array()) {
        throw_schema_violation(path, std::string{"array expected, got "} + json.type_name());
    }
}

const std::string& expect_string(const nlohmann::json& json, const std::string& path) {
    if (!json.is_string()) {
        throw_schema_violation(path, std::string{"string expected, got "} + json.type_name());
    }
    return json.get_ref<const std::string&>();
}

// Absent and null fields are both reported as nullptr
const nlohmann::json* optional_field(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

const nlohmann::json& required_field(const nlohmann::json& object, const char* key, const std::string& path) {
    const auto* field = optional_field(object, key);
    if (field == nullptr) {
        throw_schema_violation(child_path(path, key), "missing required field");
    }
    return *field;
}

// Field which may take its zero default when missing, depending on the codec configuration. Never nullable.
const nlohmann::json* defaultable_field(const nlohmann::json& object, const char* key, const std::string& path, bool allow_default) {
    const auto it = object.find(key);
    if (it == object.end()) {
        if (!allow_default) {
            throw_schema_violation(child_path(path, key), "missing required field");
        }
        return nullptr;
    }
    if (it->is_null()) {
        throw_schema_violation(child_path(path, key), "null not allowed");
    }
    return &*it;
}

Bytes decode_bytes(const nlohmann::json& json, const std::string& path) {
    const auto& hex = expect_string(json, path);
    if (!silkworm::has_hex_prefix(hex)) {
        throw_schema_violation(path, "missing 0x prefix in byte string");
    }
    auto bytes = from_hex(hex);
    if (!bytes) {
        throw_schema_violation(path, "malformed hex byte string");
    }
    return std::move(*bytes);
}

// Machine words and gas amounts are accepted both as JSON numbers and as hex quantities
uint64_t decode_word(const nlohmann::json& json, const std::string& path) {
    if (json.is_number_unsigned()) {
        return json.get<uint64_t>();
    }
    if (json.is_number_integer() && json.get<int64_t>() >= 0) {
        return static_cast<uint64_t>(json.get<int64_t>());
    }
    if (json.is_string()) {
        const auto value = uint64_from_quantity(json.get_ref<const std::string&>());
        if (!value) {
            throw_schema_violation(path, "malformed 64-bit quantity");
        }
        return *value;
    }
    throw_schema_violation(path, std::string{"unsigned integer expected, got "} + json.type_name());
}

template <typename Decode>
auto decode_field(const nlohmann::json& object, const char* key, const std::string& path, Decode decode) {
    return decode(required_field(object, key, path), child_path(path, key));
}

template <typename T, typename Decode>
Diff<T> decode_diff(const nlohmann::json& json, const std::string& path, Decode decode_value) {
    if (json.is_string()) {
        const auto& tag = json.get_ref<const std::string&>();
        if (tag != "=") {
            throw_schema_violation(path, "unknown diff tag: " + tag);
        }
        return DiffSame{};
    }
    if (!json.is_object() || json.size() != 1) {
        throw_schema_violation(path, "diff must be \"=\" or an object with exactly one tag");
    }
    const auto it = json.begin();
    const auto& tag = it.key();
    const auto& payload = it.value();
    const auto tag_path = child_path(path, tag);
    if (tag == "=") {
        if (!payload.is_null()) {
            throw_schema_violation(tag_path, "unexpected payload for unchanged value");
        }
        return DiffSame{};
    }
    if (tag == "+") {
        return DiffBorn<T>{decode_value(payload, tag_path)};
    }
    if (tag == "-") {
        return DiffDied<T>{decode_value(payload, tag_path)};
    }
    if (tag == "*") {
        expect_object(payload, tag_path);
        if (payload.size() != 2) {
            throw_schema_violation(tag_path, "changed value must have exactly from and to");
        }
        auto from = decode_field(payload, "from", tag_path, decode_value);
        auto to = decode_field(payload, "to", tag_path, decode_value);
        return DiffChanged<T>{std::move(from), std::move(to)};
    }
    throw_schema_violation(tag_path, "unknown diff tag: " + tag);
}

template <typename T, typename Encode>
nlohmann::json encode_diff(const Diff<T>& diff, Encode encode_value) {
    nlohmann::json json;
    if (std::holds_alternative<DiffSame>(diff)) {
        json = "=";
    } else if (const auto* born = std::get_if<DiffBorn<T>>(&diff)) {
        json["+"] = encode_value(born->value);
    } else if (const auto* died = std::get_if<DiffDied<T>>(&diff)) {
        json["-"] = encode_value(died->value);
    } else {
        const auto& changed = std::get<DiffChanged<T>>(diff);
        json["*"] = {
            {"from", encode_value(changed.from)},
            {"to", encode_value(changed.to)}
        };
    }
    return json;
}

std::string hex_of(const evmc::address& address) {
    return kHexPrefix + to_hex(address);
}

std::string hex_of(const evmc::bytes32& b32) {
    return kHexPrefix + to_hex(b32);
}

bool output_matches(const TraceOutput& output, ActionType action_type) {
    switch (action_type) {
        case ActionType::kCall:
            return std::holds_alternative<CallOutput>(output);
        case ActionType::kCreate:
            return std::holds_alternative<CreateOutput>(output);
        default:
            return false;
    }
}

} // namespace

std::ostream& operator<<(std::ostream& out, const CodecConfig& config) {
    out << "max_vm_trace_depth: " << config.max_vm_trace_depth;
    out << " default_missing_vm_fields: " << std::boolalpha << config.default_missing_vm_fields;
    out << " lenient_outcome: " << std::boolalpha << config.lenient_outcome;
    out << " emit_nulls: " << std::boolalpha << config.emit_nulls;
    out << " word_format: " << (config.word_format == WordFormat::kHex ? "hex" : "decimal");
    return out;
}

BlockTrace TraceDecoder::decode_block_trace(const nlohmann::json& json) const {
    SILKTRACE_TRACE << "TraceDecoder::decode_block_trace config: " << config_ << "\n";
    try {
        return decode_block_trace(json, "");
    } catch (const CodecError& e) {
        SILKTRACE_DEBUG << "TraceDecoder::decode_block_trace failed: " << e << "\n";
        throw;
    }
}

std::vector<BlockTrace> TraceDecoder::decode_block_traces(const nlohmann::json& json) const {
    SILKTRACE_TRACE << "TraceDecoder::decode_block_traces config: " << config_ << "\n";
    try {
        expect_array(json, "");
        std::vector<BlockTrace> block_traces;
        block_traces.reserve(json.size());
        for (std::size_t i{0}; i < json.size(); ++i) {
            block_traces.push_back(decode_block_trace(json[i], child_path("", i)));
        }
        SILKTRACE_TRACE << "TraceDecoder::decode_block_traces #block_traces: " << block_traces.size() << "\n";
        return block_traces;
    } catch (const CodecError& e) {
        SILKTRACE_DEBUG << "TraceDecoder::decode_block_traces failed: " << e << "\n";
        throw;
    }
}

std::vector<TraceType> TraceDecoder::decode_trace_types(const nlohmann::json& json) const {
    expect_array(json, "");
    std::vector<TraceType> trace_types;
    trace_types.reserve(json.size());
    for (std::size_t i{0}; i < json.size(); ++i) {
        const auto path = child_path("", i);
        const auto& tag = expect_string(json[i], path);
        const auto trace_type = trace_type_from_string(tag);
        if (!trace_type) {
            throw_schema_violation(path, "unknown trace type: " + tag);
        }
        trace_types.push_back(*trace_type);
    }
    return trace_types;
}

StateDiff TraceDecoder::decode_state_diff(const nlohmann::json& json) const {
    return decode_state_diff(json, "");
}

AccountDiff TraceDecoder::decode_account_diff(const nlohmann::json& json) const {
    return decode_account_diff(json, "");
}

std::vector<TransactionTrace> TraceDecoder::decode_transaction_traces(const nlohmann::json& json) const {
    return decode_transaction_traces(json, "");
}

TransactionTrace TraceDecoder::decode_transaction_trace(const nlohmann::json& json) const {
    return decode_transaction_trace(json, "");
}

VmTrace TraceDecoder::decode_vm_trace(const nlohmann::json& json) const {
    return decode_vm_trace(json, "", 1);
}

BlockTrace TraceDecoder::decode_block_trace(const nlohmann::json& json, const std::string& path) const {
    expect_object(json, path);

    BlockTrace block_trace;
    block_trace.output = decode_field(json, "output", path, decode_bytes);
    if (const auto* trace = optional_field(json, "trace")) {
        block_trace.trace = decode_transaction_traces(*trace, child_path(path, "trace"));
    }
    if (const auto* vm_trace = optional_field(json, "vmTrace")) {
        block_trace.vm_trace = decode_vm_trace(*vm_trace, child_path(path, "vmTrace"), 1);
    }
    if (const auto* state_diff = optional_field(json, "stateDiff")) {
        block_trace.state_diff = decode_state_diff(*state_diff, child_path(path, "stateDiff"));
    }
    if (const auto* transaction_hash = optional_field(json, "transactionHash")) {
        block_trace.transaction_hash = decode_hash(*transaction_hash, child_path(path, "transactionHash"));
    }
    return block_trace;
}

StateDiff TraceDecoder::decode_state_diff(const nlohmann::json& json, const std::string& path) const {
    expect_object(json, path);

    StateDiff state_diff;
    for (auto it = json.begin(); it != json.end(); ++it) {
        const auto account_path = child_path(path, it.key());
        const auto address = address_from_hex(it.key());
        if (!address) {
            throw_schema_violation(account_path, "malformed address key");
        }
        const auto [_, inserted] = state_diff.emplace(*address, decode_account_diff(it.value(), account_path));
        if (!inserted) {
            throw_schema_violation(account_path, "duplicate address key");
        }
    }
    return state_diff;
}

AccountDiff TraceDecoder::decode_account_diff(const nlohmann::json& json, const std::string& path) const {
    expect_object(json, path);

    AccountDiff account_diff;
    account_diff.balance = decode_diff<intx::uint256>(required_field(json, "balance", path), child_path(path, "balance"), decode_uint256);
    account_diff.nonce = decode_diff<intx::uint256>(required_field(json, "nonce", path), child_path(path, "nonce"), decode_uint256);
    account_diff.code = decode_diff<Bytes>(required_field(json, "code", path), child_path(path, "code"), decode_bytes);

    const auto storage_path = child_path(path, "storage");
    const auto& storage = required_field(json, "storage", path);
    expect_object(storage, storage_path);
    for (auto it = storage.begin(); it != storage.end(); ++it) {
        const auto slot_path = child_path(storage_path, it.key());
        const auto key = bytes32_from_hex(it.key());
        if (!key) {
            throw_schema_violation(slot_path, "malformed storage key");
        }
        const auto [_, inserted] = account_diff.storage.emplace(*key, decode_diff<evmc::bytes32>(it.value(), slot_path, decode_hash));
        if (!inserted) {
            throw_schema_violation(slot_path, "duplicate storage key");
        }
    }
    return account_diff;
}

std::vector<TransactionTrace> TraceDecoder::decode_transaction_traces(const nlohmann::json& json, const std::string& path) const {
    expect_array(json, path);

    std::vector<TransactionTrace> traces;
    traces.reserve(json.size());
    for (std::size_t i{0}; i < json.size(); ++i) {
        traces.push_back(decode_transaction_trace(json[i], child_path(path, i)));
    }
    return traces;
}

TransactionTrace TraceDecoder::decode_transaction_trace(const nlohmann::json& json, const std::string& path) const {
    expect_object(json, path);

    TransactionTrace trace;
    const auto trace_address_path = child_path(path, "traceAddress");
    const auto& trace_address = required_field(json, "traceAddress", path);
    expect_array(trace_address, trace_address_path);
    trace.trace_address.reserve(trace_address.size());
    for (std::size_t i{0}; i < trace_address.size(); ++i) {
        trace.trace_address.push_back(decode_word(trace_address[i], child_path(trace_address_path, i)));
    }
    trace.subtraces = decode_field(json, "subtraces", path, decode_word);

    const auto type_path = child_path(path, "type");
    const auto& type_tag = expect_string(required_field(json, "type", path), type_path);
    const auto action_type = action_type_from_string(type_tag);
    if (!action_type) {
        throw_schema_violation(type_path, "unknown action type: " + type_tag);
    }
    trace.action_type = *action_type;
    trace.action = decode_action(required_field(json, "action", path), trace.action_type, child_path(path, "action"));

    const auto* result = optional_field(json, "result");
    const auto* error = optional_field(json, "error");
    if (result != nullptr && error != nullptr) {
        if (!config_.lenient_outcome) {
            throw_schema_violation(path, "both result and error present");
        }
        SILKTRACE_WARN << "trace at " << (path.empty() ? "/" : path) << " has both result and error, result dropped\n";
        result = nullptr;
    }
    if (result != nullptr) {
        trace.result = decode_trace_output(*result, trace.action_type, child_path(path, "result"));
    }
    if (error != nullptr) {
        trace.error = expect_string(*error, child_path(path, "error"));
    }
    return trace;
}

Action TraceDecoder::decode_action(const nlohmann::json& json, ActionType action_type, const std::string& path) const {
    expect_object(json, path);

    switch (action_type) {
        case ActionType::kCall: {
            CallAction call;
            call.from = decode_field(json, "from", path, decode_address);
            call.to = decode_field(json, "to", path, decode_address);
            call.value = decode_field(json, "value", path, decode_uint256);
            call.gas = decode_field(json, "gas", path, decode_word);
            call.input = decode_field(json, "input", path, decode_bytes);
            const auto call_type_path = child_path(path, "callType");
            const auto& call_type_tag = expect_string(required_field(json, "callType", path), call_type_path);
            const auto call_type = call_type_from_string(call_type_tag);
            if (!call_type) {
                throw_schema_violation(call_type_path, "unknown call type: " + call_type_tag);
            }
            call.call_type = *call_type;
            return call;
        }
        case ActionType::kCreate: {
            CreateAction create;
            create.from = decode_field(json, "from", path, decode_address);
            create.value = decode_field(json, "value", path, decode_uint256);
            create.gas = decode_field(json, "gas", path, decode_word);
            create.init = decode_field(json, "init", path, decode_bytes);
            return create;
        }
        case ActionType::kSuicide: {
            SuicideAction suicide;
            suicide.address = decode_field(json, "address", path, decode_address);
            suicide.refund_address = decode_field(json, "refundAddress", path, decode_address);
            suicide.balance = decode_field(json, "balance", path, decode_uint256);
            return suicide;
        }
        case ActionType::kReward: {
            RewardAction reward;
            reward.author = decode_field(json, "author", path, decode_address);
            reward.value = decode_field(json, "value", path, decode_uint256);
            const auto reward_type_path = child_path(path, "rewardType");
            const auto& reward_type_tag = expect_string(required_field(json, "rewardType", path), reward_type_path);
            const auto reward_type = reward_type_from_string(reward_type_tag);
            if (!reward_type) {
                throw_schema_violation(reward_type_path, "unknown reward type: " + reward_type_tag);
            }
            reward.reward_type = *reward_type;
            return reward;
        }
    }
    throw_schema_violation(path, "unsupported action type");
}

TraceOutput TraceDecoder::decode_trace_output(const nlohmann::json& json, ActionType action_type, const std::string& path) const {
    expect_object(json, path);

    switch (action_type) {
        case ActionType::kCall: {
            CallOutput output;
            output.gas_used = decode_field(json, "gasUsed", path, decode_word);
            output.output = decode_field(json, "output", path, decode_bytes);
            return output;
        }
        case ActionType::kCreate: {
            CreateOutput output;
            output.gas_used = decode_field(json, "gasUsed", path, decode_word);
            output.code = decode_field(json, "code", path, decode_bytes);
            output.address = decode_field(json, "address", path, decode_address);
            return output;
        }
        default:
            throw_schema_violation(path, "unexpected result for " + std::string{to_string(action_type)} + " action");
    }
}

VmTrace TraceDecoder::decode_vm_trace(const nlohmann::json& json, const std::string& path, std::size_t depth) const {
    if (depth > config_.max_vm_trace_depth) {
        throw CodecError{TraceError::depth_exceeded, path, "vm trace nesting exceeds " + std::to_string(config_.max_vm_trace_depth)};
    }
    expect_object(json, path);

    const bool allow_default{config_.default_missing_vm_fields};
    VmTrace vm_trace;
    if (const auto* code = defaultable_field(json, "code", path, allow_default)) {
        vm_trace.code = decode_bytes(*code, child_path(path, "code"));
    }
    if (const auto* ops = defaultable_field(json, "ops", path, allow_default)) {
        const auto ops_path = child_path(path, "ops");
        expect_array(*ops, ops_path);
        vm_trace.ops.reserve(ops->size());
        for (std::size_t i{0}; i < ops->size(); ++i) {
            vm_trace.ops.push_back(decode_vm_operation((*ops)[i], child_path(ops_path, i), depth));
        }
    }
    return vm_trace;
}

VmOperation TraceDecoder::decode_vm_operation(const nlohmann::json& json, const std::string& path, std::size_t depth) const {
    expect_object(json, path);

    VmOperation op;
    op.pc = decode_field(json, "pc", path, decode_word);
    if (const auto* cost = defaultable_field(json, "cost", path, config_.default_missing_vm_fields)) {
        op.cost = decode_word(*cost, child_path(path, "cost"));
    }
    if (const auto* ex = optional_field(json, "ex")) {
        op.ex = decode_vm_executed_operation(*ex, child_path(path, "ex"));
    }
    if (const auto* sub = optional_field(json, "sub")) {
        op.sub = std::make_unique<VmTrace>(decode_vm_trace(*sub, child_path(path, "sub"), depth + 1));
    }
    return op;
}

VmExecutedOperation TraceDecoder::decode_vm_executed_operation(const nlohmann::json& json, const std::string& path) const {
    expect_object(json, path);

    const bool allow_default{config_.default_missing_vm_fields};
    VmExecutedOperation ex;
    if (const auto* used = defaultable_field(json, "used", path, allow_default)) {
        ex.used = decode_word(*used, child_path(path, "used"));
    }
    if (const auto* push = defaultable_field(json, "push", path, allow_default)) {
        const auto push_path = child_path(path, "push");
        expect_array(*push, push_path);
        ex.push.reserve(push->size());
        for (std::size_t i{0}; i < push->size(); ++i) {
            ex.push.push_back(decode_uint256((*push)[i], child_path(push_path, i)));
        }
    }
    if (const auto* mem = optional_field(json, "mem")) {
        const auto mem_path = child_path(path, "mem");
        expect_object(*mem, mem_path);
        MemoryDiff memory;
        memory.off = decode_field(*mem, "off", mem_path, decode_word);
        memory.data = decode_field(*mem, "data", mem_path, decode_bytes);
        ex.mem = std::move(memory);
    }
    if (const auto* store = optional_field(json, "store")) {
        const auto store_path = child_path(path, "store");
        expect_object(*store, store_path);
        StorageDiff storage;
        storage.key = decode_field(*store, "key", store_path, decode_uint256);
        storage.val = decode_field(*store, "val", store_path, decode_uint256);
        ex.store = storage;
    }
    return ex;
}

nlohmann::json TraceEncoder::encode(const BlockTrace& block_trace) const {
    SILKTRACE_TRACE << "TraceEncoder::encode block_trace: " << block_trace << "\n";
    return encode(block_trace, "");
}

nlohmann::json TraceEncoder::encode(const std::vector<BlockTrace>& block_traces) const {
    SILKTRACE_TRACE << "TraceEncoder::encode #block_traces: " << block_traces.size() << "\n";
    nlohmann::json json = nlohmann::json::array();
    for (std::size_t i{0}; i < block_traces.size(); ++i) {
        json.push_back(encode(block_traces[i], child_path("", i)));
    }
    return json;
}

nlohmann::json TraceEncoder::encode(const std::vector<TraceType>& trace_types) const {
    nlohmann::json json = nlohmann::json::array();
    for (const auto trace_type : trace_types) {
        json.push_back(std::string{to_string(trace_type)});
    }
    return json;
}

nlohmann::json TraceEncoder::encode(const StateDiff& state_diff) const {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [address, account_diff] : state_diff) {
        json[hex_of(address)] = encode(account_diff);
    }
    return json;
}

nlohmann::json TraceEncoder::encode(const AccountDiff& account_diff) const {
    const auto quantity = [](const intx::uint256& value) { return to_quantity(value); };
    const auto bytes = [](const Bytes& value) { return to_prefixed_hex(value); };
    const auto hash = [](const evmc::bytes32& value) { return hex_of(value); };

    nlohmann::json json;
    json["balance"] = encode_diff(account_diff.balance, quantity);
    json["code"] = encode_diff(account_diff.code, bytes);
    json["nonce"] = encode_diff(account_diff.nonce, quantity);
    json["storage"] = nlohmann::json::object();
    for (const auto& [key, diff] : account_diff.storage) {
        json["storage"][hex_of(key)] = encode_diff(diff, hash);
    }
    return json;
}

nlohmann::json TraceEncoder::encode(const std::vector<TransactionTrace>& traces) const {
    return encode(traces, "");
}

nlohmann::json TraceEncoder::encode(const TransactionTrace& trace) const {
    return encode(trace, "");
}

nlohmann::json TraceEncoder::encode(const VmTrace& vm_trace) const {
    nlohmann::json json;
    json["code"] = to_prefixed_hex(vm_trace.code);
    json["ops"] = nlohmann::json::array();
    for (const auto& op : vm_trace.ops) {
        json["ops"].push_back(encode_vm_operation(op));
    }
    return json;
}

nlohmann::json TraceEncoder::encode(const BlockTrace& block_trace, const std::string& path) const {
    nlohmann::json json;
    json["output"] = to_prefixed_hex(block_trace.output);
    if (block_trace.trace) {
        json["trace"] = encode(*block_trace.trace, child_path(path, "trace"));
    } else {
        encode_absent(json, "trace");
    }
    if (block_trace.vm_trace) {
        json["vmTrace"] = encode(*block_trace.vm_trace);
    } else {
        encode_absent(json, "vmTrace");
    }
    if (block_trace.state_diff) {
        json["stateDiff"] = encode(*block_trace.state_diff);
    } else {
        encode_absent(json, "stateDiff");
    }
    if (block_trace.transaction_hash) {
        json["transactionHash"] = hex_of(*block_trace.transaction_hash);
    } else {
        encode_absent(json, "transactionHash");
    }
    return json;
}

nlohmann::json TraceEncoder::encode(const std::vector<TransactionTrace>& traces, const std::string& path) const {
    nlohmann::json json = nlohmann::json::array();
    for (std::size_t i{0}; i < traces.size(); ++i) {
        json.push_back(encode(traces[i], child_path(path, i)));
    }
    return json;
}

nlohmann::json TraceEncoder::encode(const TransactionTrace& trace, const std::string& path) const {
    if (trace.result && trace.error) {
        throw_encoding_error(path, "both result and error set");
    }
    const auto action_type = action_type_of(trace.action);
    if (action_type != trace.action_type) {
        throw_encoding_error(child_path(path, "type"), "action type " + std::string{to_string(trace.action_type)} +
            " does not match " + std::string{to_string(action_type)} + " action");
    }
    if (trace.result && !output_matches(*trace.result, action_type)) {
        throw_encoding_error(child_path(path, "result"), "result does not match " + std::string{to_string(action_type)} + " action");
    }

    nlohmann::json json;
    json["action"] = encode_action(trace.action);
    if (trace.result) {
        json["result"] = encode_trace_output(*trace.result);
    } else {
        encode_absent(json, "result");
    }
    if (trace.error) {
        json["error"] = *trace.error;
    }
    json["subtraces"] = encode_word(trace.subtraces);
    json["traceAddress"] = nlohmann::json::array();
    for (const auto index : trace.trace_address) {
        json["traceAddress"].push_back(encode_word(index));
    }
    json["type"] = action_type;
    return json;
}

nlohmann::json TraceEncoder::encode_action(const Action& action) const {
    nlohmann::json json;
    if (const auto* call = std::get_if<CallAction>(&action)) {
        json["callType"] = call->call_type;
        json["from"] = call->from;
        json["gas"] = to_quantity(call->gas);
        json["input"] = to_prefixed_hex(call->input);
        json["to"] = call->to;
        json["value"] = call->value;
    } else if (const auto* create = std::get_if<CreateAction>(&action)) {
        json["from"] = create->from;
        json["gas"] = to_quantity(create->gas);
        json["init"] = to_prefixed_hex(create->init);
        json["value"] = create->value;
    } else if (const auto* suicide = std::get_if<SuicideAction>(&action)) {
        json["address"] = suicide->address;
        json["balance"] = suicide->balance;
        json["refundAddress"] = suicide->refund_address;
    } else {
        const auto& reward = std::get<RewardAction>(action);
        json["author"] = reward.author;
        json["rewardType"] = reward.reward_type;
        json["value"] = reward.value;
    }
    return json;
}

nlohmann::json TraceEncoder::encode_trace_output(const TraceOutput& output) const {
    nlohmann::json json;
    if (const auto* call = std::get_if<CallOutput>(&output)) {
        json["gasUsed"] = to_quantity(call->gas_used);
        json["output"] = to_prefixed_hex(call->output);
    } else {
        const auto& create = std::get<CreateOutput>(output);
        json["address"] = create.address;
        json["code"] = to_prefixed_hex(create.code);
        json["gasUsed"] = to_quantity(create.gas_used);
    }
    return json;
}

nlohmann::json TraceEncoder::encode_vm_operation(const VmOperation& op) const {
    nlohmann::json json;
    json["cost"] = encode_word(op.cost);
    if (op.ex) {
        json["ex"] = encode_vm_executed_operation(*op.ex);
    } else {
        encode_absent(json, "ex");
    }
    json["pc"] = encode_word(op.pc);
    if (op.sub) {
        json["sub"] = encode(*op.sub);
    } else {
        encode_absent(json, "sub");
    }
    return json;
}

nlohmann::json TraceEncoder::encode_vm_executed_operation(const VmExecutedOperation& ex) const {
    nlohmann::json json;
    if (ex.mem) {
        json["mem"] = {
            {"data", to_prefixed_hex(ex.mem->data)},
            {"off", encode_word(ex.mem->off)}
        };
    } else {
        encode_absent(json, "mem");
    }
    json["push"] = nlohmann::json::array();
    for (const auto& value : ex.push) {
        json["push"].push_back(to_quantity(value));
    }
    if (ex.store) {
        json["store"] = {
            {"key", to_quantity(ex.store->key)},
            {"val", to_quantity(ex.store->val)}
        };
    } else {
        encode_absent(json, "store");
    }
    json["used"] = encode_word(ex.used);
    return json;
}

nlohmann::json TraceEncoder::encode_word(uint64_t word) const {
    if (config_.word_format == WordFormat::kHex) {
        return to_quantity(word);
    }
    return word;
}

void TraceEncoder::encode_absent(nlohmann::json& json, const char* key) const {
    if (config_.emit_nulls) {
        json[key] = nullptr;
    }
}

void to_json(nlohmann::json& json, TraceType trace_type) {
    json = std::string{to_string(trace_type)};
}

void from_json(const nlohmann::json& json, TraceType& trace_type) {
    const auto& tag = expect_string(json, "");
    const auto decoded = trace_type_from_string(tag);
    if (!decoded) {
        throw_schema_violation("", "unknown trace type: " + tag);
    }
    trace_type = *decoded;
}

void to_json(nlohmann::json& json, const AccountDiff& account_diff) {
    json = TraceEncoder{}.encode(account_diff);
}

void from_json(const nlohmann::json& json, AccountDiff& account_diff) {
    account_diff = TraceDecoder{}.decode_account_diff(json);
}

void to_json(nlohmann::json& json, const TransactionTrace& trace) {
    json = TraceEncoder{}.encode(trace);
}

void from_json(const nlohmann::json& json, TransactionTrace& trace) {
    trace = TraceDecoder{}.decode_transaction_trace(json);
}

void to_json(nlohmann::json& json, const VmTrace& vm_trace) {
    json = TraceEncoder{}.encode(vm_trace);
}

void from_json(const nlohmann::json& json, VmTrace& vm_trace) {
    vm_trace = TraceDecoder{}.decode_vm_trace(json);
}

void to_json(nlohmann::json& json, const BlockTrace& block_trace) {
    json = TraceEncoder{}.encode(block_trace);
}

void from_json(const nlohmann::json& json, BlockTrace& block_trace) {
    block_trace = TraceDecoder{}.decode_block_trace(json);
}

} // namespace silktrace
