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

#include "block_trace.hpp"

namespace silktrace {

std::string_view to_string(TraceType trace_type) {
    switch (trace_type) {
        case TraceType::kTrace: return "trace";
        case TraceType::kVmTrace: return "vmTrace";
        case TraceType::kStateDiff: return "stateDiff";
    }
    return "unknown";
}

std::optional<TraceType> trace_type_from_string(std::string_view tag) {
    if (tag == "trace") {
        return TraceType::kTrace;
    }
    if (tag == "vmTrace") {
        return TraceType::kVmTrace;
    }
    if (tag == "stateDiff") {
        return TraceType::kStateDiff;
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& out, TraceType trace_type) {
    out << to_string(trace_type);
    return out;
}

TraceConfig make_trace_config(const std::vector<TraceType>& trace_types) {
    TraceConfig config;
    for (const auto trace_type : trace_types) {
        switch (trace_type) {
            case TraceType::kTrace:
                config.trace = true;
                break;
            case TraceType::kVmTrace:
                config.vm_trace = true;
                break;
            case TraceType::kStateDiff:
                config.state_diff = true;
                break;
        }
    }
    return config;
}

std::vector<TraceType> make_trace_types(const TraceConfig& config) {
    std::vector<TraceType> trace_types;
    if (config.trace) {
        trace_types.push_back(TraceType::kTrace);
    }
    if (config.vm_trace) {
        trace_types.push_back(TraceType::kVmTrace);
    }
    if (config.state_diff) {
        trace_types.push_back(TraceType::kStateDiff);
    }
    return trace_types;
}

std::ostream& operator<<(std::ostream& out, const TraceConfig& tc) {
    out << "vmTrace: " << std::boolalpha << tc.vm_trace;
    out << " Trace: " << std::boolalpha << tc.trace;
    out << " stateDiff: " << std::boolalpha << tc.state_diff;

    return out;
}

std::ostream& operator<<(std::ostream& out, const BlockTrace& block_trace) {
    out << "#output: " << block_trace.output.size();
    if (block_trace.transaction_hash) {
        out << " transaction_hash: " << *block_trace.transaction_hash;
    }
    if (block_trace.trace) {
        out << " #trace: " << block_trace.trace->size();
    }
    if (block_trace.vm_trace) {
        out << " vm_trace: {" << *block_trace.vm_trace << "}";
    }
    if (block_trace.state_diff) {
        out << " state_diff: {" << *block_trace.state_diff << "}";
    }
    return out;
}

} // namespace silktrace
