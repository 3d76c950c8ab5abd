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

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/flags/usage_config.h>
#include <absl/strings/match.h>
#include <nlohmann/json.hpp>

#include <silktrace/common/constants.hpp>
#include <silktrace/common/log.hpp>
#include <silktrace/common/util.hpp>
#include <silktrace/json/trace.hpp>
#include <silktrace/json/types.hpp>

ABSL_FLAG(std::string, file, silktrace::kDefaultTraceFile, "trace payload file path as string");
ABSL_FLAG(bool, batch, false, "decode payload as a batch of block traces");
ABSL_FLAG(uint32_t, max_depth, silktrace::kDefaultMaxVmTraceDepth, "maximum vm trace nesting depth as 32-bit integer");
ABSL_FLAG(bool, lenient, false, "keep error and drop result when a trace has both");
ABSL_FLAG(bool, nulls, false, "emit absent optional fields as null when re-encoding");
ABSL_FLAG(bool, hex_words, false, "emit machine words as hex quantities when re-encoding");
ABSL_FLAG(bool, reencode, false, "print the re-encoded payload");
ABSL_FLAG(silktrace::LogLevel, logLevel, silktrace::LogLevel::Critical, "logging level");

void print_summary(std::size_t index, const silktrace::BlockTrace& block_trace) {
    std::cout << "BlockTrace #" << index << " output: " << block_trace.output.size() << " bytes";
    if (block_trace.transaction_hash) {
        std::cout << " transaction_hash: 0x" << silktrace::to_hex(*block_trace.transaction_hash);
    }
    std::cout << "\n";
    if (block_trace.trace) {
        std::size_t failed{0};
        for (const auto& trace : *block_trace.trace) {
            if (trace.error) {
                ++failed;
            }
        }
        std::cout << "  trace: " << block_trace.trace->size() << " actions, " << failed << " failed\n";
    }
    if (block_trace.vm_trace) {
        std::cout << "  vmTrace: " << silktrace::count_operations(*block_trace.vm_trace) << " ops, depth "
                  << silktrace::depth_of(*block_trace.vm_trace) << "\n";
    }
    if (block_trace.state_diff) {
        std::cout << "  stateDiff: " << block_trace.state_diff->size() << " accounts\n";
        for (const auto& [address, account_diff] : *block_trace.state_diff) {
            std::cout << "    0x" << silktrace::to_hex(address) << " " << account_diff << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    absl::FlagsUsageConfig config;
    config.contains_helpshort_flags = [](absl::string_view) { return false; };
    config.contains_help_flags = [](absl::string_view filename) { return absl::EndsWith(filename, "trace_inspect.cpp"); };
    config.contains_helppackage_flags = [](absl::string_view) { return false; };
    config.normalize_filename = [](absl::string_view f) { return std::string{f.substr(f.rfind("/") + 1)}; };
    config.version_string = []() { return "trace_inspect 0.1.0\n"; };
    absl::SetFlagsUsageConfig(config);
    absl::SetProgramUsageMessage("Decode and inspect ad-hoc trace API payloads (trace/vmTrace/stateDiff)");
    absl::ParseCommandLine(argc, argv);

    SILKTRACE_LOG_VERBOSITY(absl::GetFlag(FLAGS_logLevel));

    auto file{absl::GetFlag(FLAGS_file)};
    if (file.empty() || !std::filesystem::exists(file)) {
        std::cerr << "Parameter file is invalid: [" << file << "]\n";
        std::cerr << "Use --file flag to specify the path of the trace payload\n";
        return -1;
    }

    auto max_depth{absl::GetFlag(FLAGS_max_depth)};
    if (max_depth == 0) {
        std::cerr << "Parameter max_depth is invalid: [" << max_depth << "]\n";
        std::cerr << "Use --max_depth flag to specify a positive vm trace nesting limit\n";
        return -1;
    }

    silktrace::CodecConfig codec_config;
    codec_config.max_vm_trace_depth = max_depth;
    codec_config.lenient_outcome = absl::GetFlag(FLAGS_lenient);
    codec_config.emit_nulls = absl::GetFlag(FLAGS_nulls);
    codec_config.word_format = absl::GetFlag(FLAGS_hex_words) ? silktrace::WordFormat::kHex : silktrace::WordFormat::kDecimal;
    SILKTRACE_DEBUG << "trace_inspect file: " << file << " codec config: " << codec_config << "\n";

    try {
        std::ifstream input{file};
        const auto payload = nlohmann::json::parse(input);

        const silktrace::TraceDecoder decoder{codec_config};
        std::vector<silktrace::BlockTrace> block_traces;
        if (absl::GetFlag(FLAGS_batch)) {
            block_traces = decoder.decode_block_traces(payload);
        } else {
            block_traces.push_back(decoder.decode_block_trace(payload));
        }
        SILKTRACE_INFO << "trace_inspect decoded " << block_traces.size() << " block traces from " << file << "\n";

        for (std::size_t i{0}; i < block_traces.size(); ++i) {
            print_summary(i, block_traces[i]);
        }

        if (absl::GetFlag(FLAGS_reencode)) {
            const silktrace::TraceEncoder encoder{codec_config};
            const auto reencoded = absl::GetFlag(FLAGS_batch) ? encoder.encode(block_traces) : encoder.encode(block_traces.front());
            std::cout << reencoded.dump(4) << "\n";
        }
    } catch (const silktrace::CodecError& e) {
        SILKTRACE_ERROR << "trace_inspect decode failed: " << e << "\n";
        std::cerr << "Invalid trace payload: " << nlohmann::json(e).dump() << "\n";
        return -1;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Invalid JSON in " << file << ": " << e.what() << "\n";
        return -1;
    } catch (const std::exception& e) {
        SILKTRACE_CRIT << "Exception: " << e.what() << "\n" << std::flush;
        return -1;
    }

    return 0;
}
