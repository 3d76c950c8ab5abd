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

#ifndef SILKTRACE_TYPES_VM_TRACE_HPP_
#define SILKTRACE_TYPES_VM_TRACE_HPP_

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

#include <intx/intx.hpp>

#include <silktrace/common/util.hpp>

namespace silktrace {

//! Chunk of memory written by an instruction
struct MemoryDiff {
    uint64_t off{0};
    Bytes data;

    bool operator==(const MemoryDiff&) const = default;
};

//! Storage slot written by an instruction
struct StorageDiff {
    intx::uint256 key{0};
    intx::uint256 val{0};

    bool operator==(const StorageDiff&) const = default;
};

//! Effects of an executed instruction
struct VmExecutedOperation {
    uint64_t used{0};   // gas remaining after execution
    std::vector<intx::uint256> push;
    std::optional<MemoryDiff> mem;
    std::optional<StorageDiff> store;

    bool operator==(const VmExecutedOperation&) const = default;
};

struct VmTrace;

//! A single instruction. The nested trace of a CALL/CREATE is exclusively owned and deep-copied.
struct VmOperation {
    uint64_t pc{0};
    uint64_t cost{0};
    std::optional<VmExecutedOperation> ex;  // absent when the instruction was not executed
    std::unique_ptr<VmTrace> sub;

    VmOperation();
    VmOperation(const VmOperation& other);
    VmOperation(VmOperation&& other) noexcept;
    ~VmOperation();

    VmOperation& operator=(const VmOperation& other);
    VmOperation& operator=(VmOperation&& other) noexcept;

    bool operator==(const VmOperation& other) const;
};

//! Execution record of one call frame
struct VmTrace {
    Bytes code;
    std::vector<VmOperation> ops;

    bool operator==(const VmTrace&) const = default;
};

//! Nesting depth of the trace tree, 1 for a trace without sub-traces
std::size_t depth_of(const VmTrace& vm_trace);

//! Number of operations in the whole trace tree
std::size_t count_operations(const VmTrace& vm_trace);

std::ostream& operator<<(std::ostream& out, const VmTrace& vm_trace);

} // namespace silktrace

#endif  // SILKTRACE_TYPES_VM_TRACE_HPP_
