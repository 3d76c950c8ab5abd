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

#include "vm_trace.hpp"

#include <algorithm>
#include <stack>
#include <utility>

namespace silktrace {

VmOperation::VmOperation() = default;

VmOperation::VmOperation(const VmOperation& other)
    : pc{other.pc}, cost{other.cost}, ex{other.ex}, sub{other.sub ? std::make_unique<VmTrace>(*other.sub) : nullptr} {}

VmOperation::VmOperation(VmOperation&& other) noexcept = default;

VmOperation::~VmOperation() = default;

VmOperation& VmOperation::operator=(const VmOperation& other) {
    if (this != &other) {
        VmOperation copy{other};
        *this = std::move(copy);
    }
    return *this;
}

VmOperation& VmOperation::operator=(VmOperation&& other) noexcept = default;

bool VmOperation::operator==(const VmOperation& other) const {
    if (pc != other.pc || cost != other.cost || ex != other.ex) {
        return false;
    }
    if (!sub || !other.sub) {
        return !sub && !other.sub;
    }
    return *sub == *other.sub;
}

std::size_t depth_of(const VmTrace& vm_trace) {
    std::size_t max_depth{0};
    std::stack<std::pair<const VmTrace*, std::size_t>> pending;
    pending.emplace(&vm_trace, 1);
    while (!pending.empty()) {
        const auto [trace, depth] = pending.top();
        pending.pop();
        max_depth = std::max(max_depth, depth);
        for (const auto& op : trace->ops) {
            if (op.sub) {
                pending.emplace(op.sub.get(), depth + 1);
            }
        }
    }
    return max_depth;
}

std::size_t count_operations(const VmTrace& vm_trace) {
    std::size_t count{0};
    std::stack<const VmTrace*> pending;
    pending.push(&vm_trace);
    while (!pending.empty()) {
        const auto* trace = pending.top();
        pending.pop();
        count += trace->ops.size();
        for (const auto& op : trace->ops) {
            if (op.sub) {
                pending.push(op.sub.get());
            }
        }
    }
    return count;
}

std::ostream& operator<<(std::ostream& out, const VmTrace& vm_trace) {
    out << "#code: " << vm_trace.code.size();
    out << " #ops: " << vm_trace.ops.size();
    out << " #total_ops: " << count_operations(vm_trace);
    out << " depth: " << depth_of(vm_trace);
    return out;
}

} // namespace silktrace
