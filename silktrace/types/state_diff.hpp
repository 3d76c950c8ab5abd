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

#ifndef SILKTRACE_TYPES_STATE_DIFF_HPP_
#define SILKTRACE_TYPES_STATE_DIFF_HPP_

#include <iostream>
#include <map>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <silktrace/common/util.hpp>
#include <silktrace/types/diff.hpp>

namespace silktrace {

// Ordered by key so that equal diffs compare and encode identically whatever the insertion order
using StorageDiffMap = std::map<evmc::bytes32, Diff<evmc::bytes32>>;

struct AccountDiff {
    Diff<intx::uint256> balance;
    Diff<intx::uint256> nonce;
    Diff<Bytes> code;
    StorageDiffMap storage;

    bool operator==(const AccountDiff&) const = default;
};

using StateDiff = std::map<evmc::address, AccountDiff>;

std::ostream& operator<<(std::ostream& out, const AccountDiff& account_diff);
std::ostream& operator<<(std::ostream& out, const StateDiff& state_diff);

} // namespace silktrace

#endif  // SILKTRACE_TYPES_STATE_DIFF_HPP_
