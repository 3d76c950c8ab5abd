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

#include "state_diff.hpp"

#include <type_traits>
#include <variant>

namespace silktrace {

namespace {

template <typename T>
char diff_symbol(const Diff<T>& diff) {
    return std::visit([](const auto& d) -> char {
        using D = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<D, DiffSame>) {
            return '=';
        } else if constexpr (std::is_same_v<D, DiffBorn<T>>) {
            return '+';
        } else if constexpr (std::is_same_v<D, DiffDied<T>>) {
            return '-';
        } else {
            return '*';
        }
    }, diff);
}

} // namespace

std::ostream& operator<<(std::ostream& out, const AccountDiff& account_diff) {
    out << "balance: " << diff_symbol(account_diff.balance);
    out << " nonce: " << diff_symbol(account_diff.nonce);
    out << " code: " << diff_symbol(account_diff.code);
    out << " #storage: " << account_diff.storage.size();
    return out;
}

std::ostream& operator<<(std::ostream& out, const StateDiff& state_diff) {
    out << "#accounts: " << state_diff.size();
    for (const auto& [address, account_diff] : state_diff) {
        out << " [" << address << " " << account_diff << "]";
    }
    return out;
}

} // namespace silktrace
