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

#ifndef SILKTRACE_TYPES_DIFF_HPP_
#define SILKTRACE_TYPES_DIFF_HPP_

#include <utility>
#include <variant>

namespace silktrace {

//! Value unchanged, wire tag "="
struct DiffSame {
    bool operator==(const DiffSame&) const = default;
};

//! Value created, wire tag "+"
template <typename T>
struct DiffBorn {
    T value;

    bool operator==(const DiffBorn&) const = default;
};

//! Value removed, wire tag "-"
template <typename T>
struct DiffDied {
    T value;

    bool operator==(const DiffDied&) const = default;
};

//! Value replaced, wire tag "*"
template <typename T>
struct DiffChanged {
    T from;
    T to;

    bool operator==(const DiffChanged&) const = default;
};

//! Change of a value across a before/after boundary: exactly one of same, born, died or changed
template <typename T>
using Diff = std::variant<DiffSame, DiffBorn<T>, DiffDied<T>, DiffChanged<T>>;

template <typename T>
Diff<T> make_same_diff() { return DiffSame{}; }

template <typename T>
Diff<T> make_born_diff(T value) { return DiffBorn<T>{std::move(value)}; }

template <typename T>
Diff<T> make_died_diff(T value) { return DiffDied<T>{std::move(value)}; }

template <typename T>
Diff<T> make_changed_diff(T from, T to) { return DiffChanged<T>{std::move(from), std::move(to)}; }

template <typename T>
bool is_same_diff(const Diff<T>& diff) { return std::holds_alternative<DiffSame>(diff); }

} // namespace silktrace

#endif  // SILKTRACE_TYPES_DIFF_HPP_
