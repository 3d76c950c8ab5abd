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

#include "transaction_trace.hpp"

namespace silktrace {

std::ostream& operator<<(std::ostream& out, const TransactionTrace& trace) {
    out << "trace_address: [";
    for (std::size_t i{0}; i < trace.trace_address.size(); ++i) {
        out << (i == 0 ? "" : ",") << trace.trace_address[i];
    }
    out << "] subtraces: " << trace.subtraces;
    out << " action: {" << trace.action << "}";
    if (trace.result) {
        out << " result: " << (std::holds_alternative<CallOutput>(*trace.result) ? "call" : "create");
    }
    if (trace.error) {
        out << " error: " << *trace.error;
    }
    return out;
}

} // namespace silktrace
