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

#include "error.hpp"

#include <string>

namespace silktrace {

namespace {

struct TraceErrorCategory : std::error_category {
    const char* name() const noexcept override;
    std::string message(int ev) const override;
};

const char* TraceErrorCategory::name() const noexcept { return "trace"; }

std::string TraceErrorCategory::message(int ev) const {
    switch (static_cast<TraceError>(ev)) {
        case TraceError::schema_violation:
            return "schema violation";
        case TraceError::depth_exceeded:
            return "vm trace depth exceeded";
        case TraceError::encoding_error:
            return "encoding error";
    }
    return "unknown trace error";
}

const TraceErrorCategory trace_error_category{};

} // namespace

std::error_code make_error_code(TraceError errc) {
    return {static_cast<int>(errc), trace_error_category};
}

std::ostream& operator<<(std::ostream& out, const CodecError& error) {
    out << error.code().category().name() << ":" << error.code().value() << " " << error.what();
    return out;
}

} // namespace silktrace
