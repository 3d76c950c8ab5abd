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

#include "log.hpp"

#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

namespace silktrace {

TEST_CASE("parse log level", "[silktrace][common][log]") {
    std::vector<absl::string_view> input_texts{"n", "c", "e", "w", "i", "d", "t"};
    std::vector<LogLevel> expected_levels{
        LogLevel::None,
        LogLevel::Critical,
        LogLevel::Error,
        LogLevel::Warn,
        LogLevel::Info,
        LogLevel::Debug,
        LogLevel::Trace,
    };
    for (std::size_t i{0}; i < input_texts.size(); i++) {
        LogLevel level;
        std::string error;
        const auto success{AbslParseFlag(input_texts[i], &level, &error)};
        CHECK(success == true);
        CHECK(error.empty());
        CHECK(level == expected_levels[i]);
    }
}

TEST_CASE("parse invalid log level", "[silktrace][common][log]") {
    LogLevel level;
    std::string error;
    const auto success{AbslParseFlag("abc", &level, &error)};
    CHECK(success == false);
    CHECK(!error.empty());
}

TEST_CASE("unparse log level", "[silktrace][common][log]") {
    std::vector<LogLevel> input_levels{
        LogLevel::None,
        LogLevel::Critical,
        LogLevel::Error,
        LogLevel::Warn,
        LogLevel::Info,
        LogLevel::Debug,
        LogLevel::Trace,
    };
    std::vector<std::string> expected_texts{"n", "c", "e", "w", "i", "d", "t"};
    for (std::size_t i{0}; i < input_levels.size(); i++) {
        CHECK(AbslUnparseFlag(input_levels[i]) == expected_texts[i]);
    }
}

TEST_CASE("log macro does nothing for lower verbosity", "[silktrace][common][log]") {
    std::stringstream ss;
    SILKTRACE_LOG_STREAMS(ss, null_stream());
    SILKTRACE_LOG_VERBOSITY(LogLevel::Warn);
    SILKTRACE_INFO << "test";
    CHECK(ss.str().empty());
    SILKTRACE_LOG_STREAMS(null_stream(), null_stream());
}

TEST_CASE("log macro does output for higher or equal verbosity", "[silktrace][common][log]") {
    std::stringstream ss1;
    SILKTRACE_LOG_STREAMS(ss1, null_stream());
    SILKTRACE_LOG_VERBOSITY(LogLevel::Warn);
    SILKTRACE_WARN << "test";
    CHECK(ss1.str().find("WARN") != std::string::npos);
    CHECK(ss1.str().find("test") != std::string::npos);
    std::stringstream ss2;
    SILKTRACE_LOG_STREAMS(ss2, null_stream());
    SILKTRACE_CRIT << "test";
    CHECK(ss2.str().find("CRIT") != std::string::npos);
    CHECK(ss2.str().find("test") != std::string::npos);
    SILKTRACE_LOG_STREAMS(null_stream(), null_stream());
}

TEST_CASE("each macro uses its own level tag", "[silktrace][common][log]") {
    SILKTRACE_LOG_VERBOSITY(LogLevel::Trace);

    SECTION("trace") {
        std::stringstream ss;
        SILKTRACE_LOG_STREAMS(ss, null_stream());
        SILKTRACE_TRACE << "test";
        CHECK(ss.str().find("TRACE") != std::string::npos);
    }
    SECTION("debug") {
        std::stringstream ss;
        SILKTRACE_LOG_STREAMS(ss, null_stream());
        SILKTRACE_DEBUG << "test";
        CHECK(ss.str().find("DEBUG") != std::string::npos);
    }
    SECTION("error") {
        std::stringstream ss;
        SILKTRACE_LOG_STREAMS(ss, null_stream());
        SILKTRACE_ERROR << "test";
        CHECK(ss.str().find("ERROR") != std::string::npos);
    }
    SECTION("none") {
        std::stringstream ss;
        SILKTRACE_LOG_STREAMS(ss, null_stream());
        SILKTRACE_LOG << "test";
        CHECK(ss.str().find("NONE") != std::string::npos);
    }
    SILKTRACE_LOG_STREAMS(null_stream(), null_stream());
    SILKTRACE_LOG_VERBOSITY(LogLevel::None);
}

TEST_CASE("log thread flag enables/disables thread id", "[silktrace][common][log]") {
    std::stringstream ss1;
    SILKTRACE_LOG_STREAMS(ss1, null_stream());
    SILKTRACE_LOG_VERBOSITY(LogLevel::None);
    SILKTRACE_LOG_THREAD(true);
    SILKTRACE_LOG << "test";
    std::stringstream thread_id_stream;
    thread_id_stream << std::this_thread::get_id();
    CHECK(ss1.str().find(thread_id_stream.str()) != std::string::npos);
    std::stringstream ss2;
    SILKTRACE_LOG_STREAMS(ss2, null_stream());
    SILKTRACE_LOG_THREAD(false);
    SILKTRACE_LOG << "test";
    CHECK(ss2.str().find(thread_id_stream.str()) == std::string::npos);
    SILKTRACE_LOG_STREAMS(null_stream(), null_stream());
}

} // namespace silktrace
