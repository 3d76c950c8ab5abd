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

#include <array>
#include <iostream>
#include <streambuf>
#include <string>
#include <thread>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace silktrace {

namespace {

// Unbuffered streambuf writing every character to two underlying streambufs.
class teebuf : public std::streambuf {
  public:
    teebuf(std::streambuf* b1, std::streambuf* b2) : sb1_(b1), sb2_(b2) {}

    void set_streams(std::streambuf* b1, std::streambuf* b2) {
        sb1_ = b1;
        sb2_ = b2;
    }

  private:
    int overflow(int c) override {
        if (c == EOF) {
            return !EOF;
        }
        const int r1 = sb1_->sputc(static_cast<char>(c));
        const int r2 = sb2_->sputc(static_cast<char>(c));
        return (r1 == EOF || r2 == EOF) ? EOF : c;
    }

    int sync() override {
        const int r1 = sb1_->pubsync();
        const int r2 = sb2_->pubsync();
        return (r1 == 0 && r2 == 0) ? 0 : -1;
    }

    std::streambuf* sb1_;
    std::streambuf* sb2_;
};

class teestream : public std::ostream {
  public:
    teestream(std::ostream& o1, std::ostream& o2) : std::ostream(&tbuf_), tbuf_(o1.rdbuf(), o2.rdbuf()) {}

    void set_streams(std::streambuf* sb1, std::streambuf* sb2) { tbuf_.set_streams(sb1, sb2); }

  private:
    teebuf tbuf_;
};

constexpr char const kLogTags[7][6] = {
    "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "CRIT ", "NONE ",
};

constexpr std::array<std::pair<LogLevel, absl::string_view>, 7> kLogLevelFlags{{
    {LogLevel::None, "n"},
    {LogLevel::Critical, "c"},
    {LogLevel::Error, "e"},
    {LogLevel::Warn, "w"},
    {LogLevel::Info, "i"},
    {LogLevel::Debug, "d"},
    {LogLevel::Trace, "t"},
}};

teestream& log_streams() {
    static teestream streams{std::cerr, null_stream()};
    return streams;
}

} // namespace

LogLevel log_verbosity_{LogLevel::Info};
bool log_thread_enabled_{false};

// Log to one or two output streams - typically the console and optional log file.
void log_set_streams_(std::ostream& o1, std::ostream& o2) { log_streams().set_streams(o1.rdbuf(), o2.rdbuf()); }

std::mutex log_::log_mtx_;

std::ostream& log_::header_(LogLevel level) {
    auto& out = log_streams();
    out << kLogTags[static_cast<int>(level)] << "["
        << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), absl::LocalTimeZone()) << "]";
    if (log_thread_enabled_) {
        out << " " << std::this_thread::get_id();
    }
    return out;
}

std::ostream& null_stream() {
    static struct null_buf : public std::streambuf {
        int overflow(int c) override { return c; }
    } null_buf;
    static struct null_strm : public std::ostream {
        null_strm() : std::ostream(&null_buf) {}
    } null_strm;
    return null_strm;
}

bool AbslParseFlag(absl::string_view text, LogLevel* level, std::string* error) {
    for (const auto& [l, flag] : kLogLevelFlags) {
        if (text == flag) {
            *level = l;
            return true;
        }
    }
    *error = absl::StrCat("unknown value for LogLevel: ", text);
    return false;
}

std::string AbslUnparseFlag(LogLevel level) {
    for (const auto& [l, flag] : kLogLevelFlags) {
        if (l == level) {
            return std::string(flag.data(), flag.size());
        }
    }
    return absl::StrCat(static_cast<int>(level));
}

} // namespace silktrace
