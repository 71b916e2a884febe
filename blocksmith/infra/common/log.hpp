// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace blocksmith::log {

//! \brief Severity of a log line, from the most to the least important
enum class Level {
    kNone,  // printed regardless of verbosity, without a tag
    kCritical,
    kError,
    kWarning,
    kInfo,
    kDebug,
    kTrace,
};

//! \brief Logging configuration, usually filled from the command line
struct Settings {
    Level verbosity{Level::kInfo};
    bool to_stdout{false};   // console lines go to std::cerr unless set
    bool no_color{false};    // colors are also off when the console is not a terminal
    bool local_time{false};  // timestamps are UTC unless set
    bool short_tags{false};  // four-letter level tags
    std::string file;        // if not empty, every line is appended here without colors
};

//! \brief Applies the given settings to the process-wide logger
//! \throws std::runtime_error if the log file cannot be opened
//! \note Not thread safe: call once at startup before any line is written
void init(const Settings& settings = {});

Level verbosity();
void set_verbosity(Level level);

//! \brief Whether lines of the given level are currently printed
bool enabled(Level level);

//! Alternating keys and values, rendered as key=value
using Args = std::vector<std::string>;

//! \brief A single log line, built by streaming and written out on destruction
class Line {
  public:
    explicit Line(Level level);
    Line(Level level, std::string_view message, const Args& args = {});
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template <class T>
    Line& operator<<(const T& value) {
        if (enabled_) {
            std::ostringstream os;
            os << value;
            put(os.str());
        }
        return *this;
    }
    Line& operator<<(const Args& args);

  protected:
    const std::string& plain() const { return plain_; }
    const std::string& styled() const { return styled_; }

  private:
    void put(std::string_view text, std::string_view color = {});

    const bool enabled_;
    std::string plain_;   // what goes to the log file and to a colorless console
    std::string styled_;  // same text with ANSI color sequences
};

}  // namespace blocksmith::log

#define BLOCKSMITH_LOG_AT(level_, ...)        \
    if (!blocksmith::log::enabled(level_)) { \
    } else                                   \
        blocksmith::log::Line(level_ __VA_OPT__(, ) __VA_ARGS__)

#define BLOCKSMITH_TRACE_M(...) BLOCKSMITH_LOG_AT(blocksmith::log::Level::kTrace, __VA_ARGS__)
#define BLOCKSMITH_DEBUG_M(...) BLOCKSMITH_LOG_AT(blocksmith::log::Level::kDebug, __VA_ARGS__)
#define BLOCKSMITH_INFO_M(...) BLOCKSMITH_LOG_AT(blocksmith::log::Level::kInfo, __VA_ARGS__)
#define BLOCKSMITH_WARN_M(...) BLOCKSMITH_LOG_AT(blocksmith::log::Level::kWarning, __VA_ARGS__)
#define BLOCKSMITH_ERROR_M(...) BLOCKSMITH_LOG_AT(blocksmith::log::Level::kError, __VA_ARGS__)
#define BLOCKSMITH_CRIT_M(...) BLOCKSMITH_LOG_AT(blocksmith::log::Level::kCritical, __VA_ARGS__)

#define BLOCKSMITH_TRACE BLOCKSMITH_LOG_AT(blocksmith::log::Level::kTrace)
#define BLOCKSMITH_DEBUG BLOCKSMITH_LOG_AT(blocksmith::log::Level::kDebug)
#define BLOCKSMITH_INFO BLOCKSMITH_LOG_AT(blocksmith::log::Level::kInfo)
#define BLOCKSMITH_WARN BLOCKSMITH_LOG_AT(blocksmith::log::Level::kWarning)
#define BLOCKSMITH_ERROR BLOCKSMITH_LOG_AT(blocksmith::log::Level::kError)
#define BLOCKSMITH_CRIT BLOCKSMITH_LOG_AT(blocksmith::log::Level::kCritical)
