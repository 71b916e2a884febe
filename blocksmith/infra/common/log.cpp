// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <absl/strings/ascii.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <magic_enum.hpp>

namespace blocksmith::log {

namespace {

    constexpr std::string_view kReset{"\x1b[0m"};
    constexpr std::string_view kGray{"\x1b[90m"};
    constexpr std::string_view kCyan{"\x1b[36m"};

    // Width of the message column before key=value pairs start
    constexpr size_t kMessageWidth{40};
    constexpr size_t kTagWidth{8};

    Settings settings{};
    bool colored_console{false};
    std::unique_ptr<std::ofstream> file_stream;
    std::mutex output_mutex;

    std::string_view level_color(Level level) {
        switch (level) {
            case Level::kCritical:
                return "\x1b[41m";
            case Level::kError:
                return "\x1b[31m";
            case Level::kWarning:
                return "\x1b[33m";
            case Level::kInfo:
                return "\x1b[32m";
            case Level::kDebug:
                return "\x1b[35m";
            case Level::kTrace:
                return kGray;
            case Level::kNone:
                break;
        }
        return {};
    }

    // kWarning is rendered as WARNING, or WARN with short tags
    std::string level_tag(Level level) {
        if (level == Level::kNone) {
            return {};
        }
        std::string tag{absl::AsciiStrToUpper(magic_enum::enum_name(level).substr(1))};
        if (settings.short_tags) {
            tag.resize(std::min<size_t>(tag.size(), 4));
        }
        return tag;
    }

    std::string padding(size_t used, size_t width) {
        return std::string(used < width ? width - used : 1, ' ');
    }

}  // namespace

void init(const Settings& new_settings) {
    std::unique_ptr<std::ofstream> stream;
    if (!new_settings.file.empty()) {
        stream = std::make_unique<std::ofstream>(new_settings.file, std::ios::out | std::ios::app);
        if (!stream->is_open()) {
            throw std::runtime_error{"cannot open log file " + new_settings.file};
        }
    }

    std::scoped_lock lock{output_mutex};
    settings = new_settings;
    file_stream = std::move(stream);
    const int console_fd{settings.to_stdout ? fileno(stdout) : fileno(stderr)};
    colored_console = !settings.no_color && isatty(console_fd) == 1;
}

Level verbosity() { return settings.verbosity; }

void set_verbosity(Level level) { settings.verbosity = level; }

bool enabled(Level level) { return level <= settings.verbosity; }

Line::Line(Level level) : enabled_{enabled(level)} {
    if (!enabled_) {
        return;
    }
    const std::string tag{level_tag(level)};
    const size_t tag_width{settings.short_tags ? 4 : kTagWidth};
    put(tag, level_color(level));
    put(padding(tag.size(), tag_width + 1));

    const absl::TimeZone zone{settings.local_time ? absl::LocalTimeZone() : absl::UTCTimeZone()};
    put("[" + absl::FormatTime("%Y-%m-%d %H:%M:%E3S %Z", absl::Now(), zone) + "] ", kGray);
}

Line::Line(Level level, std::string_view message, const Args& args) : Line{level} {
    if (!enabled_) {
        return;
    }
    put(message);
    if (!args.empty()) {
        put(padding(message.size(), kMessageWidth));
        *this << args;
    }
}

Line& Line::operator<<(const Args& args) {
    if (!enabled_) {
        return *this;
    }
    for (size_t i{0}; i < args.size(); i += 2) {
        if (!plain_.empty() && plain_.back() != ' ') {
            put(" ");
        }
        put(args[i], kCyan);
        put("=");
        if (i + 1 < args.size()) {
            put(args[i + 1]);
        }
    }
    return *this;
}

void Line::put(std::string_view text, std::string_view color) {
    plain_.append(text);
    if (color.empty()) {
        styled_.append(text);
    } else {
        styled_.append(color).append(text).append(kReset);
    }
}

Line::~Line() {
    if (!enabled_) {
        return;
    }
    std::scoped_lock lock{output_mutex};
    std::ostream& console{settings.to_stdout ? std::cout : std::cerr};
    console << (colored_console ? styled_ : plain_) << '\n';
    if (file_stream) {
        *file_stream << plain_ << '\n';
        file_stream->flush();
    }
}

}  // namespace blocksmith::log
