// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>
#include <string>

#include <absl/strings/ascii.h>
#include <magic_enum.hpp>

namespace blocksmith::cmd::common {

namespace {

    // kWarning is accepted as "warning"; kNone is not selectable
    std::map<std::string, log::Level> verbosity_names() {
        std::map<std::string, log::Level> names;
        for (const auto& [level, name] : magic_enum::enum_entries<log::Level>()) {
            if (level != log::Level::kNone) {
                names.emplace(absl::AsciiStrToLower(name.substr(1)), level);
            }
        }
        return names;
    }

}  // namespace

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    auto& group = *cli.add_option_group("Log", "Logging options");
    group.add_option("--log.verbosity", log_settings.verbosity, "Least important level printed")
        ->transform(CLI::CheckedTransformer(verbosity_names(), CLI::ignore_case));
    group.add_flag("--log.stdout", log_settings.to_stdout, "Log to std::cout instead of std::cerr");
    group.add_flag("--log.nocolor", log_settings.no_color, "Disable colors on the console");
    group.add_flag("--log.localtime", log_settings.local_time, "Log timestamps in local time instead of UTC");
    group.add_flag("--log.short-tags", log_settings.short_tags, "Use four-letter level tags");
    group.add_option("--log.file", log_settings.file, "Also append log lines to this file");
}

}  // namespace blocksmith::cmd::common
