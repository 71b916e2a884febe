// Copyright 2025 The Blocksmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>

#include <blocksmith/infra/common/log.hpp>

namespace blocksmith::test_util {

//! Overrides the log verbosity until the end of the enclosing scope
class ScopedVerbosity {
  public:
    explicit ScopedVerbosity(log::Level level) : saved_{log::verbosity()} { log::set_verbosity(level); }
    ~ScopedVerbosity() { log::set_verbosity(saved_); }

    ScopedVerbosity(const ScopedVerbosity&) = delete;
    ScopedVerbosity& operator=(const ScopedVerbosity&) = delete;

  private:
    log::Level saved_;
};

//! Sends everything written to `stream` into `sink` until the end of the enclosing scope
class RedirectStream {
  public:
    RedirectStream(std::ostream& stream, std::ostream& sink) : stream_{stream}, saved_{stream.rdbuf(sink.rdbuf())} {}
    ~RedirectStream() { stream_.rdbuf(saved_); }

    RedirectStream(const RedirectStream&) = delete;
    RedirectStream& operator=(const RedirectStream&) = delete;

  private:
    std::ostream& stream_;
    std::streambuf* saved_;
};

}  // namespace blocksmith::test_util
