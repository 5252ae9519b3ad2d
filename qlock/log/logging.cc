// Copyright (c) 2021, gottingen group.
// All rights reserved.
// Created by liyinbin lijippy@163.com

#include "qlock/log/logging.h"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace qlock {

std::shared_ptr<spdlog::logger> log_singleton::_log_ptr;

void create_log_ptr() {
    auto logger = spdlog::get("qlock");
    if (!logger) {
        logger = spdlog::stderr_color_mt("qlock");
    }
    // SPDLOG_LEVEL=qlock=debug and friends.
    spdlog::cfg::load_env_levels();
    log_singleton::_log_ptr = logger;
}

}  // namespace qlock
