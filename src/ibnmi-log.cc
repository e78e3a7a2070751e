/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-log.cc
 */

#include "ibnmi-common.h"
#include "ibnmi-log.h"

#include "spdlog/sinks/stdout_sinks.h"
#include "spdlog/sinks/syslog_sink.h"
#include <spdlog/common.h>
#include <spdlog/spdlog.h>

/**
 * Applies level, flush policy and an optional pattern to a fresh logger.
 */
static ibnmi_logger::logger_t
ibnmi_logger_setup(
    ibnmi_logger::logger_t logger,
    spdlog::level::level_enum level,
    cstr_t pattern = nullptr
) {
    logger->set_level(level);
    if (pattern) logger->set_pattern(pattern);
    logger->flush_on(level);
    return logger;
}

// Info lines are plain output; debug lines carry timing and identity.
static constexpr cstr_t ibnmi_info_pattern = "%v";
static constexpr cstr_t ibnmi_debug_pattern = "[%H:%M:%S.%e pid=%P tid=%t] %v";

ibnmi_logger::ibnmi_logger(void)
{
    // Formatting applied globally to all registered loggers.
    spdlog::set_pattern("[" PACKAGE_NAME " %l at (%s::%!::%#)] %v");

    m_console_info = ibnmi_logger_setup(
        spdlog::stderr_logger_mt("console_info"),
        spdlog::level::info, ibnmi_info_pattern
    );
    m_console_error = ibnmi_logger_setup(
        spdlog::stderr_logger_mt("console_error"), spdlog::level::err
    );
    m_console_warn = ibnmi_logger_setup(
        spdlog::stderr_logger_mt("console_warn"), spdlog::level::warn
    );
    m_console_debug = ibnmi_logger_setup(
        spdlog::stderr_logger_mt("console_debug"),
        spdlog::level::debug, ibnmi_debug_pattern
    );
}

ibnmi_logger::~ibnmi_logger(void)
{
    spdlog::shutdown();
}

ibnmi_logger &
ibnmi_logger::the_ibnmi_logger(void)
{
    static ibnmi_logger singleton;
    return singleton;
}

ibnmi_logger &
ibnmi_logger::operator=(const ibnmi_logger &)
{
    // Just return the singleton.
    return ibnmi_logger::the_ibnmi_logger();
}

//
// Console
//
ibnmi_logger::logger_t
ibnmi_logger::console_info(void)
{
    return ibnmi_logger::the_ibnmi_logger().m_console_info;
}

ibnmi_logger::logger_t
ibnmi_logger::console_warn(void)
{
    return ibnmi_logger::the_ibnmi_logger().m_console_warn;
}

ibnmi_logger::logger_t
ibnmi_logger::console_error(void)
{
    return ibnmi_logger::the_ibnmi_logger().m_console_error;
}

ibnmi_logger::logger_t
ibnmi_logger::console_debug(void)
{
    return ibnmi_logger::the_ibnmi_logger().m_console_debug;
}

void
ibnmi_logger::console_to_syslog(void)
{
    auto &logger = ibnmi_logger::the_ibnmi_logger();

    for (const auto &l : {
        logger.m_console_info, logger.m_console_error,
        logger.m_console_warn, logger.m_console_debug
    }) {
        spdlog::drop(l->name());
    }

    logger.m_console_info = ibnmi_logger_setup(
        spdlog::syslog_logger_mt("syslog_info", PACKAGE_NAME),
        spdlog::level::info, ibnmi_info_pattern
    );
    logger.m_console_error = ibnmi_logger_setup(
        spdlog::syslog_logger_mt("syslog_error", PACKAGE_NAME),
        spdlog::level::err
    );
    logger.m_console_warn = ibnmi_logger_setup(
        spdlog::syslog_logger_mt("syslog_warn", PACKAGE_NAME),
        spdlog::level::warn
    );
    logger.m_console_debug = ibnmi_logger_setup(
        spdlog::syslog_logger_mt("syslog_debug", PACKAGE_NAME),
        spdlog::level::debug
    );
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
