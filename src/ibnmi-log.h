/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-log.h
 */

#ifndef IBNMI_LOG_H
#define IBNMI_LOG_H

#if IBNMI_DEBUG_MODE == 0
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#endif
#include "spdlog/spdlog.h"

class ibnmi_logger {
public:
    // Convenience internal logger type alias.
    using logger_t = decltype(spdlog::get(""));
private:
    // Log sinks.
    // console (stderr)
    logger_t m_console_info;
    logger_t m_console_error;
    logger_t m_console_warn;
    logger_t m_console_debug;
    //
    ibnmi_logger(void);
    //
    ~ibnmi_logger(void);

public:
    //
    static ibnmi_logger &
    the_ibnmi_logger(void);
    // Disable copy constructor.
    ibnmi_logger(const ibnmi_logger &) = delete;
    // Just return the singleton.
    ibnmi_logger &
    operator=(const ibnmi_logger &);
    //
    // console
    //
    static logger_t
    console_info(void);
    //
    static logger_t
    console_warn(void);
    //
    static logger_t
    console_error(void);
    //
    static logger_t
    console_debug(void);
    /**
     * Redirects console output to syslog. Used by hook invocations, whose
     * stderr is not kept by the container runtime.
     */
    static void
    console_to_syslog(void);
};

//
// Console
//
#define ibnmi_log_info(...)                                                    \
SPDLOG_LOGGER_INFO(ibnmi_logger::console_info(), __VA_ARGS__)

#define ibnmi_log_warn(...)                                                    \
SPDLOG_LOGGER_WARN(ibnmi_logger::console_warn(), __VA_ARGS__)

#define ibnmi_log_error(...)                                                   \
SPDLOG_LOGGER_ERROR(ibnmi_logger::console_error(), __VA_ARGS__)

#define ibnmi_log_debug(...)                                                   \
SPDLOG_LOGGER_DEBUG(ibnmi_logger::console_debug(), __VA_ARGS__)

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
