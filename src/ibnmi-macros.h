/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-macros.h
 */

#ifndef IBNMI_MACROS_H
#define IBNMI_MACROS_H

/**
 * Add branch prediction information: won't likely happen.
 */
#define ibnmi_unlikely(x) __builtin_expect(!!(x), 0)

/**
 * Convenience macro used to silence warnings about unused variables.
 *
 * @param[in] x Unused variable.
 */
#define ibnmi_unused(x)                                                        \
do {                                                                           \
    (void)(x);                                                                 \
} while (0)

#define ibnmi_runtime_error(rc)                                                \
ibnmi_rterror(__FILE__ ":" + std::to_string(__LINE__), rc)

/**
 * Converts exceptions escaping an API boundary into return codes. Only
 * ibnmi_rterror and std::exception are expected; anything else maps to
 * IBNM_ERR and is logged.
 */
#define ibnmi_catch_and_return()                                               \
catch (const ibnmi_rterror &e)                                                 \
{                                                                              \
    if (ibnmi_envset(IBNMI_ENV_VEXCEPT)) {                                     \
        ibnmi_log_error(                                                       \
            "An exception occurred at {} ({})",                                \
            e.what(), ibnm_strerr(e.rc())                                      \
        );                                                                     \
    }                                                                          \
    return e.rc();                                                             \
}                                                                              \
catch (const std::exception &e)                                                \
{                                                                              \
    if (ibnmi_envset(IBNMI_ENV_VEXCEPT)) {                                     \
        ibnmi_log_error("An exception occurred: {}", e.what());                \
    }                                                                          \
    return IBNM_ERR;                                                           \
}                                                                              \
catch (...)                                                                    \
{                                                                              \
    ibnmi_log_error("An unknown exception occurred.");                         \
    return IBNM_ERR;                                                           \
}                                                                              \
do {                                                                           \
} while (0)

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
