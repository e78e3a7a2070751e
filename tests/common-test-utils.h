/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file common-test-utils.h
 *
 * Common test infrastructure.
 */

#ifndef COMMON_TEST_UTILS_H
#define COMMON_TEST_UTILS_H

#include "ibnm.h"

#include <stdlib.h>
#include <stdio.h>
#include <string.h>

#define CTU_STRINGIFY(x) #x
#define CTU_TOSTRING(x)  CTU_STRINGIFY(x)

#define ctu_panic(...)                                                         \
do {                                                                           \
    fprintf(stderr, "\n%s@%d: ", __func__, __LINE__);                          \
    fprintf(stderr, __VA_ARGS__);                                              \
    fprintf(stderr, "\n");                                                     \
    fflush(stderr);                                                            \
    exit(EXIT_FAILURE);                                                        \
} while (0)

/**
 * Panics unless rc equals the expected return code.
 */
#define ctu_expect_rc(rc, expected)                                            \
do {                                                                           \
    const int ctu_rc_ = (rc);                                                  \
    const int ctu_ex_ = (expected);                                            \
    if (ctu_rc_ != ctu_ex_) {                                                  \
        ctu_panic(                                                             \
            "%s: expected %s, got %s", CTU_TOSTRING(rc),                       \
            ibnm_strerr(ctu_ex_), ibnm_strerr(ctu_rc_)                         \
        );                                                                     \
    }                                                                          \
} while (0)

/**
 * Panics unless the condition holds.
 */
#define ctu_expect(cond)                                                       \
do {                                                                           \
    if (!(cond)) {                                                             \
        ctu_panic("expectation failed: %s", CTU_TOSTRING(cond));               \
    }                                                                          \
} while (0)

/**
 * Panics unless the two std::string-convertible values are equal.
 */
#define ctu_expect_str(actual, expected)                                       \
do {                                                                           \
    const std::string ctu_a_ = (actual);                                       \
    const std::string ctu_e_ = (expected);                                     \
    if (ctu_a_ != ctu_e_) {                                                    \
        ctu_panic(                                                             \
            "%s: expected \"%s\", got \"%s\"", CTU_TOSTRING(actual),           \
            ctu_e_.c_str(), ctu_a_.c_str()                                     \
        );                                                                     \
    }                                                                          \
} while (0)

/**
 * Runs a test case, announcing it first.
 */
#define ctu_run(test)                                                          \
do {                                                                           \
    printf("# %s\n", CTU_TOSTRING(test));                                      \
    test();                                                                    \
} while (0)

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
