/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-common.h
 */

#ifndef IBNMI_COMMON_H
#define IBNMI_COMMON_H

// IWYU pragma: begin_keep
#include "ibnmi-macros.h"
#include "ibnm.h"

#include <assert.h>
#include <errno.h>
#include <fcntl.h>
#include <getopt.h>
#include <inttypes.h>
#include <limits.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "ibnmi-log.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>
// IWYU pragma: end_keep

// Internal type aliases.
using cstr_t = char const *;

// Environment variables.
static const std::string IBNMI_ENV_SYSFS_ROOT = "IBNM_SYSFS_ROOT";
static const std::string IBNMI_ENV_HOOK_PATH = "IBNM_HOOK_PATH";
static const std::string IBNMI_ENV_VEXCEPT = "IBNM_VEXCEPT";
static const std::string IBNMI_ENV_NODE_NAME = "NODE_NAME";
static const std::string IBNMI_ENV_NUM_VFS = "NUM_VFS";

/** Default location of the driver binary re-invoked as its own hook. */
static const std::string IBNMI_DEFAULT_HOOK_PATH = "/usr/bin/ibnm-plugin";

/**
 * Internal exception type carrying an ibnm return code.
 */
class ibnmi_rterror : public std::runtime_error {
    int m_rc = IBNM_ERR;
public:
    ibnmi_rterror(
        const std::string &where,
        int rc = IBNM_ERR
    ) : std::runtime_error(where)
      , m_rc(rc) { }

    int
    rc(void) const
    {
        return m_rc;
    }
};

// Forward declarations.
struct ibnmi_sysfs;
struct ibnmi_cancel;

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
