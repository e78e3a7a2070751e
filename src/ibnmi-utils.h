/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-utils.h
 */

#ifndef IBNMI_UTILS_H
#define IBNMI_UTILS_H

#include "ibnmi-common.h" // IWYU pragma: keep

/**
 * Returns whether the given environment variable is set.
 */
bool
ibnmi_envset(
    const std::string &varname
) noexcept;

/**
 * Cancellation token shared between a blocking operation and whoever may need
 * to interrupt it (e.g., a signal handler thread during shutdown).
 */
struct ibnmi_cancel {
private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_canceled = false;
public:
    ibnmi_cancel(void) = default;
    ibnmi_cancel(const ibnmi_cancel &) = delete;
    void
    operator=(const ibnmi_cancel &) = delete;
    /** Requests cancellation and wakes up all waiters. */
    void
    cancel(void)
    {
        {
            std::lock_guard<std::mutex> guard(m_mutex);
            m_canceled = true;
        }
        m_cv.notify_all();
    }
    /** */
    bool
    canceled(void)
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        return m_canceled;
    }
    /**
     * Sleeps for up to the given duration. Returns true if cancellation was
     * requested before or during the wait.
     */
    template <class Rep, class Period>
    bool
    wait_for(
        const std::chrono::duration<Rep, Period> &d
    ) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, d, [this] { return m_canceled; });
    }
};

/**
 * Constructs a new object of a given type. *t will be valid if successful,
 * undefined otherwise. Returns IBNM_SUCCESS if successful.
 */
template <class T, typename... Types>
int
ibnmi_new(
    T **t,
    Types&&... args
) {
    try {
        *t = new T(std::forward<Types>(args)...);
        return IBNM_SUCCESS;
    }
    ibnmi_catch_and_return();
}

/**
 * Simple wrapper around delete that also nullifies the input pointer.
 */
template <class T>
void
ibnmi_delete(
    T **t
) {
    if (ibnmi_unlikely(!t)) return;
    T *it = *t;
    if (it) {
        delete it;
    }
    *t = nullptr;
}

/**
 * Returns the value of the given environment variable, or defval if unset.
 */
std::string
ibnmi_getenv(
    const std::string &varname,
    const std::string &defval = ""
);

/**
 * Converts string to an int, if possible. The entire string must be
 * consumed, modulo surrounding whitespace.
 */
int
ibnmi_stoi(
    const std::string &str,
    int &maybe_result,
    int base = 10
);

/**
 * Returns str without leading and trailing whitespace.
 */
std::string
ibnmi_strtrim(
    const std::string &str
);

/**
 * Reads the contents of a small (sysfs-like) file, trimmed of surrounding
 * whitespace.
 */
int
ibnmi_file_read(
    const std::string &path,
    std::string &contents
);

/**
 * Reads an integer from a small (sysfs-like) file.
 */
int
ibnmi_file_read_int(
    const std::string &path,
    int &value
);

/**
 * Writes the given contents to an existing file, as a single write(2). Sysfs
 * attributes apply the whole value or reject it, so short writes are errors.
 */
int
ibnmi_file_write(
    const std::string &path,
    const std::string &contents
);

/**
 * Runs the given command, waiting for it to complete. Combined stdout and
 * stderr is returned through output. A command that cannot be started or that
 * exits with a non-zero status yields IBNM_ERR_SYS.
 */
int
ibnmi_run(
    const std::vector<std::string> &argv,
    std::string &output
);

/**
 * Joins the given arguments with a single space, for log messages.
 */
std::string
ibnmi_join(
    const std::vector<std::string> &args,
    const std::string &sep = " "
);

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
