/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-utils.cc
 */

#include "ibnmi-utils.h"

/** Maps return codes to their respective descriptions. */
static const std::map<int, std::string> ibnmi_rc2str = {
    {IBNM_SUCCESS, "Success"},
    {IBNM_SUCCESS_ALREADY_DONE, "Success, operation already complete"},
    {IBNM_SUCCESS_SHUTDOWN, "Success, shut down"},
    {IBNM_ERR, "Unspecified error"},
    {IBNM_ERR_ENV, "Environment error"},
    {IBNM_ERR_INTERNAL, "Internal error"},
    {IBNM_ERR_FILE_IO, "File I/O error"},
    {IBNM_ERR_SYS, "System error"},
    {IBNM_ERR_OOR, "Out of resources"},
    {IBNM_ERR_INVLD_ARG, "Invalid argument"},
    {IBNM_ERR_HWLOC, "Hardware locality error"},
    {IBNM_ERR_VERBS, "Verbs error"},
    {IBNM_ERR_NOT_SUPPORTED, "Operation not supported"},
    {IBNM_ERR_NOT_FOUND, "Not found"},
    {IBNM_ERR_CONFIG, "Invalid configuration"},
    {IBNM_ERR_CAPACITY, "Request exceeds capacity"},
    {IBNM_ERR_TIMEOUT, "Timed out"},
    {IBNM_ERR_CANCELED, "Canceled"},
    {IBNM_ERR_NETNS, "Namespace operation failed"},
    {IBNM_ERR_PAYLOAD, "Malformed hook payload"}
};

const char *
ibnm_strerr(int ec)
{
    const auto got = ibnmi_rc2str.find(ec);
    // Not found.
    if (got == ibnmi_rc2str.end()) {
        static const cstr_t bad = "";
        return bad;
    }
    return got->second.c_str();
}

bool
ibnmi_envset(
    const std::string &varname
) noexcept {
    return (getenv(varname.c_str()) != nullptr);
}

std::string
ibnmi_getenv(
    const std::string &varname,
    const std::string &defval
) {
    const cstr_t val = getenv(varname.c_str());
    if (!val) return defval;
    return std::string(val);
}

int
ibnmi_stoi(
    const std::string &str,
    int &maybe_result,
    int base
) {
    const std::string tstr = ibnmi_strtrim(str);
    try {
        size_t pos = 0;
        const int result = std::stoi(tstr, &pos, base);
        if (pos != tstr.size()) return IBNM_ERR_INVLD_ARG;
        maybe_result = result;
        return IBNM_SUCCESS;
    }
    catch (const std::invalid_argument &) { }
    catch (const std::out_of_range &) { }
    return IBNM_ERR_INVLD_ARG;
}

std::string
ibnmi_strtrim(
    const std::string &str
) {
    static const cstr_t ws = " \t\n\r\f\v";
    const size_t start = str.find_first_not_of(ws);
    if (start == std::string::npos) return std::string();
    const size_t end = str.find_last_not_of(ws);
    return str.substr(start, end - start + 1);
}

int
ibnmi_file_read(
    const std::string &path,
    std::string &contents
) {
    contents.clear();

    std::ifstream file(path);
    if (!file.is_open()) return IBNM_ERR_FILE_IO;

    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad()) return IBNM_ERR_FILE_IO;

    contents = ibnmi_strtrim(ss.str());
    return IBNM_SUCCESS;
}

int
ibnmi_file_read_int(
    const std::string &path,
    int &value
) {
    std::string contents;
    const int rc = ibnmi_file_read(path, contents);
    if (rc != IBNM_SUCCESS) return rc;
    return ibnmi_stoi(contents, value);
}

int
ibnmi_file_write(
    const std::string &path,
    const std::string &contents
) {
    // No O_CREAT: control files are provided by the kernel.
    const int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
    if (ibnmi_unlikely(fd == -1)) {
        const int err = errno;
        ibnmi_log_error("open({}) failed: {}", path, strerror(err));
        return IBNM_ERR_FILE_IO;
    }

    int rc = IBNM_SUCCESS;
    ssize_t nw = 0;
    do {
        nw = write(fd, contents.data(), contents.size());
    } while (nw == -1 && errno == EINTR);

    if (ibnmi_unlikely(nw == -1)) {
        const int err = errno;
        ibnmi_log_error(
            "write({}, \"{}\") failed: {}", path, contents, strerror(err)
        );
        rc = IBNM_ERR_FILE_IO;
    }
    else if (ibnmi_unlikely(size_t(nw) != contents.size())) {
        ibnmi_log_error("short write to {}", path);
        rc = IBNM_ERR_FILE_IO;
    }

    if (ibnmi_unlikely(close(fd) == -1 && rc == IBNM_SUCCESS)) {
        const int err = errno;
        ibnmi_log_error("close({}) failed: {}", path, strerror(err));
        rc = IBNM_ERR_FILE_IO;
    }
    return rc;
}

int
ibnmi_run(
    const std::vector<std::string> &argv,
    std::string &output
) {
    output.clear();
    if (ibnmi_unlikely(argv.empty())) return IBNM_ERR_INVLD_ARG;

    int pipefd[2] = {-1, -1};
    if (ibnmi_unlikely(pipe2(pipefd, O_CLOEXEC) == -1)) {
        const int err = errno;
        ibnmi_log_error("pipe2() failed: {}", strerror(err));
        return IBNM_ERR_SYS;
    }
    // Build the argument vector before forking.
    std::vector<char *> cargv;
    for (const auto &arg : argv) {
        cargv.push_back(const_cast<char *>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    const pid_t pid = fork();
    // Fork failed.
    if (ibnmi_unlikely(pid == -1)) {
        const int err = errno;
        ibnmi_log_error("fork() failed while starting {}: {}", argv[0], strerror(err));
        (void)close(pipefd[0]);
        (void)close(pipefd[1]);
        return IBNM_ERR_SYS;
    }
    // Child
    if (pid == 0) {
        // dup2() clears FD_CLOEXEC on the duplicates.
        if (dup2(pipefd[1], STDOUT_FILENO) == -1 ||
            dup2(pipefd[1], STDERR_FILENO) == -1) {
            _exit(127);
        }
        // The signal mask survives exec; commands start with none blocked.
        sigset_t none;
        sigemptyset(&none);
        if (sigprocmask(SIG_SETMASK, &none, nullptr) == -1) {
            _exit(127);
        }
        execvp(cargv[0], cargv.data());
        // If we get here, then the command could not be started. Only
        // async-signal-safe calls are allowed past fork().
        static const char ers[] = "exec failed\n";
        ssize_t nw = write(STDERR_FILENO, ers, sizeof(ers) - 1);
        ibnmi_unused(nw);
        _exit(127);
    }
    // Parent
    (void)close(pipefd[1]);

    char buff[512];
    while (true) {
        const ssize_t nr = read(pipefd[0], buff, sizeof(buff));
        if (nr > 0) {
            output.append(buff, size_t(nr));
            continue;
        }
        if (nr == -1 && errno == EINTR) continue;
        break;
    }
    (void)close(pipefd[0]);

    int status = 0;
    pid_t wrc = 0;
    do {
        wrc = waitpid(pid, &status, 0);
    } while (wrc == -1 && errno == EINTR);

    output = ibnmi_strtrim(output);

    if (ibnmi_unlikely(wrc == -1)) {
        const int err = errno;
        ibnmi_log_error("waitpid() failed for {}: {}", argv[0], strerror(err));
        return IBNM_ERR_SYS;
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        return IBNM_SUCCESS;
    }
    ibnmi_log_debug(
        "'{}' failed (status={}): {}", ibnmi_join(argv), status, output
    );
    return IBNM_ERR_SYS;
}

std::string
ibnmi_join(
    const std::vector<std::string> &args,
    const std::string &sep
) {
    std::string result;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i != 0) result += sep;
        result += args[i];
    }
    return result;
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
