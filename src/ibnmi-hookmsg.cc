/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-hookmsg.cc
 */

#include "ibnmi-hookmsg.h"
#include "ibnmi-utils.h"

#include "cereal/archives/json.hpp"

ibnmi_hook_descriptor
ibnmi_hook_move_netdev(
    const std::string &path,
    const std::string &adapter
) {
    ibnmi_hook_descriptor hook;
    hook.hook_name = IBNMI_HOOK_CREATE_RUNTIME;
    hook.path = path;
    // The runtime passes args verbatim to execve, so argv[0] is repeated.
    hook.args = {path, IBNMI_HOOK_MOVE_NETDEV, IBNMI_HOOK_IBDEV_FLAG, adapter};
    return hook;
}

int
ibnmi_hook_parse_move_netdev(
    const std::vector<std::string> &args,
    std::string &adapter
) {
    if (args.size() != 4) return IBNM_ERR_INVLD_ARG;
    if (args[1] != IBNMI_HOOK_MOVE_NETDEV) return IBNM_ERR_INVLD_ARG;
    if (args[2] != IBNMI_HOOK_IBDEV_FLAG) return IBNM_ERR_INVLD_ARG;
    if (args[3].empty()) return IBNM_ERR_INVLD_ARG;
    adapter = args[3];
    return IBNM_SUCCESS;
}

/**
 * Loads an optional string member, leaving value empty if not present.
 */
static void
load_optional(
    cereal::JSONInputArchive &archive,
    const char *name,
    std::string &value
) {
    try {
        archive(cereal::make_nvp(name, value));
    }
    catch (const cereal::RapidJSONException &) {
        throw;
    }
    catch (const cereal::Exception &) {
        value.clear();
    }
}

int
ibnmi_container_state_from_json(
    const std::string &json,
    ibnmi_container_state &state
) {
    state = ibnmi_container_state();

    int64_t pid = 0;
    try {
        std::stringstream ss(json);
        cereal::JSONInputArchive iarchive(ss);
        iarchive(cereal::make_nvp("pid", pid));
        load_optional(iarchive, "id", state.id);
        load_optional(iarchive, "status", state.status);
    }
    catch (const cereal::Exception &e) {
        ibnmi_log_error("Malformed container state: {}", e.what());
        return IBNM_ERR_PAYLOAD;
    }

    if (pid <= 0 || pid > INT_MAX) {
        ibnmi_log_error("Invalid container pid {} in container state", pid);
        return IBNM_ERR_PAYLOAD;
    }
    state.pid = int(pid);
    return IBNM_SUCCESS;
}

int
ibnmi_read_all(
    std::istream &is,
    std::string &contents
) {
    std::stringstream ss;
    ss << is.rdbuf();
    if (is.bad()) return IBNM_ERR_FILE_IO;
    contents = ss.str();
    return IBNM_SUCCESS;
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
