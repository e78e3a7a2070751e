/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-hookmsg.h
 *
 * Message contract between the prepare step, which emits hook descriptors,
 * and the hook helper, which the container runtime runs later in a separate
 * process.
 */

#ifndef IBNMI_HOOKMSG_H
#define IBNMI_HOOKMSG_H

#include "ibnmi-common.h"

#include "cereal/cereal.hpp"
#include "cereal/types/string.hpp"
#include "cereal/types/vector.hpp"

/** Runtime lifecycle point at which the hook runs. */
static const std::string IBNMI_HOOK_CREATE_RUNTIME = "createRuntime";
/** Subcommand that moves an adapter's interfaces into a container. */
static const std::string IBNMI_HOOK_MOVE_NETDEV = "move-netdev";
/** */
static const std::string IBNMI_HOOK_IBDEV_FLAG = "--ib-dev";

/**
 * A deferred hook, as handed to the container runtime.
 */
struct ibnmi_hook_descriptor {
    /** Lifecycle point. */
    std::string hook_name;
    /** Executable path. */
    std::string path;
    /** Full argument vector, argv[0] included. */
    std::vector<std::string> args;

    template <class Archive>
    void
    save(
        Archive &archive
    ) const {
        archive(
            cereal::make_nvp("hookName", hook_name),
            cereal::make_nvp("path", path),
            cereal::make_nvp("args", args)
        );
    }
};

/**
 * The subset of the OCI container state the hook helper needs.
 */
struct ibnmi_container_state {
    /** Container process id. Never 0 once decoded. */
    int pid = 0;
    /** Container id, empty if not given. */
    std::string id;
    /** */
    std::string status;
};

/**
 * Builds the hook that moves the given adapter's interfaces into the
 * container's namespaces.
 */
ibnmi_hook_descriptor
ibnmi_hook_move_netdev(
    const std::string &path,
    const std::string &adapter
);

/**
 * Recovers the adapter name from a move-netdev argument vector (argv[0]
 * included). Returns IBNM_ERR_INVLD_ARG if the vector does not follow the
 * contract.
 */
int
ibnmi_hook_parse_move_netdev(
    const std::vector<std::string> &args,
    std::string &adapter
);

/**
 * Decodes the container state delivered on the hook's standard input. Only
 * pid is required; a pid that is missing, not an integer, or not positive
 * yields IBNM_ERR_PAYLOAD.
 */
int
ibnmi_container_state_from_json(
    const std::string &json,
    ibnmi_container_state &state
);

/**
 * Reads the whole input stream.
 */
int
ibnmi_read_all(
    std::istream &is,
    std::string &contents
);

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
