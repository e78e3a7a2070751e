/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-netns.h
 *
 * Moves network interfaces and RDMA devices between network namespaces.
 */

#ifndef IBNMI_NETNS_H
#define IBNMI_NETNS_H

#include "ibnmi-common.h"
#include "ibnmi-sysfs.h"

/**
 * Host operations used by the namespace executor.
 */
struct ibnmi_host_ops {
    /** Virtual destructor. */
    virtual
    ~ibnmi_host_ops(void) = default;
    /**
     * Runs a command to completion. Combined output is returned through
     * output. A non-zero exit status is an error.
     */
    virtual int
    run(
        const std::vector<std::string> &argv,
        std::string &output
    ) = 0;
    /** Returns whether a process with the given id exists. */
    virtual bool
    process_exists(
        int pid
    ) = 0;
};

/**
 * Host operations backed by fork/exec and kill(2).
 */
struct ibnmi_exec_host_ops : public ibnmi_host_ops {
    /** */
    virtual int
    run(
        const std::vector<std::string> &argv,
        std::string &output
    ) override;
    /** */
    virtual bool
    process_exists(
        int pid
    ) override;
};

/**
 * Namespace move primitives. Each one issues the standard ip, nsenter or rdma
 * command.
 */
struct ibnmi_netns {
private:
    /** */
    ibnmi_host_ops &m_ops;
    /** Runs argv, logging failures with the command output. */
    int
    m_exec(
        const std::vector<std::string> &argv,
        std::string &output
    );
public:
    /** Constructor. */
    explicit ibnmi_netns(
        ibnmi_host_ops &ops
    ) : m_ops(ops) { }
    /** */
    ibnmi_host_ops &
    ops(void)
    {
        return m_ops;
    }
    /**
     * Moves an interface into the network namespace of pid, then brings it up
     * inside that namespace.
     */
    int
    move_netdev(
        const std::string &netdev,
        int pid
    );
    /**
     * Moves an interface from the network namespace of pid back to the host.
     */
    int
    move_netdev_to_host(
        const std::string &netdev,
        int pid
    );
    /**
     * Moves an RDMA device into the network namespace of pid.
     */
    int
    move_rdma_dev(
        const std::string &rdma_dev,
        int pid
    );
    /**
     * Switches the RDMA subsystem to exclusive namespace mode, unless it is
     * already. Returns IBNM_SUCCESS_ALREADY_DONE in the latter case.
     */
    int
    ensure_rdma_exclusive_mode(void);
};

/**
 * Hook entry point: moves every interface of the given adapter, then the
 * adapter's RDMA device, into the namespace of pid. Interface failures are
 * fatal; an RDMA move failure is logged and ignored.
 */
int
ibnmi_move_netdev_hook(
    ibnmi_netns &netns,
    const ibnmi_sysfs &sysfs,
    const std::string &adapter,
    int pid
);

/**
 * Moves an interface back to the host namespace. Safe to call repeatedly:
 * returns IBNM_SUCCESS_ALREADY_DONE if the interface is already on the host
 * or the container process is gone.
 */
int
ibnmi_restore_netdev(
    ibnmi_netns &netns,
    const ibnmi_sysfs &sysfs,
    const std::string &netdev,
    int pid
);

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
