/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-netns.cc
 */

#include "ibnmi-netns.h"
#include "ibnmi-utils.h"

int
ibnmi_exec_host_ops::run(
    const std::vector<std::string> &argv,
    std::string &output
) {
    return ibnmi_run(argv, output);
}

bool
ibnmi_exec_host_ops::process_exists(
    int pid
) {
    if (pid <= 0) return false;
    if (kill(pid_t(pid), 0) == 0) return true;
    // The process exists, we just may not signal it.
    return errno == EPERM;
}

int
ibnmi_netns::m_exec(
    const std::vector<std::string> &argv,
    std::string &output
) {
    const int rc = m_ops.run(argv, output);
    if (rc != IBNM_SUCCESS) {
        ibnmi_log_error(
            "'{}' failed: {} (output: {})",
            ibnmi_join(argv), ibnm_strerr(rc), output
        );
        return IBNM_ERR_NETNS;
    }
    return IBNM_SUCCESS;
}

int
ibnmi_netns::move_netdev(
    const std::string &netdev,
    int pid
) {
    const std::string spid = std::to_string(pid);
    ibnmi_log_debug("Moving {} to netns of pid {}", netdev, spid);

    std::string output;
    int rc = m_exec({"ip", "link", "set", netdev, "netns", spid}, output);
    if (rc != IBNM_SUCCESS) return rc;

    return m_exec(
        {"nsenter", "-t", spid, "-n", "--", "ip", "link", "set", netdev, "up"},
        output
    );
}

int
ibnmi_netns::move_netdev_to_host(
    const std::string &netdev,
    int pid
) {
    const std::string spid = std::to_string(pid);
    ibnmi_log_debug("Moving {} from netns of pid {} to host", netdev, spid);

    std::string output;
    return m_exec(
        {"nsenter", "-t", spid, "-n", "--",
         "ip", "link", "set", netdev, "netns", "1"},
        output
    );
}

int
ibnmi_netns::move_rdma_dev(
    const std::string &rdma_dev,
    int pid
) {
    const std::string spid = std::to_string(pid);
    ibnmi_log_debug("Moving RDMA device {} to netns of pid {}", rdma_dev, spid);

    std::string output;
    return m_exec({"rdma", "dev", "set", rdma_dev, "netns", spid}, output);
}

int
ibnmi_netns::ensure_rdma_exclusive_mode(void)
{
    std::string output;
    int rc = m_exec({"rdma", "system"}, output);
    if (rc != IBNM_SUCCESS) return rc;

    if (output.find("exclusive") != std::string::npos) {
        ibnmi_log_debug("RDMA subsystem already in exclusive netns mode");
        return IBNM_SUCCESS_ALREADY_DONE;
    }

    ibnmi_log_info("Setting RDMA subsystem to exclusive netns mode");
    return m_exec({"rdma", "system", "set", "netns", "exclusive"}, output);
}

int
ibnmi_move_netdev_hook(
    ibnmi_netns &netns,
    const ibnmi_sysfs &sysfs,
    const std::string &adapter,
    int pid
) {
    if (ibnmi_unlikely(pid <= 0)) {
        ibnmi_log_error("Invalid container pid {}", pid);
        return IBNM_ERR_INVLD_ARG;
    }

    ibnmi_topo_device info;
    int rc = sysfs.device_info(adapter, info);
    if (rc != IBNM_SUCCESS) {
        ibnmi_log_error("Cannot read sysfs info for {}: {}", adapter, ibnm_strerr(rc));
        return rc;
    }
    if (info.netdevs.empty()) {
        ibnmi_log_warn("{} has no network interfaces on the host", adapter);
    }

    for (const auto &netdev : info.netdevs) {
        rc = netns.move_netdev(netdev, pid);
        if (rc != IBNM_SUCCESS) {
            ibnmi_log_error(
                "Moving {} of {} into netns of pid {} failed", netdev, adapter, pid
            );
            return rc;
        }
    }

    rc = netns.move_rdma_dev(adapter, pid);
    if (rc != IBNM_SUCCESS) {
        // Exclusive RDMA netns mode is not available on every kernel.
        ibnmi_log_warn(
            "Moving RDMA device {} into netns of pid {} failed, continuing",
            adapter, pid
        );
    }
    ibnmi_log_info("Moved {} into netns of pid {}", adapter, pid);
    return IBNM_SUCCESS;
}

int
ibnmi_restore_netdev(
    ibnmi_netns &netns,
    const ibnmi_sysfs &sysfs,
    const std::string &netdev,
    int pid
) {
    if (sysfs.netdev_present(netdev)) {
        ibnmi_log_debug("{} is already in the host netns", netdev);
        return IBNM_SUCCESS_ALREADY_DONE;
    }
    if (pid <= 0 || !netns.ops().process_exists(pid)) {
        // The kernel returns physical interfaces to the host when the
        // namespace goes away.
        ibnmi_log_debug(
            "Container pid {} is gone, {} returns to the host netns", pid, netdev
        );
        return IBNM_SUCCESS_ALREADY_DONE;
    }

    const int rc = netns.move_netdev_to_host(netdev, pid);
    if (rc != IBNM_SUCCESS) {
        if (sysfs.netdev_present(netdev)) return IBNM_SUCCESS_ALREADY_DONE;
        return rc;
    }
    ibnmi_log_info("Restored {} to the host netns", netdev);
    return IBNM_SUCCESS;
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
