/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-sriov.cc
 */

#include "ibnmi-sriov.h"

int
ibnmi_sriov::m_fail(
    int rc,
    const std::string &what
) {
    m_last_error = what;
    ibnmi_log_error("{} ({})", what, ibnm_strerr(rc));
    return rc;
}

int
ibnmi_sriov::m_sleep(
    std::chrono::milliseconds d
) {
    if (!m_cancel) {
        std::this_thread::sleep_for(d);
        return IBNM_SUCCESS;
    }
    if (m_cancel->wait_for(d)) return IBNM_ERR_CANCELED;
    return IBNM_SUCCESS;
}

int
ibnmi_sriov::m_wait_for_vfs(
    const std::string &pf,
    const std::string &label,
    int expected
) {
    using clock = std::chrono::steady_clock;
    const clock::time_point deadline = clock::now() + m_timing.settle_timeout;

    while (true) {
        std::vector<std::string> vfs;
        const int rc = m_ctl.list_vfs(pf, vfs);
        if (rc == IBNM_SUCCESS && int(vfs.size()) >= expected) {
            return IBNM_SUCCESS;
        }

        const clock::time_point now = clock::now();
        if (now >= deadline) break;

        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - now
        );
        const int src = m_sleep(std::min(m_timing.poll_interval, left));
        if (src != IBNM_SUCCESS) {
            return m_fail(src, "Canceled while waiting for " +
                std::to_string(expected) + " VFs on " + label);
        }
    }
    return m_fail(
        IBNM_ERR_TIMEOUT, "Timed out waiting for " +
        std::to_string(expected) + " VFs on " + label
    );
}

int
ibnmi_sriov::m_resize(
    const std::string &pf,
    const std::string &label,
    int current,
    int desired
) {
    if (current == desired) {
        ibnmi_log_debug("{} already has {} VFs", label, desired);
        return IBNM_SUCCESS_ALREADY_DONE;
    }

    int rc = IBNM_SUCCESS;
    // A live pool cannot be resized in place.
    if (current > 0) {
        ibnmi_log_info(
            "Resetting {} VFs on {} before creating {}", current, label, desired
        );
        rc = m_ctl.set_num_vfs(pf, 0);
        if (rc != IBNM_SUCCESS) {
            return m_fail(rc, "Resetting sriov_numvfs to 0 on " + label + " failed");
        }
        if (desired == 0) {
            ibnmi_log_info("Removed all VFs on {}", label);
            return IBNM_SUCCESS;
        }
        rc = m_sleep(m_timing.settle_delay);
        if (rc != IBNM_SUCCESS) {
            return m_fail(rc, "Canceled while resetting VFs on " + label);
        }
    }

    ibnmi_log_info("Creating {} VFs on {}", desired, label);
    rc = m_ctl.set_num_vfs(pf, desired);
    if (rc != IBNM_SUCCESS) {
        return m_fail(
            rc, "Setting sriov_numvfs to " + std::to_string(desired) +
            " on " + label + " failed"
        );
    }

    rc = m_wait_for_vfs(pf, label, desired);
    if (rc != IBNM_SUCCESS) return rc;

    ibnmi_log_info("Provisioned {} VFs on {}", desired, label);
    return IBNM_SUCCESS;
}

int
ibnmi_sriov::provision_vfs(
    const std::string &pf,
    int desired
) {
    m_last_error.clear();

    if (desired < 0) {
        return m_fail(
            IBNM_ERR_INVLD_ARG, "Invalid VF count " + std::to_string(desired)
        );
    }

    int total = 0;
    int rc = m_ctl.total_vfs(pf, total);
    if (rc != IBNM_SUCCESS) {
        return m_fail(rc, "Reading sriov_totalvfs of " + pf + " failed");
    }
    if (desired > total) {
        return m_fail(
            IBNM_ERR_CAPACITY, "Requested " + std::to_string(desired) +
            " VFs exceeds maximum " + std::to_string(total) + " for PF " + pf
        );
    }

    int current = 0;
    rc = m_ctl.num_vfs(pf, current);
    if (rc != IBNM_SUCCESS) {
        return m_fail(rc, "Reading sriov_numvfs of " + pf + " failed");
    }
    return m_resize(pf, pf, current, desired);
}

int
ibnmi_sriov::provision_fleet(
    const std::vector<ibnmi_pf_inventory> &pfs,
    int requested
) {
    m_last_error.clear();

    if (pfs.empty()) {
        ibnmi_log_info("No SR-IOV capable PFs found, nothing to provision");
        return IBNM_SUCCESS;
    }
    if (requested <= 0) return IBNM_SUCCESS;

    int first_error = IBNM_SUCCESS;
    for (const auto &pf : pfs) {
        const int desired = std::min(requested, pf.total_vfs);
        const std::string label = pf.adapter.empty() ?
            pf.pci_address : pf.adapter + " (" + pf.pci_address + ")";

        ibnmi_log_info(
            "Provisioning {}: desired={} total={}", label, desired, pf.total_vfs
        );
        // Re-read the current count, the inventory may be stale.
        int current = pf.current_vfs;
        int rc = m_ctl.num_vfs(pf.pci_address, current);
        if (rc != IBNM_SUCCESS) {
            rc = m_fail(rc, "Reading sriov_numvfs of " + label + " failed");
        }
        else {
            rc = m_resize(pf.pci_address, label, current, desired);
        }

        if (rc == IBNM_SUCCESS || rc == IBNM_SUCCESS_ALREADY_DONE) continue;
        if (first_error == IBNM_SUCCESS) first_error = rc;
        // Cancellation applies to the whole pass.
        if (rc == IBNM_ERR_CANCELED) break;
    }
    return first_error;
}

int
ibnmi_sriov::destroy_vfs(
    const std::string &pf
) {
    m_last_error.clear();

    const int rc = m_ctl.set_num_vfs(pf, 0);
    if (rc != IBNM_SUCCESS) {
        return m_fail(rc, "Destroying VFs on " + pf + " failed");
    }
    ibnmi_log_info("Destroyed all VFs on {}", pf);
    return IBNM_SUCCESS;
}

int
ibnmi_discover_pfs(
    const ibnmi_sysfs &sysfs,
    std::vector<ibnmi_pf_inventory> &pfs
) {
    pfs.clear();

    std::vector<ibnmi_topo_device> devices;
    const int rc = sysfs.list_devices(devices);
    if (rc != IBNM_SUCCESS) return rc;

    for (const auto &dev : devices) {
        if (!dev.is_pf || dev.sriov_totalvfs == 0) continue;
        ibnmi_pf_inventory pf;
        pf.pci_address = dev.pci_address;
        pf.adapter = dev.name;
        pf.total_vfs = dev.sriov_totalvfs;
        pf.current_vfs = dev.sriov_numvfs;
        pfs.push_back(std::move(pf));
    }
    return IBNM_SUCCESS;
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
