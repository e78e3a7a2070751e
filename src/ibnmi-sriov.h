/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-sriov.h
 *
 * SR-IOV virtual function lifecycle management.
 */

#ifndef IBNMI_SRIOV_H
#define IBNMI_SRIOV_H

#include "ibnmi-common.h"
#include "ibnmi-sysfs.h"
#include "ibnmi-utils.h"

/**
 * An SR-IOV capable PF, as found by one provisioning pass.
 */
struct ibnmi_pf_inventory {
    /** */
    std::string pci_address;
    /** */
    std::string adapter;
    /** sriov_totalvfs */
    int total_vfs = 0;
    /** sriov_numvfs */
    int current_vfs = 0;
};

/**
 * Delays used while resizing a VF pool.
 */
struct ibnmi_sriov_timing {
    /** Pause after resetting a live pool to 0. */
    std::chrono::milliseconds settle_delay{1000};
    /** Interval between checks for new VFs. */
    std::chrono::milliseconds poll_interval{500};
    /** How long to wait for new VFs to appear. */
    std::chrono::milliseconds settle_timeout{30000};
};

/**
 * Capability interface over the per-PF SR-IOV control files.
 */
struct ibnmi_vf_control {
    /** Virtual destructor. */
    virtual
    ~ibnmi_vf_control(void) = default;
    /** */
    virtual int
    total_vfs(
        const std::string &pf,
        int &count
    ) = 0;
    /** */
    virtual int
    num_vfs(
        const std::string &pf,
        int &count
    ) = 0;
    /** */
    virtual int
    set_num_vfs(
        const std::string &pf,
        int count
    ) = 0;
    /** */
    virtual int
    list_vfs(
        const std::string &pf,
        std::vector<std::string> &vfs
    ) = 0;
};

/**
 * VF control through sysfs.
 */
struct ibnmi_sysfs_vf_control : public ibnmi_vf_control {
private:
    /** */
    const ibnmi_sysfs &m_sysfs;
public:
    /** Constructor. */
    explicit ibnmi_sysfs_vf_control(
        const ibnmi_sysfs &sysfs
    ) : m_sysfs(sysfs) { }
    /** */
    virtual int
    total_vfs(
        const std::string &pf,
        int &count
    ) override {
        return m_sysfs.sriov_totalvfs(pf, count);
    }
    /** */
    virtual int
    num_vfs(
        const std::string &pf,
        int &count
    ) override {
        return m_sysfs.sriov_numvfs(pf, count);
    }
    /** */
    virtual int
    set_num_vfs(
        const std::string &pf,
        int count
    ) override {
        return m_sysfs.set_sriov_numvfs(pf, count);
    }
    /** */
    virtual int
    list_vfs(
        const std::string &pf,
        std::vector<std::string> &vfs
    ) override {
        return m_sysfs.list_vfs(pf, vfs);
    }
};

/**
 * Resizes VF pools. A single writer per PF is assumed.
 */
struct ibnmi_sriov {
private:
    /** */
    ibnmi_vf_control &m_ctl;
    /** */
    ibnmi_sriov_timing m_timing;
    /** Optional cancellation token. Not owned. */
    ibnmi_cancel *m_cancel = nullptr;
    /** Description of the most recent hard error. */
    std::string m_last_error;
    /** Sleeps for the given duration, returning IBNM_ERR_CANCELED if
     *  cancellation was requested. */
    int
    m_sleep(
        std::chrono::milliseconds d
    );
    /** */
    int
    m_wait_for_vfs(
        const std::string &pf,
        const std::string &label,
        int expected
    );
    /** */
    int
    m_fail(
        int rc,
        const std::string &what
    );
    /** */
    int
    m_resize(
        const std::string &pf,
        const std::string &label,
        int current,
        int desired
    );
public:
    /** Constructor. */
    ibnmi_sriov(
        ibnmi_vf_control &ctl,
        const ibnmi_sriov_timing &timing = ibnmi_sriov_timing(),
        ibnmi_cancel *cancel = nullptr
    ) : m_ctl(ctl)
      , m_timing(timing)
      , m_cancel(cancel) { }
    /**
     * Sets the VF count of one PF. Requests beyond the PF's capacity are
     * rejected before any write. Returns IBNM_SUCCESS_ALREADY_DONE if the
     * count already matches.
     */
    int
    provision_vfs(
        const std::string &pf,
        int desired
    );
    /**
     * Provisions every given PF with the requested count, clamped to each
     * PF's capacity. A PF that fails does not stop the others; the first
     * error is returned.
     */
    int
    provision_fleet(
        const std::vector<ibnmi_pf_inventory> &pfs,
        int requested
    );
    /**
     * Resets the PF's VF count to 0. Single attempt.
     */
    int
    destroy_vfs(
        const std::string &pf
    );
    /** */
    const std::string &
    last_error(void) const
    {
        return m_last_error;
    }
};

/**
 * Finds all PFs with a nonzero VF capacity.
 */
int
ibnmi_discover_pfs(
    const ibnmi_sysfs &sysfs,
    std::vector<ibnmi_pf_inventory> &pfs
);

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
