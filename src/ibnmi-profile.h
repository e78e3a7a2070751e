/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-profile.h
 *
 * Device kind profiles.
 */

#ifndef IBNMI_PROFILE_H
#define IBNMI_PROFILE_H

#include "ibnmi-common.h"
#include "ibnmi-config.h"
#include "ibnmi-edits.h"
#include "ibnmi-fusion.h"
#include "ibnmi-netns.h"
#include "ibnmi-publish.h"
#include "ibnmi-sriov.h"

/** Name of the InfiniBand profile. */
static const std::string IBNMI_PROFILE_IB = "ib";

/**
 * Profile settings and collaborators. Collaborators are not owned.
 */
struct ibnmi_profile_cfg {
    /** Pool name for published devices. */
    std::string node_name;
    /** VFs to create on each SR-IOV capable PF; 0 disables provisioning. */
    int num_vfs = 0;
    /** Executable path written into hook descriptors. */
    std::string hook_path = IBNMI_DEFAULT_HOOK_PATH;
    /** */
    ibnmi_sriov_timing timing;
    /** Optional. */
    ibnmi_cancel *cancel = nullptr;
    /** Required. */
    ibnmi_port_query *query = nullptr;
    /** Required. */
    const ibnmi_sysfs *sysfs = nullptr;
    /** Required. */
    ibnmi_vf_control *vf_control = nullptr;
    /** Optional. If set, RDMA exclusive namespace mode is ensured before
     *  devices are published. */
    ibnmi_netns *netns = nullptr;
};

/**
 * Virtual base profile class. One profile per device kind, selected once.
 */
struct ibnmi_profile {
    /** Virtual destructor. */
    virtual
    ~ibnmi_profile(void) = default;
    /** Returns the profile's name. */
    virtual std::string
    name(void) const = 0;
    /**
     * Discovers devices, replacing any previous snapshot, and returns them in
     * published form.
     */
    virtual int
    enumerate(
        ibnmi_resource_pool &pool
    ) = 0;
    /**
     * Checks a JSON-encoded configuration. Returns IBNM_ERR_CONFIG if it is
     * rejected.
     */
    virtual int
    validate_config(
        const std::string &json
    ) = 0;
    /**
     * Plans container edits for the given allocated devices, in order.
     */
    virtual int
    apply_config(
        const std::string &json,
        const std::vector<std::string> &devices,
        std::vector<ibnmi_isolation_edit> &edits
    ) = 0;
};

/**
 * InfiniBand profile.
 */
struct ibnmi_ib_profile : public ibnmi_profile {
private:
    /** */
    ibnmi_profile_cfg m_cfg;
    /** The latest snapshot. */
    ibnmi_snapshot m_snapshot;
    /** */
    int
    m_provision(void);
public:
    /** Constructor. */
    explicit ibnmi_ib_profile(
        const ibnmi_profile_cfg &cfg
    );
    /** */
    virtual
    ~ibnmi_ib_profile(void) = default;
    /** */
    virtual std::string
    name(void) const override
    {
        return IBNMI_PROFILE_IB;
    }
    /** */
    virtual int
    enumerate(
        ibnmi_resource_pool &pool
    ) override;
    /** */
    virtual int
    validate_config(
        const std::string &json
    ) override;
    /** */
    virtual int
    apply_config(
        const std::string &json,
        const std::vector<std::string> &devices,
        std::vector<ibnmi_isolation_edit> &edits
    ) override;
    /** */
    const ibnmi_snapshot &
    snapshot(void) const
    {
        return m_snapshot;
    }
    /**
     * Looks up a port of the latest snapshot by name.
     */
    int
    device_by_name(
        const std::string &name,
        ibnmi_adapter_port &port
    ) const;
};

/**
 * Creates the profile with the given name. Returns IBNM_ERR_NOT_SUPPORTED for
 * unknown names.
 */
int
ibnmi_profile_new(
    const std::string &name,
    const ibnmi_profile_cfg &cfg,
    ibnmi_profile **profile
);

/** */
void
ibnmi_profile_delete(
    ibnmi_profile **profile
);

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
