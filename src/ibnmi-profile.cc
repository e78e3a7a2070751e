/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-profile.cc
 */

#include "ibnmi-profile.h"
#include "ibnmi-utils.h"

ibnmi_ib_profile::ibnmi_ib_profile(
    const ibnmi_profile_cfg &cfg
) : m_cfg(cfg)
{
    if (ibnmi_unlikely(!m_cfg.query || !m_cfg.sysfs || !m_cfg.vf_control)) {
        throw ibnmi_runtime_error(IBNM_ERR_INVLD_ARG);
    }
}

int
ibnmi_ib_profile::m_provision(void)
{
    std::vector<ibnmi_pf_inventory> pfs;
    int rc = ibnmi_discover_pfs(*m_cfg.sysfs, pfs);
    if (rc != IBNM_SUCCESS) {
        ibnmi_log_error("Discovering SR-IOV PFs failed: {}", ibnm_strerr(rc));
        return rc;
    }

    ibnmi_sriov sriov(*m_cfg.vf_control, m_cfg.timing, m_cfg.cancel);
    return sriov.provision_fleet(pfs, m_cfg.num_vfs);
}

int
ibnmi_ib_profile::enumerate(
    ibnmi_resource_pool &pool
) {
    int rc = IBNM_SUCCESS;
    if (m_cfg.num_vfs > 0) {
        rc = m_provision();
        if (rc == IBNM_ERR_CANCELED) return rc;
        if (rc != IBNM_SUCCESS) {
            ibnmi_log_warn(
                "VF provisioning failed ({}), continuing with existing devices",
                ibnm_strerr(rc)
            );
        }
    }

    if (m_cfg.netns) {
        rc = m_cfg.netns->ensure_rdma_exclusive_mode();
        if (rc != IBNM_SUCCESS && rc != IBNM_SUCCESS_ALREADY_DONE) {
            ibnmi_log_warn(
                "Cannot set RDMA exclusive netns mode, RDMA devices will "
                "stay shared"
            );
        }
    }

    ibnmi_snapshot snapshot;
    rc = ibnmi_enumerate(*m_cfg.query, *m_cfg.sysfs, snapshot);
    if (rc != IBNM_SUCCESS) return rc;

    rc = ibnmi_publish(m_cfg.node_name, snapshot, pool);
    if (rc != IBNM_SUCCESS) return rc;

    m_snapshot = std::move(snapshot);
    return IBNM_SUCCESS;
}

int
ibnmi_ib_profile::validate_config(
    const std::string &json
) {
    ibnmi_ib_config config;
    int rc = ibnmi_ib_config_from_json(json, config);
    if (rc != IBNM_SUCCESS) return rc;

    std::string reason;
    rc = config.validate(reason);
    if (rc != IBNM_SUCCESS) {
        ibnmi_log_error("Invalid IB config: {}", reason);
    }
    return rc;
}

int
ibnmi_ib_profile::apply_config(
    const std::string &json,
    const std::vector<std::string> &devices,
    std::vector<ibnmi_isolation_edit> &edits
) {
    edits.clear();

    ibnmi_ib_config config;
    const int rc = ibnmi_ib_config_from_json(json, config);
    if (rc != IBNM_SUCCESS) return rc;

    return ibnmi_plan_edits(config, devices, m_cfg.hook_path, edits);
}

int
ibnmi_ib_profile::device_by_name(
    const std::string &name,
    ibnmi_adapter_port &port
) const {
    const ibnmi_adapter_port *found = m_snapshot.find(name);
    if (!found) return IBNM_ERR_NOT_FOUND;
    port = *found;
    return IBNM_SUCCESS;
}

int
ibnmi_profile_new(
    const std::string &name,
    const ibnmi_profile_cfg &cfg,
    ibnmi_profile **profile
) {
    if (name == IBNMI_PROFILE_IB) {
        ibnmi_ib_profile *ibp = nullptr;
        const int rc = ibnmi_new(&ibp, cfg);
        *profile = ibp;
        return rc;
    }
    ibnmi_log_error("Unknown device profile '{}'", name);
    *profile = nullptr;
    return IBNM_ERR_NOT_SUPPORTED;
}

void
ibnmi_profile_delete(
    ibnmi_profile **profile
) {
    ibnmi_delete(profile);
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
