/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-edits.cc
 */

#include "ibnmi-edits.h"
#include "ibnmi-fusion.h"
#include "ibnmi-utils.h"

#include "cereal/archives/json.hpp"

std::vector<std::string>
ibnmi_isolation_edit::env_strings(void) const
{
    std::vector<std::string> result;
    for (const auto &kv : env) {
        result.push_back(kv.first + "=" + kv.second);
    }
    return result;
}

const std::string *
ibnmi_isolation_edit::env_value(
    const std::string &key
) const {
    for (const auto &kv : env) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

static std::string
pkey_string(
    int64_t pkey
) {
    char buff[16];
    snprintf(buff, sizeof(buff), "0x%04X", unsigned(pkey));
    return std::string(buff);
}

int
ibnmi_plan_edits(
    const ibnmi_ib_config &config,
    const std::vector<std::string> &devices,
    const std::string &hook_path,
    std::vector<ibnmi_isolation_edit> &edits
) {
    edits.clear();

    ibnmi_ib_config cfg = config;
    int rc = cfg.normalize();
    if (ibnmi_unlikely(rc != IBNM_SUCCESS)) {
        ibnmi_log_error("Normalizing IB config failed: {}", ibnm_strerr(rc));
        return rc;
    }
    std::string reason;
    rc = cfg.validate(reason);
    if (rc != IBNM_SUCCESS) {
        ibnmi_log_error("Rejecting IB config: {}", reason);
        return rc;
    }

    for (size_t i = 0; i < devices.size(); ++i) {
        const std::string base = IBNMI_ENV_DEVICE_PREFIX + std::to_string(i);

        ibnmi_isolation_edit edit;
        edit.device = devices[i];
        edit.env.emplace_back(base, devices[i]);

        std::string adapter, port;
        const bool is_port =
            (ibnmi_port_name_split(devices[i], adapter, port) == IBNM_SUCCESS);
        if (is_port) {
            edit.env.emplace_back(base + "_IBDEV", adapter);
            edit.env.emplace_back(base + "_PORT", port);
        }
        if (cfg.pkey) {
            edit.env.emplace_back(base + "_PKEY", pkey_string(*cfg.pkey));
        }
        if (cfg.traffic_class) {
            edit.env.emplace_back(
                base + "_TRAFFIC_CLASS", std::to_string(*cfg.traffic_class)
            );
        }
        if (cfg.mtu) {
            edit.env.emplace_back(base + "_MTU", std::to_string(*cfg.mtu));
        }
        if (is_port) {
            edit.hook = ibnmi_hook_move_netdev(hook_path, adapter);
        }
        else {
            ibnmi_log_debug(
                "{} does not name an adapter port, no hook emitted", devices[i]
            );
        }
        edits.push_back(std::move(edit));
    }
    return IBNM_SUCCESS;
}

int
ibnmi_edits_json(
    const std::vector<ibnmi_isolation_edit> &edits,
    std::string &json
) {
    try {
        std::stringstream ss;
        {
            cereal::JSONOutputArchive oarchive(ss);
            oarchive(cereal::make_nvp("edits", edits));
        }
        json = ss.str();
        return IBNM_SUCCESS;
    }
    ibnmi_catch_and_return();
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
