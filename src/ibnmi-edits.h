/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-edits.h
 *
 * Plans per-device container edits at allocation time.
 */

#ifndef IBNMI_EDITS_H
#define IBNMI_EDITS_H

#include "ibnmi-common.h"
#include "ibnmi-config.h"
#include "ibnmi-hookmsg.h"

/** Prefix of every emitted environment variable. */
static const std::string IBNMI_ENV_DEVICE_PREFIX = "IB_DEVICE_";

/**
 * Container edits for one allocated device.
 */
struct ibnmi_isolation_edit {
    /** Allocated device name. */
    std::string device;
    /** Environment assignments, in emission order. */
    std::vector<std::pair<std::string, std::string>> env;
    /** Deferred namespace move, if the device name names an adapter port. */
    std::optional<ibnmi_hook_descriptor> hook;
    /** Returns the environment as KEY=VALUE strings. */
    std::vector<std::string>
    env_strings(void) const;
    /** Returns the value of the given variable, or nullptr. */
    const std::string *
    env_value(
        const std::string &key
    ) const;

    template <class Archive>
    void
    save(
        Archive &archive
    ) const {
        archive(
            cereal::make_nvp("device", device),
            cereal::make_nvp("env", env_strings())
        );
        if (hook) {
            archive(cereal::make_nvp("hook", *hook));
        }
    }
};

/**
 * Plans the edits for each allocated device, in input order. The
 * configuration is re-validated first; an invalid configuration yields
 * IBNM_ERR_CONFIG and no edits.
 */
int
ibnmi_plan_edits(
    const ibnmi_ib_config &config,
    const std::vector<std::string> &devices,
    const std::string &hook_path,
    std::vector<ibnmi_isolation_edit> &edits
);

/**
 * Renders planned edits as JSON.
 */
int
ibnmi_edits_json(
    const std::vector<ibnmi_isolation_edit> &edits,
    std::string &json
);

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
