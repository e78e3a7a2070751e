/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-config.h
 *
 * Per-claim InfiniBand device configuration.
 */

#ifndef IBNMI_CONFIG_H
#define IBNMI_CONFIG_H

#include "ibnmi-common.h"

/**
 * Device configuration. Every field is optional; an unset field means the
 * fabric or port default applies.
 */
struct ibnmi_ib_config {
    /** Partition key, 0x0001-0xFFFF. Fabric default if unset. */
    std::optional<int64_t> pkey;
    /** Traffic class, 0-255. 0 if unset. */
    std::optional<int64_t> traffic_class;
    /** One of 256, 512, 1024, 2048, 4096. Port's active MTU if unset. */
    std::optional<int64_t> mtu;
    /** Returns a configuration with every field unset. */
    static ibnmi_ib_config
    defaults(void)
    {
        return ibnmi_ib_config();
    }
    /**
     * Fills in implied defaults. All fields are independent, so there is
     * currently nothing to derive.
     */
    int
    normalize(void);
    /**
     * Returns IBNM_ERR_CONFIG, naming the offending field, if any set field is
     * out of range.
     */
    int
    validate(
        std::string &reason
    ) const;
};

/** */
bool
ibnmi_mtu_valid(
    int64_t mtu
);

/**
 * Decodes a configuration from JSON. Members pkey, trafficClass and mtu are
 * optional and unknown members are ignored. Malformed JSON and members of the
 * wrong type yield IBNM_ERR_CONFIG. An empty document yields the defaults.
 */
int
ibnmi_ib_config_from_json(
    const std::string &json,
    ibnmi_ib_config &config
);

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
