/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-verbs.h
 *
 * Port attribute queries through the verbs interface.
 */

#ifndef IBNMI_VERBS_H
#define IBNMI_VERBS_H

#include "ibnmi-common.h"

/**
 * Raw attributes of one adapter port.
 */
struct ibnmi_verbs_port {
    /** Port number, starting at 1. */
    int port_num = 0;
    /** Raw port state code. */
    int state = 0;
    /** Raw active speed code. */
    int active_speed = 0;
    /** Raw active width code. */
    int active_width = 0;
    /** */
    int lid = 0;
    /** Raw active MTU code. */
    int active_mtu = 0;
    /** Raw link layer code. */
    int link_layer = 0;
    /** GID at index 0, raw bytes. */
    std::vector<uint8_t> gid;
};

/**
 * Raw attributes of one adapter.
 */
struct ibnmi_verbs_adapter {
    /** Adapter name (e.g., mlx5_0). */
    std::string name;
    /** Node GUID in host byte order. */
    uint64_t node_guid = 0;
    /** */
    std::string fw_ver;
    /** Number of physical ports. */
    int nports = 0;
    /** */
    uint32_t vendor_id = 0;
    /** */
    uint32_t device_id = 0;
    /** Ports that could be queried, in port number order. */
    std::vector<ibnmi_verbs_port> ports;
};

/**
 * Capability interface for hardware port queries.
 */
struct ibnmi_port_query {
    /** Virtual destructor. */
    virtual
    ~ibnmi_port_query(void) = default;
    /**
     * Lists every adapter that could be opened, together with the ports that
     * could be queried. Adapters and ports that fail are skipped.
     */
    virtual int
    list_adapters(
        std::vector<ibnmi_verbs_adapter> &adapters
    ) = 0;
};

/**
 * libibverbs implementation.
 */
struct ibnmi_verbs : public ibnmi_port_query {
    /** */
    virtual
    ~ibnmi_verbs(void) = default;
    /** */
    virtual int
    list_adapters(
        std::vector<ibnmi_verbs_adapter> &adapters
    ) override;
};

/**
 * Returns the effective link speed (e.g., "100Gb/s") for the given raw speed
 * and width codes.
 */
std::string
ibnmi_effective_speed(
    int speed_code,
    int width_code
);

/**
 * Formats a raw GID as eight colon-separated groups of four hex digits.
 * Input that is not exactly 16 bytes yields an empty string.
 */
std::string
ibnmi_gid_string(
    const std::vector<uint8_t> &gid
);

/**
 * Formats a GUID as 16 lowercase hex digits.
 */
std::string
ibnmi_guid_string(
    uint64_t guid
);

/** */
ibnm_link_state_t
ibnmi_link_state(
    int state_code
);

/** */
std::string
ibnmi_link_state_string(
    ibnm_link_state_t state
);

/**
 * Maps a raw MTU code to bytes, or 0 if unknown.
 */
int
ibnmi_mtu_bytes(
    int mtu_code
);

/** */
std::string
ibnmi_link_layer_string(
    int link_layer
);

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
