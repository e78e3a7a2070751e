/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-verbs.cc
 */

#include "ibnmi-verbs.h"

#include <endian.h>
#include <infiniband/verbs.h>

/**
 * Queries a single port. Returns IBNM_ERR_VERBS if the port cannot be queried.
 */
static int
query_port(
    ibv_context *ctx,
    int port_num,
    ibnmi_verbs_port &port
) {
    ibv_port_attr attr;
    memset(&attr, 0, sizeof(attr));

    const int rc = ibv_query_port(ctx, uint8_t(port_num), &attr);
    if (rc != 0) {
        ibnmi_log_debug(
            "ibv_query_port({}) failed for {}: {}",
            port_num, ibv_get_device_name(ctx->device), rc
        );
        return IBNM_ERR_VERBS;
    }

    port.port_num = port_num;
    port.state = int(attr.state);
    port.active_speed = int(attr.active_speed);
    port.active_width = int(attr.active_width);
    port.lid = int(attr.lid);
    port.active_mtu = int(attr.active_mtu);
    port.link_layer = int(attr.link_layer);
    port.gid.clear();

    ibv_gid gid;
    // A missing GID leaves the port usable, just without a port GUID.
    if (ibv_query_gid(ctx, uint8_t(port_num), 0, &gid) == 0) {
        port.gid.assign(gid.raw, gid.raw + sizeof(gid.raw));
    }
    return IBNM_SUCCESS;
}

/**
 * Opens and queries one adapter and all of its ports.
 */
static int
query_adapter(
    ibv_device *dev,
    ibnmi_verbs_adapter &adapter
) {
    const cstr_t name = ibv_get_device_name(dev);

    ibv_context *ctx = ibv_open_device(dev);
    if (!ctx) {
        const int err = errno;
        ibnmi_log_debug("ibv_open_device failed for {}: {}", name, strerror(err));
        return IBNM_ERR_VERBS;
    }

    int rc = IBNM_SUCCESS;
    do {
        ibv_device_attr attr;
        memset(&attr, 0, sizeof(attr));
        if (ibv_query_device(ctx, &attr) != 0) {
            ibnmi_log_debug("ibv_query_device failed for {}", name);
            rc = IBNM_ERR_VERBS;
            break;
        }

        adapter = ibnmi_verbs_adapter();
        adapter.name = name;
        adapter.node_guid = be64toh(ibv_get_device_guid(dev));
        adapter.fw_ver = attr.fw_ver;
        adapter.nports = int(attr.phys_port_cnt);
        adapter.vendor_id = attr.vendor_id;
        adapter.device_id = attr.vendor_part_id;

        for (int pn = 1; pn <= adapter.nports; ++pn) {
            ibnmi_verbs_port port;
            if (query_port(ctx, pn, port) != IBNM_SUCCESS) continue;
            adapter.ports.push_back(std::move(port));
        }
    } while (false);

    if (ibv_close_device(ctx) != 0) {
        ibnmi_log_debug("ibv_close_device failed for {}", name);
    }
    return rc;
}

int
ibnmi_verbs::list_adapters(
    std::vector<ibnmi_verbs_adapter> &adapters
) {
    adapters.clear();

    int ndevs = 0;
    ibv_device **devs = ibv_get_device_list(&ndevs);
    if (!devs) {
        const int err = errno;
        // No verbs provider loaded means no adapters.
        if (err == ENOSYS) return IBNM_SUCCESS;
        ibnmi_log_error("ibv_get_device_list failed: {}", strerror(err));
        return IBNM_ERR_VERBS;
    }

    for (int i = 0; i < ndevs; ++i) {
        if (!devs[i]) continue;
        ibnmi_verbs_adapter adapter;
        if (query_adapter(devs[i], adapter) != IBNM_SUCCESS) continue;
        adapters.push_back(std::move(adapter));
    }
    ibv_free_device_list(devs);
    return IBNM_SUCCESS;
}

/**
 * Maps a raw width code to a lane count. Unknown codes count as one lane.
 */
static int
width_multiplier(
    int width_code
) {
    switch (width_code) {
        case 1:
            return 1;
        case 2:
            return 4;
        case 4:
            return 8;
        case 8:
            return 12;
        default:
            return 1;
    }
}

std::string
ibnmi_effective_speed(
    int speed_code,
    int width_code
) {
    static const std::map<int, int> base_gbps = {
        {1, 2},    // SDR
        {2, 5},    // DDR
        {4, 10},   // QDR
        {8, 10},   // FDR10
        {16, 14},  // FDR
        {32, 25},  // EDR
        {64, 50},  // HDR
        {128, 100},// NDR
        {256, 200} // XDR
    };

    const int mult = width_multiplier(width_code);
    const auto got = base_gbps.find(speed_code);
    if (got == base_gbps.end()) {
        return std::to_string(speed_code * mult) + "Gb/s";
    }
    return std::to_string(got->second * mult) + "Gb/s";
}

std::string
ibnmi_gid_string(
    const std::vector<uint8_t> &gid
) {
    if (gid.size() != 16) return std::string();

    char buff[8 * 5];
    int off = 0;
    for (size_t i = 0; i < gid.size(); i += 2) {
        off += snprintf(
            buff + off, sizeof(buff) - size_t(off),
            "%s%02x%02x", (i == 0 ? "" : ":"), gid[i], gid[i + 1]
        );
    }
    return std::string(buff, size_t(off));
}

std::string
ibnmi_guid_string(
    uint64_t guid
) {
    char buff[17];
    snprintf(buff, sizeof(buff), "%016" PRIx64, guid);
    return std::string(buff);
}

ibnm_link_state_t
ibnmi_link_state(
    int state_code
) {
    switch (state_code) {
        case IBV_PORT_DOWN:
            return IBNM_LINK_STATE_DOWN;
        case IBV_PORT_INIT:
            return IBNM_LINK_STATE_INIT;
        case IBV_PORT_ARMED:
            return IBNM_LINK_STATE_ARMED;
        case IBV_PORT_ACTIVE:
            return IBNM_LINK_STATE_ACTIVE;
        default:
            return IBNM_LINK_STATE_UNKNOWN;
    }
}

std::string
ibnmi_link_state_string(
    ibnm_link_state_t state
) {
    switch (state) {
        case IBNM_LINK_STATE_DOWN:
            return "Down";
        case IBNM_LINK_STATE_INIT:
            return "Init";
        case IBNM_LINK_STATE_ARMED:
            return "Armed";
        case IBNM_LINK_STATE_ACTIVE:
            return "Active";
        default:
            return "Unknown";
    }
}

int
ibnmi_mtu_bytes(
    int mtu_code
) {
    switch (mtu_code) {
        case IBV_MTU_256:
            return 256;
        case IBV_MTU_512:
            return 512;
        case IBV_MTU_1024:
            return 1024;
        case IBV_MTU_2048:
            return 2048;
        case IBV_MTU_4096:
            return 4096;
        default:
            return 0;
    }
}

std::string
ibnmi_link_layer_string(
    int link_layer
) {
    switch (link_layer) {
        case IBV_LINK_LAYER_INFINIBAND:
            return "InfiniBand";
        case IBV_LINK_LAYER_ETHERNET:
            return "Ethernet";
        default:
            return "Unknown";
    }
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
