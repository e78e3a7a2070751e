/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-fusion.h
 *
 * Joins verbs port attributes and sysfs topology into device snapshots.
 */

#ifndef IBNMI_FUSION_H
#define IBNMI_FUSION_H

#include "ibnmi-common.h"
#include "ibnmi-sysfs.h"
#include "ibnmi-verbs.h"

/**
 * One allocatable unit: a single port of a PF or VF.
 */
struct ibnmi_adapter_port {
    /** Composite name, <adapter>-port<N>. */
    std::string name;
    /** */
    std::string adapter;
    /** */
    int port = 0;
    /** */
    ibnm_port_kind_t kind = IBNM_PORT_KIND_PF;
    /** */
    ibnm_link_state_t link_state = IBNM_LINK_STATE_UNKNOWN;
    /** Effective link speed (e.g., 100Gb/s). */
    std::string link_speed;
    /** */
    std::string fw_version;
    /** 16 lowercase hex digits. */
    std::string node_guid;
    /** Derived from GID index 0. */
    std::string port_guid;
    /** */
    int numa_node = IBNM_NUMA_NODE_UNKNOWN;
    /** */
    std::string pci_address;
    /** Adapter name of the parent PF. Only set for VFs. */
    std::string parent;
    /** */
    std::vector<std::string> netdevs;
    /** Active MTU in bytes, 0 if unknown. */
    int active_mtu = 0;
    /** */
    std::string link_layer;
    /** */
    int lid = 0;
};

/**
 * Immutable, ordered list of adapter ports for one node. Re-enumeration
 * produces a new snapshot.
 */
struct ibnmi_snapshot {
private:
    /** */
    std::vector<ibnmi_adapter_port> m_ports;
public:
    /** Constructor. */
    ibnmi_snapshot(void) = default;
    /** Constructor. */
    explicit ibnmi_snapshot(
        std::vector<ibnmi_adapter_port> &&ports
    ) : m_ports(std::move(ports)) { }
    /** */
    const std::vector<ibnmi_adapter_port> &
    ports(void) const
    {
        return m_ports;
    }
    /** */
    size_t
    size(void) const
    {
        return m_ports.size();
    }
    /** */
    bool
    empty(void) const
    {
        return m_ports.empty();
    }
    /**
     * Returns the port with the given composite name, or nullptr.
     */
    const ibnmi_adapter_port *
    find(
        const std::string &name
    ) const;
};

/**
 * Returns the composite name of an adapter port.
 */
std::string
ibnmi_port_name(
    const std::string &adapter,
    int port
);

/**
 * Splits a composite name at the first "-port" separator. Returns
 * IBNM_ERR_NOT_FOUND if there is no separator.
 */
int
ibnmi_port_name_split(
    const std::string &name,
    std::string &adapter,
    std::string &port
);

/** Returns "PF" or "VF". */
std::string
ibnmi_port_kind_string(
    ibnm_port_kind_t kind
);

/**
 * Builds a snapshot from verbs adapters and sysfs topology records. Ports
 * keep the order in which verbs reported them. A port without a matching
 * topology record is kept as a PF with empty topology fields.
 */
int
ibnmi_fuse(
    const std::vector<ibnmi_verbs_adapter> &adapters,
    const std::vector<ibnmi_topo_device> &topology,
    ibnmi_snapshot &snapshot
);

/**
 * Queries both sources and fuses them. Only a failing port query is fatal; a
 * failing topology read degrades to verbs-only data.
 */
int
ibnmi_enumerate(
    ibnmi_port_query &query,
    const ibnmi_sysfs &sysfs,
    ibnmi_snapshot &snapshot
);

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
