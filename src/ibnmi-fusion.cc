/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-fusion.cc
 */

#include "ibnmi-fusion.h"

static const std::string port_separator = "-port";

const ibnmi_adapter_port *
ibnmi_snapshot::find(
    const std::string &name
) const {
    for (const auto &port : m_ports) {
        if (port.name == name) return &port;
    }
    return nullptr;
}

std::string
ibnmi_port_name(
    const std::string &adapter,
    int port
) {
    return adapter + port_separator + std::to_string(port);
}

int
ibnmi_port_name_split(
    const std::string &name,
    std::string &adapter,
    std::string &port
) {
    const size_t pos = name.find(port_separator);
    if (pos == std::string::npos) return IBNM_ERR_NOT_FOUND;
    adapter = name.substr(0, pos);
    port = name.substr(pos + port_separator.size());
    return IBNM_SUCCESS;
}

std::string
ibnmi_port_kind_string(
    ibnm_port_kind_t kind
) {
    return (kind == IBNM_PORT_KIND_VF) ? "VF" : "PF";
}

int
ibnmi_fuse(
    const std::vector<ibnmi_verbs_adapter> &adapters,
    const std::vector<ibnmi_topo_device> &topology,
    ibnmi_snapshot &snapshot
) {
    std::map<std::string, const ibnmi_topo_device *> by_name;
    std::map<std::string, std::string> pci_to_name;
    for (const auto &dev : topology) {
        by_name[dev.name] = &dev;
        if (!dev.pci_address.empty()) {
            pci_to_name[dev.pci_address] = dev.name;
        }
    }

    std::vector<ibnmi_adapter_port> ports;
    std::set<std::string> seen;
    for (const auto &adapter : adapters) {
        const auto got = by_name.find(adapter.name);
        const ibnmi_topo_device *topo =
            (got == by_name.end()) ? nullptr : got->second;

        for (const auto &vport : adapter.ports) {
            ibnmi_adapter_port port;
            port.name = ibnmi_port_name(adapter.name, vport.port_num);
            if (!seen.insert(port.name).second) {
                ibnmi_log_warn("Dropping duplicate adapter port {}", port.name);
                continue;
            }
            port.adapter = adapter.name;
            port.port = vport.port_num;
            port.link_state = ibnmi_link_state(vport.state);
            port.link_speed = ibnmi_effective_speed(
                vport.active_speed, vport.active_width
            );
            port.fw_version = adapter.fw_ver;
            port.node_guid = ibnmi_guid_string(adapter.node_guid);
            port.port_guid = ibnmi_gid_string(vport.gid);
            port.active_mtu = ibnmi_mtu_bytes(vport.active_mtu);
            port.link_layer = ibnmi_link_layer_string(vport.link_layer);
            port.lid = vport.lid;

            if (topo) {
                port.pci_address = topo->pci_address;
                port.numa_node = topo->numa_node;
                port.netdevs = topo->netdevs;
                if (topo->is_vf) {
                    port.kind = IBNM_PORT_KIND_VF;
                    const auto parent = pci_to_name.find(topo->parent_pf);
                    if (!topo->parent_pf.empty() && parent != pci_to_name.end()) {
                        port.parent = parent->second;
                    }
                }
            }
            else {
                ibnmi_log_debug(
                    "No topology record for {}, assuming PF", adapter.name
                );
            }
            ports.push_back(std::move(port));
        }
    }

    snapshot = ibnmi_snapshot(std::move(ports));
    return IBNM_SUCCESS;
}

int
ibnmi_enumerate(
    ibnmi_port_query &query,
    const ibnmi_sysfs &sysfs,
    ibnmi_snapshot &snapshot
) {
    std::vector<ibnmi_verbs_adapter> adapters;
    int rc = query.list_adapters(adapters);
    if (ibnmi_unlikely(rc != IBNM_SUCCESS)) {
        ibnmi_log_error("Listing adapters failed: {}", ibnm_strerr(rc));
        return rc;
    }
    if (adapters.empty()) {
        ibnmi_log_info("No InfiniBand devices found on this host");
        snapshot = ibnmi_snapshot();
        return IBNM_SUCCESS;
    }

    std::vector<ibnmi_topo_device> topology;
    rc = sysfs.list_devices(topology);
    if (rc != IBNM_SUCCESS) {
        ibnmi_log_warn(
            "Reading sysfs topology failed ({}), using verbs data only",
            ibnm_strerr(rc)
        );
        topology.clear();
    }
    return ibnmi_fuse(adapters, topology, snapshot);
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
