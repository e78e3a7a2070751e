/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-publish.cc
 */

#include "ibnmi-publish.h"

#include "ibnmi-utils.h"

#include "cereal/archives/json.hpp"

const ibnmi_attr_value *
ibnmi_attributes::find(
    const std::string &name
) const {
    for (const auto &item : items) {
        if (item.first == name) return &item.second;
    }
    return nullptr;
}

ibnmi_published_device
ibnmi_publish_port(
    const ibnmi_adapter_port &port
) {
    ibnmi_published_device dev;
    dev.name = port.name;

    auto &items = dev.attributes.items;
    auto add_str = [&items](const std::string &key, const std::string &val) {
        items.emplace_back(key, ibnmi_attr_value(val));
    };

    add_str("type", ibnmi_port_kind_string(port.kind));
    add_str("linkSpeed", port.link_speed);
    add_str("portState", ibnmi_link_state_string(port.link_state));
    add_str("firmwareVersion", port.fw_version);
    add_str("nodeGUID", port.node_guid);
    add_str("portGUID", port.port_guid);
    items.emplace_back("numaNode", ibnmi_attr_value(int64_t(port.numa_node)));
    add_str("pciAddress", port.pci_address);
    if (!port.parent.empty()) {
        add_str("parentDevice", port.parent);
    }
    return dev;
}

int
ibnmi_publish(
    const std::string &node,
    const ibnmi_snapshot &snapshot,
    ibnmi_resource_pool &pool
) {
    pool = ibnmi_resource_pool();
    pool.node = node;

    std::set<std::string> names;
    for (const auto &port : snapshot.ports()) {
        if (ibnmi_unlikely(!names.insert(port.name).second)) {
            ibnmi_log_error("Device name {} is not unique on {}", port.name, node);
            pool.devices.clear();
            return IBNM_ERR_INTERNAL;
        }
        pool.devices.push_back(ibnmi_publish_port(port));
    }
    ibnmi_log_info(
        "Enumerated {} IB devices on node {}", pool.devices.size(), node
    );
    return IBNM_SUCCESS;
}

int
ibnmi_publish_json(
    const ibnmi_resource_pool &pool,
    std::string &json
) {
    try {
        std::stringstream ss;
        {
            cereal::JSONOutputArchive oarchive(ss);
            oarchive(cereal::make_nvp("resources", pool));
        }
        json = ss.str();
        return IBNM_SUCCESS;
    }
    ibnmi_catch_and_return();
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
