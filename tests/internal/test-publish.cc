/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file test-publish.cc
 */

#include "ibnmi-common.h" // IWYU pragma: keep
#include "ibnmi-publish.h"

#include "common-test-utils.h"

static ibnmi_adapter_port
make_port(
    const std::string &adapter,
    int port,
    ibnm_port_kind_t kind
) {
    ibnmi_adapter_port p;
    p.name = ibnmi_port_name(adapter, port);
    p.adapter = adapter;
    p.port = port;
    p.kind = kind;
    p.link_state = IBNM_LINK_STATE_ACTIVE;
    p.link_speed = "200Gb/s";
    p.fw_version = "28.39.1002";
    p.node_guid = "0002c90300a1b2c3";
    p.port_guid = "fe80:0000:0000:0000:0002:c903:00a1:b2c3";
    p.pci_address = "0000:3b:00.0";
    return p;
}

static void
test_publish_port(void)
{
    ibnmi_adapter_port pf = make_port("mlx5_0", 1, IBNM_PORT_KIND_PF);
    pf.numa_node = 1;

    const ibnmi_published_device dev = ibnmi_publish_port(pf);
    ctu_expect_str(dev.name, "mlx5_0-port1");

    static const char *const keys[] = {
        "type", "linkSpeed", "portState", "firmwareVersion",
        "nodeGUID", "portGUID", "numaNode", "pciAddress"
    };
    const size_t nkeys = sizeof(keys) / sizeof(keys[0]);
    ctu_expect(dev.attributes.items.size() == nkeys);
    for (size_t i = 0; i < nkeys; ++i) {
        ctu_expect_str(dev.attributes.items[i].first, keys[i]);
    }

    ctu_expect_str(dev.attributes.find("type")->str(), "PF");
    ctu_expect_str(dev.attributes.find("linkSpeed")->str(), "200Gb/s");
    ctu_expect_str(dev.attributes.find("portState")->str(), "Active");
    ctu_expect(dev.attributes.find("numaNode")->is_int());
    ctu_expect(dev.attributes.find("numaNode")->integer() == 1);
    // Parent only for VFs.
    ctu_expect(dev.attributes.find("parentDevice") == nullptr);
}

static void
test_publish_vf(void)
{
    ibnmi_adapter_port vf = make_port("mlx5_2", 1, IBNM_PORT_KIND_VF);
    vf.parent = "mlx5_0";

    const ibnmi_published_device dev = ibnmi_publish_port(vf);
    ctu_expect_str(dev.attributes.find("type")->str(), "VF");
    ctu_expect_str(dev.attributes.find("parentDevice")->str(), "mlx5_0");
    // Unknown NUMA stays -1.
    ctu_expect(dev.attributes.find("numaNode")->integer() == -1);
}

static void
test_publish_pool(void)
{
    std::vector<ibnmi_adapter_port> ports = {
        make_port("mlx5_0", 1, IBNM_PORT_KIND_PF),
        make_port("mlx5_0", 2, IBNM_PORT_KIND_PF),
        make_port("mlx5_2", 1, IBNM_PORT_KIND_VF)
    };
    ports[2].parent = "mlx5_0";
    const ibnmi_snapshot snapshot(std::move(ports));

    ibnmi_resource_pool pool;
    ctu_expect_rc(ibnmi_publish("node-a", snapshot, pool), IBNM_SUCCESS);
    ctu_expect_str(pool.node, "node-a");
    ctu_expect(pool.devices.size() == 3);
    ctu_expect_str(pool.devices[1].name, "mlx5_0-port2");

    std::string json;
    ctu_expect_rc(ibnmi_publish_json(pool, json), IBNM_SUCCESS);
    printf("%s\n", json.c_str());
    ctu_expect(json.find("\"resources\"") != std::string::npos);
    ctu_expect(json.find("\"pool\": \"node-a\"") != std::string::npos);
    ctu_expect(json.find("\"mlx5_2-port1\"") != std::string::npos);
    ctu_expect(json.find("\"parentDevice\"") != std::string::npos);
    ctu_expect(json.find("\"int\": -1") != std::string::npos);
}

static void
test_publish_empty(void)
{
    ibnmi_resource_pool pool;
    ctu_expect_rc(ibnmi_publish("node-b", ibnmi_snapshot(), pool), IBNM_SUCCESS);
    ctu_expect(pool.devices.empty());

    std::string json;
    ctu_expect_rc(ibnmi_publish_json(pool, json), IBNM_SUCCESS);
    ctu_expect(json.find("\"devices\"") != std::string::npos);
}

static void
test_publish_duplicate(void)
{
    std::vector<ibnmi_adapter_port> ports = {
        make_port("mlx5_0", 1, IBNM_PORT_KIND_PF),
        make_port("mlx5_0", 1, IBNM_PORT_KIND_PF)
    };
    const ibnmi_snapshot snapshot(std::move(ports));

    ibnmi_resource_pool pool;
    ctu_expect_rc(ibnmi_publish("node-a", snapshot, pool), IBNM_ERR_INTERNAL);
    ctu_expect(pool.devices.empty());
}

int
main(void)
{
    ctu_run(test_publish_port);
    ctu_run(test_publish_vf);
    ctu_run(test_publish_pool);
    ctu_run(test_publish_empty);
    ctu_run(test_publish_duplicate);
    return EXIT_SUCCESS;
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
