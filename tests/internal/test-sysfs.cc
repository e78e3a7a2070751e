/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file test-sysfs.cc
 */

#include "ibnmi-common.h" // IWYU pragma: keep
#include "ibnmi-sysfs.h"

#include "ibnm-test-sysfs.h"

static const std::string pf0 = "0000:3b:00.0";
static const std::string pf1 = "0000:86:00.0";
static const std::string vf0 = "0000:3b:00.1";
static const std::string vf1 = "0000:3b:00.2";

/**
 * Two PFs, one with two VFs. The second PF has no numa_node file.
 */
static void
build_host(
    ibnm_test_sysfs &tree
) {
    tree.add_pci(pf0, 0, 8, 2);
    tree.add_pci(pf1, -1, 16, 0);
    tree.add_vf(pf0, 0, vf0, 0);
    tree.add_vf(pf0, 1, vf1, 0);

    tree.add_ib(
        "mlx5_0", pf0, "0002:c903:00a1:b2c3",
        {{1, "fe80:0000:0000:0000:0002:c903:00a1:b2c3"}}
    );
    tree.add_ib("mlx5_1", pf1, "0002:c903:00a1:b2d0");
    tree.add_ib("mlx5_2", vf0);
    tree.add_ib("mlx5_3", vf1);

    tree.add_netdev(pf0, "ib0");
    tree.add_netdev(vf0, "ib2");
}

static void
test_missing_class_dir(void)
{
    ibnmi_sysfs sysfs("/nonexistent-ibnm-root");
    std::vector<ibnmi_topo_device> devices;
    ctu_expect_rc(sysfs.list_devices(devices), IBNM_SUCCESS);
    ctu_expect(devices.empty());
}

static void
test_list_devices(void)
{
    ibnm_test_sysfs tree;
    build_host(tree);
    tree.add_dangling_ib("mlx5_9");

    ibnmi_sysfs sysfs(tree.root());
    std::vector<ibnmi_topo_device> devices;
    ctu_expect_rc(sysfs.list_devices(devices), IBNM_SUCCESS);
    // The dangling entry is skipped.
    ctu_expect(devices.size() == 4);
    ctu_expect_str(devices[0].name, "mlx5_0");
    ctu_expect_str(devices[3].name, "mlx5_3");

    const ibnmi_topo_device &d0 = devices[0];
    ctu_expect_str(d0.pci_address, pf0);
    ctu_expect(d0.numa_node == 0);
    ctu_expect(d0.is_pf && !d0.is_vf);
    ctu_expect(d0.sriov_totalvfs == 8);
    ctu_expect(d0.sriov_numvfs == 2);
    ctu_expect(d0.parent_pf.empty());
    ctu_expect(d0.netdevs.size() == 1);
    ctu_expect_str(d0.netdevs[0], "ib0");
    ctu_expect_str(d0.node_guid, "0002:c903:00a1:b2c3");
    ctu_expect(d0.port_guids.size() == 1);
    ctu_expect_str(
        d0.port_guids.at(1), "fe80:0000:0000:0000:0002:c903:00a1:b2c3"
    );

    // No numa_node file means unknown, never node 0.
    const ibnmi_topo_device &d1 = devices[1];
    ctu_expect(d1.numa_node == IBNM_NUMA_NODE_UNKNOWN);
    ctu_expect(d1.is_pf);
    ctu_expect(d1.sriov_totalvfs == 16);
    ctu_expect(d1.netdevs.empty());
    ctu_expect(d1.port_guids.empty());

    const ibnmi_topo_device &d2 = devices[2];
    ctu_expect(d2.is_vf && !d2.is_pf);
    ctu_expect_str(d2.parent_pf, pf0);
    ctu_expect(d2.sriov_totalvfs == 0);
    ctu_expect_str(d2.netdevs.at(0), "ib2");
}

static void
test_device_info(void)
{
    ibnm_test_sysfs tree;
    build_host(tree);
    ibnmi_sysfs sysfs(tree.root());

    ibnmi_topo_device info;
    ctu_expect_rc(sysfs.device_info("mlx5_3", info), IBNM_SUCCESS);
    ctu_expect_str(info.pci_address, vf1);
    ctu_expect_str(info.parent_pf, pf0);
    ctu_expect(info.is_vf);

    ctu_expect_rc(sysfs.device_info("mlx5_42", info), IBNM_ERR_NOT_FOUND);
}

static void
test_sriov_accessors(void)
{
    ibnm_test_sysfs tree;
    build_host(tree);
    ibnmi_sysfs sysfs(tree.root());

    int count = -1;
    ctu_expect_rc(sysfs.sriov_totalvfs(pf1, count), IBNM_SUCCESS);
    ctu_expect(count == 16);
    ctu_expect_rc(sysfs.sriov_numvfs(pf0, count), IBNM_SUCCESS);
    ctu_expect(count == 2);

    ctu_expect_rc(sysfs.set_sriov_numvfs(pf1, 4), IBNM_SUCCESS);
    ctu_expect_str(tree.read(tree.pci_path(pf1) + "/sriov_numvfs"), "4");
    ctu_expect_rc(sysfs.sriov_numvfs(pf1, count), IBNM_SUCCESS);
    ctu_expect(count == 4);

    // Control files are never created.
    ctu_expect(sysfs.set_sriov_numvfs(vf0, 1) != IBNM_SUCCESS);
    ctu_expect(sysfs.sriov_totalvfs(vf0, count) != IBNM_SUCCESS);

    ctu_expect(sysfs.is_pf(pf0));
    ctu_expect(!sysfs.is_vf(pf0));
    ctu_expect(sysfs.is_vf(vf1));

    std::string parent;
    ctu_expect_rc(sysfs.parent_pf(vf1, parent), IBNM_SUCCESS);
    ctu_expect_str(parent, pf0);
    ctu_expect(sysfs.parent_pf(pf0, parent) != IBNM_SUCCESS);
}

static void
test_list_vfs(void)
{
    ibnm_test_sysfs tree;
    tree.add_pci(pf0, 0, 16, 11);
    // Index order, not name order: virtfn10 sorts before virtfn2 by name.
    for (int i = 0; i < 11; ++i) {
        char vf[32];
        snprintf(vf, sizeof(vf), "0000:3c:%02x.0", 20 - i);
        tree.add_vf(pf0, i, vf);
    }
    ibnmi_sysfs sysfs(tree.root());

    std::vector<std::string> vfs;
    ctu_expect_rc(sysfs.list_vfs(pf0, vfs), IBNM_SUCCESS);
    ctu_expect(vfs.size() == 11);
    ctu_expect_str(vfs[0], "0000:3c:14.0");
    ctu_expect_str(vfs[2], "0000:3c:12.0");
    ctu_expect_str(vfs[10], "0000:3c:0a.0");

    ctu_expect_rc(sysfs.list_vfs(pf1, vfs), IBNM_ERR_FILE_IO);
}

static void
test_find_device_by_pci(void)
{
    ibnm_test_sysfs tree;
    build_host(tree);
    ibnmi_sysfs sysfs(tree.root());

    std::string name;
    ctu_expect_rc(sysfs.find_device_by_pci(vf0, name), IBNM_SUCCESS);
    ctu_expect_str(name, "mlx5_2");
    ctu_expect_rc(
        sysfs.find_device_by_pci("0000:ff:00.0", name), IBNM_ERR_NOT_FOUND
    );
}

static void
test_netdevs(void)
{
    ibnm_test_sysfs tree;
    build_host(tree);
    tree.add_netdev(pf1, "ib1", false);
    ibnmi_sysfs sysfs(tree.root());

    ctu_expect(sysfs.netdevs("mlx5_0").size() == 1);
    ctu_expect(sysfs.netdevs("mlx5_3").empty());
    ctu_expect(sysfs.netdevs("mlx5_42").empty());

    ctu_expect(sysfs.netdev_present("ib0"));
    ctu_expect(!sysfs.netdev_present("ib1"));
    ctu_expect(!sysfs.netdev_present("eth7"));
}

int
main(void)
{
    ctu_run(test_missing_class_dir);
    ctu_run(test_list_devices);
    ctu_run(test_device_info);
    ctu_run(test_sriov_accessors);
    ctu_run(test_list_vfs);
    ctu_run(test_find_device_by_pci);
    ctu_run(test_netdevs);
    return EXIT_SUCCESS;
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
