/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-sysfs.h
 *
 * Reads InfiniBand and SR-IOV topology from sysfs.
 */

#ifndef IBNMI_SYSFS_H
#define IBNMI_SYSFS_H

#include "ibnmi-common.h"

/**
 * Topology record for one InfiniBand device, as seen through sysfs.
 */
struct ibnmi_topo_device {
    /** IB device name (e.g., mlx5_0). */
    std::string name;
    /** PCI bus address (e.g., 0000:3b:00.0). Empty if unresolved. */
    std::string pci_address;
    /** NUMA node affinity. */
    int numa_node = IBNM_NUMA_NODE_UNKNOWN;
    /** Physical function: has an sriov_totalvfs attribute. */
    bool is_pf = false;
    /** Virtual function: has a physfn link. */
    bool is_vf = false;
    /** Total VF capacity (PFs only). */
    int sriov_totalvfs = 0;
    /** Currently enabled VFs (PFs only). */
    int sriov_numvfs = 0;
    /** PCI address of the parent PF (VFs only). */
    std::string parent_pf;
    /** Associated network interface names. */
    std::vector<std::string> netdevs;
    /** Node GUID, as exposed by the kernel. */
    std::string node_guid;
    /** Port number to GID index 0. */
    std::map<int, std::string> port_guids;
};

/**
 * Topology reader. All paths are resolved relative to a root so the same
 * code runs against the host's /sys or a relocated copy of it.
 */
struct ibnmi_sysfs {
private:
    /** Prefix prepended to every /sys path. */
    std::string m_root;
    /** */
    std::string
    m_pci_path(
        const std::string &pci_address
    ) const;
    /** Returns the last path component of the resolved link. */
    static int
    s_link_basename(
        const std::string &link,
        std::string &basename
    );
public:
    /** Constructor. Root defaults to the value of IBNM_SYSFS_ROOT. */
    ibnmi_sysfs(void);
    /** Constructor. */
    explicit ibnmi_sysfs(
        const std::string &root
    );
    /** */
    const std::string &
    root(void) const;
    /** */
    std::string
    class_infiniband_path(void) const;
    /** */
    std::string
    class_net_path(void) const;
    /** */
    std::string
    bus_pci_path(void) const;
    /**
     * Lists all InfiniBand devices, sorted by name. Devices whose details
     * cannot be read are skipped. A host without an infiniband class yields
     * an empty list, not an error.
     */
    int
    list_devices(
        std::vector<ibnmi_topo_device> &devices
    ) const;
    /**
     * Reads everything sysfs knows about a single IB device.
     */
    int
    device_info(
        const std::string &name,
        ibnmi_topo_device &info
    ) const;
    /** */
    int
    sriov_totalvfs(
        const std::string &pci_address,
        int &count
    ) const;
    /** */
    int
    sriov_numvfs(
        const std::string &pci_address,
        int &count
    ) const;
    /**
     * Writes sriov_numvfs. Failure is always reported to the caller.
     */
    int
    set_sriov_numvfs(
        const std::string &pci_address,
        int count
    ) const;
    /** */
    bool
    is_pf(
        const std::string &pci_address
    ) const;
    /** */
    bool
    is_vf(
        const std::string &pci_address
    ) const;
    /** */
    int
    parent_pf(
        const std::string &vf_pci_address,
        std::string &pf_pci_address
    ) const;
    /**
     * Lists the PCI addresses of the VFs under a PF, ordered by VF index.
     */
    int
    list_vfs(
        const std::string &pf_pci_address,
        std::vector<std::string> &vfs
    ) const;
    /**
     * Resolves the IB device name bound to the given PCI address.
     */
    int
    find_device_by_pci(
        const std::string &pci_address,
        std::string &name
    ) const;
    /**
     * Lists the network interfaces of an IB device that are visible in the
     * caller's network namespace.
     */
    std::vector<std::string>
    netdevs(
        const std::string &ibdev
    ) const;
    /**
     * Returns whether the interface is visible in the caller's network
     * namespace.
     */
    bool
    netdev_present(
        const std::string &netdev
    ) const;
};

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
