/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-hwloc.h
 *
 * Host locality of PCI devices, from the hwloc topology.
 */

#ifndef IBNMI_HWLOC_H
#define IBNMI_HWLOC_H

#include "ibnmi-common.h"

#include "hwloc.h"

/**
 * CPUs and NUMA nodes closest to a PCI device.
 */
struct ibnmi_hwloc_locality {
    /** List-formatted CPU set (e.g., 0-15,32-47). */
    std::string cpulist;
    /** List-formatted NUMA node set. */
    std::string nodeset;
};

/**
 * Wraps an hwloc topology loaded with PCI devices.
 */
struct ibnmi_hwloc {
private:
    /** The cached node topology. */
    hwloc_topology_t m_topo = nullptr;
public:
    /** Constructor. */
    ibnmi_hwloc(void) = default;
    /** Destructor. */
    ~ibnmi_hwloc(void);
    /** */
    ibnmi_hwloc(const ibnmi_hwloc &) = delete;
    /** */
    void
    operator=(const ibnmi_hwloc &) = delete;
    /** Initializes the topology. */
    int
    topology_init(void);
    /** Loads the host topology, keeping PCI devices. */
    int
    topology_load(void);
    /** */
    hwloc_topology_t
    topology(void)
    {
        return m_topo;
    }
    /** Returns the list-formatted string of the given bitmap. */
    static std::string
    bitmap_list_string(
        hwloc_const_bitmap_t bitmap
    );
    /**
     * Looks up the PCI device with the given bus id and returns the locality
     * of its closest non-I/O ancestor. Returns IBNM_ERR_NOT_FOUND if hwloc
     * does not know the device.
     */
    int
    pci_locality(
        const std::string &busid,
        ibnmi_hwloc_locality &locality
    );
};

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
