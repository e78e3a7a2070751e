/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-hwloc.cc
 */

#include "ibnmi-hwloc.h"
#include "ibnmi-utils.h"

ibnmi_hwloc::~ibnmi_hwloc(void)
{
    if (m_topo) hwloc_topology_destroy(m_topo);
}

int
ibnmi_hwloc::topology_init(void)
{
    const int rc = hwloc_topology_init(&m_topo);
    if (ibnmi_unlikely(rc != 0)) {
        ibnmi_log_error("hwloc_topology_init() failed");
        m_topo = nullptr;
        return IBNM_ERR_HWLOC;
    }
    return IBNM_SUCCESS;
}

int
ibnmi_hwloc::topology_load(void)
{
    if (ibnmi_unlikely(!m_topo)) return IBNM_ERR_INTERNAL;

    int rc = IBNM_SUCCESS;
    cstr_t ers = nullptr;
    do {
        rc = hwloc_topology_set_all_types_filter(
            m_topo, HWLOC_TYPE_FILTER_KEEP_IMPORTANT
        );
        if (ibnmi_unlikely(rc != 0)) {
            ers = "hwloc_topology_set_all_types_filter() failed";
            rc = IBNM_ERR_HWLOC;
            break;
        }
        // Adapters must be visible even if hwloc deems them unimportant.
        rc = hwloc_topology_set_type_filter(
            m_topo, HWLOC_OBJ_PCI_DEVICE, HWLOC_TYPE_FILTER_KEEP_ALL
        );
        if (ibnmi_unlikely(rc != 0)) {
            ers = "hwloc_topology_set_type_filter() failed";
            rc = IBNM_ERR_HWLOC;
            break;
        }

        rc = hwloc_topology_load(m_topo);
        if (ibnmi_unlikely(rc != 0)) {
            ers = "hwloc_topology_load() failed";
            rc = IBNM_ERR_HWLOC;
            break;
        }
        rc = IBNM_SUCCESS;
    } while (false);

    if (ibnmi_unlikely(ers)) {
        ibnmi_log_error("{} with rc={} ({})", ers, rc, ibnm_strerr(rc));
    }
    return rc;
}

std::string
ibnmi_hwloc::bitmap_list_string(
    hwloc_const_bitmap_t bitmap
) {
    char *iresult = nullptr;
    (void)hwloc_bitmap_list_asprintf(&iresult, bitmap);
    if (ibnmi_unlikely(!iresult)) throw ibnmi_runtime_error(IBNM_ERR_OOR);

    std::string result(iresult);
    free(iresult);
    return result;
}

int
ibnmi_hwloc::pci_locality(
    const std::string &busid,
    ibnmi_hwloc_locality &locality
) {
    if (ibnmi_unlikely(!m_topo)) return IBNM_ERR_INTERNAL;

    hwloc_obj_t pcidev = hwloc_get_pcidev_by_busidstring(m_topo, busid.c_str());
    if (!pcidev) {
        ibnmi_log_debug("hwloc does not know PCI device {}", busid);
        return IBNM_ERR_NOT_FOUND;
    }

    hwloc_obj_t ancestor = hwloc_get_non_io_ancestor_obj(m_topo, pcidev);
    if (ibnmi_unlikely(!ancestor || !ancestor->cpuset)) {
        return IBNM_ERR_HWLOC;
    }
    try {
        locality.cpulist = bitmap_list_string(ancestor->cpuset);
        locality.nodeset = ancestor->nodeset ?
            bitmap_list_string(ancestor->nodeset) : std::string();
    }
    ibnmi_catch_and_return();
    return IBNM_SUCCESS;
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
