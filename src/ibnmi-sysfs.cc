/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-sysfs.cc
 */

#include "ibnmi-sysfs.h"
#include "ibnmi-utils.h"

namespace fs = std::filesystem;

static const std::string sys_class_infiniband = "/sys/class/infiniband";
static const std::string sys_class_net = "/sys/class/net";
static const std::string sys_bus_pci = "/sys/bus/pci/devices";

static bool
path_exists(
    const fs::path &p
) {
    std::error_code ec;
    return fs::exists(p, ec);
}

/**
 * Like path_exists(), but does not follow a trailing symlink.
 */
static bool
link_exists(
    const fs::path &p
) {
    std::error_code ec;
    const fs::file_status st = fs::symlink_status(p, ec);
    if (ec) return false;
    return fs::exists(st);
}

/**
 * Returns the sorted entry names of a directory.
 */
static int
dir_entries(
    const fs::path &dir,
    std::vector<std::string> &names
) {
    names.clear();
    try {
        for (const auto &entry : fs::directory_iterator(dir)) {
            names.push_back(entry.path().filename().string());
        }
    }
    catch (const fs::filesystem_error &e) {
        ibnmi_log_debug("{}", e.what());
        return IBNM_ERR_FILE_IO;
    }
    std::sort(names.begin(), names.end());
    return IBNM_SUCCESS;
}

ibnmi_sysfs::ibnmi_sysfs(void)
    : m_root(ibnmi_getenv(IBNMI_ENV_SYSFS_ROOT)) { }

ibnmi_sysfs::ibnmi_sysfs(
    const std::string &root
) : m_root(root) { }

const std::string &
ibnmi_sysfs::root(void) const
{
    return m_root;
}

std::string
ibnmi_sysfs::class_infiniband_path(void) const
{
    return m_root + sys_class_infiniband;
}

std::string
ibnmi_sysfs::class_net_path(void) const
{
    return m_root + sys_class_net;
}

std::string
ibnmi_sysfs::bus_pci_path(void) const
{
    return m_root + sys_bus_pci;
}

std::string
ibnmi_sysfs::m_pci_path(
    const std::string &pci_address
) const {
    return bus_pci_path() + "/" + pci_address;
}

int
ibnmi_sysfs::s_link_basename(
    const std::string &link,
    std::string &basename
) {
    std::error_code ec;
    const fs::path resolved = fs::canonical(link, ec);
    if (ec) return IBNM_ERR_NOT_FOUND;
    basename = resolved.filename().string();
    return IBNM_SUCCESS;
}

int
ibnmi_sysfs::list_devices(
    std::vector<ibnmi_topo_device> &devices
) const {
    devices.clear();

    const std::string ibpath = class_infiniband_path();
    if (!path_exists(ibpath)) {
        ibnmi_log_debug("{} does not exist, no IB devices", ibpath);
        return IBNM_SUCCESS;
    }

    std::vector<std::string> names;
    const int rc = dir_entries(ibpath, names);
    if (ibnmi_unlikely(rc != IBNM_SUCCESS)) {
        ibnmi_log_error("Cannot read {}", ibpath);
        return rc;
    }

    for (const auto &name : names) {
        ibnmi_topo_device info;
        const int irc = device_info(name, info);
        if (irc != IBNM_SUCCESS) {
            ibnmi_log_debug(
                "Skipping {}: {}", name, ibnm_strerr(irc)
            );
            continue;
        }
        devices.push_back(std::move(info));
    }
    return IBNM_SUCCESS;
}

int
ibnmi_sysfs::device_info(
    const std::string &name,
    ibnmi_topo_device &info
) const {
    const fs::path devpath = fs::path(class_infiniband_path()) / name;
    if (!path_exists(devpath)) return IBNM_ERR_NOT_FOUND;

    info = ibnmi_topo_device();
    info.name = name;

    std::string pci_address;
    int rc = s_link_basename((devpath / "device").string(), pci_address);
    if (rc == IBNM_SUCCESS) {
        info.pci_address = pci_address;
        const std::string pcipath = m_pci_path(pci_address);

        int numa = IBNM_NUMA_NODE_UNKNOWN;
        rc = ibnmi_file_read_int(pcipath + "/numa_node", numa);
        info.numa_node = (rc == IBNM_SUCCESS) ? numa : IBNM_NUMA_NODE_UNKNOWN;

        info.is_pf = is_pf(pci_address);
        info.is_vf = is_vf(pci_address);

        if (info.is_pf) {
            if (sriov_totalvfs(pci_address, info.sriov_totalvfs) != IBNM_SUCCESS) {
                info.sriov_totalvfs = 0;
            }
            if (sriov_numvfs(pci_address, info.sriov_numvfs) != IBNM_SUCCESS) {
                info.sriov_numvfs = 0;
            }
        }
        if (info.is_vf) {
            std::string parent;
            if (parent_pf(pci_address, parent) == IBNM_SUCCESS) {
                info.parent_pf = parent;
            }
        }
    }

    std::string guid;
    if (ibnmi_file_read((devpath / "node_guid").string(), guid) == IBNM_SUCCESS) {
        info.node_guid = guid;
    }

    const fs::path portspath = devpath / "ports";
    std::vector<std::string> ports;
    if (path_exists(portspath) && dir_entries(portspath, ports) == IBNM_SUCCESS) {
        for (const auto &port : ports) {
            int portno = 0;
            if (ibnmi_stoi(port, portno) != IBNM_SUCCESS) continue;

            std::string gid;
            const fs::path gidpath = portspath / port / "gids" / "0";
            if (ibnmi_file_read(gidpath.string(), gid) != IBNM_SUCCESS) continue;
            if (gid.empty()) continue;
            info.port_guids[portno] = gid;
        }
    }

    info.netdevs = netdevs(name);
    return IBNM_SUCCESS;
}

int
ibnmi_sysfs::sriov_totalvfs(
    const std::string &pci_address,
    int &count
) const {
    return ibnmi_file_read_int(m_pci_path(pci_address) + "/sriov_totalvfs", count);
}

int
ibnmi_sysfs::sriov_numvfs(
    const std::string &pci_address,
    int &count
) const {
    return ibnmi_file_read_int(m_pci_path(pci_address) + "/sriov_numvfs", count);
}

int
ibnmi_sysfs::set_sriov_numvfs(
    const std::string &pci_address,
    int count
) const {
    const std::string path = m_pci_path(pci_address) + "/sriov_numvfs";
    const int rc = ibnmi_file_write(path, std::to_string(count));
    if (ibnmi_unlikely(rc != IBNM_SUCCESS)) {
        ibnmi_log_error(
            "Setting sriov_numvfs={} for {} failed", count, pci_address
        );
    }
    return rc;
}

bool
ibnmi_sysfs::is_pf(
    const std::string &pci_address
) const {
    return path_exists(m_pci_path(pci_address) + "/sriov_totalvfs");
}

bool
ibnmi_sysfs::is_vf(
    const std::string &pci_address
) const {
    return link_exists(m_pci_path(pci_address) + "/physfn");
}

int
ibnmi_sysfs::parent_pf(
    const std::string &vf_pci_address,
    std::string &pf_pci_address
) const {
    const int rc = s_link_basename(
        m_pci_path(vf_pci_address) + "/physfn", pf_pci_address
    );
    if (rc != IBNM_SUCCESS) {
        ibnmi_log_debug("Cannot resolve physfn of {}", vf_pci_address);
    }
    return rc;
}

int
ibnmi_sysfs::list_vfs(
    const std::string &pf_pci_address,
    std::vector<std::string> &vfs
) const {
    vfs.clear();

    static const std::string prefix = "virtfn";
    const std::string pfpath = m_pci_path(pf_pci_address);

    std::vector<std::string> entries;
    const int rc = dir_entries(pfpath, entries);
    if (rc != IBNM_SUCCESS) return rc;

    std::vector<std::pair<int, std::string>> indexed;
    for (const auto &entry : entries) {
        if (entry.rfind(prefix, 0) != 0) continue;
        int index = 0;
        if (ibnmi_stoi(entry.substr(prefix.size()), index) != IBNM_SUCCESS) {
            continue;
        }
        std::string vf;
        if (s_link_basename(pfpath + "/" + entry, vf) != IBNM_SUCCESS) continue;
        indexed.emplace_back(index, vf);
    }
    std::sort(indexed.begin(), indexed.end());
    for (const auto &vf : indexed) {
        vfs.push_back(vf.second);
    }
    return IBNM_SUCCESS;
}

int
ibnmi_sysfs::find_device_by_pci(
    const std::string &pci_address,
    std::string &name
) const {
    std::vector<std::string> names;
    const int rc = dir_entries(class_infiniband_path(), names);
    if (rc != IBNM_SUCCESS) return rc;

    for (const auto &ibdev : names) {
        std::string resolved;
        const std::string link = class_infiniband_path() + "/" + ibdev + "/device";
        if (s_link_basename(link, resolved) != IBNM_SUCCESS) continue;
        if (resolved == pci_address) {
            name = ibdev;
            return IBNM_SUCCESS;
        }
    }
    return IBNM_ERR_NOT_FOUND;
}

std::vector<std::string>
ibnmi_sysfs::netdevs(
    const std::string &ibdev
) const {
    std::vector<std::string> names;
    const fs::path netpath = fs::path(class_infiniband_path()) / ibdev / "device" / "net";
    if (!path_exists(netpath)) return names;
    if (dir_entries(netpath, names) != IBNM_SUCCESS) names.clear();
    return names;
}

bool
ibnmi_sysfs::netdev_present(
    const std::string &netdev
) const {
    return link_exists(fs::path(class_net_path()) / netdev);
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
