/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnm-plugin.cc
 *
 * Implements the ibnm node plugin. The same binary is re-invoked by the
 * container runtime as its own namespace hook helper.
 */

#include "ibnmi-utils.h"
#include "ibnmi-hookmsg.h"
#include "ibnmi-hwloc.h"
#include "ibnmi-profile.h"

#include <iostream>
#include <pthread.h>

static const std::string app_name = "ibnm-plugin";

using option_help = std::map<std::string, std::string>;

/**
 * Parsed command line.
 */
struct ibnm_plugin_args {
    /** Subcommand. */
    std::string cmd;
    /** */
    std::string node_name;
    /** */
    int num_vfs = 0;
    /** */
    bool no_provision = false;
    /** PF PCI address. */
    std::string pf;
    /** JSON-encoded device configuration. */
    std::string config;
    /** Allocated devices, in order. */
    std::vector<std::string> devices;
    /** */
    std::string ib_dev;
    /** */
    std::string netdev;
    /** Container pid, 0 if not given. */
    int pid = 0;
};

/**
 * Turns SIGINT and SIGTERM into a cancellation request.
 */
struct ibnm_signal_watch {
private:
    /** */
    std::thread m_thread;
    /** */
    sigset_t m_set;
public:
    /** Constructor. Must run before any other thread is started. */
    explicit ibnm_signal_watch(
        ibnmi_cancel &cancel
    ) {
        sigemptyset(&m_set);
        sigaddset(&m_set, SIGINT);
        sigaddset(&m_set, SIGTERM);
        sigaddset(&m_set, SIGUSR1);
        const int rc = pthread_sigmask(SIG_BLOCK, &m_set, nullptr);
        if (ibnmi_unlikely(rc != 0)) {
            throw ibnmi_runtime_error(IBNM_ERR_SYS);
        }
        m_thread = std::thread([this, &cancel]() {
            int sig = 0;
            while (sigwait(&m_set, &sig) == 0) {
                if (sig == SIGUSR1) return;
                ibnmi_log_info("Caught signal {}, canceling", sig);
                cancel.cancel();
                return;
            }
        });
    }
    /** Destructor. */
    ~ibnm_signal_watch(void)
    {
        // Wake up the watcher if no signal arrived.
        (void)pthread_kill(m_thread.native_handle(), SIGUSR1);
        m_thread.join();
    }
};

/**
 * Process-wide collaborators.
 */
struct ibnm_plugin {
    /** */
    ibnmi_cancel cancel;
    /** */
    ibnmi_sysfs sysfs;
    /** */
    ibnmi_verbs verbs;
    /** */
    ibnmi_sysfs_vf_control vf_control{sysfs};
    /** */
    ibnmi_exec_host_ops host_ops;
    /** */
    ibnmi_netns netns{host_ops};
    /** Selected once, at startup. */
    ibnmi_profile *profile = nullptr;
    /** */
    ibnm_plugin(void) = default;
    /** */
    ~ibnm_plugin(void)
    {
        ibnmi_profile_delete(&profile);
    }

    int
    create_profile(
        const ibnm_plugin_args &args,
        bool provision,
        bool exclusive_rdma
    ) {
        ibnmi_profile_cfg cfg;
        cfg.node_name = args.node_name;
        cfg.num_vfs = provision ? args.num_vfs : 0;
        cfg.hook_path = ibnmi_getenv(IBNMI_ENV_HOOK_PATH, IBNMI_DEFAULT_HOOK_PATH);
        cfg.cancel = &cancel;
        cfg.query = &verbs;
        cfg.sysfs = &sysfs;
        cfg.vf_control = &vf_control;
        cfg.netns = exclusive_rdma ? &netns : nullptr;
        return ibnmi_profile_new(IBNMI_PROFILE_IB, cfg, &profile);
    }
};

static void
show_usage(
    const option_help &opt_help
) {
    ibnmi_log_info(
        "\nUsage:\n"
        "{} COMMAND [OPTIONS]\n"
        "Commands:\n"
        "  enumerate       Provision VFs, discover devices, print them as JSON.\n"
        "  provision       Set the VF count of one PF.\n"
        "  destroy-vfs     Remove all VFs of one PF.\n"
        "  prepare         Validate a config and print per-device edits.\n"
        "  move-netdev     Container runtime hook (container state on stdin).\n"
        "  restore-netdev  Move an interface back to the host.\n"
        "  info            Print host locality of every device.\n"
        "Options:"
        , app_name
    );

    for (auto &i : opt_help) {
        ibnmi_log_info("  {} {}", i.first, i.second);
    }
}

static int
parse_args(
    int argc,
    char **argv,
    ibnm_plugin_args &args
) {
    enum {
        FLOOR = 256,
        HELP,
        NODE_NAME,
        NUM_VFS,
        NO_PROVISION,
        PF,
        CONFIG,
        DEVICE,
        IB_DEV,
        NETDEV,
        PID
    };

    const cstr_t opts = "";
    const struct option lopts[] = {
        {"help"            , no_argument,       nullptr, HELP                 },
        {"node-name"       , required_argument, nullptr, NODE_NAME            },
        {"num-vfs"         , required_argument, nullptr, NUM_VFS              },
        {"no-provision"    , no_argument,       nullptr, NO_PROVISION         },
        {"pf"              , required_argument, nullptr, PF                   },
        {"config"          , required_argument, nullptr, CONFIG               },
        {"device"          , required_argument, nullptr, DEVICE               },
        {"ib-dev"          , required_argument, nullptr, IB_DEV               },
        {"netdev"          , required_argument, nullptr, NETDEV               },
        {"pid"             , required_argument, nullptr, PID                  },
        {nullptr           , 0,                 nullptr, 0                    }
    };
    static const option_help opt_help = {
        {"[--help]             ", "Show this message and exit."               },
        {"[--node-name NAME]   ", "Pool name (default: $NODE_NAME)."          },
        {"[--num-vfs COUNT]    ", "VFs per PF (default: $NUM_VFS or 0)."      },
        {"[--no-provision]     ", "Do not create VFs while enumerating."      },
        {"[--pf PCI]           ", "PCI address of a PF."                      },
        {"[--config JSON]      ", "Device configuration."                     },
        {"[--device NAME]      ", "Allocated device, may be repeated."        },
        {"[--ib-dev NAME]      ", "IB device to move into a container."       },
        {"[--netdev IF]        ", "Interface to move back to the host."       },
        {"[--pid PID]          ", "Container pid (default: from stdin)."      }
    };

    if (argc < 2) {
        show_usage(opt_help);
        return IBNM_ERR_INVLD_ARG;
    }
    args.cmd = argv[1];
    if (args.cmd == "--help" || args.cmd == "-help" || args.cmd == "help") {
        show_usage(opt_help);
        return IBNM_SUCCESS_SHUTDOWN;
    }
    // The hook invocation has a fixed shape, built by ibnmi_hook_move_netdev().
    if (args.cmd == IBNMI_HOOK_MOVE_NETDEV) {
        const std::vector<std::string> hargs(argv, argv + argc);
        const int rc = ibnmi_hook_parse_move_netdev(hargs, args.ib_dev);
        if (ibnmi_unlikely(rc != IBNM_SUCCESS)) {
            ibnmi_log_error(
                "{}: Malformed hook invocation: '{}'", app_name, ibnmi_join(hargs)
            );
        }
        return rc;
    }

    args.node_name = ibnmi_getenv(IBNMI_ENV_NODE_NAME);
    const std::string env_num_vfs = ibnmi_getenv(IBNMI_ENV_NUM_VFS);
    if (!env_num_vfs.empty()) {
        const int rc = ibnmi_stoi(env_num_vfs, args.num_vfs);
        if (ibnmi_unlikely(rc != IBNM_SUCCESS)) {
            ibnmi_log_error("Invalid {}={}", IBNMI_ENV_NUM_VFS, env_num_vfs);
            return rc;
        }
    }

    // Options follow the subcommand, which takes the place of argv[0].
    const int sargc = argc - 1;
    char **sargv = argv + 1;
    optind = 1;

    int opt;
    while (-1 != (opt = getopt_long_only(sargc, sargv, opts, lopts, nullptr))) {
        switch (opt) {
            case HELP:
                show_usage(opt_help);
                return IBNM_SUCCESS_SHUTDOWN;
            case NODE_NAME:
                args.node_name = optarg;
                break;
            case NUM_VFS: {
                const int rc = ibnmi_stoi(std::string(optarg), args.num_vfs);
                if (ibnmi_unlikely(rc != IBNM_SUCCESS)) return rc;
                break;
            }
            case NO_PROVISION:
                args.no_provision = true;
                break;
            case PF:
                args.pf = optarg;
                break;
            case CONFIG:
                args.config = optarg;
                break;
            case DEVICE:
                args.devices.push_back(optarg);
                break;
            case IB_DEV:
                args.ib_dev = optarg;
                break;
            case NETDEV:
                args.netdev = optarg;
                break;
            case PID: {
                const int rc = ibnmi_stoi(std::string(optarg), args.pid);
                if (ibnmi_unlikely(rc != IBNM_SUCCESS)) return rc;
                break;
            }
            default:
                show_usage(opt_help);
                return IBNM_ERR_INVLD_ARG;
        }
    }
    // Make sure no bogus options were provided.
    if (optind < sargc) {
        ibnmi_log_warn(
            "{}: Unrecognized option detected: \'{}\'",
            app_name, sargv[optind]
        );
        show_usage(opt_help);
        return IBNM_ERR_INVLD_ARG;
    }
    if (args.num_vfs < 0) {
        ibnmi_log_error("VF count must not be negative");
        return IBNM_ERR_INVLD_ARG;
    }
    return IBNM_SUCCESS;
}

/**
 * Fails with IBNM_ERR_INVLD_ARG if a required option is missing.
 */
static int
require(
    const std::string &value,
    const std::string &option
) {
    if (!value.empty()) return IBNM_SUCCESS;
    ibnmi_log_error("{} is required", option);
    return IBNM_ERR_INVLD_ARG;
}

static int
cmd_enumerate(
    ibnm_plugin &plugin,
    ibnm_plugin_args &args
) {
    if (args.node_name.empty()) {
        char host[HOST_NAME_MAX + 1] = {'\0'};
        if (gethostname(host, sizeof(host)) == 0) args.node_name = host;
    }
    int rc = require(args.node_name, "--node-name");
    if (rc != IBNM_SUCCESS) return rc;

    rc = plugin.create_profile(args, !args.no_provision, true);
    if (rc != IBNM_SUCCESS) return rc;

    ibnmi_resource_pool pool;
    rc = plugin.profile->enumerate(pool);
    if (rc != IBNM_SUCCESS) return rc;

    std::string json;
    rc = ibnmi_publish_json(pool, json);
    if (rc != IBNM_SUCCESS) return rc;

    std::cout << json << std::endl;
    return IBNM_SUCCESS;
}

static int
cmd_provision(
    ibnm_plugin &plugin,
    const ibnm_plugin_args &args
) {
    const int rc = require(args.pf, "--pf");
    if (rc != IBNM_SUCCESS) return rc;

    ibnmi_sriov sriov(plugin.vf_control, ibnmi_sriov_timing(), &plugin.cancel);
    return sriov.provision_vfs(args.pf, args.num_vfs);
}

static int
cmd_destroy_vfs(
    ibnm_plugin &plugin,
    const ibnm_plugin_args &args
) {
    const int rc = require(args.pf, "--pf");
    if (rc != IBNM_SUCCESS) return rc;

    ibnmi_sriov sriov(plugin.vf_control);
    return sriov.destroy_vfs(args.pf);
}

static int
cmd_prepare(
    ibnm_plugin &plugin,
    const ibnm_plugin_args &args
) {
    if (args.devices.empty()) {
        ibnmi_log_error("At least one --device is required");
        return IBNM_ERR_INVLD_ARG;
    }
    int rc = plugin.create_profile(args, false, false);
    if (rc != IBNM_SUCCESS) return rc;

    std::vector<ibnmi_isolation_edit> edits;
    rc = plugin.profile->apply_config(args.config, args.devices, edits);
    if (rc != IBNM_SUCCESS) return rc;

    std::string json;
    rc = ibnmi_edits_json(edits, json);
    if (rc != IBNM_SUCCESS) return rc;

    std::cout << json << std::endl;
    return IBNM_SUCCESS;
}

/**
 * Reads the container state the runtime writes to the hook's stdin.
 */
static int
read_container_pid(
    int &pid
) {
    std::string payload;
    int rc = ibnmi_read_all(std::cin, payload);
    if (ibnmi_unlikely(rc != IBNM_SUCCESS)) {
        ibnmi_log_error("Reading container state from stdin failed");
        return rc;
    }
    ibnmi_container_state state;
    rc = ibnmi_container_state_from_json(payload, state);
    if (rc != IBNM_SUCCESS) return rc;

    pid = state.pid;
    return IBNM_SUCCESS;
}

static int
cmd_move_netdev(
    ibnm_plugin &plugin,
    const ibnm_plugin_args &args
) {
    int rc = require(args.ib_dev, "--ib-dev");
    if (rc != IBNM_SUCCESS) return rc;

    int pid = 0;
    rc = read_container_pid(pid);
    if (rc != IBNM_SUCCESS) return rc;

    return ibnmi_move_netdev_hook(plugin.netns, plugin.sysfs, args.ib_dev, pid);
}

static int
cmd_restore_netdev(
    ibnm_plugin &plugin,
    const ibnm_plugin_args &args
) {
    int rc = require(args.netdev, "--netdev");
    if (rc != IBNM_SUCCESS) return rc;

    int pid = args.pid;
    if (pid == 0) {
        rc = read_container_pid(pid);
        if (rc != IBNM_SUCCESS) return rc;
    }
    return ibnmi_restore_netdev(plugin.netns, plugin.sysfs, args.netdev, pid);
}

static int
cmd_info(
    ibnm_plugin &plugin,
    const ibnm_plugin_args &args
) {
    int rc = plugin.create_profile(args, false, false);
    if (rc != IBNM_SUCCESS) return rc;

    ibnmi_resource_pool pool;
    rc = plugin.profile->enumerate(pool);
    if (rc != IBNM_SUCCESS) return rc;

    ibnmi_hwloc hwloc;
    rc = hwloc.topology_init();
    if (rc != IBNM_SUCCESS) return rc;
    rc = hwloc.topology_load();
    if (rc != IBNM_SUCCESS) return rc;

    auto *ibp = dynamic_cast<ibnmi_ib_profile *>(plugin.profile);
    if (ibnmi_unlikely(!ibp)) return IBNM_ERR_INTERNAL;

    ibnmi_log_info("{:<16} {:<4} {:<14} {:>4} {:<20} {}",
        "DEVICE", "KIND", "PCI", "NUMA", "CPUS", "NODES"
    );
    for (const auto &port : ibp->snapshot().ports()) {
        ibnmi_hwloc_locality loc;
        if (port.pci_address.empty() ||
            hwloc.pci_locality(port.pci_address, loc) != IBNM_SUCCESS) {
            loc.cpulist = "-";
            loc.nodeset = "-";
        }
        ibnmi_log_info("{:<16} {:<4} {:<14} {:>4} {:<20} {}",
            port.name, ibnmi_port_kind_string(port.kind),
            port.pci_address.empty() ? "-" : port.pci_address,
            port.numa_node, loc.cpulist, loc.nodeset
        );
    }
    return IBNM_SUCCESS;
}

static int
start(
    int argc,
    char **argv
) {
    try {
        ibnm_plugin_args args;
        int rc = parse_args(argc, argv, args);
        if (rc != IBNM_SUCCESS) {
            if (rc == IBNM_SUCCESS_SHUTDOWN) {
                rc = IBNM_SUCCESS;
            }
            return rc;
        }

        if (args.cmd == "move-netdev" || args.cmd == "restore-netdev") {
            // The container runtime does not keep hook output.
            ibnmi_logger::console_to_syslog();
        }

        ibnm_plugin plugin;
        ibnm_signal_watch watch(plugin.cancel);

        if (args.cmd == "enumerate") {
            rc = cmd_enumerate(plugin, args);
        }
        else if (args.cmd == "provision") {
            rc = cmd_provision(plugin, args);
        }
        else if (args.cmd == "destroy-vfs") {
            rc = cmd_destroy_vfs(plugin, args);
        }
        else if (args.cmd == "prepare") {
            rc = cmd_prepare(plugin, args);
        }
        else if (args.cmd == IBNMI_HOOK_MOVE_NETDEV) {
            rc = cmd_move_netdev(plugin, args);
        }
        else if (args.cmd == "restore-netdev") {
            rc = cmd_restore_netdev(plugin, args);
        }
        else if (args.cmd == "info") {
            rc = cmd_info(plugin, args);
        }
        else {
            ibnmi_log_error("{}: Unknown command '{}'", app_name, args.cmd);
            rc = IBNM_ERR_INVLD_ARG;
        }

        if (rc == IBNM_SUCCESS_ALREADY_DONE) rc = IBNM_SUCCESS;
        if (rc != IBNM_SUCCESS) {
            ibnmi_log_error("{} {} failed: {}", app_name, args.cmd, ibnm_strerr(rc));
        }
        return rc;
    }
    ibnmi_catch_and_return();
}

int
main(
    int argc,
    char **argv
) {
    const int rc = start(argc, argv);
    return (rc == IBNM_SUCCESS ? EXIT_SUCCESS : EXIT_FAILURE);
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
