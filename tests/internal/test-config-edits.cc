/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file test-config-edits.cc
 */

#include "ibnmi-common.h" // IWYU pragma: keep
#include "ibnmi-config.h"
#include "ibnmi-edits.h"

#include "common-test-utils.h"

static const std::string hook_path = "/opt/ibnm/bin/ibnm-plugin";

static void
test_config_defaults(void)
{
    ibnmi_ib_config config;
    ctu_expect_rc(ibnmi_ib_config_from_json("", config), IBNM_SUCCESS);
    ctu_expect(!config.pkey && !config.traffic_class && !config.mtu);
    ctu_expect_rc(ibnmi_ib_config_from_json("  \n", config), IBNM_SUCCESS);
    ctu_expect_rc(ibnmi_ib_config_from_json("{}", config), IBNM_SUCCESS);
    ctu_expect(!config.pkey && !config.traffic_class && !config.mtu);

    std::string reason;
    ctu_expect_rc(ibnmi_ib_config::defaults().validate(reason), IBNM_SUCCESS);
    ctu_expect(reason.empty());
}

static void
test_config_parse(void)
{
    ibnmi_ib_config config;
    ctu_expect_rc(
        ibnmi_ib_config_from_json(
            "{\"pkey\": 32769, \"trafficClass\": 106, \"mtu\": 4096}", config
        ),
        IBNM_SUCCESS
    );
    ctu_expect(config.pkey && *config.pkey == 0x8001);
    ctu_expect(config.traffic_class && *config.traffic_class == 106);
    ctu_expect(config.mtu && *config.mtu == 4096);

    // Partial configurations leave the rest unset.
    ctu_expect_rc(
        ibnmi_ib_config_from_json("{\"mtu\": 2048}", config), IBNM_SUCCESS
    );
    ctu_expect(!config.pkey && !config.traffic_class);
    ctu_expect(*config.mtu == 2048);

    ctu_expect_rc(
        ibnmi_ib_config_from_json("{\"pkey\": \"0x8001\"}", config),
        IBNM_ERR_CONFIG
    );
    ctu_expect_rc(ibnmi_ib_config_from_json("{\"pkey\":", config), IBNM_ERR_CONFIG);
    ctu_expect(!config.pkey);

    // null means unset.
    ctu_expect_rc(
        ibnmi_ib_config_from_json(
            "{\"pkey\": null, \"trafficClass\": null, \"mtu\": 1024}", config
        ),
        IBNM_SUCCESS
    );
    ctu_expect(!config.pkey && !config.traffic_class);
    ctu_expect(config.mtu && *config.mtu == 1024);

    // Only objects are configurations.
    static const char *const not_objects[] = {
        "[1]", "[]", "42", "\"pkey\"", "null", "true"
    };
    for (const char *json : not_objects) {
        ctu_expect_rc(ibnmi_ib_config_from_json(json, config), IBNM_ERR_CONFIG);
        ctu_expect(!config.pkey && !config.traffic_class && !config.mtu);
    }
}

static void
test_config_validate(void)
{
    typedef struct bad_case_s {
        char const *json;
        char const *word;
    } bad_case_t;

    static const bad_case_t bad[] = {
        {"{\"pkey\": 0}", "pkey"},
        {"{\"pkey\": 65536}", "pkey"},
        {"{\"trafficClass\": 256}", "trafficClass"},
        {"{\"trafficClass\": -1}", "trafficClass"},
        {"{\"mtu\": 1500}", "1500"},
        {"{\"mtu\": 8192}", "8192"}
    };
    const size_t nbad = sizeof(bad) / sizeof(bad[0]);
    for (size_t i = 0; i < nbad; ++i) {
        ibnmi_ib_config config;
        ctu_expect_rc(ibnmi_ib_config_from_json(bad[i].json, config), IBNM_SUCCESS);
        std::string reason;
        ctu_expect_rc(config.validate(reason), IBNM_ERR_CONFIG);
        printf("# %s: %s\n", bad[i].json, reason.c_str());
        ctu_expect(reason.find(bad[i].word) != std::string::npos);
    }

    ibnmi_ib_config edge;
    edge.pkey = 0xFFFF;
    edge.traffic_class = 0;
    edge.mtu = 256;
    std::string reason;
    ctu_expect_rc(edge.validate(reason), IBNM_SUCCESS);

    ctu_expect(ibnmi_mtu_valid(1024));
    ctu_expect(!ibnmi_mtu_valid(0));
}

static void
test_plan_edits(void)
{
    ibnmi_ib_config config;
    config.pkey = 0x8001;

    std::vector<ibnmi_isolation_edit> edits;
    ctu_expect_rc(
        ibnmi_plan_edits(config, {"mlx5_1-port2"}, hook_path, edits),
        IBNM_SUCCESS
    );
    ctu_expect(edits.size() == 1);

    const ibnmi_isolation_edit &edit = edits[0];
    ctu_expect_str(edit.device, "mlx5_1-port2");
    ctu_expect_str(*edit.env_value("IB_DEVICE_0"), "mlx5_1-port2");
    ctu_expect_str(*edit.env_value("IB_DEVICE_0_IBDEV"), "mlx5_1");
    ctu_expect_str(*edit.env_value("IB_DEVICE_0_PORT"), "2");
    ctu_expect_str(*edit.env_value("IB_DEVICE_0_PKEY"), "0x8001");
    ctu_expect(edit.env_value("IB_DEVICE_0_TRAFFIC_CLASS") == nullptr);
    ctu_expect(edit.env_value("IB_DEVICE_0_MTU") == nullptr);

    const std::vector<std::string> env = edit.env_strings();
    ctu_expect(env.size() == 4);
    ctu_expect_str(env[0], "IB_DEVICE_0=mlx5_1-port2");
    ctu_expect_str(env[3], "IB_DEVICE_0_PKEY=0x8001");

    ctu_expect(edit.hook.has_value());
    ctu_expect_str(edit.hook->hook_name, "createRuntime");
    ctu_expect_str(edit.hook->path, hook_path);
    const std::vector<std::string> args = {
        hook_path, "move-netdev", "--ib-dev", "mlx5_1"
    };
    ctu_expect(edit.hook->args == args);
}

static void
test_plan_edits_many(void)
{
    ibnmi_ib_config config;
    config.pkey = 0x7f;
    config.traffic_class = 106;
    config.mtu = 4096;

    std::vector<ibnmi_isolation_edit> edits;
    ctu_expect_rc(
        ibnmi_plan_edits(
            config, {"mlx5_0-port1", "rdma0", "mlx5_3-port1"}, hook_path, edits
        ),
        IBNM_SUCCESS
    );
    ctu_expect(edits.size() == 3);

    ctu_expect_str(*edits[0].env_value("IB_DEVICE_0_PKEY"), "0x007F");
    ctu_expect_str(*edits[0].env_value("IB_DEVICE_0_TRAFFIC_CLASS"), "106");
    ctu_expect_str(*edits[0].env_value("IB_DEVICE_0_MTU"), "4096");

    // No separator: plain device variable, no hook.
    ctu_expect_str(*edits[1].env_value("IB_DEVICE_1"), "rdma0");
    ctu_expect(edits[1].env_value("IB_DEVICE_1_IBDEV") == nullptr);
    ctu_expect(edits[1].env_value("IB_DEVICE_1_PORT") == nullptr);
    ctu_expect(!edits[1].hook.has_value());

    ctu_expect_str(*edits[2].env_value("IB_DEVICE_2_IBDEV"), "mlx5_3");
    ctu_expect_str(edits[2].hook->args.at(3), "mlx5_3");

    std::string json;
    ctu_expect_rc(ibnmi_edits_json(edits, json), IBNM_SUCCESS);
    printf("%s\n", json.c_str());
    ctu_expect(json.find("\"edits\"") != std::string::npos);
    ctu_expect(json.find("IB_DEVICE_2_MTU=4096") != std::string::npos);
    ctu_expect(json.find("\"hookName\": \"createRuntime\"") != std::string::npos);
}

static void
test_plan_edits_rejected(void)
{
    ibnmi_ib_config config;
    config.mtu = 1500;

    std::vector<ibnmi_isolation_edit> edits(1);
    ctu_expect_rc(
        ibnmi_plan_edits(config, {"mlx5_0-port1"}, hook_path, edits),
        IBNM_ERR_CONFIG
    );
    ctu_expect(edits.empty());

    ctu_expect_rc(
        ibnmi_plan_edits(ibnmi_ib_config(), {}, hook_path, edits), IBNM_SUCCESS
    );
    ctu_expect(edits.empty());
}

int
main(void)
{
    ctu_run(test_config_defaults);
    ctu_run(test_config_parse);
    ctu_run(test_config_validate);
    ctu_run(test_plan_edits);
    ctu_run(test_plan_edits_many);
    ctu_run(test_plan_edits_rejected);
    return EXIT_SUCCESS;
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
