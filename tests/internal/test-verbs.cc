/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file test-verbs.cc
 */

#include "ibnmi-common.h" // IWYU pragma: keep
#include "ibnmi-verbs.h"

#include "common-test-utils.h"

#include <infiniband/verbs.h>

typedef struct speed_case_s {
    int speed;
    int width;
    char const *expected;
} speed_case_t;

static const speed_case_t speed_cases[] = {
    // EDR 4x
    {32,  2, "100Gb/s"},
    // QDR 1x
    {4,   1, "10Gb/s"},
    // HDR 4x
    {64,  2, "200Gb/s"},
    // NDR 8x
    {128, 4, "800Gb/s"},
    // FDR 12x
    {16,  8, "168Gb/s"},
    // SDR 1x
    {1,   1, "2Gb/s"},
    // Unknown speed code counts raw.
    {3,   2, "12Gb/s"},
    // Unknown width counts as one lane.
    {32,  3, "25Gb/s"}
};

static void
test_effective_speed(void)
{
    const int ncases = sizeof(speed_cases) / sizeof(speed_case_t);
    for (int i = 0; i < ncases; ++i) {
        const speed_case_t &sc = speed_cases[i];
        const std::string got = ibnmi_effective_speed(sc.speed, sc.width);
        printf("# speed=%d width=%d -> %s\n", sc.speed, sc.width, got.c_str());
        ctu_expect_str(got, sc.expected);
    }
}

static void
test_gid_string(void)
{
    ctu_expect_str(
        ibnmi_gid_string(std::vector<uint8_t>(16, 0)),
        "0000:0000:0000:0000:0000:0000:0000:0000"
    );

    const std::vector<uint8_t> gid = {
        0xfe, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x02, 0xc9, 0x03, 0x00, 0x0a, 0xbc, 0xde
    };
    ctu_expect_str(
        ibnmi_gid_string(gid), "fe80:0000:0000:0000:0002:c903:000a:bcde"
    );

    ctu_expect_str(ibnmi_gid_string(std::vector<uint8_t>()), "");
    ctu_expect_str(ibnmi_gid_string(std::vector<uint8_t>(8, 0xff)), "");
    ctu_expect_str(ibnmi_gid_string(std::vector<uint8_t>(17, 0)), "");
}

static void
test_guid_string(void)
{
    ctu_expect_str(ibnmi_guid_string(0), "0000000000000000");
    ctu_expect_str(ibnmi_guid_string(0x0002c90300a1b2c3ULL), "0002c90300a1b2c3");
    ctu_expect_str(ibnmi_guid_string(UINT64_MAX), "ffffffffffffffff");
}

static void
test_port_codes(void)
{
    ctu_expect(ibnmi_link_state(IBV_PORT_ACTIVE) == IBNM_LINK_STATE_ACTIVE);
    ctu_expect(ibnmi_link_state(IBV_PORT_DOWN) == IBNM_LINK_STATE_DOWN);
    ctu_expect(ibnmi_link_state(IBV_PORT_INIT) == IBNM_LINK_STATE_INIT);
    ctu_expect(ibnmi_link_state(IBV_PORT_ARMED) == IBNM_LINK_STATE_ARMED);
    ctu_expect(ibnmi_link_state(IBV_PORT_NOP) == IBNM_LINK_STATE_UNKNOWN);
    ctu_expect(ibnmi_link_state(99) == IBNM_LINK_STATE_UNKNOWN);

    ctu_expect_str(ibnmi_link_state_string(IBNM_LINK_STATE_ACTIVE), "Active");
    ctu_expect_str(ibnmi_link_state_string(IBNM_LINK_STATE_DOWN), "Down");
    ctu_expect_str(ibnmi_link_state_string(IBNM_LINK_STATE_UNKNOWN), "Unknown");

    ctu_expect(ibnmi_mtu_bytes(IBV_MTU_256) == 256);
    ctu_expect(ibnmi_mtu_bytes(IBV_MTU_4096) == 4096);
    ctu_expect(ibnmi_mtu_bytes(0) == 0);

    ctu_expect_str(
        ibnmi_link_layer_string(IBV_LINK_LAYER_INFINIBAND), "InfiniBand"
    );
    ctu_expect_str(ibnmi_link_layer_string(IBV_LINK_LAYER_ETHERNET), "Ethernet");
    ctu_expect_str(ibnmi_link_layer_string(42), "Unknown");
}

/**
 * Runs against whatever adapters this host has. Zero adapters is fine.
 */
static void
test_list_adapters(void)
{
    ibnmi_verbs verbs;
    std::vector<ibnmi_verbs_adapter> adapters;
    const int rc = verbs.list_adapters(adapters);
    if (rc != IBNM_SUCCESS) {
        printf("# list_adapters: %s, skipping\n", ibnm_strerr(rc));
        return;
    }
    printf("# found %zu adapter(s)\n", adapters.size());
    for (const auto &adapter : adapters) {
        ctu_expect(!adapter.name.empty());
        ctu_expect(int(adapter.ports.size()) <= adapter.nports);
        for (const auto &port : adapter.ports) {
            ctu_expect(port.port_num >= 1 && port.port_num <= adapter.nports);
            printf(
                "# %s port %d: %s\n", adapter.name.c_str(), port.port_num,
                ibnmi_effective_speed(
                    port.active_speed, port.active_width
                ).c_str()
            );
        }
    }
}

int
main(void)
{
    ctu_run(test_effective_speed);
    ctu_run(test_gid_string);
    ctu_run(test_guid_string);
    ctu_run(test_port_codes);
    ctu_run(test_list_adapters);
    return EXIT_SUCCESS;
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
