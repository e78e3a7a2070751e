/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-config.cc
 */

#include "ibnmi-config.h"
#include "ibnmi-utils.h"

#include "cereal/archives/json.hpp"

bool
ibnmi_mtu_valid(
    int64_t mtu
) {
    switch (mtu) {
        case 256:
        case 512:
        case 1024:
        case 2048:
        case 4096:
            return true;
        default:
            return false;
    }
}

int
ibnmi_ib_config::normalize(void)
{
    return IBNM_SUCCESS;
}

int
ibnmi_ib_config::validate(
    std::string &reason
) const {
    reason.clear();

    if (pkey && (*pkey < 0x0001 || *pkey > 0xFFFF)) {
        reason = "invalid pkey " + std::to_string(*pkey) +
                 ", must be in range 0x0001-0xFFFF";
    }
    else if (traffic_class && (*traffic_class < 0 || *traffic_class > 255)) {
        reason = "invalid trafficClass " + std::to_string(*traffic_class) +
                 ", must be in range 0-255";
    }
    else if (mtu && !ibnmi_mtu_valid(*mtu)) {
        reason = "invalid IB MTU value: " + std::to_string(*mtu) +
                 ", must be one of 256, 512, 1024, 2048, 4096";
    }

    if (reason.empty()) return IBNM_SUCCESS;
    return IBNM_ERR_CONFIG;
}

using ibnmi_json_document = CEREAL_RAPIDJSON_NAMESPACE::Document;

/**
 * Loads an optional integer member. A missing or null member leaves value
 * unset; a member of any other type than integer throws.
 */
static void
load_optional(
    cereal::JSONInputArchive &archive,
    const ibnmi_json_document &document,
    const char *name,
    std::optional<int64_t> &value
) {
    value.reset();
    const auto member = document.FindMember(name);
    if (member == document.MemberEnd() || member->value.IsNull()) return;

    int64_t v = 0;
    archive(cereal::make_nvp(name, v));
    value = v;
}

int
ibnmi_ib_config_from_json(
    const std::string &json,
    ibnmi_ib_config &config
) {
    config = ibnmi_ib_config::defaults();
    if (ibnmi_strtrim(json).empty()) return IBNM_SUCCESS;

    try {
        ibnmi_json_document document;
        document.Parse(json.c_str());
        if (document.HasParseError()) {
            ibnmi_log_error("Malformed IB configuration: not valid JSON");
            return IBNM_ERR_CONFIG;
        }
        if (!document.IsObject()) {
            ibnmi_log_error("Malformed IB configuration: not a JSON object");
            return IBNM_ERR_CONFIG;
        }

        std::stringstream ss(json);
        cereal::JSONInputArchive iarchive(ss);
        load_optional(iarchive, document, "pkey", config.pkey);
        load_optional(iarchive, document, "trafficClass", config.traffic_class);
        load_optional(iarchive, document, "mtu", config.mtu);
    }
    catch (const cereal::Exception &e) {
        ibnmi_log_error("Malformed IB configuration: {}", e.what());
        config = ibnmi_ib_config::defaults();
        return IBNM_ERR_CONFIG;
    }
    return IBNM_SUCCESS;
}

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
