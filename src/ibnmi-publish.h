/* -*- Mode: C++; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnmi-publish.h
 *
 * Maps adapter ports to published device attributes.
 */

#ifndef IBNMI_PUBLISH_H
#define IBNMI_PUBLISH_H

#include "ibnmi-common.h"
#include "ibnmi-fusion.h"

#include "cereal/cereal.hpp"
#include "cereal/types/string.hpp"
#include "cereal/types/vector.hpp"

/**
 * A published attribute value: either a string or a signed integer.
 */
struct ibnmi_attr_value {
private:
    /** */
    std::variant<std::string, int64_t> m_value;
public:
    /** Constructor. */
    ibnmi_attr_value(void) = default;
    /** Constructor. */
    explicit ibnmi_attr_value(
        const std::string &value
    ) : m_value(value) { }
    /** Constructor. */
    explicit ibnmi_attr_value(
        int64_t value
    ) : m_value(value) { }
    /** */
    bool
    is_int(void) const
    {
        return std::holds_alternative<int64_t>(m_value);
    }
    /** Returns the string value. Only valid if !is_int(). */
    const std::string &
    str(void) const
    {
        return std::get<std::string>(m_value);
    }
    /** Returns the integer value. Only valid if is_int(). */
    int64_t
    integer(void) const
    {
        return std::get<int64_t>(m_value);
    }

    template <class Archive>
    void
    save(
        Archive &archive
    ) const {
        if (is_int()) {
            archive(cereal::make_nvp("int", integer()));
        }
        else {
            archive(cereal::make_nvp("string", str()));
        }
    }
};

/**
 * Ordered attribute set of one published device.
 */
struct ibnmi_attributes {
    /** */
    std::vector<std::pair<std::string, ibnmi_attr_value>> items;
    /** Returns the named attribute, or nullptr. */
    const ibnmi_attr_value *
    find(
        const std::string &name
    ) const;

    template <class Archive>
    void
    save(
        Archive &archive
    ) const {
        for (const auto &item : items) {
            archive(cereal::make_nvp(item.first, item.second));
        }
    }
};

/**
 * One published unit.
 */
struct ibnmi_published_device {
    /** */
    std::string name;
    /** */
    ibnmi_attributes attributes;

    template <class Archive>
    void
    save(
        Archive &archive
    ) const {
        archive(
            cereal::make_nvp("name", name),
            cereal::make_nvp("attributes", attributes)
        );
    }
};

/**
 * All devices published by one node.
 */
struct ibnmi_resource_pool {
    /** Pool name, the node name. */
    std::string node;
    /** */
    std::vector<ibnmi_published_device> devices;

    template <class Archive>
    void
    save(
        Archive &archive
    ) const {
        archive(
            cereal::make_nvp("pool", node),
            cereal::make_nvp("devices", devices)
        );
    }
};

/**
 * Maps one adapter port to its published form.
 */
ibnmi_published_device
ibnmi_publish_port(
    const ibnmi_adapter_port &port
);

/**
 * Publishes every port of a snapshot under the node's pool. Fails with
 * IBNM_ERR_INTERNAL if two ports share a name.
 */
int
ibnmi_publish(
    const std::string &node,
    const ibnmi_snapshot &snapshot,
    ibnmi_resource_pool &pool
);

/**
 * Renders a pool as JSON.
 */
int
ibnmi_publish_json(
    const ibnmi_resource_pool &pool,
    std::string &json
);

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
