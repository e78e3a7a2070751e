/* -*- Mode: C; c-basic-offset:4; indent-tabs-mode:nil -*- */
/*
 * Copyright (c) 2025-2026 The ibnm Authors
 *                         All rights reserved.
 *
 * This file is part of the ibnm project. See the LICENSE file at the
 * top-level directory of this distribution.
 */

/**
 * @file ibnm.h
 */

#ifndef IBNM_H
#define IBNM_H

#ifdef __cplusplus
extern "C" {
#endif

/** Convenience definition. */
#define IBNM 1

/**
 * This number is updated to (X<<16)+(Y<<8)+Z
 * when a release X.Y.Z modifies the API.
 */
#define IBNM_API_VERSION 0x00000100

/**
 * Return codes.
 */
enum {
    IBNM_SUCCESS = 0,
    IBNM_SUCCESS_ALREADY_DONE,
    IBNM_SUCCESS_SHUTDOWN,
    IBNM_ERR,
    IBNM_ERR_ENV,
    IBNM_ERR_INTERNAL,
    IBNM_ERR_FILE_IO,
    IBNM_ERR_SYS,
    IBNM_ERR_OOR,
    IBNM_ERR_INVLD_ARG,
    IBNM_ERR_HWLOC,
    IBNM_ERR_VERBS,
    IBNM_ERR_NOT_SUPPORTED,
    IBNM_ERR_NOT_FOUND,
    /** Configuration rejected by validation. */
    IBNM_ERR_CONFIG,
    /** Request exceeds a hardware capacity. */
    IBNM_ERR_CAPACITY,
    IBNM_ERR_TIMEOUT,
    IBNM_ERR_CANCELED,
    /** Namespace move failed. */
    IBNM_ERR_NETNS,
    /** Malformed hook payload. */
    IBNM_ERR_PAYLOAD
};

/**
 * Kind of an adapter port.
 */
typedef enum {
    IBNM_PORT_KIND_PF = 0,
    IBNM_PORT_KIND_VF
} ibnm_port_kind_t;

/**
 * Logical link state of an adapter port.
 */
typedef enum {
    IBNM_LINK_STATE_UNKNOWN = 0,
    IBNM_LINK_STATE_DOWN,
    IBNM_LINK_STATE_INIT,
    IBNM_LINK_STATE_ARMED,
    IBNM_LINK_STATE_ACTIVE
} ibnm_link_state_t;

/**
 * NUMA node value used when affinity is unknown.
 */
#define IBNM_NUMA_NODE_UNKNOWN (-1)

/**
 * Returns a description of the provided return code.
 */
const char *
ibnm_strerr(int ec);

#ifdef __cplusplus
}
#endif

#endif

/*
 * vim: ft=cpp ts=4 sts=4 sw=4 expandtab
 */
