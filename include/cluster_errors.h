#pragma once

#include <cstdint>
#include <string>

/*
  Error codes carried by Option<T> across the library. Precondition failures are always reported
  before any mutation is issued against the cluster.
*/
namespace cluster_error {
    // consensus store or proxy table could not be read: retryable
    constexpr uint32_t TOPOLOGY_UNAVAILABLE = 1001;

    // caller's node role cannot serve the request: configuration error
    constexpr uint32_t ROLE_UNSUPPORTED = 1101;
    constexpr uint32_t WRONG_ROLE = 1102;

    constexpr uint32_t ALREADY_MEMBER = 1201;
    constexpr uint32_t NOT_A_MEMBER = 1202;
    constexpr uint32_t MEMBER_NOT_FOUND = 1203;

    constexpr uint32_t LAST_REPLICA = 1301;
    constexpr uint32_t CANNOT_REMOVE_PRIMARY = 1302;
    constexpr uint32_t CANNOT_REINIT_PRIMARY = 1303;
    constexpr uint32_t ALREADY_PRIMARY = 1304;

    constexpr uint32_t NODE_NOT_RESPONDING = 1401;

    // external command returned a non-zero exit code while mutating the cluster
    constexpr uint32_t COMMAND_FAILED = 1501;
    constexpr uint32_t CONSENSUS_NOT_READY = 1502;
    constexpr uint32_t MALFORMED_CONFIG_BLOB = 1503;

    constexpr uint32_t INVALID_CONFIG = 1601;

    std::string name(uint32_t code);
}
