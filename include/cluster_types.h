#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// IP or hostname of a cluster member; the join key across all node records
typedef std::string node_address_t;

// injectable so that retry and poll loops can run without wall-clock waits in tests
typedef std::function<void(uint32_t)> sleep_fn_t;

void sleep_ms(uint32_t duration_ms);

struct replication_peer_t {
    node_address_t peer_address;
    std::string sync_state;
};

// Status document served by a node's HA agent, parsed at the probe boundary.
struct raw_agent_status_t {
    std::string state;
    std::string role;
    std::optional<int64_t> timeline;
    std::optional<int64_t> log_position;
    std::optional<int64_t> replayed_position;
    std::vector<replication_peer_t> replication;

    static std::optional<raw_agent_status_t> parse(const std::string& body);
};

enum class ConsensusRole {
    LEADER,
    FOLLOWER,
    DEAD
};

struct raw_consensus_status_t {
    std::string state;
    ConsensusRole role = ConsensusRole::DEAD;

    static std::optional<raw_consensus_status_t> parse(const std::string& body);
};

enum class NodeStatusRole {
    LEADER,
    SYNC_REPLICA,
    ASYNC_REPLICA,
    UNKNOWN
};

// Normalized view of one member, rebuilt on every status query.
struct node_status_t {
    node_address_t address;
    NodeStatusRole role = NodeStatusRole::UNKNOWN;
    bool alive = false;
    std::optional<int64_t> log_position;
    std::optional<int64_t> timeline;
    ConsensusRole consensus_role = ConsensusRole::DEAD;
    std::vector<std::string> errors;

    // standbys this node reports as synchronous (meaningful on the primary only)
    std::vector<node_address_t> sync_replicas;

    // agent claims the primary role itself
    bool reports_primary = false;

    nlohmann::json to_json() const;
};

// Ordered: a higher value always dominates a lower one.
enum class ClusterStatus {
    HEALTHY = 0,
    DEGRADED = 1,
    DOWN = 2
};

struct cluster_verdict_t {
    ClusterStatus status = ClusterStatus::HEALTHY;
    std::vector<node_status_t> nodes;

    // cluster wide findings that do not belong to a single node, e.g. loss of consensus
    std::vector<std::string> messages;

    nlohmann::json to_json() const;
};

struct cluster_topology_t {
    std::optional<node_address_t> primary;
    std::vector<node_address_t> replicas;

    bool is_primary(const node_address_t& address) const {
        return primary.has_value() && primary.value() == address;
    }

    bool is_member(const node_address_t& address) const;
};

std::string to_string(ClusterStatus status);
std::string to_string(NodeStatusRole role);
std::string to_string(ConsensusRole role);

ClusterStatus worst_of(ClusterStatus a, ClusterStatus b);
