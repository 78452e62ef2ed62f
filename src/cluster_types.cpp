#include <algorithm>
#include <chrono>
#include <thread>
#include "cluster_types.h"
#include "logger.h"

namespace {
    std::optional<int64_t> get_optional_int(const nlohmann::json& obj, const char* key) {
        if(obj.is_object() && obj.count(key) != 0 && obj[key].is_number_integer()) {
            return obj[key].get<int64_t>();
        }

        return std::nullopt;
    }

    std::string get_string(const nlohmann::json& obj, const char* key) {
        if(obj.is_object() && obj.count(key) != 0 && obj[key].is_string()) {
            return obj[key].get<std::string>();
        }

        return "";
    }
}

std::optional<raw_agent_status_t> raw_agent_status_t::parse(const std::string& body) {
    nlohmann::json status_json;

    try {
        status_json = nlohmann::json::parse(body);
    } catch(const std::exception& e) {
        LOG(WARNING) << "Failed to parse DB status: " << e.what();
        return std::nullopt;
    }

    if(!status_json.is_object()) {
        LOG(WARNING) << "DB status is not a JSON object.";
        return std::nullopt;
    }

    raw_agent_status_t status;
    status.state = get_string(status_json, "state");
    status.role = get_string(status_json, "role");
    status.timeline = get_optional_int(status_json, "timeline");

    if(status_json.count("xlog") != 0 && status_json["xlog"].is_object()) {
        const nlohmann::json& xlog = status_json["xlog"];
        status.log_position = get_optional_int(xlog, "location");
        status.replayed_position = get_optional_int(xlog, "replayed_location");
    }

    if(status_json.count("replication") != 0 && status_json["replication"].is_array()) {
        for(const auto& peer_json: status_json["replication"]) {
            replication_peer_t peer;
            peer.peer_address = get_string(peer_json, "client_addr");
            peer.sync_state = get_string(peer_json, "sync_state");
            status.replication.push_back(peer);
        }
    }

    return status;
}

std::optional<raw_consensus_status_t> raw_consensus_status_t::parse(const std::string& body) {
    nlohmann::json status_json;

    try {
        status_json = nlohmann::json::parse(body);
    } catch(const std::exception& e) {
        LOG(WARNING) << "Failed to parse etcd status: " << e.what();
        return std::nullopt;
    }

    if(!status_json.is_object() || status_json.count("state") == 0 || !status_json["state"].is_string()) {
        LOG(WARNING) << "Etcd status has no `state` field.";
        return std::nullopt;
    }

    raw_consensus_status_t status;
    status.state = status_json["state"].get<std::string>();

    if(status.state == "StateLeader") {
        status.role = ConsensusRole::LEADER;
    } else if(status.state == "StateFollower") {
        status.role = ConsensusRole::FOLLOWER;
    } else {
        // candidates and unknown states do not count towards quorum
        status.role = ConsensusRole::DEAD;
    }

    return status;
}

void sleep_ms(const uint32_t duration_ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(duration_ms));
}

bool cluster_topology_t::is_member(const node_address_t& address) const {
    return is_primary(address) || std::find(replicas.begin(), replicas.end(), address) != replicas.end();
}

nlohmann::json node_status_t::to_json() const {
    nlohmann::json node_json;
    node_json["address"] = address;
    node_json["role"] = to_string(role);
    node_json["alive"] = alive;
    node_json["log_position"] = log_position.has_value() ? nlohmann::json(log_position.value()) : nlohmann::json();
    node_json["timeline"] = timeline.has_value() ? nlohmann::json(timeline.value()) : nlohmann::json();
    node_json["consensus_role"] = to_string(consensus_role);
    node_json["errors"] = errors;
    return node_json;
}

nlohmann::json cluster_verdict_t::to_json() const {
    nlohmann::json verdict_json;
    verdict_json["status"] = to_string(status);
    verdict_json["messages"] = messages;
    verdict_json["nodes"] = nlohmann::json::array();

    for(const auto& node: nodes) {
        verdict_json["nodes"].push_back(node.to_json());
    }

    return verdict_json;
}

std::string to_string(const ClusterStatus status) {
    switch(status) {
        case ClusterStatus::HEALTHY:
            return "HEALTHY";
        case ClusterStatus::DEGRADED:
            return "DEGRADED";
        case ClusterStatus::DOWN:
            return "DOWN";
    }

    return "DOWN";
}

std::string to_string(const NodeStatusRole role) {
    switch(role) {
        case NodeStatusRole::LEADER:
            return "leader";
        case NodeStatusRole::SYNC_REPLICA:
            return "sync_replica";
        case NodeStatusRole::ASYNC_REPLICA:
            return "async_replica";
        case NodeStatusRole::UNKNOWN:
            return "unknown";
    }

    return "unknown";
}

std::string to_string(const ConsensusRole role) {
    switch(role) {
        case ConsensusRole::LEADER:
            return "leader";
        case ConsensusRole::FOLLOWER:
            return "follower";
        case ConsensusRole::DEAD:
            return "dead";
    }

    return "dead";
}

ClusterStatus worst_of(const ClusterStatus a, const ClusterStatus b) {
    return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}
