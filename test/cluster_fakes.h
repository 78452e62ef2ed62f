#pragma once

#include <algorithm>
#include <deque>
#include <map>
#include <string>
#include <vector>
#include "cluster_agent.h"
#include "cluster_errors.h"
#include "command_runner.h"
#include "consensus_store.h"
#include "proxy_backends.h"
#include "service_manager.h"
#include "status_probe.h"
#include "topology_resolver.h"

/*
  Hand-written stand-ins for the narrow interfaces the cluster logic talks to. Each fake records the
  calls that would have mutated the cluster so tests can assert on them.
*/

inline raw_agent_status_t agent_status(const std::string& state, int64_t timeline,
                                       std::optional<int64_t> location,
                                       std::optional<int64_t> replayed_location = std::nullopt) {
    raw_agent_status_t status;
    status.state = state;
    status.timeline = timeline;
    status.log_position = location;
    status.replayed_position = replayed_location;
    return status;
}

inline raw_consensus_status_t consensus_status(ConsensusRole role) {
    raw_consensus_status_t status;
    status.role = role;
    status.state = (role == ConsensusRole::LEADER) ? "StateLeader" :
                   (role == ConsensusRole::FOLLOWER) ? "StateFollower" : "StateCandidate";
    return status;
}

class FakeStatusProbe: public StatusProbe {
public:
    std::map<node_address_t, raw_agent_status_t> agent_statuses;
    std::map<node_address_t, raw_consensus_status_t> consensus_statuses;
    std::vector<node_address_t> probed_agents;

    std::optional<raw_agent_status_t> probe_agent(const node_address_t& address) override {
        if(address.empty()) {
            return std::nullopt;
        }

        probed_agents.push_back(address);

        auto it = agent_statuses.find(address);
        if(it == agent_statuses.end()) {
            return std::nullopt;
        }

        return it->second;
    }

    std::optional<raw_consensus_status_t> probe_consensus(const node_address_t& address) override {
        auto it = consensus_statuses.find(address);
        if(it == consensus_statuses.end()) {
            return std::nullopt;
        }

        return it->second;
    }
};

class FakeConsensusStore: public ConsensusStore {
public:
    std::string health = "cluster is healthy";
    std::string members;
    bool members_fail = false;
    std::string blob;
    std::vector<Option<bool>> auth_results;

    std::vector<std::string> removed_members;
    std::vector<std::pair<std::string, std::string>> set_keys;

    size_t mutation_count() const {
        return removed_members.size() + set_keys.size();
    }

    Option<std::string> cluster_health() override {
        return Option<std::string>(health);
    }

    Option<std::string> member_list() override {
        if(members_fail) {
            return Option<std::string>(cluster_error::COMMAND_FAILED, "etcdctl failed");
        }

        return Option<std::string>(members);
    }

    Option<bool> remove_member(const std::string& member_id) override {
        removed_members.push_back(member_id);
        return Option<bool>(true);
    }

    Option<std::string> get_key(const std::string& key, bool local_only) override {
        return Option<std::string>(blob);
    }

    Option<bool> set_key(const std::string& key, const std::string& value, bool local_only) override {
        set_keys.emplace_back(key, value);
        blob = value;
        return Option<bool>(true);
    }

    Option<bool> requires_auth() override {
        if(auth_results.empty()) {
            return Option<bool>(false);
        }

        return auth_results.front();
    }
};

class FakeClusterAgent: public ClusterAgent {
public:
    std::string dsn;
    std::vector<std::string> reinits;
    std::vector<std::string> switchovers;

    Option<std::string> primary_dsn() override {
        return Option<std::string>(dsn);
    }

    Option<bool> reinit(const std::string& member_name) override {
        reinits.push_back(member_name);
        return Option<bool>(true);
    }

    Option<bool> switchover(const std::string& candidate_name) override {
        switchovers.push_back(candidate_name);
        return Option<bool>(true);
    }
};

class FakeProxyBackends: public ProxyBackends {
public:
    std::vector<proxy_backend_t> backends;
    bool unreadable = false;
    std::vector<node_address_t> appended;
    std::vector<node_address_t> removed;

    Option<std::vector<proxy_backend_t>> list_backends() override {
        if(unreadable) {
            return Option<std::vector<proxy_backend_t>>(cluster_error::TOPOLOGY_UNAVAILABLE,
                                                        "Could not connect to proxy stats socket");
        }

        return Option<std::vector<proxy_backend_t>>(backends);
    }

    Option<bool> append_backend(const node_address_t& address) override {
        appended.push_back(address);
        return Option<bool>(true);
    }

    Option<bool> remove_backend(const node_address_t& address) override {
        removed.push_back(address);
        return Option<bool>(true);
    }
};

class FakeServiceManager: public ServiceManager {
public:
    std::vector<std::string> restarted;

    Option<bool> restart(const std::string& service_name) override {
        restarted.push_back(service_name);
        return Option<bool>(true);
    }
};

// Replays the given topologies in order; the last one repeats once the script runs out.
class ScriptedTopologyResolver: public TopologyResolver {
public:
    std::vector<cluster_topology_t> script;
    size_t calls = 0;

    Option<cluster_topology_t> resolve() override {
        const size_t index = std::min(calls, script.size() - 1);
        calls++;
        return Option<cluster_topology_t>(script[index]);
    }
};

class FakeCommandRunner: public CommandRunner {
public:
    std::deque<command_result_t> results;
    std::vector<command_t> commands;

    command_result_t run(const command_t& command) override {
        commands.push_back(command);

        if(results.empty()) {
            command_result_t result;
            result.exit_code = 0;
            return result;
        }

        command_result_t result = results.front();
        results.pop_front();
        return result;
    }
};

inline command_result_t command_result(int exit_code, const std::string& std_out, const std::string& std_err = "") {
    command_result_t result;
    result.exit_code = exit_code;
    result.std_out = std_out;
    result.std_err = std_err;
    return result;
}

inline cluster_topology_t topology(std::optional<node_address_t> primary, std::vector<node_address_t> replicas) {
    cluster_topology_t topo;
    topo.primary = primary;
    topo.replicas = replicas;
    return topo;
}
