#pragma once

#include <string>
#include "option.h"
#include "cluster_types.h"
#include "command_runner.h"

class Config;

// Name under which a node is registered as a consensus store member.
std::string consensus_member_name(const node_address_t& address);

// Name under which a node's HA agent identifies its database instance.
std::string agent_member_name(const node_address_t& address);

/**
 * Control surface of the local HA agent. Mutations are fire and forget: the agent carries them out
 * asynchronously and callers observe the result through the topology.
 */
class ClusterAgent {
public:
    virtual ~ClusterAgent() = default;

    // Connection string the agent has recorded for the current primary, e.g. `host=192.0.2.1 port=5432`
    virtual Option<std::string> primary_dsn() = 0;

    virtual Option<bool> reinit(const std::string& member_name) = 0;

    virtual Option<bool> switchover(const std::string& candidate_name) = 0;
};

class PatroniClusterAgent: public ClusterAgent {
private:
    const Config& config;
    CommandRunner& runner;

    Option<std::string> patronictl(const std::vector<std::string>& args);

public:
    PatroniClusterAgent(const Config& config, CommandRunner& runner);

    Option<std::string> primary_dsn() override;

    Option<bool> reinit(const std::string& member_name) override;

    Option<bool> switchover(const std::string& candidate_name) override;
};
