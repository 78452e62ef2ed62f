#pragma once

#include <string>
#include "option.h"
#include "cluster_types.h"

class Config;
class TopologyResolver;
class StatusProbe;
class ConsensusStore;
class ClusterAgent;
class ProxyBackends;
class ServiceManager;

/**
 * Topology changing operations. Every operation resolves the topology afresh and checks all of its
 * preconditions before issuing the first mutation, so a rejected call leaves the cluster untouched.
 */
class MembershipController {
private:
    const Config& config;
    TopologyResolver& resolver;
    StatusProbe& probe;
    ConsensusStore& store;
    ClusterAgent& agent;
    ProxyBackends& backends;
    ServiceManager& services;
    sleep_fn_t sleep_fn;

    Option<bool> restart_dependent_services();

    Option<bool> remove_consensus_member(const node_address_t& address);

public:
    MembershipController(const Config& config, TopologyResolver& resolver, StatusProbe& probe,
                         ConsensusStore& store, ClusterAgent& agent, ProxyBackends& backends,
                         ServiceManager& services, sleep_fn_t sleep_fn = sleep_ms);

    // Adds a running database node to the proxy of a client node. Database nodes join at install time.
    Option<bool> add(const node_address_t& address);

    Option<bool> remove(const node_address_t& address);

    // Asks the HA agent to rebuild a replica from the primary. Does not wait for the rebuild.
    Option<bool> reinit(const node_address_t& address);

    // Switches the primary over to `address` and waits for the topology to reflect it. Not seeing the
    // change within the poll budget is only logged: the switchover may have completed and moved on again.
    Option<bool> promote(const node_address_t& address);

    // Makes sure the access-control list lets `address` connect as a cluster member.
    Option<bool> grant_access(const node_address_t& address);
};
