#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "option.h"
#include "cluster_types.h"
#include "command_runner.h"

class Config;

/**
 * Narrow interface over the consensus store that records cluster membership and the HA agent's
 * dynamic configuration. Text outputs are returned unparsed: interpreting them is the topology layer's job.
 */
class ConsensusStore {
public:
    virtual ~ConsensusStore() = default;

    // Output of the store's cluster health check against the local member. Fails only when the
    // check itself could not be run.
    virtual Option<std::string> cluster_health() = 0;

    // One line per member: `<id>: name=... peerURLs=... clientURLs=... isLeader=...`
    virtual Option<std::string> member_list() = 0;

    // Removal goes through the local member only, as the removed node may be unreachable.
    virtual Option<bool> remove_member(const std::string& member_id) = 0;

    virtual Option<std::string> get_key(const std::string& key, bool local_only) = 0;

    virtual Option<bool> set_key(const std::string& key, const std::string& value, bool local_only) = 0;

    // Whether the store has authentication enabled. Retries while the store is not reachable and
    // fails with CONSENSUS_NOT_READY once the attempts are exhausted.
    virtual Option<bool> requires_auth() = 0;
};

class EtcdConsensusStore: public ConsensusStore {
private:
    const Config& config;
    CommandRunner& runner;
    sleep_fn_t sleep_fn;

    command_t etcdctl_command(const std::vector<std::string>& args, bool local_only,
                              const std::string& username) const;

    Option<std::string> run_checked(const command_t& command);

public:
    // etcd exit code for errors reported by the cluster, authentication failures among them
    static constexpr int EXIT_CLUSTER_ERROR = 4;

    EtcdConsensusStore(const Config& config, CommandRunner& runner, sleep_fn_t sleep_fn = sleep_ms);

    Option<std::string> cluster_health() override;

    Option<std::string> member_list() override;

    Option<bool> remove_member(const std::string& member_id) override;

    Option<std::string> get_key(const std::string& key, bool local_only) override;

    Option<bool> set_key(const std::string& key, const std::string& value, bool local_only) override;

    Option<bool> requires_auth() override;

    std::string endpoints(bool local_only) const;
};
