#include <iomanip>
#include <sstream>
#include "quorum_evaluator.h"
#include "pgquorum_config.h"
#include "logger.h"

QuorumEvaluator::QuorumEvaluator(const Config& config): lag_threshold_mib(config.get_lag_threshold_mib()) {

}

QuorumEvaluator::QuorumEvaluator(const float lag_threshold_mib): lag_threshold_mib(lag_threshold_mib) {

}

std::string QuorumEvaluator::format_lag(const double lag_mib) {
    std::ostringstream lag_stream;
    lag_stream << "Lag: " << std::fixed << std::setprecision(2) << lag_mib << "MiB";
    return lag_stream.str();
}

cluster_verdict_t QuorumEvaluator::evaluate(const node_status_t& primary,
                                            const std::vector<node_status_t>& replicas) const {
    cluster_verdict_t verdict;
    const bool primary_resolved = !primary.address.empty();

    if(primary_resolved) {
        verdict.nodes.push_back(primary);
    } else {
        LOG(ERROR) << "No master found.";
        verdict.messages.push_back("No master found");
        raise(verdict, ClusterStatus::DOWN);
    }

    verdict.nodes.insert(verdict.nodes.end(), replicas.begin(), replicas.end());

    if(!primary.alive) {
        raise(verdict, ClusterStatus::DOWN);
    }

    if(primary.sync_replicas.empty()) {
        // writes cannot be acknowledged without a synchronous standby
        LOG(ERROR) << "No synchronous replicas found.";
        verdict.messages.push_back("No synchronous replicas found");
        raise(verdict, ClusterStatus::DOWN);
    }

    std::vector<const node_status_t*> consensus_members;
    for(const auto& node: verdict.nodes) {
        consensus_members.push_back(&node);
    }

    check_consensus(consensus_members, replicas.size(), verdict);

    // replicas follow the primary entry in the node list
    const size_t first_replica = primary_resolved ? 1 : 0;
    for(size_t i = first_replica; i < verdict.nodes.size(); i++) {
        check_replica(primary, verdict.nodes[i], verdict);
    }

    return verdict;
}

void QuorumEvaluator::check_consensus(const std::vector<const node_status_t*>& members, const size_t replica_count,
                                      cluster_verdict_t& verdict) const {
    const size_t member_count = 1 + replica_count;
    const size_t majority_requirement = member_count / 2;

    size_t leaders = 0;
    size_t followers = 0;

    for(const node_status_t* member: members) {
        if(member->consensus_role == ConsensusRole::LEADER) {
            leaders++;
        } else if(member->consensus_role == ConsensusRole::FOLLOWER) {
            followers++;
        }
    }

    if(leaders != 1) {
        LOG(ERROR) << "Expected to find 1 etcd leader, but found " << leaders << ", cluster consensus lost.";
        verdict.messages.push_back("Expected 1 etcd leader, found " + std::to_string(leaders) +
                                   ", consensus lost");
        raise(verdict, ClusterStatus::DOWN);
    }

    if(followers < majority_requirement) {
        LOG(ERROR) << "Insufficient etcd followers found, cluster consensus lost.";
        verdict.messages.push_back("Insufficient etcd followers, consensus lost");
        raise(verdict, ClusterStatus::DOWN);
    } else if(followers < replica_count) {
        LOG(WARNING) << "Missing one or more etcd followers.";
        verdict.messages.push_back("Missing one or more etcd followers");
        raise(verdict, ClusterStatus::DEGRADED);
    }
}

void QuorumEvaluator::check_replica(const node_status_t& primary, node_status_t& replica,
                                    cluster_verdict_t& verdict) const {
    if(replica.role == NodeStatusRole::SYNC_REPLICA) {
        if(primary.log_position && replica.log_position &&
           replica.log_position.value() < primary.log_position.value()) {
            LOG(ERROR) << "Synchronous replica " << replica.address << " not in sync with master. "
                       << "Writes will be blocked until replica is in sync.";
            replica.errors.push_back("Out of sync");
            raise(verdict, ClusterStatus::DOWN);
        }
    } else {
        // a replica without a timeline is out of sync as well
        if(primary.timeline && replica.timeline != primary.timeline) {
            LOG(WARNING) << "Asynchronous replica " << replica.address << " not on same timeline as master.";
            replica.errors.push_back("Out of sync");
            raise(verdict, ClusterStatus::DEGRADED);
        }

        if(primary.log_position && replica.log_position) {
            const int64_t lag_bytes = primary.log_position.value() - replica.log_position.value();
            const double lag_mib = lag_bytes / 1024.0 / 1024.0;

            if(lag_mib > lag_threshold_mib) {
                LOG(WARNING) << "Asynchronous replica " << replica.address << " appears to be lagging excessively.";
                replica.errors.push_back(format_lag(lag_mib));
            }
        }
    }

    if(replica.reports_primary) {
        // only expected when a failover happens while the status is being collected
        LOG(ERROR) << "MULTIPLE MASTERS DETECTED! PLEASE RUN THIS STATUS COMMAND AGAIN. "
                   << "IF THIS ERROR OCCURS AGAIN THEN STOP ALL USERS OF THE DATABASE CLUSTER AND CONTACT SUPPORT!";
        replica.errors.push_back("EXTRA MASTER");
    }
}
