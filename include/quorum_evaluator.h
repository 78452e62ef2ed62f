#pragma once

#include <vector>
#include "cluster_types.h"

class Config;

/**
 * Classifies cluster health from the aggregated member statuses.
 *
 * Checks run in a fixed order and can only raise the status:
 *   1. primary unresolved                         -> DOWN
 *   2. primary not running                        -> DOWN
 *   3. primary reports no synchronous standby     -> DOWN
 *   4. consensus store: leader count != 1         -> DOWN
 *      followers below floor(members / 2)         -> DOWN
 *      followers below the replica count          -> DEGRADED
 *   5. sync replica behind the primary            -> DOWN
 *   6. async replica on another timeline          -> DEGRADED (lag above the threshold is only reported)
 *   7. replica claiming to be primary             -> reported only
 */
class QuorumEvaluator {
private:
    float lag_threshold_mib;

    static void raise(cluster_verdict_t& verdict, ClusterStatus status) {
        verdict.status = worst_of(verdict.status, status);
    }

    void check_consensus(const std::vector<const node_status_t*>& members, size_t replica_count,
                         cluster_verdict_t& verdict) const;

    void check_replica(const node_status_t& primary, node_status_t& replica, cluster_verdict_t& verdict) const;

public:
    explicit QuorumEvaluator(const Config& config);

    explicit QuorumEvaluator(float lag_threshold_mib);

    // `primary` carries an empty address when no primary could be resolved.
    cluster_verdict_t evaluate(const node_status_t& primary, const std::vector<node_status_t>& replicas) const;

    static std::string format_lag(double lag_mib);
};
