#pragma once

#include "option.h"
#include "cluster_types.h"
#include "node_status_aggregator.h"
#include "quorum_evaluator.h"

class TopologyResolver;

// Public status query: resolves the topology, probes every member and classifies the cluster.
class ClusterMonitor {
private:
    TopologyResolver& resolver;
    NodeStatusAggregator aggregator;
    QuorumEvaluator evaluator;

public:
    ClusterMonitor(TopologyResolver& resolver, StatusProbe& probe, const QuorumEvaluator& evaluator);

    Option<cluster_verdict_t> get_cluster_status();
};
