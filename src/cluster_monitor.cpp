#include "cluster_monitor.h"
#include "topology_resolver.h"
#include "logger.h"

ClusterMonitor::ClusterMonitor(TopologyResolver& resolver, StatusProbe& probe, const QuorumEvaluator& evaluator):
        resolver(resolver), aggregator(probe), evaluator(evaluator) {

}

Option<cluster_verdict_t> ClusterMonitor::get_cluster_status() {
    const auto topology_op = resolver.resolve();
    if(!topology_op.ok()) {
        return Option<cluster_verdict_t>(topology_op.code(), topology_op.error());
    }

    const cluster_topology_t& topology = topology_op.get_ref();

    // an unresolved primary is carried as an empty address, which probes nothing
    const node_status_t primary = aggregator.status_for(topology.primary.value_or(""), NodeStatusRole::LEADER);

    std::vector<node_status_t> replicas;
    for(const auto& address: topology.replicas) {
        replicas.push_back(aggregator.replica_status_for(address, primary.sync_replicas));
    }

    const cluster_verdict_t verdict = evaluator.evaluate(primary, replicas);
    LOG(INFO) << "Cluster status: " << to_string(verdict.status);

    return Option<cluster_verdict_t>(verdict);
}
