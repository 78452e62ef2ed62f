#pragma once

#include <optional>
#include <string>
#include "cluster_types.h"

class Config;

class StatusProbe {
public:
    virtual ~StatusProbe() = default;

    // Empty when the node's HA agent could not be reached or did not return a status document.
    virtual std::optional<raw_agent_status_t> probe_agent(const node_address_t& address) = 0;

    // Empty when the node's consensus store member could not be reached.
    virtual std::optional<raw_consensus_status_t> probe_consensus(const node_address_t& address) = 0;
};

/**
 * Probes node end-points over HTTPS. Each request is bounded by the configured probe timeout and any failure
 * is logged and reported as an empty result.
 */
class HttpStatusProbe: public StatusProbe {
private:
    const Config& config;

    bool fetch(const std::string& kind, const std::string& url, std::string& body) const;

public:
    explicit HttpStatusProbe(const Config& config);

    std::optional<raw_agent_status_t> probe_agent(const node_address_t& address) override;

    std::optional<raw_consensus_status_t> probe_consensus(const node_address_t& address) override;

    std::string agent_url(const node_address_t& address) const;

    std::string consensus_url(const node_address_t& address) const;
};

// Wraps an IPv6 literal in brackets so it can be used as a URL host.
std::string url_host(const node_address_t& address);
