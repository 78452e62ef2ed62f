#pragma once

#include <string>
#include <vector>
#include "option.h"
#include "cluster_types.h"

class Config;

struct proxy_backend_t {
    std::string svname;
    std::string status;
};

class ProxyBackends {
public:
    virtual ~ProxyBackends() = default;

    // Live backend table of the database proxy. Fails when the table cannot be read.
    virtual Option<std::vector<proxy_backend_t>> list_backends() = 0;

    virtual Option<bool> append_backend(const node_address_t& address) = 0;

    virtual Option<bool> remove_backend(const node_address_t& address) = 0;
};

/**
 * HAProxy backed implementation: the backend table is read from the stats socket and backends are
 * added or removed by editing the proxy configuration file. Callers restart the proxy to apply edits.
 */
class HaproxyBackends: public ProxyBackends {
private:
    const Config& config;

    Option<std::string> query_stats_socket(const std::string& query) const;

public:
    explicit HaproxyBackends(const Config& config);

    Option<std::vector<proxy_backend_t>> list_backends() override;

    Option<bool> append_backend(const node_address_t& address) override;

    Option<bool> remove_backend(const node_address_t& address) override;

    // Configuration line declaring `address` as a database backend.
    std::string backend_line(const node_address_t& address) const;

    // Parses `show stat` CSV output, keeping server rows (the FRONTEND and BACKEND summary rows are skipped).
    static std::vector<proxy_backend_t> parse_stat_csv(const std::string& csv);

    // Backend names look like `postgresql_192.0.2.1_5432`; empty when the name does not carry an address.
    static node_address_t backend_address(const std::string& svname);
};
