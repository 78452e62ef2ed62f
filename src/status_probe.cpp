#include "status_probe.h"
#include "http_client.h"
#include "pgquorum_config.h"
#include "logger.h"

std::string url_host(const node_address_t& address) {
    if(address.find(':') != std::string::npos && address.find('[') != 0) {
        return "[" + address + "]";
    }

    return address;
}

HttpStatusProbe::HttpStatusProbe(const Config& config): config(config) {

}

std::string HttpStatusProbe::agent_url(const node_address_t& address) const {
    return "https://" + url_host(address) + ":" + std::to_string(config.get_agent_port()) + "/";
}

std::string HttpStatusProbe::consensus_url(const node_address_t& address) const {
    return "https://" + url_host(address) + ":" + std::to_string(config.get_consensus_client_port()) +
           "/v2/stats/self";
}

bool HttpStatusProbe::fetch(const std::string& kind, const std::string& url, std::string& body) const {
    long status_code = HttpClient::get_response(url, body, config.get_probe_ca_path(),
                                                config.get_probe_timeout_ms());

    // the agent answers 503 on replicas but still sends its status document, so only transport
    // failures (which leave the body empty) mark the node as unreachable
    if(body.empty()) {
        LOG(WARNING) << "Failed to get status of " << kind << " node from " << url
                     << ". Status code was: " << status_code;
        return false;
    }

    return true;
}

std::optional<raw_agent_status_t> HttpStatusProbe::probe_agent(const node_address_t& address) {
    if(address.empty()) {
        return std::nullopt;
    }

    const std::string url = agent_url(address);
    std::string body;

    if(!fetch("DB", url, body)) {
        return std::nullopt;
    }

    auto status = raw_agent_status_t::parse(body);
    if(!status) {
        LOG(WARNING) << "Unusable DB status from " << url;
    }

    return status;
}

std::optional<raw_consensus_status_t> HttpStatusProbe::probe_consensus(const node_address_t& address) {
    if(address.empty()) {
        return std::nullopt;
    }

    const std::string url = consensus_url(address);
    std::string body;

    if(!fetch("etcd", url, body)) {
        return std::nullopt;
    }

    auto status = raw_consensus_status_t::parse(body);
    if(!status) {
        LOG(WARNING) << "Unusable etcd status from " << url;
    }

    return status;
}
