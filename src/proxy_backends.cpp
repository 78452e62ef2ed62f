#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>
#include <cstring>
#include "proxy_backends.h"
#include "cluster_errors.h"
#include "file_utils.h"
#include "pgquorum_config.h"
#include "string_utils.h"
#include "logger.h"

HaproxyBackends::HaproxyBackends(const Config& config): config(config) {

}

std::string HaproxyBackends::backend_line(const node_address_t& address) const {
    const std::string db_port = std::to_string(config.get_db_port());
    return "    server postgresql_" + address + "_" + db_port + " " + address + ":" + db_port +
           " maxconn 100 check check-ssl port " + std::to_string(config.get_agent_port()) +
           " ca-file " + config.get_proxy_ca_path();
}

Option<std::string> HaproxyBackends::query_stats_socket(const std::string& query) const {
    const std::string& socket_path = config.get_proxy_stats_socket();

    sockaddr_un addr;
    if(socket_path.size() >= sizeof(addr.sun_path)) {
        return Option<std::string>(cluster_error::TOPOLOGY_UNAVAILABLE,
                                   "Proxy stats socket path is too long: " + socket_path);
    }

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if(fd < 0) {
        LOG(ERROR) << "Could not create socket: " << strerror(errno);
        return Option<std::string>(cluster_error::TOPOLOGY_UNAVAILABLE, "Could not create socket.");
    }

    timeval timeout;
    timeout.tv_sec = config.get_probe_timeout_ms() / 1000;
    timeout.tv_usec = (config.get_probe_timeout_ms() % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if(connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        LOG(ERROR) << "Could not connect to proxy stats socket " << socket_path << ": " << strerror(errno);
        close(fd);
        return Option<std::string>(cluster_error::TOPOLOGY_UNAVAILABLE,
                                   "Could not connect to proxy stats socket " + socket_path);
    }

    size_t written = 0;
    while(written < query.size()) {
        ssize_t n = write(fd, query.data() + written, query.size() - written);
        if(n < 0) {
            if(errno == EINTR) {
                continue;
            }

            LOG(ERROR) << "Write to proxy stats socket failed: " << strerror(errno);
            close(fd);
            return Option<std::string>(cluster_error::TOPOLOGY_UNAVAILABLE, "Write to proxy stats socket failed.");
        }
        written += n;
    }

    // the proxy closes the connection once the response is complete
    std::string response;
    char buf[4096];

    while(true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if(n == 0) {
            break;
        }

        if(n < 0) {
            if(errno == EINTR) {
                continue;
            }

            LOG(ERROR) << "Read from proxy stats socket failed: " << strerror(errno);
            close(fd);
            return Option<std::string>(cluster_error::TOPOLOGY_UNAVAILABLE, "Read from proxy stats socket failed.");
        }

        response.append(buf, n);
    }

    close(fd);
    return Option<std::string>(response);
}

std::vector<proxy_backend_t> HaproxyBackends::parse_stat_csv(const std::string& csv) {
    std::vector<proxy_backend_t> backends;
    const std::vector<std::string> lines = StringUtils::split_lines(csv);

    if(lines.empty()) {
        return backends;
    }

    std::string header = lines[0];
    if(StringUtils::starts_with(header, "#")) {
        header = header.substr(1);
    }

    std::vector<std::string> columns;
    StringUtils::split(header, columns, ",", true, true);

    int svname_index = -1;
    int status_index = -1;

    for(size_t i = 0; i < columns.size(); i++) {
        if(columns[i] == "svname") {
            svname_index = i;
        } else if(columns[i] == "status") {
            status_index = i;
        }
    }

    if(svname_index < 0 || status_index < 0) {
        LOG(WARNING) << "Proxy stats header has no `svname` or `status` column: " << lines[0];
        return backends;
    }

    for(size_t i = 1; i < lines.size(); i++) {
        std::vector<std::string> fields;
        StringUtils::split(lines[i], fields, ",", true, true);

        if(fields.size() <= size_t(std::max(svname_index, status_index))) {
            continue;
        }

        const std::string& svname = fields[svname_index];
        if(svname == "FRONTEND" || svname == "BACKEND") {
            continue;
        }

        backends.push_back(proxy_backend_t{svname, fields[status_index]});
    }

    return backends;
}

node_address_t HaproxyBackends::backend_address(const std::string& svname) {
    std::vector<std::string> parts;
    StringUtils::split(svname, parts, "_", true, false);

    if(parts.size() < 3) {
        return "";
    }

    return parts[1];
}

Option<std::vector<proxy_backend_t>> HaproxyBackends::list_backends() {
    const auto stats_op = query_stats_socket("show stat\n");
    if(!stats_op.ok()) {
        return Option<std::vector<proxy_backend_t>>(stats_op.code(), stats_op.error());
    }

    return Option<std::vector<proxy_backend_t>>(parse_stat_csv(stats_op.get()));
}

Option<bool> HaproxyBackends::append_backend(const node_address_t& address) {
    LOG(INFO) << "Updating DB proxy configuration.";

    if(!append_to_file(config.get_proxy_config_path(), backend_line(address) + "\n")) {
        return Option<bool>(cluster_error::COMMAND_FAILED,
                            "Could not update proxy configuration " + config.get_proxy_config_path());
    }

    return Option<bool>(true);
}

Option<bool> HaproxyBackends::remove_backend(const node_address_t& address) {
    LOG(INFO) << "Updating DB proxy configuration.";

    std::vector<std::string> lines;
    if(!read_file_lines(config.get_proxy_config_path(), lines)) {
        return Option<bool>(cluster_error::COMMAND_FAILED,
                            "Could not read proxy configuration " + config.get_proxy_config_path());
    }

    const std::string entry = backend_line(address);
    std::string content;
    size_t removed = 0;

    for(const auto& line: lines) {
        if(line.find(entry) != std::string::npos) {
            removed++;
            continue;
        }

        content += line;
        content += "\n";
    }

    if(removed == 0) {
        LOG(WARNING) << "No proxy backend entry found for " << address;
        return Option<bool>(true);
    }

    if(!write_file_atomically(config.get_proxy_config_path(), content)) {
        return Option<bool>(cluster_error::COMMAND_FAILED,
                            "Could not update proxy configuration " + config.get_proxy_config_path());
    }

    return Option<bool>(true);
}
