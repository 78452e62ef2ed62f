#include <algorithm>
#include <nlohmann/json.hpp>
#include "access_list.h"
#include "cluster_errors.h"
#include "logger.h"

namespace {
    Option<nlohmann::json> parse_blob(const std::string& blob) {
        nlohmann::json blob_json;

        try {
            blob_json = nlohmann::json::parse(blob);
        } catch(const std::exception& e) {
            LOG(ERROR) << "Could not parse DB config blob: " << e.what();
            return Option<nlohmann::json>(cluster_error::MALFORMED_CONFIG_BLOB,
                                          std::string("Could not parse DB config blob: ") + e.what());
        }

        if(!blob_json.is_object() || blob_json.count("postgresql") == 0 || !blob_json["postgresql"].is_object()) {
            return Option<nlohmann::json>(cluster_error::MALFORMED_CONFIG_BLOB,
                                          "DB config blob has no `postgresql` object.");
        }

        nlohmann::json& postgresql = blob_json["postgresql"];

        if(postgresql.count("pg_hba") == 0) {
            postgresql["pg_hba"] = nlohmann::json::array();
        }

        if(!postgresql["pg_hba"].is_array()) {
            return Option<nlohmann::json>(cluster_error::MALFORMED_CONFIG_BLOB,
                                          "DB config blob field `postgresql.pg_hba` is not a list.");
        }

        for(const auto& entry: postgresql["pg_hba"]) {
            if(!entry.is_string()) {
                return Option<nlohmann::json>(cluster_error::MALFORMED_CONFIG_BLOB,
                                              "DB config blob field `postgresql.pg_hba` must only hold strings.");
            }
        }

        return Option<nlohmann::json>(blob_json);
    }
}

std::vector<std::string> access_entries_for(const node_address_t& address) {
    return {
        "hostssl all postgres " + address + "/32 md5",
        "hostssl replication replicator " + address + "/32 md5"
    };
}

Option<std::string> remove_node_entries(const std::string& blob, const node_address_t& address) {
    auto blob_op = parse_blob(blob);
    if(!blob_op.ok()) {
        return Option<std::string>(blob_op.code(), blob_op.error());
    }

    nlohmann::json blob_json = blob_op.get();
    const std::string exclusion = " " + address + "/32 ";

    nlohmann::json kept_entries = nlohmann::json::array();
    for(const auto& entry: blob_json["postgresql"]["pg_hba"]) {
        if(entry.get<std::string>().find(exclusion) == std::string::npos) {
            kept_entries.push_back(entry);
        }
    }

    blob_json["postgresql"]["pg_hba"] = kept_entries;
    return Option<std::string>(blob_json.dump());
}

Option<std::string> ensure_node_access(const std::string& blob, const node_address_t& address, bool& changed) {
    changed = false;

    auto blob_op = parse_blob(blob);
    if(!blob_op.ok()) {
        return Option<std::string>(blob_op.code(), blob_op.error());
    }

    nlohmann::json blob_json = blob_op.get();
    nlohmann::json& pg_hba = blob_json["postgresql"]["pg_hba"];

    nlohmann::json missing_entries = nlohmann::json::array();
    for(const auto& entry: access_entries_for(address)) {
        if(std::find(pg_hba.begin(), pg_hba.end(), nlohmann::json(entry)) == pg_hba.end()) {
            missing_entries.push_back(entry);
        }
    }

    if(missing_entries.empty()) {
        return Option<std::string>(blob);
    }

    for(const auto& entry: pg_hba) {
        missing_entries.push_back(entry);
    }

    pg_hba = missing_entries;
    changed = true;

    return Option<std::string>(blob_json.dump());
}
