#include "cluster_errors.h"

std::string cluster_error::name(const uint32_t code) {
    switch(code) {
        case TOPOLOGY_UNAVAILABLE:
            return "TopologyUnavailable";
        case ROLE_UNSUPPORTED:
            return "RoleUnsupported";
        case WRONG_ROLE:
            return "WrongRole";
        case ALREADY_MEMBER:
            return "AlreadyMember";
        case NOT_A_MEMBER:
            return "NotAMember";
        case MEMBER_NOT_FOUND:
            return "MemberNotFound";
        case LAST_REPLICA:
            return "LastReplica";
        case CANNOT_REMOVE_PRIMARY:
            return "CannotRemovePrimary";
        case CANNOT_REINIT_PRIMARY:
            return "CannotReinitPrimary";
        case ALREADY_PRIMARY:
            return "AlreadyPrimary";
        case NODE_NOT_RESPONDING:
            return "NodeNotResponding";
        case COMMAND_FAILED:
            return "CommandFailed";
        case CONSENSUS_NOT_READY:
            return "ConsensusNotReady";
        case MALFORMED_CONFIG_BLOB:
            return "MalformedConfigBlob";
        case INVALID_CONFIG:
            return "InvalidConfig";
        default:
            return "Unknown(" + std::to_string(code) + ")";
    }
}
