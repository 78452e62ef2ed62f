#pragma once

#include <string>
#include <vector>
#include "option.h"
#include "cluster_types.h"

/*
  Edits the database access-control list kept in the HA agent's configuration blob:
  {"postgresql": {"pg_hba": ["hostssl all postgres 192.0.2.1/32 md5", ...]}}
  The blob is always rewritten wholesale; entries not touched keep their text and order.
*/

// Entries that let a cluster member connect as the superuser and as the replication user.
std::vector<std::string> access_entries_for(const node_address_t& address);

// Drops every entry that references ` <address>/32 `.
Option<std::string> remove_node_entries(const std::string& blob, const node_address_t& address);

// Prepends the member's entries that are not yet present. `changed` is false when nothing was added.
Option<std::string> ensure_node_access(const std::string& blob, const node_address_t& address, bool& changed);
