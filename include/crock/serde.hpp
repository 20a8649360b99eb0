#pragma once

#include <crock/crockford_uuid.hpp>
#include <crock/result.hpp>
#include <toml++/toml.hpp>
#include <string>

// TOML encode/decode hooks for CrockfordUuid.
//
// Identifiers are written as their canonical string. On the way in a
// string node is decoded as Crockford Base32 and an array of 16 integers
// (0..255) is taken as raw bytes; any other node is UnsupportedInput.
namespace crock::serde {

toml::value<std::string> to_node(const CrockfordUuid& id);

Result<CrockfordUuid> from_node(const toml::node& node);

// Looks up `key` in `tbl`; NotFound when absent. Errors carry the key.
Result<CrockfordUuid> get(const toml::table& tbl, const std::string& key);

const char* node_type_name(toml::node_type t);

} // namespace crock::serde
