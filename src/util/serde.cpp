#include <crock/serde.hpp>
#include <crock/log.hpp>
#include <vector>

namespace crock::serde {

static const char* kAcceptedForms = "expected Crockford string, 16 bytes, or UUID";

const char* node_type_name(toml::node_type t) {
    switch (t) {
        case toml::node_type::none:           return "none";
        case toml::node_type::table:          return "table";
        case toml::node_type::array:          return "array";
        case toml::node_type::string:         return "string";
        case toml::node_type::integer:        return "integer";
        case toml::node_type::floating_point: return "float";
        case toml::node_type::boolean:        return "boolean";
        case toml::node_type::date:           return "date";
        case toml::node_type::time:           return "time";
        case toml::node_type::date_time:      return "date-time";
    }
    return "unknown";
}

toml::value<std::string> to_node(const CrockfordUuid& id) {
    return toml::value<std::string>(id.to_string());
}

static Result<CrockfordUuid> from_byte_array(const toml::array& arr) {
    if (arr.size() != base32::kPayloadBytes) {
        return CrockError(CrockError::WrongByteCount,
            "bytes input must be 16 bytes, got " + std::to_string(arr.size()));
    }

    std::vector<uint8_t> raw;
    raw.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        auto v = arr[i].as_integer();
        if (!v || v->get() < 0 || v->get() > 255) {
            return CrockError(CrockError::UnsupportedInput,
                std::string(kAcceptedForms) + "; element " + std::to_string(i) +
                " is not a byte",
                "byte arrays hold integers in 0..255");
        }
        raw.push_back(static_cast<uint8_t>(v->get()));
    }
    return CrockfordUuid::from_bytes(raw);
}

Result<CrockfordUuid> from_node(const toml::node& node) {
    if (auto s = node.as_string()) {
        return CrockfordUuid::from_string(s->get());
    }
    if (auto arr = node.as_array()) {
        return from_byte_array(*arr);
    }
    log::trace("rejecting %s node as identifier", node_type_name(node.type()));
    return CrockError(CrockError::UnsupportedInput,
        std::string(kAcceptedForms) + ", got " + node_type_name(node.type()));
}

Result<CrockfordUuid> get(const toml::table& tbl, const std::string& key) {
    const toml::node* node = tbl.get(key);
    if (!node) {
        return CrockError(CrockError::NotFound, "missing key '" + key + "'");
    }
    return from_node(*node).with_context("key '" + key + "'");
}

} // namespace crock::serde
