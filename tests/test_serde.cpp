#include <catch2/catch.hpp>
#include <crock/serde.hpp>

using namespace crock;

static toml::table parse_doc(const char* text) {
    return toml::parse(text);
}

TEST_CASE("to_node writes the canonical string", "[serde]") {
    auto id = CrockfordUuid::from_string("064gmqdc-jsvmqf6e-pc10k6m0aw").value();
    auto node = serde::to_node(id);
    REQUIRE(node.get() == "064GMQDCJSVMQF6EPC10K6M0AW");
}

TEST_CASE("written identifiers read back", "[serde]") {
    auto id = CrockfordUuid::generate_v7();
    toml::table tbl;
    tbl.insert("id", serde::to_node(id));

    auto r = serde::get(tbl, "id");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == id);
}

TEST_CASE("string nodes decode leniently", "[serde]") {
    auto doc = parse_doc(R"(id = "064g-mqdc-jsvm-qf6e-pc1o-k6m0-aw")");
    auto r = serde::from_node(*doc.get("id"));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "064GMQDCJSVMQF6EPC10K6M0AW");
}

TEST_CASE("byte array nodes", "[serde]") {
    auto doc = parse_doc(R"(id = [0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15])");
    auto r = serde::from_node(*doc.get("id"));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "000G40R40M30E209185GR38E1W");
}

TEST_CASE("byte array with wrong count", "[serde]") {
    auto doc = parse_doc(R"(id = [1, 2, 3])");
    auto r = serde::from_node(*doc.get("id"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrockError::WrongByteCount);
}

TEST_CASE("byte array with non-byte elements", "[serde]") {
    auto doc = parse_doc(R"(
big = [0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 256]
text = [0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, "f"]
)");
    for (const char* key : {"big", "text"}) {
        auto r = serde::from_node(*doc.get(key));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == CrockError::UnsupportedInput);
        REQUIRE(r.error().message.find("element 15") != std::string::npos);
    }
}

TEST_CASE("other node types are unsupported", "[serde]") {
    auto doc = parse_doc(R"(
number = 42
flag = true
nested = { a = 1 }
)");
    for (const char* key : {"number", "flag", "nested"}) {
        auto r = serde::from_node(*doc.get(key));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == CrockError::UnsupportedInput);
        REQUIRE(r.error().message.find("expected Crockford string, 16 bytes, or UUID")
                != std::string::npos);
    }
    auto r = serde::from_node(*doc.get("number"));
    REQUIRE(r.error().message.find("got integer") != std::string::npos);
}

TEST_CASE("get reports missing keys", "[serde]") {
    toml::table tbl;
    auto r = serde::get(tbl, "id");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrockError::NotFound);
}

TEST_CASE("get prefixes errors with the key", "[serde]") {
    auto doc = parse_doc(R"(owner = "ABC")");
    auto r = serde::get(doc, "owner");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrockError::InvalidLength);
    REQUIRE(r.error().message == "key 'owner': expected 16 bytes, got 1");
}

TEST_CASE("node_type_name", "[serde]") {
    REQUIRE(std::string(serde::node_type_name(toml::node_type::string)) == "string");
    REQUIRE(std::string(serde::node_type_name(toml::node_type::floating_point)) == "float");
}
