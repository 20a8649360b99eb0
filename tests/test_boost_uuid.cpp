#include <catch2/catch.hpp>
#include <crock/boost_uuid.hpp>
#include <crock/crockford_uuid.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

using namespace crock;

TEST_CASE("boost uuid converts without a text round trip", "[boost_uuid]") {
    boost::uuids::string_generator parse;
    auto bu = parse("01890a5d-ac96-774b-bcce-b302099a8057");

    auto id = CrockfordUuid::from_uuid(bu);
    REQUIRE(id.to_string() == "064GMQDCJSVMQF6EPC10K6M0AW");
    REQUIRE(id.uuid().to_string() == boost::uuids::to_string(bu));
}

TEST_CASE("boost uuid round trip", "[boost_uuid]") {
    boost::uuids::random_generator gen;
    for (int i = 0; i < 20; ++i) {
        auto bu = gen();
        auto id = CrockfordUuid::from_uuid(bu);
        REQUIRE(id.to_uuid<boost::uuids::uuid>() == bu);
        REQUIRE(id.version() == 4);
    }
}

TEST_CASE("boost and crock uuids give equal identifiers", "[boost_uuid]") {
    auto id = CrockfordUuid::generate_v7();
    auto via_boost = CrockfordUuid::from_uuid(id.to_uuid<boost::uuids::uuid>());
    auto via_crock = CrockfordUuid::from_uuid(id.uuid());
    REQUIRE(via_boost == via_crock);
    REQUIRE(via_boost.hash() == via_crock.hash());
}
