#include <catch2/catch_test_macros.hpp>

#include "store/feature_store.hpp"
#include "test_helpers.hpp"
#include "utility/exceptions.hpp"

using namespace geoedit;

namespace {

Feature well(double x, double y, std::int64_t depth) {
    return Feature{0, Point{x, y}, {{"depth", depth}}};
}

} // namespace

TEST_CASE("FeatureStore - Collections", "[feature_store]") {
    FeatureStore store;
    test::add_collections(store);

    SECTION("Catalog") {
        REQUIRE(store.has_collection("parcels"));
        REQUIRE_FALSE(store.has_collection("rivers"));
        REQUIRE(store.collection_names() ==
                std::vector<std::string>{"parcels", "roads", "wells"});
        REQUIRE(store.geometry_type("roads") == GeometryType::LineString);
        REQUIRE(store.size("wells") == 0);
        REQUIRE(store.next_id("wells") == 1);
    }

    SECTION("Invalid collections") {
        REQUIRE_THROWS_AS(store.create_collection("wells", GeometryType::Point),
                          ValidationError);
        REQUIRE_THROWS_AS(store.create_collection("", GeometryType::Point),
                          ValidationError);
        REQUIRE_THROWS_AS(store.size("rivers"), NotFoundError);
        REQUIRE_THROWS_AS(store.geometry_type("rivers"), NotFoundError);
    }

    SECTION("Missing features") {
        REQUIRE_THROWS_AS(store.get("wells", 1), NotFoundError);
        REQUIRE_THROWS_AS(store.get("rivers", 1), NotFoundError);
        REQUIRE_FALSE(store.contains({"wells", 1}));
        REQUIRE_FALSE(store.contains({"rivers", 1}));
    }
}

TEST_CASE("FeatureStore - Guards", "[feature_store]") {
    FeatureStore store;
    test::add_collections(store);

    SECTION("Writes through a write guard") {
        {
            auto guard = store.lock_for_write({"wells"});
            const auto change = guard.apply_directive({"wells", 1}, well(0, 0, 10));
            REQUIRE_FALSE(change.before.has_value());
            REQUIRE(change.after.has_value());
            REQUIRE(guard.find({"wells", 1}) != nullptr);
            REQUIRE(guard.next_id("wells") == 2);
        }

        const Feature stored = store.get("wells", 1);
        REQUIRE(stored.id == 1);
        REQUIRE(std::get<std::int64_t>(stored.attributes.at("depth")) == 10);
    }

    SECTION("Revisions move on every write") {
        auto guard = store.lock_for_write({"wells"});
        REQUIRE(guard.revision({"wells", 1}) == 0);

        guard.apply_directive({"wells", 1}, well(0, 0, 10));
        const auto first = guard.revision({"wells", 1});
        guard.apply_directive({"wells", 1}, well(0, 0, 11));
        REQUIRE(guard.revision({"wells", 1}) > first);
    }

    SECTION("Deleted ids are not reused") {
        {
            auto guard = store.lock_for_write({"wells"});
            guard.apply_directive({"wells", 1}, well(0, 0, 1));
            guard.apply_directive({"wells", 2}, well(1, 1, 2));
            const auto change = guard.apply_directive({"wells", 2}, std::nullopt);
            REQUIRE(change.before.has_value());
            REQUIRE_FALSE(change.after.has_value());
        }
        REQUIRE(store.size("wells") == 1);
        REQUIRE(store.next_id("wells") == 3);
    }

    SECTION("Reserved ids") {
        auto guard = store.lock_for_write({"roads"});
        guard.reserve_ids("roads", 7);
        guard.reserve_ids("roads", 3);
        REQUIRE(guard.next_id("roads") == 7);
    }

    SECTION("Guards only cover the requested collections") {
        auto guard = store.lock_for_read({"wells"});
        REQUIRE(guard.covers("wells"));
        REQUIRE_FALSE(guard.covers("roads"));
        REQUIRE_THROWS_AS(guard.find({"roads", 1}), NotFoundError);
    }

    SECTION("Unknown collections take no locks") {
        REQUIRE_THROWS_AS(store.lock_for_write({"rivers", "wells"}),
                          NotFoundError);
        auto guard = store.lock_for_write({"wells"});
        REQUIRE(guard.covers("wells"));
    }
}

TEST_CASE("FeatureStore - Selection", "[feature_store]") {
    FeatureStore store;
    test::add_collections(store);
    {
        auto guard = store.lock_for_write({"wells"});
        guard.apply_directive({"wells", 1}, well(0, 0, 5));
        guard.apply_directive({"wells", 2}, well(1, 0, 50));
        guard.apply_directive({"wells", 3}, well(2, 0, 500));
    }

    SECTION("By predicate") {
        const auto deep =
            store.select_by_predicate("wells", [](const Feature &f) {
                return std::get<std::int64_t>(f.attributes.at("depth")) > 10;
            });
        REQUIRE(deep.size() == 2);
        REQUIRE(deep.contains({"wells", 2}));
        REQUIRE(deep.contains({"wells", 3}));
        REQUIRE_FALSE(deep.contains({"wells", 1}));
    }

    SECTION("All") {
        REQUIRE(store.select_all("wells").size() == 3);
        REQUIRE(store.features("wells").front().id == 1);
    }

    SECTION("Unknown collection") {
        REQUIRE_THROWS_AS(store.select_all("rivers"), NotFoundError);
    }
}
