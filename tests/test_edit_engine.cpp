#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <boost/geometry.hpp>

#include <stdexcept>

#include "engine/edit_engine.hpp"
#include "test_helpers.hpp"
#include "utility/exceptions.hpp"

using namespace geoedit;
using Catch::Approx;

namespace {

std::string text(const Feature &feature, const std::string &name) {
    return std::get<std::string>(feature.attributes.at(name));
}

/**
 * @brief Submit and return the typed rejection.
 */
template <typename E>
E expect_rejection(test::EngineFixture &fx, OperationBuilder &builder) {
    try {
        fx.submit(builder);
    } catch (const E &e) {
        return e;
    }
    FAIL("expected the operation to be rejected");
    throw std::logic_error("unreachable");
}

/**
 * @brief Kernel whose move fails the way a container does, not with a
 * GeometryError.
 */
class ThrowingMoveKernel : public BoostGeometryKernel {
  public:
    Geometry move(const Geometry &, double, double) const override {
        throw std::length_error("vector::_M_range_insert");
    }
};

} // namespace

TEST_CASE("EditEngine - Create and modify", "[edit_engine]") {
    test::EngineFixture fx;

    SECTION("Create assigns ids in submission order") {
        auto builder = fx.engine->create_operation("wells");
        builder.add_create("wells", Point{0, 0}, {{"name", std::string("a")}});
        builder.add_create("wells", Point{1, 0}, {{"name", std::string("b")}});
        const auto record = fx.submit(builder);

        REQUIRE(record->state() == TransactionState::Applied);
        REQUIRE(record->succeeded());
        REQUIRE(record->sequence() == 1);
        REQUIRE(record->created_ids() == std::vector<FeatureId>{1, 2});
        REQUIRE(text(fx.store.get("wells", 2), "name") == "b");
        REQUIRE(record->changes().size() == 2);
    }

    SECTION("Pending references target features created earlier") {
        auto builder = fx.engine->create_operation();
        const auto road =
            builder.add_create("roads", make_line({{0, 0}, {4, 0}}));
        builder.add_modify(road, {{"lanes", std::int64_t{2}}});
        builder.add_geometric_op(road, directive::MoveParams{0.0, 1.0});
        const auto record = fx.submit(builder);

        const Feature stored = fx.store.get(record->resolve(road));
        REQUIRE(std::get<std::int64_t>(stored.attributes.at("lanes")) == 2);
        REQUIRE(std::get<LineString>(stored.geometry)[0].y == Approx(1.0));

        // Touched three times, one net change
        REQUIRE(record->changes().size() == 1);
        REQUIRE_FALSE(record->changes().front().before.has_value());
        REQUIRE(record->outcomes().size() == 3);
        REQUIRE(record->outcomes()[2].changes.size() == 1);
    }

    SECTION("Modify assigns attributes and geometry") {
        const auto ref = fx.seed("parcels", test::square(0, 0, 1),
                                 {{"owner", std::string("ann")},
                                  {"zone", std::string("r1")}});

        auto builder = fx.engine->create_operation();
        builder.add_modify(ref, {{"owner", std::string("bob")},
                                 {"note", std::monostate{}}},
                           Geometry{test::square(0, 0, 2)});
        fx.submit(builder);

        const Feature stored = fx.store.get(ref);
        REQUIRE(text(stored, "owner") == "bob");
        REQUIRE(text(stored, "zone") == "r1");
        REQUIRE(std::holds_alternative<std::monostate>(
            stored.attributes.at("note")));
        REQUIRE(boost::geometry::area(std::get<Polygon>(stored.geometry)) ==
                Approx(4.0));
    }

    SECTION("Transfer attributes") {
        const auto source = fx.seed("parcels", test::square(0, 0, 1),
                                    {{"owner", std::string("ann")},
                                     {"zone", std::string("r1")}});
        const auto target = fx.seed("wells", Point{0.5, 0.5});

        auto builder = fx.engine->create_operation();
        builder.add_transfer_attributes(source, target,
                                        {{"parcel_owner", "owner"}});
        fx.submit(builder);
        const Feature stored = fx.store.get(target);
        REQUIRE(text(stored, "parcel_owner") == "ann");
        REQUIRE(stored.attributes.count("zone") == 0);

        auto all = fx.engine->create_operation();
        all.add_transfer_attributes(source, target);
        fx.submit(all);
        REQUIRE(text(fx.store.get(target), "zone") == "r1");

        auto missing = fx.engine->create_operation();
        missing.add_transfer_attributes(source, target, {{"x", "height"}});
        expect_rejection<ValidationError>(fx, missing);
    }
}

TEST_CASE("EditEngine - Rejections", "[edit_engine]") {
    test::EngineFixture fx;
    const auto parcel = fx.seed("parcels", test::square(0, 0, 1));

    SECTION("Empty descriptor") {
        auto builder = fx.engine->create_operation("nothing");
        const auto e = expect_rejection<EmptyOperationError>(fx, builder);
        REQUIRE(e.record() != nullptr);
        REQUIRE(e.record()->state() == TransactionState::Rejected);
        REQUIRE_FALSE(e.record()->succeeded());
        REQUIRE(e.record()->sequence() == 0);
    }

    SECTION("Failures leave no trace") {
        auto builder = fx.engine->create_operation("partial");
        builder.add_create("parcels", test::square(5, 5, 1));
        builder.add_modify(FeatureRef{"parcels", 99}, {{"a", true}});

        const auto e = expect_rejection<ValidationError>(fx, builder);
        REQUIRE(e.record()->state() == TransactionState::Rejected);
        REQUIRE(fx.store.size("parcels") == 1);
        REQUIRE(fx.store.next_id("parcels") == 2);

        // The next create still gets the next id
        REQUIRE(fx.seed("parcels", test::square(9, 9, 1)).id == 2);
    }

    SECTION("Geometry must fit the collection") {
        auto builder = fx.engine->create_operation();
        builder.add_create("parcels", Point{0, 0});
        expect_rejection<ValidationError>(fx, builder);

        auto modify = fx.engine->create_operation();
        modify.add_modify(parcel, {}, Geometry{make_line({{0, 0}, {1, 1}})});
        expect_rejection<ValidationError>(fx, modify);
    }

    SECTION("Degenerate geometry") {
        auto empty_line = fx.engine->create_operation();
        empty_line.add_create("roads", LineString{});
        expect_rejection<ValidationError>(fx, empty_line);

        auto one_point = fx.engine->create_operation();
        one_point.add_create("roads", make_line({{1, 1}}));
        expect_rejection<ValidationError>(fx, one_point);

        auto empty_polygon = fx.engine->create_operation();
        empty_polygon.add_modify(parcel, {}, Geometry{Polygon{}});
        expect_rejection<ValidationError>(fx, empty_polygon);

        REQUIRE(fx.store.size("roads") == 0);
        REQUIRE(fx.store.next_id("roads") == 1);
    }

    SECTION("Feature deleted by an earlier directive") {
        auto builder = fx.engine->create_operation();
        builder.add_delete(parcel);
        builder.add_geometric_op(parcel, directive::MoveParams{1, 1});
        expect_rejection<ValidationError>(fx, builder);
        REQUIRE(fx.store.contains(parcel));
    }

    SECTION("Kernel failures become apply errors") {
        const Feature before = fx.store.get(parcel);

        auto builder = fx.engine->create_operation("bad fit");
        builder.add_geometric_op(parcel, directive::MoveParams{3, 0});
        directive::TransformParams transform;
        transform.links = {ControlLink{{0, 0}, {1, 1}}};
        builder.add_geometric_op(parcel, transform);

        const auto e = expect_rejection<ApplyError>(fx, builder);
        REQUIRE(e.is_retryable());
        REQUIRE(e.record()->state() == TransactionState::Rejected);
        REQUIRE(fx.store.get(parcel) == before);
    }

    SECTION("Synchronous calls off the context") {
        auto builder = fx.engine->create_operation();
        builder.add_delete(parcel);
        const auto descriptor = builder.build();

        try {
            fx.engine->submit(descriptor);
            FAIL("submit ran off the mutation context");
        } catch (const WrongContextError &e) {
            REQUIRE_FALSE(e.is_retryable());
        }
        REQUIRE_THROWS_AS(fx.engine->undo(), WrongContextError);
        REQUIRE_THROWS_AS(fx.engine->redo(), WrongContextError);
        REQUIRE(fx.store.contains(parcel));

        const auto record = fx.engine->context().call(
            [&] { return fx.engine->submit(descriptor); });
        REQUIRE(record->state() == TransactionState::Applied);
        REQUIRE_FALSE(fx.store.contains(parcel));
    }
}

TEST_CASE("EditEngine - Unexpected kernel failures", "[edit_engine]") {
    FeatureStore store;
    test::add_collections(store);
    EditEngine engine(store, std::make_shared<ThrowingMoveKernel>());

    auto seed = engine.create_operation("seed");
    seed.add_create("wells", Point{1, 1});
    const auto well = FeatureRef{
        "wells", engine.submit_async(seed.build()).get()->created_ids().front()};
    const Feature before = store.get(well);

    auto builder = engine.create_operation("move");
    builder.add_create("wells", Point{5, 5});
    builder.add_geometric_op(well, directive::MoveParams{1, 0});

    try {
        engine.submit_async(builder.build()).get();
        FAIL("the move should have been rejected");
    } catch (const ApplyError &e) {
        REQUIRE(e.record() != nullptr);
        REQUIRE(e.record()->state() == TransactionState::Rejected);
        REQUIRE(e.record()->sequence() == 0);
        REQUIRE(std::string(e.what()).find("_M_range_insert") !=
                std::string::npos);
    }

    REQUIRE(store.size("wells") == 1);
    REQUIRE(store.next_id("wells") == 2);
    REQUIRE(store.get(well) == before);

    // The context survives the failure
    auto next = engine.create_operation();
    next.add_create("wells", Point{2, 2});
    REQUIRE(engine.submit_async(next.build()).get()->sequence() == 2);
}

TEST_CASE("EditEngine - Selection scope", "[edit_engine]") {
    test::EngineFixture block;
    test::EngineFixture single;

    SelectionSet selection;
    for (int i = 0; i < 5; ++i) {
        block.seed("wells", Point{double(i), 0});
        selection.add(single.seed("wells", Point{double(i), 0}));
    }

    auto one = block.engine->create_operation("as block");
    one.add_geometric_op(selection, directive::MoveParams{10, 5});
    const auto block_record = block.submit(one);

    auto each = single.engine->create_operation("per feature");
    for (const auto &ref : selection.refs())
        each.add_geometric_op(ref, directive::MoveParams{10, 5});
    const auto single_record = single.submit(each);

    REQUIRE(block_record->outcomes().size() == 1);
    REQUIRE(block_record->outcomes().front().changes.size() == 5);
    REQUIRE(single_record->outcomes().size() == 5);
    REQUIRE(block_record->changes().size() == 5);
    REQUIRE(single_record->changes().size() == 5);

    for (const auto &ref : selection.refs())
        REQUIRE(block.store.get(ref) == single.store.get(ref));
    REQUIRE(std::get<Point>(block.store.get("wells", 3).geometry).x ==
            Approx(12.0));
}

TEST_CASE("EditEngine - Geometry producing directives", "[edit_engine]") {
    test::EngineFixture fx;

    SECTION("Clip keeps the first piece and creates the rest") {
        const auto road = fx.seed("roads", make_line({{0, 1}, {6, 1}}),
                                  {{"name", std::string("main")}});
        const Feature before = fx.store.get(road);
        auto builder = fx.engine->create_operation("clip");
        builder.add_geometric_op(
            road, directive::ClipParams{test::square(1, 0, 4),
                                        ClipMode::DiscardArea});
        const auto record = fx.submit(builder);

        REQUIRE(fx.store.size("roads") == 2);
        const auto &created = record->outcomes().front().created;
        REQUIRE(created.size() == 1);
        REQUIRE(text(fx.store.get(created.front()), "name") == "main");

        fx.undo();
        REQUIRE(fx.store.size("roads") == 1);
        REQUIRE(fx.store.get(road) == before);
    }

    SECTION("Split a polygon along a line") {
        const auto parcel = fx.seed("parcels", test::square(0, 0, 4),
                                    {{"owner", std::string("ann")}});
        auto builder = fx.engine->create_operation("split");
        builder.add_geometric_op(
            parcel,
            directive::SplitParams{SplitByLine{make_line({{1, -1}, {1, 5}})}});
        const auto record = fx.submit(builder);

        REQUIRE(fx.store.size("parcels") == 2);
        REQUIRE(boost::geometry::area(
                    std::get<Polygon>(fx.store.get(parcel).geometry)) ==
                Approx(12.0));
        const auto extra = record->resolve(DirectiveHandle{0});
        REQUIRE(text(fx.store.get(extra), "owner") == "ann");
    }

    SECTION("Merge into a new feature") {
        const auto a = fx.seed("parcels", test::square(0, 0, 1),
                               {{"owner", std::string("ann")}});
        const auto b = fx.seed("parcels", test::square(1, 0, 1),
                               {{"owner", std::string("bob")}});

        directive::MergeParams merge;
        merge.attributes_from = b;
        merge.attributes = {{"merged", true}};
        auto builder = fx.engine->create_operation("merge");
        const auto handle = builder.add_geometric_op(
            SelectionSet("parcels", {a.id, b.id}), merge);
        const auto record = fx.submit(builder);

        const auto merged = record->resolve(handle);
        REQUIRE(merged.id == 3);
        REQUIRE_FALSE(fx.store.contains(a));
        REQUIRE_FALSE(fx.store.contains(b));
        const Feature stored = fx.store.get(merged);
        REQUIRE(text(stored, "owner") == "bob");
        REQUIRE(std::get<bool>(stored.attributes.at("merged")));
        REQUIRE(boost::geometry::area(std::get<Polygon>(stored.geometry)) ==
                Approx(2.0));

        fx.undo();
        REQUIRE(fx.store.contains(a));
        REQUIRE(fx.store.contains(b));
        REQUIRE_FALSE(fx.store.contains(merged));
    }

    SECTION("Merge keeping the originals") {
        const auto a = fx.seed("roads", make_line({{0, 0}, {1, 0}}));
        const auto b = fx.seed("roads", make_line({{1, 0}, {2, 0}}));
        directive::MergeParams merge;
        merge.keep_originals = true;
        auto builder = fx.engine->create_operation();
        builder.add_geometric_op(SelectionSet("roads", {a.id, b.id}), merge);
        fx.submit(builder);
        REQUIRE(fx.store.size("roads") == 3);
    }

    SECTION("Merge across collections") {
        fx.store.create_collection("lots", GeometryType::Polygon);
        const auto a = fx.seed("parcels", test::square(0, 0, 1));
        const auto b = fx.seed("lots", test::square(1, 0, 1));
        SelectionSet both;
        both.add(a);
        both.add(b);

        auto builder = fx.engine->create_operation();
        builder.add_geometric_op(both, directive::MergeParams{});
        expect_rejection<ValidationError>(fx, builder);

        directive::MergeParams wrong_type;
        wrong_type.destination = "roads";
        auto into_roads = fx.engine->create_operation();
        into_roads.add_geometric_op(SelectionSet("parcels", {a.id}), wrong_type);
        expect_rejection<ValidationError>(fx, into_roads);
    }

    SECTION("Parallel offset creates copies next to the line") {
        fx.store.create_collection("lanes", GeometryType::LineString);
        const auto road = fx.seed("roads", make_line({{0, 0}, {10, 0}}),
                                  {{"name", std::string("main")}});
        const Feature before = fx.store.get(road);

        directive::ParallelOffsetParams offset;
        offset.distance = 3.0;
        offset.destination = "lanes";
        offset.attributes = {{"kind", std::string("lane")}};
        auto builder = fx.engine->create_operation("offset");
        builder.add_geometric_op(road, offset);
        const auto record = fx.submit(builder);

        const auto &created = record->outcomes().front().created;
        REQUIRE(created.size() == 2);
        REQUIRE(fx.store.size("lanes") == 2);
        REQUIRE(fx.store.get(road) == before);

        const Feature left = fx.store.get(created[0]);
        REQUIRE(text(left, "name") == "main");
        REQUIRE(text(left, "kind") == "lane");
        REQUIRE(std::get<LineString>(left.geometry)[0].y == Approx(3.0));
        REQUIRE(std::get<LineString>(fx.store.get(created[1]).geometry)[0].y ==
                Approx(-3.0));

        fx.undo();
        REQUIRE(fx.store.size("lanes") == 0);
    }

    SECTION("Parallel offset needs lines") {
        const auto parcel = fx.seed("parcels", test::square(0, 0, 1));
        const auto road = fx.seed("roads", make_line({{0, 0}, {10, 0}}));

        auto of_parcel = fx.engine->create_operation();
        of_parcel.add_geometric_op(parcel,
                                   directive::ParallelOffsetParams{1.0});
        expect_rejection<ValidationError>(fx, of_parcel);

        directive::ParallelOffsetParams into_parcels{1.0};
        into_parcels.destination = "parcels";
        auto wrong_destination = fx.engine->create_operation();
        wrong_destination.add_geometric_op(road, into_parcels);
        expect_rejection<ValidationError>(fx, wrong_destination);

        auto no_distance = fx.engine->create_operation();
        no_distance.add_geometric_op(road, directive::ParallelOffsetParams{});
        expect_rejection<ValidationError>(fx, no_distance);
        REQUIRE(fx.store.size("roads") == 1);
    }

    SECTION("Planarize splits crossing lines") {
        const auto a = fx.seed("roads", make_line({{0, 0}, {10, 0}}),
                               {{"name", std::string("a")}});
        const auto b = fx.seed("roads", make_line({{5, -5}, {5, 5}}),
                               {{"name", std::string("b")}});
        const auto c = fx.seed("roads", make_line({{20, 0}, {30, 0}}));
        const Feature a_before = fx.store.get(a);
        const Feature c_before = fx.store.get(c);

        auto builder = fx.engine->create_operation("planarize");
        builder.add_geometric_op(fx.store.select_all("roads"),
                                 directive::PlanarizeParams{});
        const auto record = fx.submit(builder);

        REQUIRE(fx.store.size("roads") == 5);
        const auto &created = record->outcomes().front().created;
        REQUIRE(created.size() == 2);
        REQUIRE(text(fx.store.get(created[0]), "name") == "a");
        REQUIRE(text(fx.store.get(created[1]), "name") == "b");
        REQUIRE(boost::geometry::length(std::get<LineString>(
                    fx.store.get(a).geometry)) == Approx(5.0));
        REQUIRE(boost::geometry::length(std::get<LineString>(
                    fx.store.get(b).geometry)) == Approx(5.0));
        REQUIRE(fx.store.get(c) == c_before);
        REQUIRE(record->changes().size() == 4);

        fx.undo();
        REQUIRE(fx.store.size("roads") == 3);
        REQUIRE(fx.store.get(a) == a_before);
    }

    SECTION("Planarize needs lines") {
        const auto parcel = fx.seed("parcels", test::square(0, 0, 1));
        auto builder = fx.engine->create_operation();
        builder.add_geometric_op(parcel, directive::PlanarizeParams{});
        expect_rejection<ValidationError>(fx, builder);
    }

    SECTION("Merge of disjoint parcels") {
        const auto a = fx.seed("parcels", test::square(0, 0, 1));
        const auto b = fx.seed("parcels", test::square(5, 0, 1));
        auto builder = fx.engine->create_operation();
        builder.add_geometric_op(SelectionSet("parcels", {a.id, b.id}),
                                 directive::MergeParams{});
        expect_rejection<ApplyError>(fx, builder);
        REQUIRE(fx.store.size("parcels") == 2);
        REQUIRE(fx.store.next_id("parcels") == 3);
    }
}

TEST_CASE("EditEngine - Undo and redo", "[edit_engine]") {
    test::EngineFixture fx;
    const auto parcel = fx.seed("parcels", test::square(0, 0, 1),
                                {{"owner", std::string("ann")}});
    const Feature original = fx.store.get(parcel);

    auto builder = fx.engine->create_operation("edit");
    builder.add_modify(parcel, {{"owner", std::string("bob")}});
    builder.add_geometric_op(parcel, directive::RotateParams{{0, 0}, 33.0});
    builder.add_create("wells", Point{2, 2});
    const auto record = fx.submit(builder);
    const Feature edited = fx.store.get(parcel);

    SECTION("Undo restores the exact previous state") {
        REQUIRE(fx.undo() == record);
        REQUIRE(record->state() == TransactionState::Undone);
        REQUIRE(fx.store.get(parcel) == original);
        REQUIRE(fx.store.size("wells") == 0);

        REQUIRE(fx.redo() == record);
        REQUIRE(record->state() == TransactionState::Redone);
        REQUIRE(fx.store.get(parcel) == edited);
        REQUIRE(fx.store.get("wells", 1).id == 1);
    }

    SECTION("Ids survive undo and are never reused") {
        fx.undo();
        REQUIRE(fx.store.next_id("wells") == 2);
        REQUIRE(fx.seed("wells", Point{0, 0}).id == 2);
        REQUIRE_FALSE(fx.engine->can_redo());
    }

    SECTION("Nothing to undo") {
        fx.undo();
        fx.undo();
        REQUIRE_FALSE(fx.engine->can_undo());
        REQUIRE(fx.undo() == nullptr);
        REQUIRE(fx.engine->can_redo());
    }

    SECTION("Undo refuses when the feature changed since") {
        auto later = fx.engine->create_operation("later");
        later.add_modify(parcel, {{"owner", std::string("cid")}});
        fx.submit(later);

        try {
            fx.undo(record);
            FAIL("undo ignored the later change");
        } catch (const ConcurrentModificationError &e) {
            REQUIRE(e.is_retryable());
        }
        REQUIRE(record->state() == TransactionState::Applied);
        REQUIRE(text(fx.store.get(parcel), "owner") == "cid");
    }

    SECTION("Undoing an unknown record") {
        fx.undo();
        REQUIRE_THROWS_AS(fx.undo(record), NotFoundError);
    }
}
