#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../geometry/kernel.hpp"
#include "../store/feature.hpp"
#include "../store/selection_set.hpp"

namespace geoedit {

/**
 * @brief Position of a directive inside its descriptor.
 */
struct DirectiveHandle {
    std::uint32_t index = 0;

    bool operator==(const DirectiveHandle &other) const {
        return index == other.index;
    }
    bool operator!=(const DirectiveHandle &other) const {
        return index != other.index;
    }
};

/**
 * @brief What a directive applies to.
 *
 * A single feature, the feature an earlier Create of the same descriptor
 * produces, or every feature of a selection. All three resolve to a list of
 * FeatureRefs and go through the same per-feature path.
 */
class FeatureScope {
  public:
    using Target = std::variant<FeatureRef, DirectiveHandle, SelectionSet>;

    FeatureScope(FeatureRef ref) : m_target(std::move(ref)) {}
    FeatureScope(DirectiveHandle pending) : m_target(pending) {}
    FeatureScope(SelectionSet selection) : m_target(std::move(selection)) {}

    static FeatureScope feature(const std::string &collection, FeatureId id) {
        return FeatureScope(FeatureRef{collection, id});
    }

    const Target &target() const noexcept { return m_target; }

    bool is_pending() const noexcept {
        return std::holds_alternative<DirectiveHandle>(m_target);
    }

    /**
     * @brief Collections the scope names directly. Empty for pending
     * references, which live in the collection of their Create.
     */
    std::vector<std::string> collections() const;

  private:
    Target m_target;
};

namespace directive {

struct Create {
    std::string collection;
    Geometry geometry;
    AttributeMap attributes;
};

/**
 * Attributes are assigned over the existing ones; a null value is stored as
 * null, it does not remove the attribute.
 */
struct Modify {
    FeatureScope target;
    AttributeMap attributes;
    std::optional<Geometry> geometry;
};

struct Delete {
    FeatureScope target;
};

enum class GeometricKind {
    Move,
    Rotate,
    Scale,
    Transform,
    Clip,
    Split,
    Merge,
    Reshape,
    ParallelOffset,
    Planarize
};

const char *to_string(GeometricKind kind) noexcept;

struct MoveParams {
    double dx = 0.0;
    double dy = 0.0;
};

struct RotateParams {
    Point origin;
    double degrees = 0.0; // counter-clockwise
};

struct ScaleParams {
    Point origin;
    double sx = 1.0;
    double sy = 1.0;
};

/**
 * Either an explicit matrix, or control links the matrix is fitted from
 * when the directive is applied.
 */
struct TransformParams {
    std::optional<AffineMatrix> matrix;
    std::vector<ControlLink> links;
    TransformMethod method = TransformMethod::Affine;
};

struct ClipParams {
    Polygon clip_polygon;
    ClipMode mode = ClipMode::PreserveArea;
};

struct SplitParams {
    SplitMethod method;
};

/**
 * Merges every feature of the scope into one new feature.
 */
struct MergeParams {
    std::optional<std::string> destination; // default: source collection
    std::optional<FeatureRef> attributes_from; // default: first target
    AttributeMap attributes;
    bool keep_originals = false;
};

struct ReshapeParams {
    LineString path;
};

/**
 * Creates offset copies of every line in scope. The copies get the source
 * feature's attributes with `attributes` assigned over them; the sources
 * stay as they are.
 */
struct ParallelOffsetParams {
    double distance = 0.0;
    OffsetSide side = OffsetSide::Both;
    int iterations = 1;
    std::optional<std::string> destination; // default: source collection
    AttributeMap attributes;
};

/**
 * Splits the lines in scope where they cross each other. Each line keeps its
 * first piece; further pieces become new features with its attributes.
 */
struct PlanarizeParams {};

using GeometricParams =
    std::variant<MoveParams, RotateParams, ScaleParams, TransformParams,
                 ClipParams, SplitParams, MergeParams, ReshapeParams,
                 ParallelOffsetParams, PlanarizeParams>;

struct GeometricOp {
    FeatureScope target;
    GeometricParams params;

    GeometricKind kind() const noexcept {
        return static_cast<GeometricKind>(params.index());
    }
};

/**
 * Copies attributes of one source feature onto every target. `mapping` is
 * destination name to source name; when empty every source attribute is
 * copied under its own name.
 */
struct TransferAttributes {
    FeatureScope source;
    FeatureScope target;
    std::map<std::string, std::string> mapping;
};

} // namespace directive

using Directive =
    std::variant<directive::Create, directive::Modify, directive::Delete,
                 directive::GeometricOp, directive::TransferAttributes>;

/**
 * @brief Short name of the directive for logs and records, e.g. "create" or
 * "split".
 */
std::string directive_name(const Directive &directive);

} // namespace geoedit
