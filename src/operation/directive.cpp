#include "directive.hpp"

#include <type_traits>

namespace geoedit {

std::vector<std::string> FeatureScope::collections() const {
    return std::visit(
        [](const auto &t) -> std::vector<std::string> {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, FeatureRef>) {
                return {t.collection};
            } else if constexpr (std::is_same_v<T, SelectionSet>) {
                return t.collections();
            } else {
                return {};
            }
        },
        m_target);
}

namespace directive {

const char *to_string(GeometricKind kind) noexcept {
    switch (kind) {
    case GeometricKind::Move:
        return "move";
    case GeometricKind::Rotate:
        return "rotate";
    case GeometricKind::Scale:
        return "scale";
    case GeometricKind::Transform:
        return "transform";
    case GeometricKind::Clip:
        return "clip";
    case GeometricKind::Split:
        return "split";
    case GeometricKind::Merge:
        return "merge";
    case GeometricKind::Reshape:
        return "reshape";
    case GeometricKind::ParallelOffset:
        return "parallel_offset";
    case GeometricKind::Planarize:
        return "planarize";
    }
    return "unknown";
}

} // namespace directive

std::string directive_name(const Directive &directive) {
    return std::visit(
        [](const auto &d) -> std::string {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, directive::Create>) {
                return "create";
            } else if constexpr (std::is_same_v<T, directive::Modify>) {
                return "modify";
            } else if constexpr (std::is_same_v<T, directive::Delete>) {
                return "delete";
            } else if constexpr (std::is_same_v<T, directive::GeometricOp>) {
                return directive::to_string(d.kind());
            } else if constexpr (std::is_same_v<
                                     T, directive::TransferAttributes>) {
                return "transfer_attributes";
            }
        },
        directive);
}

} // namespace geoedit
