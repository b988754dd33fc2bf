#include "descriptor.hpp"

#include <type_traits>

namespace geoedit {

namespace {

void add_scope(std::set<std::string> &out, const FeatureScope &scope) {
    for (auto &name : scope.collections())
        out.insert(std::move(name));
}

} // namespace

std::set<std::string> OperationDescriptor::collections() const {
    std::set<std::string> out;
    for (const Directive &d : m_directives) {
        std::visit(
            [&out](const auto &dir) {
                using T = std::decay_t<decltype(dir)>;
                if constexpr (std::is_same_v<T, directive::Create>) {
                    out.insert(dir.collection);
                } else if constexpr (std::is_same_v<
                                         T, directive::TransferAttributes>) {
                    add_scope(out, dir.source);
                    add_scope(out, dir.target);
                } else if constexpr (std::is_same_v<T, directive::GeometricOp>) {
                    add_scope(out, dir.target);
                    if (const auto *merge =
                            std::get_if<directive::MergeParams>(&dir.params)) {
                        if (merge->destination)
                            out.insert(*merge->destination);
                        if (merge->attributes_from)
                            out.insert(merge->attributes_from->collection);
                    } else if (const auto *offset = std::get_if<
                                   directive::ParallelOffsetParams>(
                                   &dir.params)) {
                        if (offset->destination)
                            out.insert(*offset->destination);
                    }
                } else {
                    add_scope(out, dir.target);
                }
            },
            d);
    }
    return out;
}

} // namespace geoedit
