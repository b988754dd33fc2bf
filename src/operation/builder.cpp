#include "builder.hpp"

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace geoedit {

OperationBuilder::OperationBuilder(const FeatureStore &store, std::string name)
    : m_store(&store), m_name(std::move(name)) {}

void OperationBuilder::check_open() const {
    if (sealed())
        throw ValidationError(
            fmt::format("operation '{}' is already built", m_name));
}

void OperationBuilder::check_collection(const std::string &name) const {
    if (!m_store->has_collection(name))
        throw ValidationError(fmt::format("unknown collection '{}'", name));
}

void OperationBuilder::check_scope(const FeatureScope &scope) const {
    if (const auto *pending = std::get_if<DirectiveHandle>(&scope.target())) {
        if (pending->index >= m_directives.size() ||
            !std::holds_alternative<directive::Create>(
                m_directives[pending->index]))
            throw ValidationError(fmt::format(
                "handle {} does not refer to an earlier create",
                pending->index));
        return;
    }
    for (const std::string &name : scope.collections())
        check_collection(name);
}

DirectiveHandle OperationBuilder::push(Directive directive) {
    DirectiveHandle handle{static_cast<std::uint32_t>(m_directives.size())};
    m_directives.push_back(std::move(directive));
    return handle;
}

DirectiveHandle OperationBuilder::add_create(const std::string &collection,
                                             Geometry geometry,
                                             AttributeMap attributes) {
    check_open();
    check_collection(collection);
    return push(directive::Create{collection, std::move(geometry),
                                  std::move(attributes)});
}

DirectiveHandle OperationBuilder::add_modify(FeatureScope target,
                                             AttributeMap attributes,
                                             std::optional<Geometry> geometry) {
    check_open();
    check_scope(target);
    return push(directive::Modify{std::move(target), std::move(attributes),
                                  std::move(geometry)});
}

DirectiveHandle OperationBuilder::add_delete(FeatureScope target) {
    check_open();
    check_scope(target);
    return push(directive::Delete{std::move(target)});
}

DirectiveHandle
OperationBuilder::add_geometric_op(FeatureScope target,
                                   directive::GeometricParams params) {
    check_open();
    check_scope(target);
    if (const auto *merge = std::get_if<directive::MergeParams>(&params)) {
        if (merge->destination)
            check_collection(*merge->destination);
        if (merge->attributes_from)
            check_collection(merge->attributes_from->collection);
    } else if (const auto *offset =
                   std::get_if<directive::ParallelOffsetParams>(&params)) {
        if (offset->destination)
            check_collection(*offset->destination);
    }
    return push(directive::GeometricOp{std::move(target), std::move(params)});
}

DirectiveHandle OperationBuilder::add_transfer_attributes(
    FeatureScope source, FeatureScope target,
    std::map<std::string, std::string> mapping) {
    check_open();
    check_scope(source);
    check_scope(target);
    if (const auto *selection = std::get_if<SelectionSet>(&source.target());
        selection && selection->size() != 1)
        throw ValidationError(
            "attribute transfer needs exactly one source feature");
    return push(directive::TransferAttributes{
        std::move(source), std::move(target), std::move(mapping)});
}

DescriptorPtr OperationBuilder::build() {
    if (m_built)
        return m_built;

    std::shared_ptr<OperationDescriptor> descriptor(new OperationDescriptor());
    descriptor->m_name = m_name;
    descriptor->m_directives = std::move(m_directives);
    if (m_parent)
        descriptor->m_parent_sequence = m_parent->sequence();
    m_directives.clear();
    m_built = descriptor;

    LOG_DEBUG(fmt::format("Built operation '{}' with {} directives", m_name,
                          descriptor->size()));
    return m_built;
}

FeatureRef OperationBuilder::parent_ref(DirectiveHandle handle,
                                        std::size_t n) const {
    if (!m_parent)
        throw NotFoundError(
            fmt::format("operation '{}' is not chained", m_name));
    return m_parent->resolve(handle, n);
}

} // namespace geoedit
