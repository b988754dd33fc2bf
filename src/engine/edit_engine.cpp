#include "edit_engine.hpp"

#include <set>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"
#include "operation_chain.hpp"

namespace geoedit {

namespace {

std::optional<Feature> snapshot(const StagingArea &staging,
                                const FeatureRef &ref) {
    if (const Feature *feature = staging.find(ref))
        return *feature;
    return std::nullopt;
}

std::set<std::string> touched_collections(
    const std::vector<TransactionPtr> &batch) {
    std::set<std::string> collections;
    for (const TransactionPtr &record : batch) {
        for (const FeatureChange &change : record->changes())
            collections.insert(change.ref.collection);
    }
    return collections;
}

} // namespace

EditEngine::EditEngine(FeatureStore &store,
                       std::shared_ptr<const IGeometryKernel> kernel,
                       EngineConfig config)
    : m_store(&store), m_kernel(std::move(kernel)),
      m_config(std::move(config)) {
    if (!m_kernel)
        throw ConfigError("a geometry kernel is required");
    m_config.validate();
    m_undo.set_max_size(m_config.history_limit);
    m_context = std::make_unique<MutationContext>(m_config.context_name);
}

void EditEngine::require_context(const char *operation) const {
    if (!m_context->is_current())
        throw WrongContextError(
            fmt::format("{} must run on mutation context '{}'", operation,
                        m_context->name()));
}

OperationBuilder EditEngine::create_operation(std::string name) const {
    return OperationBuilder(*m_store, std::move(name));
}

OperationBuilder EditEngine::chain_from(const TransactionPtr &parent,
                                        std::string name) {
    if (!parent)
        throw NoParentTransactionError("no parent transaction given");

    const std::uint64_t sequence = parent->sequence();
    const bool in_history = m_context->call([this, sequence] {
        return sequence != 0 && m_undo.in_past(sequence);
    });

    OperationChain::require_parent(*parent, in_history);
    return OperationChain::seed(*m_store, parent, std::move(name));
}

// -- validation --------------------------------------------------------------

EditEngine::ReadSet
EditEngine::validate(const OperationDescriptor &descriptor) const {
    if (descriptor.empty())
        throw EmptyOperationError(fmt::format(
            "operation '{}' has no directives", descriptor.name()));

    auto guard = [&] {
        try {
            return m_store->lock_for_read(descriptor.collections());
        } catch (const NotFoundError &e) {
            throw ValidationError(e.what());
        }
    }();

    ReadSet reads;
    const auto &directives = descriptor.directives();

    // A target is an existing feature or a feature a Create of this
    // descriptor will produce.
    struct Target {
        std::string collection;
        std::optional<FeatureRef> existing;
    };

    for (std::size_t index = 0; index < directives.size(); ++index) {
        const Directive &current = directives[index];
        const std::string label =
            fmt::format("directive {} ({})", index, directive_name(current));

        auto read = [&](const FeatureRef &ref) {
            if (!guard.find(ref))
                throw ValidationError(
                    fmt::format("{}: feature {} does not exist", label, ref));
            reads.emplace(ref, guard.revision(ref));
        };

        auto targets_of = [&](const FeatureScope &scope) {
            std::vector<Target> targets;
            std::visit(
                [&](const auto &t) {
                    using T = std::decay_t<decltype(t)>;
                    if constexpr (std::is_same_v<T, FeatureRef>) {
                        read(t);
                        targets.push_back({t.collection, t});
                    } else if constexpr (std::is_same_v<T, DirectiveHandle>) {
                        const auto *create =
                            t.index < index ? std::get_if<directive::Create>(
                                                  &directives[t.index])
                                            : nullptr;
                        if (!create)
                            throw ValidationError(fmt::format(
                                "{}: handle {} does not refer to an earlier "
                                "create",
                                label, t.index));
                        targets.push_back({create->collection, std::nullopt});
                    } else {
                        for (const FeatureRef &ref : t.refs()) {
                            read(ref);
                            targets.push_back({ref.collection, ref});
                        }
                    }
                },
                scope.target());
            return targets;
        };

        auto check_type = [&](const std::string &collection,
                              const Geometry &geometry) {
            const GeometryType expected = guard.geometry_type(collection);
            if (type_of(geometry) != expected)
                throw ValidationError(fmt::format(
                    "{}: {} geometry does not fit {} collection '{}'", label,
                    to_string(type_of(geometry)), to_string(expected),
                    collection));
            if (is_degenerate(geometry))
                throw ValidationError(
                    fmt::format("{}: degenerate {} geometry", label,
                                to_string(type_of(geometry))));
        };

        auto require_lines = [&](const std::string &collection) {
            if (guard.geometry_type(collection) != GeometryType::LineString)
                throw ValidationError(
                    fmt::format("{}: collection '{}' does not hold lines",
                                label, collection));
        };

        std::visit(
            [&](const auto &dir) {
                using T = std::decay_t<decltype(dir)>;
                if constexpr (std::is_same_v<T, directive::Create>) {
                    check_type(dir.collection, dir.geometry);
                } else if constexpr (std::is_same_v<T, directive::Modify>) {
                    for (const Target &target : targets_of(dir.target)) {
                        if (dir.geometry)
                            check_type(target.collection, *dir.geometry);
                    }
                } else if constexpr (std::is_same_v<T, directive::Delete>) {
                    targets_of(dir.target);
                } else if constexpr (std::is_same_v<T,
                                                    directive::GeometricOp>) {
                    const std::vector<Target> targets = targets_of(dir.target);
                    if (const auto *offset =
                            std::get_if<directive::ParallelOffsetParams>(
                                &dir.params)) {
                        if (offset->distance <= 0.0 || offset->iterations < 1)
                            throw ValidationError(fmt::format(
                                "{}: offset needs a positive distance and "
                                "iteration count",
                                label));
                        for (const Target &target : targets)
                            require_lines(target.collection);
                        if (offset->destination)
                            require_lines(*offset->destination);
                        return;
                    }
                    if (std::holds_alternative<directive::PlanarizeParams>(
                            dir.params)) {
                        for (const Target &target : targets)
                            require_lines(target.collection);
                        return;
                    }
                    const auto *merge =
                        std::get_if<directive::MergeParams>(&dir.params);
                    if (!merge)
                        return;
                    if (targets.size() < 2)
                        throw ValidationError(fmt::format(
                            "{}: merge needs at least two features, got {}",
                            label, targets.size()));
                    const std::string &source = targets.front().collection;
                    for (const Target &target : targets) {
                        if (target.collection != source)
                            throw ValidationError(fmt::format(
                                "{}: merge spans collections '{}' and '{}'",
                                label, source, target.collection));
                    }
                    const std::string destination =
                        merge->destination.value_or(source);
                    if (guard.geometry_type(destination) !=
                        guard.geometry_type(source))
                        throw ValidationError(fmt::format(
                            "{}: cannot merge {} features into {} "
                            "collection '{}'",
                            label, to_string(guard.geometry_type(source)),
                            to_string(guard.geometry_type(destination)),
                            destination));
                    if (merge->attributes_from)
                        read(*merge->attributes_from);
                } else if constexpr (std::is_same_v<
                                         T, directive::TransferAttributes>) {
                    if (targets_of(dir.source).size() != 1)
                        throw ValidationError(fmt::format(
                            "{}: attribute transfer needs exactly one source "
                            "feature",
                            label));
                    targets_of(dir.target);
                }
            },
            current);
    }

    return reads;
}

// -- apply -------------------------------------------------------------------

std::vector<FeatureRef> EditEngine::resolve_targets(
    const FeatureScope &scope,
    const std::vector<DirectiveOutcome> &outcomes) const {
    return std::visit(
        [&outcomes](const auto &t) -> std::vector<FeatureRef> {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, FeatureRef>) {
                return {t};
            } else if constexpr (std::is_same_v<T, DirectiveHandle>) {
                if (t.index >= outcomes.size() ||
                    outcomes[t.index].created.empty())
                    throw ValidationError(fmt::format(
                        "handle {} has no created feature", t.index));
                return {outcomes[t.index].created.front()};
            } else {
                return t.refs();
            }
        },
        scope.target());
}

void EditEngine::apply_directive(const OperationDescriptor &descriptor,
                                 DirectiveHandle handle, StagingArea &staging,
                                 std::vector<DirectiveOutcome> &outcomes) const {
    const Directive &current_directive = descriptor.at(handle);

    DirectiveOutcome outcome;
    outcome.handle = handle;
    outcome.name = directive_name(current_directive);

    auto current = [&](const FeatureRef &ref) -> Feature {
        const Feature *feature = staging.find(ref);
        if (!feature)
            throw ValidationError(fmt::format(
                "directive {} ({}): feature {} was removed by an earlier "
                "directive",
                handle.index, outcome.name, ref));
        return *feature;
    };

    auto write = [&](const FeatureRef &ref, std::optional<Feature> next) {
        outcome.changes.push_back({ref, snapshot(staging, ref), next});
        staging.put(ref, std::move(next));
    };

    auto create = [&](const std::string &collection, Geometry geometry,
                      AttributeMap attributes) {
        const FeatureRef ref = staging.allocate(collection);
        write(ref, Feature{ref.id, std::move(geometry), std::move(attributes)});
        outcome.created.push_back(ref);
    };

    // Clip and split keep the first piece in place; every further piece
    // becomes a new feature with the same attributes.
    auto replace_with_pieces = [&](const FeatureRef &ref,
                                   std::vector<Geometry> pieces) {
        if (pieces.empty())
            throw GeometryError("operation produced no geometry");
        Feature feature = current(ref);
        const AttributeMap attributes = feature.attributes;
        feature.geometry = std::move(pieces.front());
        write(ref, std::move(feature));
        for (std::size_t i = 1; i < pieces.size(); ++i)
            create(ref.collection, std::move(pieces[i]), attributes);
    };

    const IGeometryKernel &kernel = *m_kernel;

    std::visit(
        [&](const auto &dir) {
            using T = std::decay_t<decltype(dir)>;
            if constexpr (std::is_same_v<T, directive::Create>) {
                create(dir.collection, dir.geometry, dir.attributes);
            } else if constexpr (std::is_same_v<T, directive::Modify>) {
                for (const FeatureRef &ref :
                     resolve_targets(dir.target, outcomes)) {
                    Feature feature = current(ref);
                    for (const auto &[name, value] : dir.attributes)
                        feature.attributes[name] = value;
                    if (dir.geometry)
                        feature.geometry = *dir.geometry;
                    write(ref, std::move(feature));
                }
            } else if constexpr (std::is_same_v<T, directive::Delete>) {
                for (const FeatureRef &ref :
                     resolve_targets(dir.target, outcomes)) {
                    current(ref);
                    write(ref, std::nullopt);
                }
            } else if constexpr (std::is_same_v<T, directive::GeometricOp>) {
                const std::vector<FeatureRef> targets =
                    resolve_targets(dir.target, outcomes);

                std::visit(
                    [&](const auto &p) {
                        using P = std::decay_t<decltype(p)>;
                        if constexpr (std::is_same_v<P, directive::MergeParams>) {
                            std::vector<Geometry> parts;
                            for (const FeatureRef &ref : targets)
                                parts.push_back(current(ref).geometry);
                            Geometry merged = kernel.merge(parts);

                            AttributeMap attributes =
                                current(p.attributes_from.value_or(
                                            targets.front()))
                                    .attributes;
                            for (const auto &[name, value] : p.attributes)
                                attributes[name] = value;

                            if (!p.keep_originals) {
                                for (const FeatureRef &ref : targets)
                                    write(ref, std::nullopt);
                            }
                            create(p.destination.value_or(
                                       targets.front().collection),
                                   std::move(merged), std::move(attributes));
                        } else if constexpr (std::is_same_v<
                                                 P, directive::ClipParams>) {
                            for (const FeatureRef &ref : targets)
                                replace_with_pieces(
                                    ref, kernel.clip(current(ref).geometry,
                                                     p.clip_polygon, p.mode));
                        } else if constexpr (std::is_same_v<
                                                 P, directive::SplitParams>) {
                            for (const FeatureRef &ref : targets)
                                replace_with_pieces(
                                    ref, kernel.split(current(ref).geometry,
                                                      p.method));
                        } else if constexpr (std::is_same_v<
                                                 P, directive::
                                                        ParallelOffsetParams>) {
                            for (const FeatureRef &ref : targets) {
                                const Feature source = current(ref);
                                AttributeMap attributes = source.attributes;
                                for (const auto &[name, value] : p.attributes)
                                    attributes[name] = value;
                                for (Geometry &copy : kernel.parallel_offset(
                                         source.geometry, p.distance, p.side,
                                         p.iterations))
                                    create(p.destination.value_or(
                                               ref.collection),
                                           std::move(copy), attributes);
                            }
                        } else if constexpr (std::is_same_v<
                                                 P,
                                                 directive::PlanarizeParams>) {
                            std::vector<Geometry> lines;
                            for (const FeatureRef &ref : targets)
                                lines.push_back(current(ref).geometry);
                            auto pieces = kernel.planarize(lines);
                            for (std::size_t i = 0; i < targets.size(); ++i) {
                                if (pieces[i].size() > 1)
                                    replace_with_pieces(targets[i],
                                                        std::move(pieces[i]));
                            }
                        } else {
                            // One geometry in, one geometry out.
                            std::optional<AffineMatrix> matrix;
                            if constexpr (std::is_same_v<
                                              P, directive::TransformParams>) {
                                matrix = p.matrix ? *p.matrix
                                                  : fit_transform(p.links,
                                                                  p.method);
                            }
                            for (const FeatureRef &ref : targets) {
                                Feature feature = current(ref);
                                if constexpr (std::is_same_v<
                                                  P, directive::MoveParams>) {
                                    feature.geometry = kernel.move(
                                        feature.geometry, p.dx, p.dy);
                                } else if constexpr (std::is_same_v<
                                                         P,
                                                         directive::
                                                             RotateParams>) {
                                    feature.geometry = kernel.rotate(
                                        feature.geometry, p.origin, p.degrees);
                                } else if constexpr (std::is_same_v<
                                                         P, directive::
                                                                ScaleParams>) {
                                    feature.geometry =
                                        kernel.scale(feature.geometry,
                                                     p.origin, p.sx, p.sy);
                                } else if constexpr (std::is_same_v<
                                                         P,
                                                         directive::
                                                             TransformParams>) {
                                    feature.geometry = kernel.transform(
                                        feature.geometry, *matrix);
                                } else if constexpr (std::is_same_v<
                                                         P,
                                                         directive::
                                                             ReshapeParams>) {
                                    feature.geometry = kernel.reshape(
                                        feature.geometry, p.path);
                                }
                                write(ref, std::move(feature));
                            }
                        }
                    },
                    dir.params);
            } else if constexpr (std::is_same_v<
                                     T, directive::TransferAttributes>) {
                const std::vector<FeatureRef> sources =
                    resolve_targets(dir.source, outcomes);
                const AttributeMap source = current(sources.front()).attributes;

                for (const FeatureRef &ref :
                     resolve_targets(dir.target, outcomes)) {
                    Feature feature = current(ref);
                    if (dir.mapping.empty()) {
                        for (const auto &[name, value] : source)
                            feature.attributes[name] = value;
                    } else {
                        for (const auto &[to, from] : dir.mapping) {
                            auto it = source.find(from);
                            if (it == source.end())
                                throw ValidationError(fmt::format(
                                    "directive {}: source {} has no "
                                    "attribute '{}'",
                                    handle.index, sources.front(), from));
                            feature.attributes[to] = it->second;
                        }
                    }
                    write(ref, std::move(feature));
                }
            }
        },
        current_directive);

    LOG_DEBUG(fmt::format("Applied directive {} ({}): {} changes, {} created",
                          handle.index, outcome.name, outcome.changes.size(),
                          outcome.created.size()));
    outcomes.push_back(std::move(outcome));
}

// -- commit ------------------------------------------------------------------

TransactionPtr EditEngine::commit(const TransactionPtr &record,
                                  const ReadSet &reads) {
    const OperationDescriptor &descriptor = *record->descriptor();

    if (const auto parent = descriptor.parent_sequence()) {
        if (!m_undo.in_past(*parent))
            throw NoParentTransactionError(
                fmt::format("parent #{} of '{}' is not applied", *parent,
                            descriptor.name()));
    }

    auto guard = m_store->lock_for_write(descriptor.collections());
    for (const auto &[ref, revision] : reads) {
        if (guard.revision(ref) != revision)
            throw ConcurrentModificationError(
                fmt::format("{} changed after '{}' was validated", ref,
                            descriptor.name()));
    }

    StagingArea staging(guard);
    std::vector<DirectiveOutcome> outcomes;
    outcomes.reserve(descriptor.size());

    for (std::uint32_t i = 0; i < descriptor.size(); ++i) {
        const DirectiveHandle handle{i};
        try {
            apply_directive(descriptor, handle, staging, outcomes);
        } catch (const OperationRejected &) {
            throw;
        } catch (const std::exception &e) {
            // Kernel and container failures alike; nothing is written yet.
            throw ApplyError(fmt::format("directive {} ({}): {}", i,
                                         directive_name(descriptor.at(handle)),
                                         e.what()));
        }
    }

    record->m_changes = staging.commit();
    record->m_outcomes = std::move(outcomes);
    record->m_sequence = ++m_last_sequence;
    record->set_state(TransactionState::Applied);
    m_undo.push(record);

    LOG_INFO(fmt::format("Committed '{}' as #{} ({} features changed)",
                         record->name(), record->sequence(),
                         record->changes().size()));
    return record;
}

TransactionPtr EditEngine::run_submission(const TransactionPtr &record,
                                          const ReadSet *reads) {
    try {
        if (reads)
            return commit(record, *reads);

        const ReadSet local = validate(*record->descriptor());
        record->set_state(TransactionState::Validated);
        return commit(record, local);
    } catch (OperationRejected &e) {
        record->set_state(TransactionState::Rejected);
        e.attach(record);
        LOG_WARN(fmt::format("Operation '{}' rejected: {}", record->name(),
                             e.what()));
        throw;
    }
}

TransactionPtr EditEngine::submit(const DescriptorPtr &descriptor) {
    require_context("submit");
    if (!descriptor)
        throw ValidationError("no descriptor given");

    return run_submission(std::make_shared<TransactionRecord>(descriptor),
                          nullptr);
}

SubmitHandle EditEngine::submit_async(const DescriptorPtr &descriptor) {
    if (!descriptor)
        return SubmitHandle::rejected(std::make_exception_ptr(
            ValidationError("no descriptor given")));

    auto record = std::make_shared<TransactionRecord>(descriptor);
    std::shared_ptr<const ReadSet> reads;

    if (m_config.validate_on_caller) {
        try {
            reads = std::make_shared<const ReadSet>(validate(*descriptor));
            record->set_state(TransactionState::Validated);
        } catch (OperationRejected &e) {
            record->set_state(TransactionState::Rejected);
            e.attach(record);
            LOG_WARN(fmt::format("Operation '{}' rejected: {}",
                                 record->name(), e.what()));
            return SubmitHandle::rejected(std::current_exception());
        }
    }

    return enqueue(
        [this, record, reads] { return run_submission(record, reads.get()); });
}

SubmitHandle EditEngine::enqueue(std::function<TransactionPtr()> work) {
    auto ticket = std::make_shared<SubmitHandle::Ticket>();
    ticket->work = std::move(work);
    try {
        m_context->post([ticket] { ticket->run(); });
    } catch (const WrongContextError &) {
        return SubmitHandle::rejected(std::current_exception());
    }
    return SubmitHandle(ticket);
}

// -- undo / redo -------------------------------------------------------------

TransactionPtr EditEngine::undo_now(const TransactionRecord *root) {
    const std::vector<TransactionPtr> batch = m_undo.undo_batch(root);
    if (batch.empty())
        return nullptr;

    auto guard = m_store->lock_for_write(touched_collections(batch));
    StagingArea staging(guard);

    for (const TransactionPtr &record : batch) {
        const auto &changes = record->changes();
        for (auto it = changes.rbegin(); it != changes.rend(); ++it) {
            if (!same_state(snapshot(staging, it->ref), it->after))
                throw ConcurrentModificationError(fmt::format(
                    "{} changed since '{}' (#{}) was applied", it->ref,
                    record->name(), record->sequence()));
            staging.put(it->ref, it->before);
        }
    }

    staging.commit();
    for (const TransactionPtr &record : batch)
        record->set_state(TransactionState::Undone);
    m_undo.commit_undo(batch);

    LOG_INFO(fmt::format("Undid '{}' (#{}) with {} chained", batch.back()->name(),
                         batch.back()->sequence(), batch.size() - 1));
    return batch.back();
}

TransactionPtr EditEngine::redo_now(const TransactionRecord *root) {
    const std::vector<TransactionPtr> batch = m_undo.redo_batch(root);
    if (batch.empty())
        return nullptr;

    const TransactionPtr &first = batch.front();
    if (const auto parent = first->parent_sequence()) {
        if (!m_undo.in_past(*parent))
            throw NoParentTransactionError(
                fmt::format("parent #{} of '{}' is not applied", *parent,
                            first->name()));
    }

    auto guard = m_store->lock_for_write(touched_collections(batch));
    StagingArea staging(guard);

    for (const TransactionPtr &record : batch) {
        for (const FeatureChange &change : record->changes()) {
            if (!same_state(snapshot(staging, change.ref), change.before))
                throw ConcurrentModificationError(fmt::format(
                    "{} changed since '{}' (#{}) was undone", change.ref,
                    record->name(), record->sequence()));
            staging.put(change.ref, change.after);
        }
    }

    staging.commit();
    for (const TransactionPtr &record : batch)
        record->set_state(TransactionState::Redone);
    m_undo.commit_redo(batch);

    LOG_INFO(fmt::format("Redid '{}' (#{}) with {} chained", first->name(),
                         first->sequence(), batch.size() - 1));
    return first;
}

TransactionPtr EditEngine::undo() {
    require_context("undo");
    return undo_now(nullptr);
}

TransactionPtr EditEngine::undo(const TransactionPtr &record) {
    require_context("undo");
    return undo_now(record.get());
}

TransactionPtr EditEngine::redo() {
    require_context("redo");
    return redo_now(nullptr);
}

TransactionPtr EditEngine::redo(const TransactionPtr &record) {
    require_context("redo");
    return redo_now(record.get());
}

SubmitHandle EditEngine::undo_async(TransactionPtr record) {
    return enqueue([this, record] { return undo_now(record.get()); });
}

SubmitHandle EditEngine::redo_async(TransactionPtr record) {
    return enqueue([this, record] { return redo_now(record.get()); });
}

bool EditEngine::can_undo() {
    return m_context->call([this] { return m_undo.can_undo(); });
}

bool EditEngine::can_redo() {
    return m_context->call([this] { return m_undo.can_redo(); });
}

} // namespace geoedit
