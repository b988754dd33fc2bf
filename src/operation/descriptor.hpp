#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "directive.hpp"

namespace geoedit {

/**
 * @brief Immutable, ordered list of directives submitted as one transaction.
 *
 * Only an OperationBuilder creates descriptors. Once built a descriptor can be
 * shared between threads freely.
 */
class OperationDescriptor {
  public:
    const std::string &name() const noexcept { return m_name; }
    const std::vector<Directive> &directives() const noexcept {
        return m_directives;
    }

    bool empty() const noexcept { return m_directives.empty(); }
    std::size_t size() const noexcept { return m_directives.size(); }

    const Directive &at(DirectiveHandle handle) const {
        return m_directives.at(handle.index);
    }

    /**
     * @brief Sequence of the transaction this one is chained to.
     */
    std::optional<std::uint64_t> parent_sequence() const noexcept {
        return m_parent_sequence;
    }

    /**
     * @brief Every collection a directive reads or writes, including merge
     * destinations and merge attribute sources.
     */
    std::set<std::string> collections() const;

  private:
    friend class OperationBuilder;
    OperationDescriptor() = default;

    std::string m_name;
    std::vector<Directive> m_directives;
    std::optional<std::uint64_t> m_parent_sequence;
};

using DescriptorPtr = std::shared_ptr<const OperationDescriptor>;

} // namespace geoedit
