// POLITY - Dependency Resolution
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// Finds the organization whose governance decides an action submitted to
// an SAO. Delegated levels pass the decision upward; the first
// non-delegated ancestor evaluates.

#ifndef POLITY_AUTHZ_DEPENDENCY_H
#define POLITY_AUTHZ_DEPENDENCY_H

#include "polity/core/status.h"
#include "polity/org/organization.h"
#include "polity/registry/registry.h"

#include <cstddef>
#include <vector>

namespace polity {
namespace authz {

using org::OrganizationId;
using org::OrganizationRecord;

/// Default bound on parent hops
constexpr size_t DEFAULT_MAX_DEPTH = 16;

/// Result of an upward walk
struct AuthorityChain {
    /// Submitting organization first, evaluator last
    std::vector<OrganizationId> path;
    /// Snapshot of the evaluating organization
    OrganizationRecord evaluator;

    size_t Depth() const { return path.empty() ? 0 : path.size() - 1; }
};

class DependencyResolver {
public:
    explicit DependencyResolver(const registry::Registry& registry,
                                size_t maxDepth = DEFAULT_MAX_DEPTH)
        : registry_(registry), maxDepth_(maxDepth) {}

    /**
     * Walk parent pointers from id until a non-delegated level is found.
     *
     * @return NotFound if id or an ancestor is missing, DepthExceeded if
     *         more than maxDepth parent hops would be needed, Rejected if a
     *         delegated organization has no parent.
     */
    Status ResolveAuthority(OrganizationId id, AuthorityChain* out) const;

    size_t GetMaxDepth() const { return maxDepth_; }

private:
    const registry::Registry& registry_;
    size_t maxDepth_;
};

} // namespace authz
} // namespace polity

#endif // POLITY_AUTHZ_DEPENDENCY_H
