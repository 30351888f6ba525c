// POLITY - Dependency Resolution Implementation
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/authz/dependency.h"
#include "polity/util/logging.h"

namespace polity {
namespace authz {

Status DependencyResolver::ResolveAuthority(OrganizationId id, AuthorityChain* out) const {
    AuthorityChain chain;
    OrganizationId current = id;

    // Iterative and bounded; each level is an independent snapshot.
    for (size_t hops = 0;; ++hops) {
        OrganizationRecord record;
        Status s = registry_.Lookup(current, &record);
        if (!s.ok()) {
            return s;
        }
        chain.path.push_back(current);

        if (!record.governance.IsDelegated()) {
            chain.evaluator = std::move(record);
            LOG_TRACE(util::LogCategory::AUTHZ) << "Organization " << id
                << " resolves to evaluator " << current << " after " << hops << " hops";
            if (out) {
                *out = std::move(chain);
            }
            return Status::Ok();
        }

        if (!record.parent) {
            return Status::Rejected("organization " + std::to_string(current) +
                                    " delegates but has no parent");
        }
        if (hops >= maxDepth_) {
            LOG_WARN(util::LogCategory::AUTHZ) << "Dependency chain from " << id
                << " exceeds " << maxDepth_ << " hops";
            return Status::DepthExceeded("dependency chain from " + std::to_string(id) +
                                         " exceeds " + std::to_string(maxDepth_) + " hops");
        }
        current = *record.parent;
    }
}

} // namespace authz
} // namespace polity
