#pragma once

#include <surety/subject/subject.hpp>

#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

namespace surety::subject {

    /// Port to whatever owns subject identities. Consulted at entity creation only.
    class SubjectRegistry {
      public:
        virtual ~SubjectRegistry() = default;

        /// ok(true) if the subject exists and is usable for the tenant
        virtual dp::Result<bool, dp::Error> exists(const std::string &tenant_id, const SubjectRef &ref) const = 0;
    };

    /// Registry backed by a tenant -> {kind:id} set. Used by tests and embedding hosts.
    class InMemorySubjectRegistry : public SubjectRegistry {
      public:
        InMemorySubjectRegistry() = default;

        inline dp::Result<void, dp::Error> registerSubject(const std::string &tenant_id, const SubjectRef &ref) {
            auto valid = ref.validate("registered");
            if (!valid.is_ok())
                return valid;

            std::unique_lock lock(mutex_);
            auto inserted = subjects_[tenant_id].insert(ref.toString()).second;
            if (!inserted) {
                return dp::Result<void, dp::Error>::err(duplicate("Subject " + ref.toString() + " already registered"));
            }
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<void, dp::Error> deregisterSubject(const std::string &tenant_id, const SubjectRef &ref) {
            std::unique_lock lock(mutex_);
            auto it = subjects_.find(tenant_id);
            if (it == subjects_.end() || it->second.erase(ref.toString()) == 0) {
                return dp::Result<void, dp::Error>::err(not_found("Subject " + ref.toString() + " not registered"));
            }
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<bool, dp::Error> exists(const std::string &tenant_id, const SubjectRef &ref) const override {
            std::shared_lock lock(mutex_);
            auto it = subjects_.find(tenant_id);
            if (it == subjects_.end())
                return dp::Result<bool, dp::Error>::ok(false);
            return dp::Result<bool, dp::Error>::ok(it->second.count(ref.toString()) > 0);
        }

        inline size_t size(const std::string &tenant_id) const {
            std::shared_lock lock(mutex_);
            auto it = subjects_.find(tenant_id);
            return it == subjects_.end() ? 0 : it->second.size();
        }

      private:
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, std::unordered_set<std::string>> subjects_;
    };

    /// Validate shape and existence of a subject in one step
    inline dp::Result<void, dp::Error> requireSubject(const SubjectRegistry &registry, const std::string &tenant_id,
                                                      const SubjectRef &ref, const std::string &role) {
        auto valid = ref.validate(role);
        if (!valid.is_ok())
            return valid;

        auto found = registry.exists(tenant_id, ref);
        if (!found.is_ok()) {
            return dp::Result<void, dp::Error>::err(found.error());
        }
        if (!found.value()) {
            return dp::Result<void, dp::Error>::err(
                subject_unresolved(role + " subject " + ref.toString() + " does not resolve in tenant " + tenant_id));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    inline dp::Result<void, dp::Error> requireOptionalSubject(const SubjectRegistry &registry,
                                                              const std::string &tenant_id,
                                                              const std::optional<SubjectRef> &ref,
                                                              const std::string &role) {
        if (!ref.has_value())
            return dp::Result<void, dp::Error>::ok();
        return requireSubject(registry, tenant_id, *ref, role);
    }

} // namespace surety::subject
