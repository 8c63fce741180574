#pragma once

#include <surety/common/error.hpp>

#include <optional>
#include <string>

namespace surety::subject {

    /// Polymorphic reference to an identity owned by another subsystem
    /// (user, biz, location, booking line, plugin object...).
    struct SubjectRef {
        std::string kind;
        std::string id;

        SubjectRef() = default;
        SubjectRef(std::string k, std::string i) : kind(std::move(k)), id(std::move(i)) {}

        inline std::string toString() const { return kind + ":" + id; }

        inline bool operator==(const SubjectRef &other) const { return kind == other.kind && id == other.id; }
        inline bool operator!=(const SubjectRef &other) const { return !(*this == other); }
        inline bool operator<(const SubjectRef &other) const {
            return kind != other.kind ? kind < other.kind : id < other.id;
        }

        /// kind: [a-z][a-z0-9_]{0,79}, id: 1..140 chars
        inline dp::Result<void, dp::Error> validate(const std::string &role) const {
            if (kind.empty() || kind.size() > 80 || kind[0] < 'a' || kind[0] > 'z') {
                return dp::Result<void, dp::Error>::err(validation_error(role + " subject kind '" + kind +
                                                                         "' must match [a-z][a-z0-9_]*"));
            }
            for (char c : kind) {
                if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_')) {
                    return dp::Result<void, dp::Error>::err(validation_error(role + " subject kind '" + kind +
                                                                             "' must match [a-z][a-z0-9_]*"));
                }
            }
            if (id.empty() || id.size() > 140) {
                return dp::Result<void, dp::Error>::err(validation_error(role + " subject id must be 1..140 chars"));
            }
            return dp::Result<void, dp::Error>::ok();
        }

        /// Build an optional reference from a loose (type, id) pair.
        /// Both or neither must be present.
        inline static dp::Result<std::optional<SubjectRef>, dp::Error>
        fromPair(const std::optional<std::string> &kind, const std::optional<std::string> &id,
                 const std::string &role) {
            if (!kind.has_value() && !id.has_value()) {
                return dp::Result<std::optional<SubjectRef>, dp::Error>::ok(std::nullopt);
            }
            if (kind.has_value() != id.has_value()) {
                return dp::Result<std::optional<SubjectRef>, dp::Error>::err(
                    validation_error(role + " subject pair must be fully set or fully empty"));
            }
            SubjectRef ref(*kind, *id);
            auto valid = ref.validate(role);
            if (!valid.is_ok()) {
                return dp::Result<std::optional<SubjectRef>, dp::Error>::err(valid.error());
            }
            return dp::Result<std::optional<SubjectRef>, dp::Error>::ok(std::optional<SubjectRef>(ref));
        }
    };

} // namespace surety::subject
