#pragma once

#include <surety/common/error.hpp>

#include <string>

namespace surety {

    /// Specialize per built-in enum:
    ///   static const char *label();
    ///   static std::string name(E value);
    ///   static bool lookup(const std::string &text, E &out);
    template <typename E> struct VocabularyTraits;

    /// Closed set of built-in values plus one `custom_<name>` escape hatch.
    /// Validated once at the boundary; everything downstream holds a typed value.
    template <typename E> class Vocabulary {
      public:
        using Builtin = E;

        Vocabulary() = default;
        Vocabulary(E value) : builtin_(value) {}

        /// `name` must already carry the `custom_` prefix
        static dp::Result<Vocabulary, dp::Error> custom(const std::string &name) {
            if (!isCustomName(name)) {
                return dp::Result<Vocabulary, dp::Error>::err(validation_error(
                    std::string("Invalid custom ") + VocabularyTraits<E>::label() + " '" + name + "'"));
            }
            Vocabulary v;
            v.custom_ = name;
            return dp::Result<Vocabulary, dp::Error>::ok(v);
        }

        static dp::Result<Vocabulary, dp::Error> parse(const std::string &text) {
            E value{};
            if (VocabularyTraits<E>::lookup(text, value)) {
                return dp::Result<Vocabulary, dp::Error>::ok(Vocabulary(value));
            }
            if (isCustomName(text)) {
                return custom(text);
            }
            return dp::Result<Vocabulary, dp::Error>::err(
                validation_error(std::string("Unknown ") + VocabularyTraits<E>::label() + " '" + text + "'"));
        }

        bool isCustom() const { return !custom_.empty(); }
        E builtin() const { return builtin_; }
        const std::string &customName() const { return custom_; }

        bool is(E value) const { return !isCustom() && builtin_ == value; }

        std::string toString() const { return isCustom() ? custom_ : VocabularyTraits<E>::name(builtin_); }

        bool operator==(const Vocabulary &other) const {
            return isCustom() ? custom_ == other.custom_ : (!other.isCustom() && builtin_ == other.builtin_);
        }
        bool operator!=(const Vocabulary &other) const { return !(*this == other); }

      private:
        static bool isCustomName(const std::string &text) {
            static const std::string prefix = "custom_";
            if (text.size() <= prefix.size() || text.compare(0, prefix.size(), prefix) != 0)
                return false;
            for (char c : text) {
                if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_'))
                    return false;
            }
            return true;
        }

        E builtin_{};
        std::string custom_;
    };

} // namespace surety
