#include <doctest/doctest.h>

#include <surety/subject/registry.hpp>

using namespace surety;
using namespace surety::subject;

TEST_SUITE("Subject Registry Tests") {

    TEST_CASE("Registered subjects resolve") {
        InMemorySubjectRegistry registry;
        SubjectRef biz("biz", "b-1");

        REQUIRE(registry.registerSubject("t1", biz).is_ok());
        auto found = registry.exists("t1", biz);
        REQUIRE(found.is_ok());
        CHECK(found.value());
        CHECK(registry.size("t1") == 1);
    }

    TEST_CASE("Registering twice is a duplicate") {
        InMemorySubjectRegistry registry;
        SubjectRef biz("biz", "b-1");

        REQUIRE(registry.registerSubject("t1", biz).is_ok());
        auto again = registry.registerSubject("t1", biz);
        REQUIRE(again.is_err());
        CHECK(again.error().code == ERR_DUPLICATE);
    }

    TEST_CASE("Tenants are isolated") {
        InMemorySubjectRegistry registry;
        SubjectRef biz("biz", "b-1");
        REQUIRE(registry.registerSubject("t1", biz).is_ok());

        auto other = registry.exists("t2", biz);
        REQUIRE(other.is_ok());
        CHECK_FALSE(other.value());

        auto required = requireSubject(registry, "t2", biz, "anchor");
        REQUIRE(required.is_err());
        CHECK(required.error().code == ERR_SUBJECT_UNRESOLVED);
    }

    TEST_CASE("Deregistered subjects stop resolving") {
        InMemorySubjectRegistry registry;
        SubjectRef user("user", "u-1");
        REQUIRE(registry.registerSubject("t1", user).is_ok());
        REQUIRE(registry.deregisterSubject("t1", user).is_ok());

        CHECK(requireSubject(registry, "t1", user, "obligor").is_err());
        CHECK(registry.deregisterSubject("t1", user).is_err());
    }

    TEST_CASE("Shape is checked before existence") {
        InMemorySubjectRegistry registry;
        auto bad = requireSubject(registry, "t1", SubjectRef("User", "u-1"), "raised_by");
        REQUIRE(bad.is_err());
        CHECK(bad.error().code == ERR_VALIDATION);
    }

    TEST_CASE("Optional subjects may be absent") {
        InMemorySubjectRegistry registry;
        CHECK(requireOptionalSubject(registry, "t1", std::nullopt, "counterparty").is_ok());
        CHECK(requireOptionalSubject(registry, "t1", SubjectRef("user", "ghost"), "counterparty").is_err());
    }
}
