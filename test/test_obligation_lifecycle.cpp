#include "engine_fixture.hpp"

using namespace surety;
using namespace surety::commitment;

TEST_SUITE("Obligation lifecycle") {

    TEST_CASE("Pending to in progress to satisfied") {
        EngineFixture f;
        auto c = f.activeContract(1000);
        auto id = f.addObligation(c.id);

        auto started = f.engine->startObligation(f.tenant, id);
        REQUIRE(started.is_ok());
        CHECK(started.value().obligation.status == ObligationStatus::InProgress);

        // Only pending obligations start
        CHECK(f.engine->startObligation(f.tenant, id).error().code == ERR_INVALID_STATE);

        f.advance(500);
        auto satisfied = f.engine->satisfyObligation(f.tenant, id);
        REQUIRE(satisfied.is_ok());
        CHECK(satisfied.value().obligation.status == ObligationStatus::Satisfied);
        CHECK(satisfied.value().obligation.satisfied_at == std::optional<Millis>(f.clock_now));
    }

    TEST_CASE("Creation checks subjects and amounts") {
        EngineFixture f;
        auto c = f.activeContract(1000);

        ObligationDraft draft;
        draft.title = "pay";
        draft.required_amount = -5;
        CHECK(f.engine->addObligation(f.tenant, c.id, draft).error().code == ERR_VALIDATION);

        draft.required_amount = 100;
        draft.obligor = subject::SubjectRef("user", "nobody");
        CHECK(f.engine->addObligation(f.tenant, c.id, draft).error().code == ERR_SUBJECT_UNRESOLVED);

        draft.obligor = f.vendor;
        draft.beneficiary = f.customer;
        auto added = f.engine->addObligation(f.tenant, c.id, draft);
        REQUIRE(added.is_ok());
        CHECK(added.value().id.rfind("obl-", 0) == 0);
        CHECK(added.value().status == ObligationStatus::Pending);
        CHECK(added.value().satisfied_amount == 0);

        CHECK(f.engine->addObligation(f.tenant, "ctr-404", draft).error().code == ERR_NOT_FOUND);
    }

    TEST_CASE("Partial satisfaction accumulates toward the required amount") {
        EngineFixture f;
        auto c = f.activeContract(1000);
        ObligationDraft draft;
        draft.title = "instalments";
        draft.required_amount = 300;
        auto id = f.engine->addObligation(f.tenant, c.id, draft).value().id;

        auto first = f.engine->recordSatisfaction(f.tenant, id, 100);
        REQUIRE(first.is_ok());
        CHECK(first.value().obligation.status == ObligationStatus::InProgress);
        CHECK(first.value().obligation.satisfied_amount == 100);

        // Cannot satisfy outright until the amount is met
        CHECK(f.engine->satisfyObligation(f.tenant, id).error().code == ERR_INVALID_STATE);

        // Overshoot is rejected and leaves the amount alone
        CHECK(f.engine->recordSatisfaction(f.tenant, id, 250).error().code == ERR_VALIDATION);
        CHECK(f.engine->obligation(f.tenant, id).value().satisfied_amount == 100);

        auto last = f.engine->recordSatisfaction(f.tenant, id, 200);
        REQUIRE(last.is_ok());
        CHECK(last.value().obligation.status == ObligationStatus::Satisfied);
        CHECK(last.value().obligation.satisfied_amount == 300);
    }

    TEST_CASE("Satisfaction with an explicit amount") {
        EngineFixture f;
        auto c = f.activeContract(1000);
        ObligationDraft draft;
        draft.required_amount = 300;
        auto id = f.engine->addObligation(f.tenant, c.id, draft).value().id;

        CHECK(f.engine->satisfyObligation(f.tenant, id, Money(400)).error().code == ERR_VALIDATION);
        CHECK(f.engine->satisfyObligation(f.tenant, id, Money(200)).error().code == ERR_INVALID_STATE);
        CHECK(f.engine->obligation(f.tenant, id).value().status == ObligationStatus::Pending);

        auto done = f.engine->satisfyObligation(f.tenant, id, Money(300));
        REQUIRE(done.is_ok());
        CHECK(done.value().obligation.status == ObligationStatus::Satisfied);
    }

    TEST_CASE("Progress needs a required amount") {
        EngineFixture f;
        auto c = f.activeContract(1000);
        auto id = f.addObligation(c.id);
        CHECK(f.engine->recordSatisfaction(f.tenant, id, 10).error().code == ERR_VALIDATION);
        CHECK(f.engine->recordSatisfaction(f.tenant, id, 0).error().code == ERR_VALIDATION);
    }

    TEST_CASE("Breach, expiry and cancellation are final") {
        EngineFixture f;
        auto c = f.activeContract(1000);
        auto breached = f.addObligation(c.id, "breached");
        auto expired = f.addObligation(c.id, "expired");
        auto cancelled = f.addObligation(c.id, "cancelled");

        REQUIRE(f.engine->markObligationBreached(f.tenant, breached).is_ok());
        REQUIRE(f.engine->markObligationExpired(f.tenant, expired).is_ok());
        REQUIRE(f.engine->cancelObligation(f.tenant, cancelled).is_ok());

        // Repeating breach or expiry is a no-op
        CHECK(f.engine->markObligationBreached(f.tenant, breached).is_ok());
        CHECK(f.engine->markObligationExpired(f.tenant, expired).is_ok());

        for (const auto &id : {breached, expired, cancelled}) {
            CHECK(f.engine->satisfyObligation(f.tenant, id).error().code == ERR_INVALID_STATE);
            CHECK(f.engine->waiveObligation(f.tenant, id).error().code == ERR_INVALID_STATE);
            CHECK(f.engine->reopenObligation(f.tenant, id).error().code == ERR_INVALID_STATE);
        }

        auto o = f.engine->obligation(f.tenant, breached).value();
        CHECK(o.breached_at.has_value());
    }

    TEST_CASE("Satisfied and waived obligations reopen") {
        EngineFixture f;
        auto c = f.activeContract(1000);
        auto id = f.addObligation(c.id);

        REQUIRE(f.engine->satisfyObligation(f.tenant, id).is_ok());
        auto reopened = f.engine->reopenObligation(f.tenant, id);
        REQUIRE(reopened.is_ok());
        CHECK(reopened.value().obligation.status == ObligationStatus::InProgress);
        CHECK_FALSE(reopened.value().obligation.satisfied_at.has_value());

        REQUIRE(f.engine->waiveObligation(f.tenant, id).is_ok());
        CHECK(f.engine->obligation(f.tenant, id).value().waived_at.has_value());
        REQUIRE(f.engine->reopenObligation(f.tenant, id).is_ok());

        // Pending and in-progress obligations have nothing to reopen
        CHECK(f.engine->reopenObligation(f.tenant, id).error().code == ERR_INVALID_STATE);
    }

    TEST_CASE("Transitions re-evaluate linked milestones") {
        EngineFixture f;
        auto c = f.activeContract(1000);
        auto o = f.addObligation(c.id);
        auto ms = f.addMilestone(c.id, "handover", 500);
        f.link(ms, o);

        auto satisfied = f.engine->satisfyObligation(f.tenant, o);
        REQUIRE(satisfied.is_ok());
        REQUIRE(satisfied.value().milestones_changed.size() == 1);
        CHECK(satisfied.value().milestones_changed[0].status == MilestoneStatus::Ready);
        CHECK(f.milestone(ms).ready_at.has_value());

        // Reopening takes readiness away again
        auto reopened = f.engine->reopenObligation(f.tenant, o);
        REQUIRE(reopened.is_ok());
        REQUIRE(reopened.value().milestones_changed.size() == 1);
        CHECK(f.milestone(ms).status == MilestoneStatus::Pending);
        CHECK_FALSE(f.milestone(ms).ready_at.has_value());
    }

    TEST_CASE("Listing follows sort order") {
        EngineFixture f;
        auto c = f.activeContract(1000);
        ObligationDraft late;
        late.title = "late";
        late.sort_order = 200;
        ObligationDraft early;
        early.title = "early";
        early.sort_order = 10;
        REQUIRE(f.engine->addObligation(f.tenant, c.id, late).is_ok());
        REQUIRE(f.engine->addObligation(f.tenant, c.id, early).is_ok());

        auto listed = f.engine->listObligations(f.tenant, c.id);
        REQUIRE(listed.is_ok());
        REQUIRE(listed.value().size() == 2);
        CHECK(listed.value()[0].title == "early");
        CHECK(listed.value()[1].title == "late");
    }

    TEST_CASE("Unknown obligations and tenants") {
        EngineFixture f;
        auto c = f.activeContract(1000);
        auto id = f.addObligation(c.id);
        CHECK(f.engine->satisfyObligation(f.tenant, "obl-404").error().code == ERR_NOT_FOUND);
        CHECK(f.engine->satisfyObligation("tenant-b", id).error().code == ERR_NOT_FOUND);
    }
}
