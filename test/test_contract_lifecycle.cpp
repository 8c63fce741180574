#include "engine_fixture.hpp"

using namespace surety;
using namespace surety::commitment;

TEST_SUITE("Contract lifecycle") {

    TEST_CASE("New contracts start as drafts") {
        EngineFixture f;
        auto c = f.draftContract(5000);
        CHECK(c.id.rfind("ctr-", 0) == 0);
        CHECK(c.status == ContractStatus::Draft);
        CHECK(c.released_amount == 0);
        CHECK(c.forfeited_amount == 0);
        CHECK_FALSE(c.started_at.has_value());
        CHECK(c.remainingCommitment() == 5000);
    }

    TEST_CASE("Creation validates its inputs") {
        EngineFixture f;
        ContractDraft draft;
        draft.tenant_id = f.tenant;
        draft.title = "Deposit";
        draft.anchor = f.biz;
        draft.committed_amount = 100;

        SUBCASE("Unknown anchor") {
            draft.anchor = subject::SubjectRef("biz", "missing");
            CHECK(f.engine->createContract(draft).error().code == ERR_SUBJECT_UNRESOLVED);
        }
        SUBCASE("Anchor from another tenant") {
            draft.tenant_id = "tenant-b";
            CHECK(f.engine->createContract(draft).error().code == ERR_SUBJECT_UNRESOLVED);
        }
        SUBCASE("Negative commitment") {
            draft.committed_amount = -1;
            CHECK(f.engine->createContract(draft).error().code == ERR_VALIDATION);
        }
        SUBCASE("Lowercase currency") {
            draft.currency = "usd";
            CHECK(f.engine->createContract(draft).error().code == ERR_VALIDATION);
        }
        SUBCASE("Malformed counterparty") {
            draft.counterparty = subject::SubjectRef("User", "u-200");
            CHECK(f.engine->createContract(draft).error().code == ERR_VALIDATION);
        }
    }

    TEST_CASE("Activate, pause, resume and complete") {
        EngineFixture f;
        auto c = f.draftContract(1000);

        auto active = f.engine->activateContract(f.tenant, c.id);
        REQUIRE(active.is_ok());
        CHECK(active.value().status == ContractStatus::Active);
        CHECK(active.value().started_at == std::optional<Millis>(f.clock_now));

        auto paused = f.engine->pauseContract(f.tenant, c.id);
        REQUIRE(paused.is_ok());
        CHECK(paused.value().status == ContractStatus::Paused);

        // Completion is only reachable from active
        CHECK(f.engine->completeContract(f.tenant, c.id).error().code == ERR_INVALID_STATE);

        REQUIRE(f.engine->resumeContract(f.tenant, c.id).is_ok());
        auto done = f.engine->completeContract(f.tenant, c.id);
        REQUIRE(done.is_ok());
        CHECK(done.value().status == ContractStatus::Completed);
        CHECK(done.value().completed_at.has_value());

        CHECK(f.engine->activateContract(f.tenant, c.id).error().code == ERR_INVALID_STATE);
        CHECK(f.engine->pauseContract(f.tenant, c.id).error().code == ERR_INVALID_STATE);
    }

    TEST_CASE("Completion waits for open obligations") {
        EngineFixture f;
        auto c = f.activeContract(1000);
        auto o = f.addObligation(c.id);

        CHECK(f.engine->completeContract(f.tenant, c.id).error().code == ERR_INVALID_STATE);

        REQUIRE(f.engine->satisfyObligation(f.tenant, o).is_ok());
        CHECK(f.engine->completeContract(f.tenant, c.id).is_ok());
    }

    TEST_CASE("Activation rejects an expiry in the past") {
        EngineFixture f;
        ContractDraft draft;
        draft.tenant_id = f.tenant;
        draft.anchor = f.biz;
        draft.committed_amount = 100;
        draft.expires_at = f.clock_now + 1000;
        auto c = f.engine->createContract(draft);
        REQUIRE(c.is_ok());

        f.advance(2000);
        CHECK(f.engine->activateContract(f.tenant, c.value().id).error().code == ERR_VALIDATION);
        CHECK(f.contract(c.value().id).status == ContractStatus::Draft);
    }

    TEST_CASE("Draft contracts can be cancelled") {
        EngineFixture f;
        auto c = f.draftContract(1000);
        auto cancelled = f.engine->cancelContract(f.tenant, c.id);
        REQUIRE(cancelled.is_ok());
        CHECK(cancelled.value().status == ContractStatus::Cancelled);
        CHECK(cancelled.value().cancelled_at.has_value());
    }

    TEST_CASE("Cancellation settles held funds by policy") {
        ContractPolicy policy;

        SUBCASE("Forfeit up to the remaining commitment, refund the rest") {
            policy.cancellation = CancellationPolicy::ForfeitHeld;
            EngineFixture f;
            auto c = f.activeContract(6000, policy);
            auto acct = f.fundContract(c.id, 10000);

            auto cancelled = f.engine->cancelContract(f.tenant, c.id);
            REQUIRE(cancelled.is_ok());
            CHECK(cancelled.value().forfeited_amount == 6000);

            auto a = f.account(acct);
            CHECK(a.held() == 0);
            CHECK(a.balance() == 0);
            CHECK(a.forfeited() == 6000);
            CHECK(f.engine->verifyAccount(f.tenant, acct).value());
        }

        SUBCASE("Release up to the remaining commitment") {
            policy.cancellation = CancellationPolicy::ReleaseHeld;
            EngineFixture f;
            auto c = f.activeContract(6000, policy);
            auto acct = f.fundContract(c.id, 10000);

            auto cancelled = f.engine->cancelContract(f.tenant, c.id);
            REQUIRE(cancelled.is_ok());
            CHECK(cancelled.value().released_amount == 6000);

            auto a = f.account(acct);
            CHECK(a.held() == 0);
            CHECK(a.released() == 6000);
            // Hold-only release keeps the released 6000 on the balance
            CHECK(a.balance() == 6000);
        }

        SUBCASE("Refund everything") {
            policy.cancellation = CancellationPolicy::RefundHeld;
            EngineFixture f;
            auto c = f.activeContract(6000, policy);
            auto acct = f.fundContract(c.id, 10000);

            auto cancelled = f.engine->cancelContract(f.tenant, c.id);
            REQUIRE(cancelled.is_ok());
            CHECK(cancelled.value().forfeited_amount == 0);
            CHECK(cancelled.value().released_amount == 0);
            CHECK(f.account(acct).held() == 0);
            CHECK(f.account(acct).balance() == 0);
        }
    }

    TEST_CASE("Cancellation retires open obligations and unsettled milestones") {
        EngineFixture f;
        auto c = f.activeContract(1000);
        auto open = f.addObligation(c.id, "open");
        auto done = f.addObligation(c.id, "done");
        REQUIRE(f.engine->satisfyObligation(f.tenant, done).is_ok());
        auto ms = f.addMilestone(c.id, "handover", 500);

        REQUIRE(f.engine->cancelContract(f.tenant, c.id).is_ok());
        CHECK(f.engine->obligation(f.tenant, open).value().status == ObligationStatus::Cancelled);
        CHECK(f.engine->obligation(f.tenant, done).value().status == ObligationStatus::Satisfied);
        CHECK(f.milestone(ms).status == MilestoneStatus::Cancelled);

        // Repeating is a no-op
        auto again = f.engine->cancelContract(f.tenant, c.id);
        REQUIRE(again.is_ok());
        CHECK(again.value().status == ContractStatus::Cancelled);

        // Terminal contracts accept no new work or money
        CHECK(f.engine->addObligation(f.tenant, c.id, ObligationDraft{}).error().code == ERR_INVALID_STATE);
        CHECK(f.engine->satisfyObligation(f.tenant, open).is_err());
    }

    TEST_CASE("Terminal contracts cannot be funded") {
        EngineFixture f;
        auto c = f.activeContract(1000);
        auto acct = f.fundContract(c.id, 0);
        REQUIRE(f.engine->completeContract(f.tenant, c.id).is_ok());
        CHECK(f.engine->fundAccount(f.tenant, acct, 100).error().code == ERR_INVALID_STATE);
        CHECK(f.engine->cancelContract(f.tenant, c.id).error().code == ERR_INVALID_STATE);
    }

    TEST_CASE("Expiry defaults the contract and expires open obligations") {
        EngineFixture f;
        ContractDraft draft;
        draft.tenant_id = f.tenant;
        draft.anchor = f.biz;
        draft.committed_amount = 1000;
        draft.expires_at = f.clock_now + 60000;
        auto created = f.engine->createContract(draft);
        REQUIRE(created.is_ok());
        auto id = created.value().id;

        // Drafts never expire
        f.advance(1);
        CHECK(f.engine->expireContract(f.tenant, id).error().code == ERR_INVALID_STATE);

        REQUIRE(f.engine->activateContract(f.tenant, id).is_ok());
        auto open = f.addObligation(id, "open");
        auto done = f.addObligation(id, "done");
        REQUIRE(f.engine->satisfyObligation(f.tenant, done).is_ok());

        CHECK(f.engine->expireContract(f.tenant, id).error().code == ERR_INVALID_STATE);

        f.advance(60000);
        auto expired = f.engine->expireContract(f.tenant, id);
        REQUIRE(expired.is_ok());
        CHECK(expired.value().status == ContractStatus::Defaulted);

        auto o = f.engine->obligation(f.tenant, open).value();
        CHECK(o.status == ObligationStatus::Expired);
        CHECK(o.expired_at == std::optional<Millis>(f.clock_now));
        CHECK(f.engine->obligation(f.tenant, done).value().status == ObligationStatus::Satisfied);

        CHECK(f.engine->expireContract(f.tenant, id).is_ok());
    }

    TEST_CASE("Contracts without expiry cannot expire") {
        EngineFixture f;
        auto c = f.activeContract(1000);
        CHECK(f.engine->expireContract(f.tenant, c.id).error().code == ERR_INVALID_STATE);
    }

    TEST_CASE("Default is idempotent") {
        EngineFixture f;
        auto draft = f.draftContract(1000);
        CHECK(f.engine->markContractDefaulted(f.tenant, draft.id).error().code == ERR_INVALID_STATE);

        auto c = f.activeContract(1000);
        REQUIRE(f.engine->pauseContract(f.tenant, c.id).is_ok());
        auto defaulted = f.engine->markContractDefaulted(f.tenant, c.id);
        REQUIRE(defaulted.is_ok());
        CHECK(defaulted.value().status == ContractStatus::Defaulted);
        CHECK(f.engine->markContractDefaulted(f.tenant, c.id).is_ok());
        CHECK(f.engine->resumeContract(f.tenant, c.id).error().code == ERR_INVALID_STATE);
    }

    TEST_CASE("Budget checks reject amounts that overflow") {
        CommitmentContract c;
        c.id = "ctr-x";
        c.committed_amount = 1000;
        c.forfeited_amount = 100;
        CHECK(c.checkBudget(900, 0).is_ok());
        CHECK(c.checkBudget(901, 0).error().code == ERR_INVARIANT_VIOLATION);
        auto huge = c.checkBudget(std::numeric_limits<Money>::max(), 0);
        REQUIRE(huge.is_err());
        CHECK(huge.error().code == ERR_INVARIANT_VIOLATION);
        CHECK(c.checkBudget(1, std::numeric_limits<Money>::max()).error().code == ERR_INVARIANT_VIOLATION);

        EngineFixture f;
        auto active = f.activeContract(1000);
        auto acct = f.fundContract(active.id, 1000);
        HeldAdjustment forfeit;
        forfeit.amount = 100;
        REQUIRE(f.engine->forfeitHeld(f.tenant, active.id, forfeit).is_ok());
        auto o = f.addObligation(active.id);
        auto ms = f.addMilestone(active.id, "HUGE", std::numeric_limits<Money>::max());
        f.link(ms, o);
        REQUIRE(f.engine->satisfyObligation(f.tenant, o).is_ok());

        auto released = f.engine->releaseMilestone(f.tenant, ms, "user:u-ops");
        REQUIRE(released.is_err());
        CHECK(released.error().code == ERR_INVARIANT_VIOLATION);
        CHECK(f.contract(active.id).released_amount == 0);
        CHECK(f.account(acct).held() == 900);
    }

    TEST_CASE("Forfeits need a running contract") {
        HeldAdjustment forfeit;
        forfeit.amount = 100;

        SUBCASE("draft") {
            EngineFixture f;
            auto c = f.draftContract(1000);
            auto acct = f.fundContract(c.id, 500);
            CHECK(f.engine->forfeitHeld(f.tenant, c.id, forfeit).error().code == ERR_INVALID_STATE);
            CHECK(f.contract(c.id).forfeited_amount == 0);
            CHECK(f.account(acct).held() == 500);
        }

        SUBCASE("completed, leftover held is still refundable") {
            EngineFixture f;
            auto c = f.activeContract(1000);
            auto acct = f.fundContract(c.id, 1000);
            REQUIRE(f.engine->completeContract(f.tenant, c.id).is_ok());

            CHECK(f.engine->forfeitHeld(f.tenant, c.id, forfeit).error().code == ERR_INVALID_STATE);
            CHECK(f.contract(c.id).forfeited_amount == 0);

            HeldAdjustment refund;
            refund.amount = 1000;
            REQUIRE(f.engine->refundHeld(f.tenant, c.id, refund).is_ok());
            CHECK(f.account(acct).held() == 0);
            CHECK(f.account(acct).balance() == 0);
            CHECK(f.contract(c.id).status == ContractStatus::Completed);
        }

        SUBCASE("defaulted") {
            EngineFixture f;
            auto c = f.activeContract(1000);
            f.fundContract(c.id, 1000);
            REQUIRE(f.engine->markContractDefaulted(f.tenant, c.id).is_ok());
            CHECK(f.engine->forfeitHeld(f.tenant, c.id, forfeit).error().code == ERR_INVALID_STATE);
            CHECK(f.contract(c.id).forfeited_amount == 0);
        }
    }

    TEST_CASE("Listing is per tenant") {
        EngineFixture f;
        auto a = f.draftContract(100);
        auto b = f.draftContract(200);

        auto listed = f.engine->listContracts(f.tenant);
        REQUIRE(listed.size() == 2);
        CHECK(listed[0].id == a.id);
        CHECK(listed[1].id == b.id);
        CHECK(f.engine->listContracts("tenant-b").empty());
        CHECK(f.engine->contract("tenant-b", a.id).error().code == ERR_NOT_FOUND);
    }
}
