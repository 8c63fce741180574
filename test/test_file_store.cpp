#include "engine_fixture.hpp"

#include <surety/storage/journal.hpp>

#include <filesystem>

using namespace surety;
using namespace surety::storage;
using namespace datapod;

// Test helper: cleanup storage directory
struct TestStore {
    std::string path;
    FileStore store;

    explicit TestStore(const std::string &name) : path(name + "_store") {
        cleanup();
        REQUIRE(store.open(String(path.c_str())).is_ok());
        REQUIRE(store.initializeCoreSchema().is_ok());
    }

    ~TestStore() {
        store.close();
        cleanup();
    }

    void reopen() {
        store.close();
        REQUIRE(store.open(String(path.c_str())).is_ok());
    }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove_all(path);
        }
    }
};

namespace {

    EntryRecord entryRecord(const std::string &id, i64 sequence, i64 balance_delta, i64 held_delta) {
        EntryRecord record;
        record.entry_id = toDp(id);
        record.tenant_id = toDp("t1");
        record.account_id = toDp("acct-1");
        record.status = static_cast<u8>(ledger::EntryStatus::Posted);
        record.currency = toDp("USD");
        record.balance_delta = balance_delta;
        record.held_delta = held_delta;
        record.contract_id = toDp("ctr-1");
        record.sequence = sequence;
        return record;
    }

    void commitEntry(FileStore &store, const EntryRecord &record) {
        auto tx = store.beginTransaction();
        REQUIRE(store.storeEntry(record).is_ok());
        REQUIRE(tx->commit().is_ok());
    }

} // namespace

// ===========================================
// Utility function tests
// ===========================================

TEST_CASE("Utility functions") {
    SUBCASE("SHA256 hashing") {
        Vector<u8> data = {0x48, 0x65, 0x6c, 0x6c, 0x6f}; // "Hello"
        auto hash = computeSHA256(data);
        CHECK(hash.size() == 32);

        auto hash2 = computeSHA256(data);
        bool equal = true;
        for (usize i = 0; i < hash.size(); ++i) {
            if (hash[i] != hash2[i])
                equal = false;
        }
        CHECK(equal);
    }

    SUBCASE("Hex digests") {
        auto hex = sha256Hex("ledger");
        CHECK(hex.size() == 64);
        CHECK(hex == sha256Hex("ledger"));
        CHECK(hex != sha256Hex("ledger!"));
    }

    SUBCASE("Optional strings round trip through records") {
        CHECK_FALSE(dpToOpt(optToDp(std::nullopt)).has_value());
        CHECK(dpToOpt(optToDp(std::string("ms-1"))) == std::optional<std::string>("ms-1"));
    }
}

// ===========================================
// FileStore tests
// ===========================================

TEST_CASE("Store lifecycle") {
    SUBCASE("Schema files exist after initialization") {
        TestStore t("schema");
        auto check = t.store.quickCheck();
        REQUIRE(check.is_ok());
        CHECK(check.value());
        CHECK(t.store.getEntryCount() == 0);
    }

    SUBCASE("Closed store rejects writes") {
        FileStore store;
        CHECK_FALSE(store.isOpen());
        CHECK(store.storeEntry(entryRecord("ent-1", 1, 100, 0)).is_err());
        CHECK(store.foldAccount(toDp("t1"), toDp("acct-1")).is_err());
        CHECK(store.getEntryCount() == 0);
    }
}

TEST_CASE("Transactions") {
    SUBCASE("Staged records are invisible until commit") {
        TestStore t("tx_commit");
        auto tx = t.store.beginTransaction();
        REQUIRE(t.store.storeEntry(entryRecord("ent-1", 1, 100, 0)).is_ok());
        CHECK_FALSE(t.store.getEntry(toDp("ent-1")).has_value());

        REQUIRE(tx->commit().is_ok());
        auto stored = t.store.getEntry(toDp("ent-1"));
        REQUIRE(stored.has_value());
        CHECK(stored->balance_delta == 100);
        CHECK(stored->created_at > 0);
    }

    SUBCASE("Rollback discards staged records") {
        TestStore t("tx_rollback");
        {
            auto tx = t.store.beginTransaction();
            REQUIRE(t.store.storeEntry(entryRecord("ent-1", 1, 100, 0)).is_ok());
            tx->rollback();
        }
        {
            auto tx = t.store.beginTransaction();
            REQUIRE(t.store.storeEntry(entryRecord("ent-2", 1, 100, 0)).is_ok());
            // dropped without commit
        }
        CHECK(t.store.getEntryCount() == 0);
    }

    SUBCASE("Entries are written once") {
        TestStore t("tx_duplicate");
        commitEntry(t.store, entryRecord("ent-1", 1, 100, 0));
        CHECK(t.store.storeEntry(entryRecord("ent-1", 2, 100, 0)).is_err());
    }
}

TEST_CASE("Account folding") {
    TestStore t("fold");
    commitEntry(t.store, entryRecord("ent-2", 2, 0, -400));
    commitEntry(t.store, entryRecord("ent-1", 1, 1000, 1000));

    auto failed = entryRecord("ent-3", 3, 5000, 0);
    failed.status = static_cast<u8>(ledger::EntryStatus::Failed);
    commitEntry(t.store, failed);

    auto entries = t.store.entriesForAccount(toDp("t1"), toDp("acct-1"));
    REQUIRE(entries.size() == 3);
    CHECK(std::string(entries[0].entry_id.c_str()) == "ent-1");

    auto fold = t.store.foldAccount(toDp("t1"), toDp("acct-1"));
    REQUIRE(fold.is_ok());
    CHECK(fold.value().balance == 1000);
    CHECK(fold.value().held == 600);
    CHECK(fold.value().entry_count == 2);

    auto continuous = t.store.verifySequenceContinuity(toDp("t1"), toDp("acct-1"));
    REQUIRE(continuous.is_ok());
    CHECK(continuous.value());

    commitEntry(t.store, entryRecord("ent-9", 9, 1, 0));
    CHECK_FALSE(t.store.verifySequenceContinuity(toDp("t1"), toDp("acct-1")).value());
}

TEST_CASE("Reopening rebuilds indexes") {
    TestStore t("reopen");
    {
        auto tx = t.store.beginTransaction();
        REQUIRE(t.store.storeEntry(entryRecord("ent-1", 1, 700, 0)).is_ok());
        AllocationRecord allocation;
        allocation.allocation_id = toDp("ent-1-a1");
        allocation.entry_id = toDp("ent-1");
        allocation.amount = 700;
        REQUIRE(t.store.storeAllocation(allocation).is_ok());
        ClaimEventRecord event;
        event.event_id = toDp("evt-1");
        event.claim_id = toDp("clm-1");
        REQUIRE(t.store.storeClaimEvent(event).is_ok());
        REQUIRE(tx->commit().is_ok());
    }
    {
        auto tx = t.store.beginTransaction();
        StatusChangeRecord change;
        change.entry_id = toDp("ent-1");
        change.status = static_cast<u8>(ledger::EntryStatus::Reversed);
        REQUIRE(t.store.storeStatusChange(change).is_ok());
        REQUIRE(tx->commit().is_ok());
    }

    t.reopen();
    CHECK(t.store.getEntryCount() == 1);
    CHECK(t.store.getAllocationCount() == 1);
    CHECK(t.store.getClaimEventCount() == 1);
    CHECK(t.store.claimEventsForClaim(toDp("clm-1")).size() == 1);
    CHECK(t.store.allocationsForEntry(toDp("ent-1")).size() == 1);

    auto entry = t.store.getEntry(toDp("ent-1"));
    REQUIRE(entry.has_value());
    CHECK(entry->status == static_cast<u8>(ledger::EntryStatus::Reversed));
    // Reversed entries still count
    CHECK(t.store.foldAccount(toDp("t1"), toDp("acct-1")).value().balance == 700);
}

// ===========================================
// Journal tests
// ===========================================

TEST_CASE("Journal keeps entries intact") {
    TestStore t("journal_roundtrip");
    Journal journal(t.store);

    ledger::LedgerEntry entry;
    entry.id = "ent-5";
    entry.tenant_id = "t1";
    entry.account_id = "acct-1";
    entry.type = ledger::EntryType::Fund;
    entry.occurred_at = 1700000000000;
    entry.balance_delta = 1200;
    entry.held_delta = 1200;
    entry.context.contract_id = "ctr-1";
    entry.context.source_subject = subject::SubjectRef("user", "u-1");
    entry.idempotency_key = "fund-1";
    entry.reason_code = "funding";
    entry.sequence = 1;
    entry.entry_hash = sha256Hex(entry.canonical());

    ledger::Allocation allocation;
    allocation.id = "ent-5-a1";
    allocation.tenant_id = "t1";
    allocation.entry_id = "ent-5";
    allocation.amount = 1200;
    allocation.target.subject = subject::SubjectRef("user", "u-1");

    REQUIRE(journal.recordPosting(entry, {allocation}).is_ok());
    auto loaded = journal.entriesForAccount("t1", "acct-1");
    REQUIRE(loaded.size() == 1);
    CHECK(loaded[0].canonical() == entry.canonical());
    CHECK(loaded[0].entry_hash == entry.entry_hash);
    CHECK_FALSE(loaded[0].context.milestone_id.has_value());

    // A second write of the same entry is a journal failure and stages nothing
    auto again = journal.recordPosting(entry, {allocation});
    REQUIRE(again.is_err());
    CHECK(again.error().code == ERR_JOURNAL_FAILED);
    CHECK(t.store.getAllocationCount() == 1);
}

TEST_CASE("Engine postings are mirrored to the journal") {
    TestStore t("journal_engine");
    Journal journal(t.store);
    EngineFixture f;
    f.engine->attachJournal(&journal);

    auto c = f.activeContract(10000);
    auto acct = f.fundContract(c.id, 10000);
    auto o = f.addObligation(c.id);
    auto ms = f.addMilestone(c.id, "A", 4000);
    f.link(ms, o);
    REQUIRE(f.engine->satisfyObligation(f.tenant, o).is_ok());
    auto released = f.engine->releaseMilestone(f.tenant, ms, "user:u-ops");
    REQUIRE(released.is_ok());

    auto fold = journal.foldAccount(f.tenant, acct);
    REQUIRE(fold.is_ok());
    CHECK(fold.value().balance == 10000);
    CHECK(fold.value().held == 6000);
    CHECK(t.store.allocationsForEntry(toDp(released.value().entry->id)).size() == 1);

    auto verified = f.engine->verifyAccount(f.tenant, acct);
    REQUIRE(verified.is_ok());
    CHECK(verified.value());
}

TEST_CASE("Claim settlement and its event share a transaction") {
    TestStore t("journal_claims");
    Journal journal(t.store);
    EngineFixture f;
    f.engine->attachJournal(&journal);

    auto c = f.activeContract(10000);
    f.fundContract(c.id, 10000);
    ClaimDraft draft;
    draft.title = "late delivery";
    draft.raised_by = f.customer;
    draft.disputed_amount = 800;
    auto opened = f.engine->openClaim(f.tenant, c.id, draft);
    REQUIRE(opened.is_ok());
    auto id = opened.value().claim.id;

    ClaimResolution r;
    r.resolution = claim::ResolutionKind::Forfeit;
    r.settled_amount = 800;
    auto resolved = f.engine->resolveClaim(f.tenant, id, r);
    REQUIRE(resolved.is_ok());

    auto events = t.store.claimEventsForClaim(toDp(id));
    REQUIRE(events.size() == 2);
    CHECK(events[1].event_type == static_cast<u8>(claim::ClaimEventType::Resolved));
    CHECK(std::string(events[1].ledger_entry_id.c_str()) == resolved.value().settlement_entry->id);
}

TEST_CASE("Funding reversal survives a reopen") {
    TestStore t("journal_reversal");
    Journal journal(t.store);
    EngineFixture f;
    f.engine->attachJournal(&journal);

    auto c = f.activeContract(10000);
    auto acct = f.fundContract(c.id, 0);
    FundingSource source;
    source.external_transaction_id = "txn-bounced";
    auto funded = f.engine->fundAccount(f.tenant, acct, 2500, source);
    REQUIRE(funded.is_ok());

    auto reversed = f.engine->reverseFunding(f.tenant, funded.value().entry.id, "chargeback");
    REQUIRE(reversed.is_ok());
    CHECK(reversed.value().entry.reverses_entry_id == std::optional<std::string>(funded.value().entry.id));
    CHECK(f.account(acct).balance() == 0);

    // Replaying the reversal is a no-op
    auto replay = f.engine->reverseFunding(f.tenant, funded.value().entry.id, "chargeback");
    REQUIRE(replay.is_ok());
    CHECK(replay.value().already_processed);

    t.reopen();
    auto original = t.store.getEntry(toDp(funded.value().entry.id));
    REQUIRE(original.has_value());
    CHECK(original->status == static_cast<u8>(ledger::EntryStatus::Reversed));
    auto fold = t.store.foldAccount(toDp(f.tenant), toDp(acct));
    REQUIRE(fold.is_ok());
    CHECK(fold.value().balance == 0);
    CHECK(fold.value().entry_count == 2);
}

TEST_CASE("A reversal and its status flip commit together") {
    TestStore t("journal_reversal_unit");
    Journal journal(t.store);

    ledger::LedgerEntry fund;
    fund.id = "ent-1";
    fund.tenant_id = "t1";
    fund.account_id = "acct-1";
    fund.type = ledger::EntryType::Fund;
    fund.balance_delta = 700;
    fund.held_delta = 700;
    fund.context.contract_id = "ctr-1";
    fund.sequence = 1;
    REQUIRE(journal.recordPosting(fund, {}).is_ok());

    ledger::LedgerEntry reversal = fund;
    reversal.id = "ent-2";
    reversal.type = ledger::EntryType::Adjustment;
    reversal.balance_delta = -700;
    reversal.held_delta = -700;
    reversal.reverses_entry_id = "ent-1";
    reversal.sequence = 2;

    // The second posting collides, so the flip staged by the first is dropped too
    auto failed = journal.recordPostings({StagedPosting{reversal, {}, {}}, StagedPosting{fund, {}, {}}});
    REQUIRE(failed.is_err());
    CHECK(failed.error().code == ERR_JOURNAL_FAILED);
    CHECK_FALSE(t.store.getEntry(toDp("ent-2")).has_value());
    CHECK(t.store.getEntry(toDp("ent-1"))->status == static_cast<u8>(ledger::EntryStatus::Posted));

    REQUIRE(journal.recordPosting(reversal, {}).is_ok());
    t.reopen();
    CHECK(t.store.getEntry(toDp("ent-1"))->status == static_cast<u8>(ledger::EntryStatus::Reversed));
    auto fold = t.store.foldAccount(toDp("t1"), toDp("acct-1"));
    REQUIRE(fold.is_ok());
    CHECK(fold.value().balance == 0);
    CHECK(fold.value().entry_count == 2);
}

TEST_CASE("A rejected reversal can be retried without double counting") {
    TestStore t("journal_reversal_retry");
    Journal journal(t.store);
    EngineFixture f;
    f.engine->attachJournal(&journal);

    auto c = f.activeContract(10000);
    auto acct = f.fundContract(c.id, 0);
    auto funded = f.engine->fundAccount(f.tenant, acct, 2500);
    REQUIRE(funded.is_ok());
    auto fund_id = funded.value().entry.id;

    // Occupy the id the reversal would take, on an unrelated account
    auto planted = entryRecord("ent-2", 1, 0, 0);
    planted.account_id = toDp("acct-elsewhere");
    commitEntry(t.store, planted);

    auto rejected = f.engine->reverseFunding(f.tenant, fund_id, "chargeback");
    REQUIRE(rejected.is_err());
    CHECK(rejected.error().code == ERR_JOURNAL_FAILED);
    CHECK(f.account(acct).balance() == 2500);
    CHECK(f.engine->ledger().entry(f.tenant, fund_id).value().status == ledger::EntryStatus::Posted);
    CHECK(t.store.getEntry(toDp(fund_id))->status == static_cast<u8>(ledger::EntryStatus::Posted));

    auto retried = f.engine->reverseFunding(f.tenant, fund_id, "chargeback");
    REQUIRE(retried.is_ok());
    CHECK(f.account(acct).balance() == 0);

    auto fold = journal.foldAccount(f.tenant, acct);
    REQUIRE(fold.is_ok());
    CHECK(fold.value().balance == 0);
    CHECK(fold.value().entry_count == 2);
    CHECK(f.engine->verifyAccount(f.tenant, acct).value());
}

TEST_CASE("Cancellation posts both legs or neither") {
    TestStore t("journal_cancel");
    Journal journal(t.store);
    EngineFixture f;
    f.engine->attachJournal(&journal);

    commitment::ContractPolicy policy;
    policy.cancellation = commitment::CancellationPolicy::ForfeitHeld;
    auto c = f.activeContract(6000, policy);
    auto acct = f.fundContract(c.id, 10000);

    // The forfeit leg would be ent-2 and the refund leg ent-3; make the refund collide
    auto planted = entryRecord("ent-3", 1, 0, 0);
    planted.account_id = toDp("acct-elsewhere");
    commitEntry(t.store, planted);

    auto rejected = f.engine->cancelContract(f.tenant, c.id);
    REQUIRE(rejected.is_err());
    CHECK(rejected.error().code == ERR_JOURNAL_FAILED);
    CHECK(f.contract(c.id).status == commitment::ContractStatus::Active);
    CHECK(f.contract(c.id).forfeited_amount == 0);
    CHECK(f.account(acct).held() == 10000);
    CHECK(f.account(acct).forfeited() == 0);
    CHECK(f.engine->ledger().entries(f.tenant, acct).size() == 1);
    CHECK_FALSE(t.store.getEntry(toDp("ent-2")).has_value());

    auto cancelled = f.engine->cancelContract(f.tenant, c.id);
    REQUIRE(cancelled.is_ok());
    CHECK(cancelled.value().forfeited_amount == 6000);
    CHECK(f.account(acct).held() == 0);
    CHECK(f.account(acct).balance() == 0);

    auto fold = journal.foldAccount(f.tenant, acct);
    REQUIRE(fold.is_ok());
    CHECK(fold.value().balance == 0);
    CHECK(fold.value().held == 0);
    CHECK(fold.value().entry_count == 3);
    CHECK(f.engine->verifyAccount(f.tenant, acct).value());
}

TEST_CASE("Only funding entries reverse") {
    EngineFixture f;
    auto c = f.activeContract(10000);
    auto acct = f.fundContract(c.id, 1000);
    HeldAdjustment refund;
    refund.amount = 200;
    auto refunded = f.engine->refundHeld(f.tenant, c.id, refund);
    REQUIRE(refunded.is_ok());
    CHECK(f.engine->reverseFunding(f.tenant, refunded.value().entry.id, "").error().code == ERR_INVALID_STATE);
    CHECK(f.engine->reverseFunding(f.tenant, "ent-404", "").error().code == ERR_NOT_FOUND);
    CHECK(f.account(acct).held() == 800);
}
