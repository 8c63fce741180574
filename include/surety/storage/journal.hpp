#pragma once

#include <surety/claim/claim.hpp>
#include <surety/common/error.hpp>
#include <surety/ledger/entry.hpp>
#include <surety/storage/file_store.hpp>

#include <mutex>
#include <vector>

namespace surety::storage {

    // ===========================================
    // Domain <-> record conversion
    // ===========================================

    inline String optToDp(const std::optional<std::string> &value) { return toDp(value.value_or("")); }

    inline std::optional<std::string> dpToOpt(const String &value) {
        if (value.empty())
            return std::nullopt;
        return std::optional<std::string>(fromDp(value));
    }

    inline EntryRecord toRecord(const ledger::LedgerEntry &entry) {
        EntryRecord record;
        record.entry_id = toDp(entry.id);
        record.tenant_id = toDp(entry.tenant_id);
        record.account_id = toDp(entry.account_id);
        record.entry_type = static_cast<u8>(entry.type);
        record.status = static_cast<u8>(entry.status);
        record.occurred_at = entry.occurred_at;
        record.currency = toDp(entry.currency);
        record.balance_delta = entry.balance_delta;
        record.held_delta = entry.held_delta;
        record.contract_id = optToDp(entry.context.contract_id);
        record.milestone_id = optToDp(entry.context.milestone_id);
        record.obligation_id = optToDp(entry.context.obligation_id);
        record.claim_id = optToDp(entry.context.claim_id);
        record.external_transaction_id = optToDp(entry.context.external_transaction_id);
        if (entry.context.source_subject) {
            record.source_subject_kind = toDp(entry.context.source_subject->kind);
            record.source_subject_id = toDp(entry.context.source_subject->id);
        }
        record.idempotency_key = optToDp(entry.idempotency_key);
        record.reason_code = toDp(entry.reason_code);
        record.reverses_entry_id = optToDp(entry.reverses_entry_id);
        record.sequence = static_cast<i64>(entry.sequence);
        record.previous_hash = toDp(entry.previous_hash);
        record.entry_hash = toDp(entry.entry_hash);
        return record;
    }

    inline ledger::LedgerEntry fromRecord(const EntryRecord &record) {
        ledger::LedgerEntry entry;
        entry.id = fromDp(record.entry_id);
        entry.tenant_id = fromDp(record.tenant_id);
        entry.account_id = fromDp(record.account_id);
        entry.type = static_cast<ledger::EntryType>(record.entry_type);
        entry.status = static_cast<ledger::EntryStatus>(record.status);
        entry.occurred_at = record.occurred_at;
        entry.currency = fromDp(record.currency);
        entry.balance_delta = record.balance_delta;
        entry.held_delta = record.held_delta;
        entry.context.contract_id = dpToOpt(record.contract_id);
        entry.context.milestone_id = dpToOpt(record.milestone_id);
        entry.context.obligation_id = dpToOpt(record.obligation_id);
        entry.context.claim_id = dpToOpt(record.claim_id);
        entry.context.external_transaction_id = dpToOpt(record.external_transaction_id);
        if (!record.source_subject_kind.empty()) {
            entry.context.source_subject =
                subject::SubjectRef(fromDp(record.source_subject_kind), fromDp(record.source_subject_id));
        }
        entry.idempotency_key = dpToOpt(record.idempotency_key);
        entry.reason_code = fromDp(record.reason_code);
        entry.reverses_entry_id = dpToOpt(record.reverses_entry_id);
        entry.sequence = static_cast<u64>(record.sequence);
        entry.previous_hash = fromDp(record.previous_hash);
        entry.entry_hash = fromDp(record.entry_hash);
        return entry;
    }

    inline AllocationRecord toRecord(const ledger::Allocation &allocation) {
        AllocationRecord record;
        record.allocation_id = toDp(allocation.id);
        record.tenant_id = toDp(allocation.tenant_id);
        record.entry_id = toDp(allocation.entry_id);
        record.allocation_type = static_cast<u8>(allocation.type);
        record.amount = allocation.amount;
        record.currency = toDp(allocation.currency);
        record.obligation_id = optToDp(allocation.target.obligation_id);
        record.milestone_id = optToDp(allocation.target.milestone_id);
        record.external_line_id = optToDp(allocation.target.external_line_id);
        if (allocation.target.subject) {
            record.target_subject_kind = toDp(allocation.target.subject->kind);
            record.target_subject_id = toDp(allocation.target.subject->id);
        }
        record.occurred_at = allocation.occurred_at;
        return record;
    }

    inline ClaimEventRecord toRecord(const claim::ClaimEvent &event) {
        ClaimEventRecord record;
        record.event_id = toDp(event.id);
        record.tenant_id = toDp(event.tenant_id);
        record.contract_id = toDp(event.contract_id);
        record.claim_id = toDp(event.claim_id);
        record.event_type = static_cast<u8>(event.type);
        record.status_after = static_cast<u8>(event.status_after);
        record.occurred_at = event.occurred_at;
        if (event.actor) {
            record.actor_kind = toDp(event.actor->kind);
            record.actor_id = toDp(event.actor->id);
        }
        record.ledger_entry_id = optToDp(event.ledger_entry_id);
        record.note = toDp(event.note);
        return record;
    }

    /// One ledger entry with the records journaled alongside it
    struct StagedPosting {
        ledger::LedgerEntry entry;
        std::vector<ledger::Allocation> allocations;
        std::vector<claim::ClaimEvent> events;
    };

    // ===========================================
    // Journal - serialized access to a FileStore
    // ===========================================

    /// Each record* call is one transaction: either every staged record is
    /// flushed or none is indexed.
    class Journal {
      public:
        inline explicit Journal(FileStore &store) : store_(store) {}

        Journal(const Journal &) = delete;
        Journal &operator=(const Journal &) = delete;

        /// Stage every posting in one transaction. An entry that reverses
        /// another also flips the reversed entry's status in that transaction.
        inline dp::Result<void, dp::Error> recordPostings(const std::vector<StagedPosting> &postings) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto tx = store_.beginTransaction();

            for (const auto &posting : postings) {
                auto staged = stage(posting);
                if (!staged.is_ok())
                    return fail(staged.error());
            }
            auto committed = tx->commit();
            if (!committed.is_ok())
                return fail(committed.error());
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<void, dp::Error> recordPosting(const ledger::LedgerEntry &entry,
                                                         const std::vector<ledger::Allocation> &allocations,
                                                         const std::vector<claim::ClaimEvent> &events = {}) {
            return recordPostings({StagedPosting{entry, allocations, events}});
        }

        inline dp::Result<void, dp::Error> recordClaimEvent(const claim::ClaimEvent &event) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto tx = store_.beginTransaction();

            auto stored = store_.storeClaimEvent(toRecord(event));
            if (!stored.is_ok())
                return fail(stored.error());
            auto committed = tx->commit();
            if (!committed.is_ok())
                return fail(committed.error());
            return dp::Result<void, dp::Error>::ok();
        }

        /// Re-fold an account from disk
        inline dp::Result<AccountFold, dp::Error> foldAccount(const std::string &tenant_id,
                                                              const std::string &account_id) {
            std::lock_guard<std::mutex> lock(mutex_);
            return store_.foldAccount(toDp(tenant_id), toDp(account_id));
        }

        inline std::vector<ledger::LedgerEntry> entriesForAccount(const std::string &tenant_id,
                                                                  const std::string &account_id) {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<ledger::LedgerEntry> entries;
            for (const auto &record : store_.entriesForAccount(toDp(tenant_id), toDp(account_id)))
                entries.push_back(fromRecord(record));
            return entries;
        }

        inline FileStore &store() { return store_; }

      private:
        inline dp::Result<void, dp::Error> stage(const StagedPosting &posting) {
            auto stored = store_.storeEntry(toRecord(posting.entry));
            if (!stored.is_ok())
                return stored;
            for (const auto &allocation : posting.allocations) {
                auto res = store_.storeAllocation(toRecord(allocation));
                if (!res.is_ok())
                    return res;
            }
            for (const auto &event : posting.events) {
                auto res = store_.storeClaimEvent(toRecord(event));
                if (!res.is_ok())
                    return res;
            }
            if (posting.entry.reverses_entry_id) {
                StatusChangeRecord record;
                record.entry_id = toDp(*posting.entry.reverses_entry_id);
                record.status = static_cast<u8>(ledger::EntryStatus::Reversed);
                record.changed_at = posting.entry.occurred_at;
                auto res = store_.storeStatusChange(record);
                if (!res.is_ok())
                    return res;
            }
            return dp::Result<void, dp::Error>::ok();
        }

        inline static dp::Result<void, dp::Error> fail(const dp::Error &cause) {
            return dp::Result<void, dp::Error>::err(journal_failed(errorMessage(cause)));
        }

        FileStore &store_;
        std::mutex mutex_;
    };

} // namespace surety::storage
