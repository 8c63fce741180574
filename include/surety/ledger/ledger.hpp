#pragma once

#include <surety/claim/claim.hpp>
#include <surety/common/error.hpp>
#include <surety/common/lock_table.hpp>
#include <surety/common/log.hpp>
#include <surety/common/money.hpp>
#include <surety/ledger/account.hpp>
#include <surety/ledger/entry.hpp>
#include <surety/storage/journal.hpp>

#include <algorithm>
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace surety::ledger {

    struct OpenAccountRequest {
        std::string tenant_id;
        std::optional<std::string> contract_id;
        AccountType type = AccountKind::Escrow;
        std::string title;
        std::string currency = "USD";
        subject::SubjectRef owner;
        std::optional<subject::SubjectRef> counterparty;
    };

    /// One append to an account log plus the allocations that explain it
    struct PostingRequest {
        std::string tenant_id;
        std::string account_id;
        EntryType type = EntryType::Fund;
        Money balance_delta = 0;
        Money held_delta = 0;
        EntryContext context;
        std::optional<std::string> idempotency_key;
        std::string reason_code;
        std::optional<std::string> reverses_entry_id;
        std::vector<AllocationDraft> allocations;
        /// Journaled in the same transaction; ledger_entry_id is filled in
        std::vector<claim::ClaimEvent> claim_events;
    };

    struct PostingResult {
        LedgerEntry entry;
        std::vector<Allocation> allocations;
        std::vector<claim::ClaimEvent> claim_events; // empty on replay
        bool already_processed = false; // idempotent replay, entry is the original
    };

    /// Owns every secured balance account and its append-only entry log.
    /// post() is the only path that changes a balance: it validates, appends
    /// the entry and folds it into the snapshot as one step under the
    /// account's lock.
    class SecuredBalanceLedger {
      public:
        inline explicit SecuredBalanceLedger(Clock clock = currentMillis, LogLevel log_level = LogLevel::Warn)
            : clock_(std::move(clock)), log_level_(log_level) {}

        SecuredBalanceLedger(const SecuredBalanceLedger &) = delete;
        SecuredBalanceLedger &operator=(const SecuredBalanceLedger &) = delete;

        /// Mirror every posting into a journal. Pass nullptr to detach.
        inline void setJournal(storage::Journal *journal) { journal_ = journal; }

        inline void setLockTimeout(std::chrono::milliseconds timeout) { lock_timeout_ = timeout; }

        inline void setLogLevel(LogLevel level) { log_level_ = level; }

        // ===========================================
        // Accounts
        // ===========================================

        inline dp::Result<SecuredBalanceAccount, dp::Error> openAccount(const OpenAccountRequest &request) {
            using R = dp::Result<SecuredBalanceAccount, dp::Error>;

            if (request.tenant_id.empty())
                return R::err(validation_error("tenant_id is required"));
            if (!isValidCurrency(request.currency))
                return R::err(validation_error("currency '" + request.currency + "' is not ISO-4217"));
            auto owner_ok = request.owner.validate("owner");
            if (!owner_ok.is_ok())
                return R::err(owner_ok.error());
            if (request.counterparty) {
                auto cp_ok = request.counterparty->validate("counterparty");
                if (!cp_ok.is_ok())
                    return R::err(cp_ok.error());
            }

            auto slot = std::make_shared<AccountSlot>();
            slot->account.id = "acct-" + std::to_string(++next_account_);
            slot->account.tenant_id = request.tenant_id;
            slot->account.contract_id = request.contract_id;
            slot->account.type = request.type;
            slot->account.title = request.title;
            slot->account.currency = request.currency;
            slot->account.owner = request.owner;
            slot->account.counterparty = request.counterparty;
            slot->account.opened_at = clock_();

            std::unique_lock<std::shared_mutex> lock(index_mutex_);
            if (request.contract_id) {
                auto key = scopedKey(request.tenant_id, *request.contract_id);
                if (contract_accounts_.count(key) > 0)
                    return R::err(duplicate("contract " + *request.contract_id + " already has an account"));
                contract_accounts_[key] = slot->account.id;
            }
            accounts_[scopedKey(request.tenant_id, slot->account.id)] = slot;

            logInfo(log_level_, "opened account " + slot->account.id + " (" + slot->account.type.toString() + ")");
            return R::ok(slot->account);
        }

        /// Snapshot copy of an account
        inline dp::Result<SecuredBalanceAccount, dp::Error> account(const std::string &tenant_id,
                                                                    const std::string &account_id) const {
            std::shared_lock<std::shared_mutex> lock(index_mutex_);
            auto it = accounts_.find(scopedKey(tenant_id, account_id));
            if (it == accounts_.end())
                return dp::Result<SecuredBalanceAccount, dp::Error>::err(
                    account_not_found("account " + account_id + " not found for tenant " + tenant_id));
            return dp::Result<SecuredBalanceAccount, dp::Error>::ok(it->second->account);
        }

        inline dp::Result<SecuredBalanceAccount, dp::Error> accountForContract(const std::string &tenant_id,
                                                                               const std::string &contract_id) const {
            std::shared_lock<std::shared_mutex> lock(index_mutex_);
            auto it = contract_accounts_.find(scopedKey(tenant_id, contract_id));
            if (it == contract_accounts_.end())
                return dp::Result<SecuredBalanceAccount, dp::Error>::err(
                    account_not_found("contract " + contract_id + " has no secured balance account"));
            return dp::Result<SecuredBalanceAccount, dp::Error>::ok(
                accounts_.at(scopedKey(tenant_id, it->second))->account);
        }

        inline std::vector<SecuredBalanceAccount> listAccounts(const std::string &tenant_id) const {
            std::shared_lock<std::shared_mutex> lock(index_mutex_);
            std::vector<SecuredBalanceAccount> out;
            for (const auto &[_, slot] : accounts_) {
                if (slot->account.tenant_id == tenant_id)
                    out.push_back(slot->account);
            }
            std::sort(out.begin(), out.end(), [](const SecuredBalanceAccount &a, const SecuredBalanceAccount &b) {
                return a.opened_at != b.opened_at ? a.opened_at < b.opened_at : a.id < b.id;
            });
            return out;
        }

        /// Lock, freeze, wind down or reopen. Closed accounts stay closed.
        inline dp::Result<SecuredBalanceAccount, dp::Error>
        setAccountStatus(const std::string &tenant_id, const std::string &account_id, AccountStatus status) {
            using R = dp::Result<SecuredBalanceAccount, dp::Error>;
            if (status == AccountStatus::Closed)
                return closeAccount(tenant_id, account_id);

            auto slot = findSlot(tenant_id, account_id);
            if (!slot)
                return R::err(account_not_found("account " + account_id + " not found"));
            auto guard = locks_.tryAcquire(scopedKey(tenant_id, account_id), lock_timeout_);
            if (!guard.owns_lock())
                return R::err(concurrency_conflict("account " + account_id + " is busy"));

            std::unique_lock<std::shared_mutex> lock(index_mutex_);
            if (slot->account.status_ == AccountStatus::Closed)
                return R::err(invalid_state("account " + account_id + " is closed"));
            slot->account.status_ = status;
            logInfo(log_level_, "account " + account_id + " -> " + accountStatusToString(status));
            return R::ok(slot->account);
        }

        /// Requires nothing held
        inline dp::Result<SecuredBalanceAccount, dp::Error> closeAccount(const std::string &tenant_id,
                                                                         const std::string &account_id) {
            using R = dp::Result<SecuredBalanceAccount, dp::Error>;
            auto slot = findSlot(tenant_id, account_id);
            if (!slot)
                return R::err(account_not_found("account " + account_id + " not found"));
            auto guard = locks_.tryAcquire(scopedKey(tenant_id, account_id), lock_timeout_);
            if (!guard.owns_lock())
                return R::err(concurrency_conflict("account " + account_id + " is busy"));

            std::unique_lock<std::shared_mutex> lock(index_mutex_);
            if (slot->account.status_ == AccountStatus::Closed)
                return R::ok(slot->account);
            if (slot->account.held_ != 0)
                return R::err(invalid_state("account " + account_id + " still holds " +
                                            std::to_string(slot->account.held_)));
            slot->account.status_ = AccountStatus::Closed;
            slot->account.closed_at_ = clock_();
            logInfo(log_level_, "closed account " + account_id);
            return R::ok(slot->account);
        }

        // ===========================================
        // Posting
        // ===========================================

        /// Prior result for an idempotency key, if any
        inline std::optional<PostingResult> findIdempotent(const std::string &tenant_id,
                                                           const std::string &key) const {
            std::shared_lock<std::shared_mutex> lock(index_mutex_);
            return findIdempotentLocked(tenant_id, key);
        }

        inline dp::Result<PostingResult, dp::Error> post(const PostingRequest &request) {
            auto posted = postAll({request});
            if (!posted.is_ok())
                return dp::Result<PostingResult, dp::Error>::err(posted.error());
            return dp::Result<PostingResult, dp::Error>::ok(posted.value().front());
        }

        /// Post several entries on one account as a single unit. Each entry is
        /// checked against the balance the earlier ones leave behind, and all
        /// of them are journaled in one transaction or none is applied.
        /// Requests whose idempotency key already posted come back as replays.
        inline dp::Result<std::vector<PostingResult>, dp::Error> postAll(const std::vector<PostingRequest> &requests) {
            using R = dp::Result<std::vector<PostingResult>, dp::Error>;

            if (requests.empty())
                return R::err(validation_error("nothing to post"));
            const std::string &tenant_id = requests.front().tenant_id;
            const std::string &account_id = requests.front().account_id;
            for (const auto &request : requests) {
                if (request.tenant_id != tenant_id || request.account_id != account_id)
                    return R::err(validation_error("postings in one unit must target one account"));
                auto valid = validateRequest(request);
                if (!valid.is_ok())
                    return R::err(valid.error());
            }

            std::vector<PostingResult> results(requests.size());
            std::vector<bool> fresh(requests.size(), true);
            bool any_fresh = false;
            for (std::size_t i = 0; i < requests.size(); ++i) {
                if (requests[i].idempotency_key) {
                    auto prior = findIdempotent(tenant_id, *requests[i].idempotency_key);
                    if (prior) {
                        results[i] = *prior;
                        fresh[i] = false;
                    }
                }
                any_fresh = any_fresh || fresh[i];
            }
            if (!any_fresh)
                return R::ok(results);

            auto slot = findSlot(tenant_id, account_id);
            if (!slot)
                return R::err(account_not_found("account " + account_id + " not found for tenant " + tenant_id));

            auto guard = locks_.tryAcquire(scopedKey(tenant_id, account_id), lock_timeout_);
            if (!guard.owns_lock())
                return R::err(concurrency_conflict("account " + account_id + " is busy"));

            // Snapshot only changes under the account lock, so it is stable from here
            const SecuredBalanceAccount &acct = slot->account;

            Money balance = acct.balance();
            Money held = acct.held();
            dp::u64 sequence = static_cast<dp::u64>(slot->entries.size());
            std::string previous_hash = slot->entries.empty() ? std::string() : slot->entries.back().entry_hash;
            std::vector<std::size_t> reversed_positions;
            std::vector<storage::StagedPosting> staged;

            for (std::size_t i = 0; i < requests.size(); ++i) {
                if (!fresh[i])
                    continue;
                const PostingRequest &request = requests[i];
                if (!acct.acceptsPosting(request.balance_delta, request.held_delta))
                    return R::err(invalid_state("account " + acct.id + " is " + accountStatusToString(acct.status()) +
                                                " and rejects " + entryTypeToString(request.type) + " postings"));

                Money new_balance = 0;
                Money new_held = 0;
                if (!checkedAdd(balance, request.balance_delta, new_balance) ||
                    !checkedAdd(held, request.held_delta, new_held))
                    return R::err(validation_error("posting overflows account " + acct.id));
                if (new_held < 0)
                    return R::err(insufficient_funds("held " + std::to_string(held) + " cannot cover " +
                                                     std::to_string(-request.held_delta) + " on account " + acct.id));
                if (new_balance < 0)
                    return R::err(insufficient_funds("balance " + std::to_string(balance) + " cannot cover " +
                                                     std::to_string(-request.balance_delta) + " on account " +
                                                     acct.id));
                if (new_held > new_balance)
                    return R::err(insufficient_funds("held " + std::to_string(new_held) + " would exceed balance " +
                                                     std::to_string(new_balance) + " on account " + acct.id));

                if (request.reverses_entry_id) {
                    std::optional<std::size_t> position;
                    for (std::size_t p = 0; p < slot->entries.size(); ++p) {
                        if (slot->entries[p].id == *request.reverses_entry_id)
                            position = p;
                    }
                    if (!position)
                        return R::err(not_found("entry " + *request.reverses_entry_id + " not on account " + acct.id));
                    const LedgerEntry &target = slot->entries[*position];
                    bool flipped = std::find(reversed_positions.begin(), reversed_positions.end(), *position) !=
                                   reversed_positions.end();
                    if (target.status != EntryStatus::Posted || flipped) {
                        auto status = flipped ? EntryStatus::Reversed : target.status;
                        return R::err(invalid_state("entry " + target.id + " is " + entryStatusToString(status)));
                    }
                    reversed_positions.push_back(*position);
                }

                PostingResult &result = results[i];
                LedgerEntry &entry = result.entry;
                entry.id = "ent-" + std::to_string(++next_entry_);
                entry.tenant_id = request.tenant_id;
                entry.account_id = request.account_id;
                entry.type = request.type;
                entry.status = EntryStatus::Posted;
                entry.occurred_at = clock_();
                entry.currency = acct.currency;
                entry.balance_delta = request.balance_delta;
                entry.held_delta = request.held_delta;
                entry.context = request.context;
                entry.idempotency_key = request.idempotency_key;
                entry.reason_code = request.reason_code;
                entry.reverses_entry_id = request.reverses_entry_id;
                entry.sequence = ++sequence;
                entry.previous_hash = previous_hash;
                entry.entry_hash = storage::sha256Hex(entry.previous_hash + entry.canonical());
                previous_hash = entry.entry_hash;

                dp::u64 n = 0;
                for (const auto &draft : request.allocations) {
                    Allocation allocation;
                    allocation.id = entry.id + "-a" + std::to_string(++n);
                    allocation.tenant_id = entry.tenant_id;
                    allocation.entry_id = entry.id;
                    allocation.type = draft.type;
                    allocation.amount = draft.amount;
                    allocation.currency = entry.currency;
                    allocation.target = draft.target;
                    allocation.occurred_at = entry.occurred_at;
                    result.allocations.push_back(allocation);
                }
                for (auto event : request.claim_events) {
                    event.ledger_entry_id = entry.id;
                    result.claim_events.push_back(event);
                }

                balance = new_balance;
                held = new_held;
                staged.push_back(storage::StagedPosting{entry, result.allocations, result.claim_events});
            }

            std::unique_lock<std::shared_mutex> lock(index_mutex_);

            // A different account may have claimed a key meanwhile
            for (std::size_t i = 0; i < requests.size(); ++i) {
                if (!fresh[i] || !requests[i].idempotency_key)
                    continue;
                auto prior = findIdempotentLocked(tenant_id, *requests[i].idempotency_key);
                if (!prior)
                    continue;
                if (requests.size() == 1)
                    return R::ok(std::vector<PostingResult>{*prior});
                return R::err(concurrency_conflict("idempotency key " + *requests[i].idempotency_key +
                                                   " was posted concurrently"));
            }

            if (journal_) {
                auto journaled = journal_->recordPostings(staged);
                if (!journaled.is_ok()) {
                    logWarn(log_level_, "journal rejected " + std::to_string(staged.size()) + " posting(s) on " +
                                            acct.id + ": " + errorMessage(journaled.error()));
                    return R::err(journaled.error());
                }
            }

            for (auto position : reversed_positions)
                slot->entries[position].status = EntryStatus::Reversed;
            for (std::size_t i = 0; i < requests.size(); ++i) {
                if (!fresh[i])
                    continue;
                const LedgerEntry &entry = results[i].entry;
                slot->account.apply(entry);
                slot->entries.push_back(entry);
                slot->allocations.insert(slot->allocations.end(), results[i].allocations.begin(),
                                         results[i].allocations.end());
                entry_accounts_[scopedKey(entry.tenant_id, entry.id)] = account_id;
                if (entry.idempotency_key)
                    idempotency_[scopedKey(entry.tenant_id, *entry.idempotency_key)] = entry.id;
                logInfo(log_level_, "posted " + entryTypeToString(entry.type) + " " + entry.id + " on " + acct.id +
                                        " balance " + std::to_string(acct.balance()) + " held " +
                                        std::to_string(acct.held()));
            }
            return R::ok(results);
        }

        // ===========================================
        // Reads
        // ===========================================

        inline dp::Result<LedgerEntry, dp::Error> entry(const std::string &tenant_id,
                                                        const std::string &entry_id) const {
            std::shared_lock<std::shared_mutex> lock(index_mutex_);
            auto owner = entry_accounts_.find(scopedKey(tenant_id, entry_id));
            if (owner == entry_accounts_.end())
                return dp::Result<LedgerEntry, dp::Error>::err(not_found("entry " + entry_id + " not found"));
            const auto &slot = accounts_.at(scopedKey(tenant_id, owner->second));
            for (const auto &e : slot->entries) {
                if (e.id == entry_id)
                    return dp::Result<LedgerEntry, dp::Error>::ok(e);
            }
            return dp::Result<LedgerEntry, dp::Error>::err(not_found("entry " + entry_id + " not found"));
        }

        /// Account log in sequence order
        inline std::vector<LedgerEntry> entries(const std::string &tenant_id, const std::string &account_id) const {
            std::shared_lock<std::shared_mutex> lock(index_mutex_);
            auto it = accounts_.find(scopedKey(tenant_id, account_id));
            if (it == accounts_.end())
                return {};
            return it->second->entries;
        }

        inline std::vector<Allocation> allocations(const std::string &tenant_id, const std::string &entry_id) const {
            std::shared_lock<std::shared_mutex> lock(index_mutex_);
            std::vector<Allocation> out;
            auto owner = entry_accounts_.find(scopedKey(tenant_id, entry_id));
            if (owner == entry_accounts_.end())
                return out;
            for (const auto &allocation : accounts_.at(scopedKey(tenant_id, owner->second))->allocations) {
                if (allocation.entry_id == entry_id)
                    out.push_back(allocation);
            }
            return out;
        }

        // ===========================================
        // Verification
        // ===========================================

        /// Snapshot equals the fold of its folded entries
        inline dp::Result<bool, dp::Error> verifyFold(const std::string &tenant_id,
                                                      const std::string &account_id) const {
            std::shared_lock<std::shared_mutex> lock(index_mutex_);
            auto it = accounts_.find(scopedKey(tenant_id, account_id));
            if (it == accounts_.end())
                return dp::Result<bool, dp::Error>::err(account_not_found("account " + account_id + " not found"));

            SecuredBalanceAccount folded;
            for (const auto &e : it->second->entries)
                folded.apply(e);
            const auto &acct = it->second->account;
            bool ok = folded.balance() == acct.balance() && folded.held() == acct.held() &&
                      folded.released() == acct.released() && folded.forfeited() == acct.forfeited();
            if (!ok)
                logWarn(log_level_, "account " + account_id + " snapshot diverges from its entry fold");
            return dp::Result<bool, dp::Error>::ok(ok);
        }

        /// Recompute the per-account hash chain
        inline dp::Result<bool, dp::Error> verifyChain(const std::string &tenant_id,
                                                       const std::string &account_id) const {
            std::shared_lock<std::shared_mutex> lock(index_mutex_);
            auto it = accounts_.find(scopedKey(tenant_id, account_id));
            if (it == accounts_.end())
                return dp::Result<bool, dp::Error>::err(account_not_found("account " + account_id + " not found"));

            std::string previous;
            dp::u64 expected = 1;
            for (const auto &e : it->second->entries) {
                if (e.sequence != expected++ || e.previous_hash != previous)
                    return dp::Result<bool, dp::Error>::ok(false);
                auto hash = storage::sha256Hex(previous + e.canonical());
                if (hash.empty())
                    return dp::Result<bool, dp::Error>::err(dp::Error::io_error("Hash computation failed"));
                if (hash != e.entry_hash)
                    return dp::Result<bool, dp::Error>::ok(false);
                previous = e.entry_hash;
            }
            return dp::Result<bool, dp::Error>::ok(true);
        }

        /// Compare the in-memory snapshot with a fold of the journaled entries
        inline dp::Result<bool, dp::Error> verifyAgainstJournal(const std::string &tenant_id,
                                                                const std::string &account_id) const {
            if (!journal_)
                return dp::Result<bool, dp::Error>::err(invalid_state("no journal attached"));
            auto acct = account(tenant_id, account_id);
            if (!acct.is_ok())
                return dp::Result<bool, dp::Error>::err(acct.error());
            auto fold = journal_->foldAccount(tenant_id, account_id);
            if (!fold.is_ok())
                return dp::Result<bool, dp::Error>::err(journal_failed(errorMessage(fold.error())));
            return dp::Result<bool, dp::Error>::ok(fold.value().balance == acct.value().balance() &&
                                                   fold.value().held == acct.value().held());
        }

      private:
        struct AccountSlot {
            SecuredBalanceAccount account;
            std::vector<LedgerEntry> entries;
            std::vector<Allocation> allocations;
        };

        inline static std::string scopedKey(const std::string &tenant_id, const std::string &id) {
            return tenant_id + "/" + id;
        }

        inline std::shared_ptr<AccountSlot> findSlot(const std::string &tenant_id,
                                                     const std::string &account_id) const {
            std::shared_lock<std::shared_mutex> lock(index_mutex_);
            auto it = accounts_.find(scopedKey(tenant_id, account_id));
            if (it == accounts_.end())
                return nullptr;
            return it->second;
        }

        inline static dp::Result<void, dp::Error> validateRequest(const PostingRequest &request) {
            if (request.balance_delta == 0 && request.held_delta == 0)
                return dp::Result<void, dp::Error>::err(validation_error("entry must change balance or held"));
            if (request.context.empty())
                return dp::Result<void, dp::Error>::err(validation_error("entry needs at least one context pointer"));
            if (request.idempotency_key && request.idempotency_key->empty())
                return dp::Result<void, dp::Error>::err(validation_error("idempotency key must not be empty"));
            for (const auto &draft : request.allocations) {
                auto positive = requirePositive(draft.amount, "allocation amount");
                if (!positive.is_ok())
                    return positive;
                if (draft.target.empty())
                    return dp::Result<void, dp::Error>::err(validation_error("allocation needs at least one target"));
            }
            return dp::Result<void, dp::Error>::ok();
        }

        inline std::optional<PostingResult> findIdempotentLocked(const std::string &tenant_id,
                                                                 const std::string &key) const {
            auto it = idempotency_.find(scopedKey(tenant_id, key));
            if (it == idempotency_.end())
                return std::nullopt;
            const auto &slot = accounts_.at(scopedKey(tenant_id, entry_accounts_.at(scopedKey(tenant_id, it->second))));
            PostingResult prior;
            prior.already_processed = true;
            for (const auto &e : slot->entries) {
                if (e.id == it->second)
                    prior.entry = e;
            }
            for (const auto &allocation : slot->allocations) {
                if (allocation.entry_id == it->second)
                    prior.allocations.push_back(allocation);
            }
            return prior;
        }

        Clock clock_;
        LogLevel log_level_;
        std::chrono::milliseconds lock_timeout_{250};
        storage::Journal *journal_ = nullptr;

        LockTable locks_;
        mutable std::shared_mutex index_mutex_;
        std::unordered_map<std::string, std::shared_ptr<AccountSlot>> accounts_;
        std::unordered_map<std::string, std::string> contract_accounts_; // tenant/contract -> account id
        std::unordered_map<std::string, std::string> entry_accounts_;    // tenant/entry -> account id
        std::unordered_map<std::string, std::string> idempotency_;       // tenant/key -> entry id
        std::atomic<dp::u64> next_account_{0};
        std::atomic<dp::u64> next_entry_{0};
    };

} // namespace surety::ledger
