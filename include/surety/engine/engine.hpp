#pragma once

#include <surety/claim/claim.hpp>
#include <surety/commitment/contract.hpp>
#include <surety/commitment/contract_book.hpp>
#include <surety/commitment/evaluator.hpp>
#include <surety/commitment/milestone.hpp>
#include <surety/commitment/obligation.hpp>
#include <surety/common/error.hpp>
#include <surety/common/log.hpp>
#include <surety/common/money.hpp>
#include <surety/ledger/ledger.hpp>
#include <surety/storage/journal.hpp>
#include <surety/subject/registry.hpp>

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace surety {

    // ===========================================
    // Configuration
    // ===========================================

    struct EngineConfig {
        /// Default for threshold milestones that do not pick one
        commitment::ThresholdConvention threshold_convention = commitment::ThresholdConvention::WeightSum;
        bool count_waived_as_satisfied = false;
        /// Per-contract and per-account lock acquisition budget
        dp::i64 lock_timeout_ms = 250;
        LogLevel log_level = LogLevel::Warn;
        Clock clock = currentMillis;
    };

    // ===========================================
    // Commands
    // ===========================================

    struct ContractDraft {
        std::string tenant_id;
        commitment::ContractType type = commitment::ContractKind::Escrow;
        std::string title;
        subject::SubjectRef anchor;
        std::optional<subject::SubjectRef> counterparty;
        std::string currency = "USD";
        Money committed_amount = 0;
        std::optional<Millis> expires_at;
        commitment::ContractPolicy policy;
    };

    struct ObligationDraft {
        commitment::ObligationType type = commitment::ObligationKind::ServiceDelivery;
        std::string title;
        std::optional<subject::SubjectRef> obligor;
        std::optional<subject::SubjectRef> beneficiary;
        std::optional<Money> required_amount;
        std::optional<Millis> due_at;
        dp::i32 sort_order = 100;
    };

    struct MilestoneDraft {
        std::string code;
        std::string title;
        commitment::EvaluationMode evaluation_mode = commitment::EvaluationMode::All;
        std::optional<dp::i32> min_satisfied_count;
        std::optional<commitment::ThresholdConvention> threshold_convention;
        commitment::ReleaseMode release_mode = commitment::ReleaseMode::Manual;
        Money release_amount = 0;
        std::optional<Millis> due_at;
        dp::i32 sort_order = 100;
    };

    struct LinkDraft {
        dp::i32 weight = 1;
        bool is_required = true;
        dp::i32 sort_order = 100;
    };

    /// Where money came from. The account's contract, if any, is always
    /// added to the entry context.
    struct FundingSource {
        std::optional<std::string> external_transaction_id;
        std::optional<subject::SubjectRef> source_subject;
        std::optional<std::string> idempotency_key;
        std::string reason_code = "funding";
    };

    /// Manual forfeit or refund of held funds on a contract's account
    struct HeldAdjustment {
        Money amount = 0;
        std::string reason_code;
        std::optional<std::string> obligation_id;
        std::optional<std::string> idempotency_key;
    };

    struct ClaimDraft {
        claim::ClaimType type = claim::ClaimKind::NonDelivery;
        std::string title;
        subject::SubjectRef raised_by;
        std::optional<subject::SubjectRef> against;
        std::optional<std::string> disputed_milestone_id;
        std::optional<Millis> respond_by_at;
        std::optional<Money> disputed_amount;
        std::string currency = "USD";
    };

    struct ClaimResolution {
        claim::ResolutionType resolution = claim::ResolutionKind::NoFault;
        std::optional<Money> settled_amount;
        std::optional<subject::SubjectRef> actor;
        std::string note;
    };

    // ===========================================
    // Outcomes
    // ===========================================

    struct ReleaseOutcome {
        commitment::Milestone milestone;
        std::optional<ledger::LedgerEntry> entry; // absent for zero-amount releases
        std::vector<ledger::Allocation> allocations;
        bool already_processed = false;
    };

    /// Result of an obligation transition and the re-evaluation it triggered
    struct ObligationUpdate {
        commitment::Obligation obligation;
        std::vector<commitment::Milestone> milestones_changed;
        std::vector<ReleaseOutcome> releases;
    };

    struct ClaimOutcome {
        claim::Claim claim;
        claim::ClaimEvent event;
        std::optional<ledger::LedgerEntry> settlement_entry;
        commitment::ContractStatus contract_status = commitment::ContractStatus::Active;
        bool already_processed = false;
    };

    // ===========================================
    // CommitmentEngine
    // ===========================================

    /// Contract, obligation, milestone and claim workflows over one
    /// SecuredBalanceLedger. Each contract is serialized by its own lock;
    /// ledger postings additionally take the account lock (contract first).
    class CommitmentEngine {
      public:
        explicit CommitmentEngine(const subject::SubjectRegistry &registry, EngineConfig config = EngineConfig{});

        CommitmentEngine(const CommitmentEngine &) = delete;
        CommitmentEngine &operator=(const CommitmentEngine &) = delete;

        /// Mirror postings and claim events into `journal`; nullptr detaches
        void attachJournal(storage::Journal *journal);

        inline ledger::SecuredBalanceLedger &ledger() { return ledger_; }
        inline const ledger::SecuredBalanceLedger &ledger() const { return ledger_; }
        inline const EngineConfig &config() const { return config_; }

        // Contracts
        dp::Result<commitment::CommitmentContract, dp::Error> createContract(const ContractDraft &draft);
        dp::Result<commitment::CommitmentContract, dp::Error> activateContract(const std::string &tenant_id,
                                                                              const std::string &contract_id);
        dp::Result<commitment::CommitmentContract, dp::Error> pauseContract(const std::string &tenant_id,
                                                                           const std::string &contract_id);
        dp::Result<commitment::CommitmentContract, dp::Error> resumeContract(const std::string &tenant_id,
                                                                            const std::string &contract_id);
        dp::Result<commitment::CommitmentContract, dp::Error> completeContract(const std::string &tenant_id,
                                                                              const std::string &contract_id);
        dp::Result<commitment::CommitmentContract, dp::Error> cancelContract(const std::string &tenant_id,
                                                                            const std::string &contract_id);
        dp::Result<commitment::CommitmentContract, dp::Error> markContractDefaulted(const std::string &tenant_id,
                                                                                   const std::string &contract_id);
        dp::Result<commitment::CommitmentContract, dp::Error> expireContract(const std::string &tenant_id,
                                                                            const std::string &contract_id);

        dp::Result<commitment::CommitmentContract, dp::Error> contract(const std::string &tenant_id,
                                                                      const std::string &contract_id) const;
        std::vector<commitment::CommitmentContract> listContracts(const std::string &tenant_id) const;

        // Obligations
        dp::Result<commitment::Obligation, dp::Error> addObligation(const std::string &tenant_id,
                                                                   const std::string &contract_id,
                                                                   const ObligationDraft &draft);
        dp::Result<ObligationUpdate, dp::Error> startObligation(const std::string &tenant_id,
                                                                const std::string &obligation_id);
        dp::Result<ObligationUpdate, dp::Error> recordSatisfaction(const std::string &tenant_id,
                                                                   const std::string &obligation_id, Money amount);
        dp::Result<ObligationUpdate, dp::Error> satisfyObligation(const std::string &tenant_id,
                                                                  const std::string &obligation_id,
                                                                  std::optional<Money> satisfied_amount = std::nullopt);
        dp::Result<ObligationUpdate, dp::Error> markObligationBreached(const std::string &tenant_id,
                                                                       const std::string &obligation_id);
        dp::Result<ObligationUpdate, dp::Error> waiveObligation(const std::string &tenant_id,
                                                                const std::string &obligation_id);
        dp::Result<ObligationUpdate, dp::Error> cancelObligation(const std::string &tenant_id,
                                                                 const std::string &obligation_id);
        dp::Result<ObligationUpdate, dp::Error> markObligationExpired(const std::string &tenant_id,
                                                                      const std::string &obligation_id);
        dp::Result<ObligationUpdate, dp::Error> reopenObligation(const std::string &tenant_id,
                                                                 const std::string &obligation_id);

        dp::Result<commitment::Obligation, dp::Error> obligation(const std::string &tenant_id,
                                                                const std::string &obligation_id) const;
        dp::Result<std::vector<commitment::Obligation>, dp::Error>
        listObligations(const std::string &tenant_id, const std::string &contract_id) const;

        // Milestones
        dp::Result<commitment::Milestone, dp::Error> addMilestone(const std::string &tenant_id,
                                                                 const std::string &contract_id,
                                                                 const MilestoneDraft &draft);
        dp::Result<commitment::MilestoneObligationLink, dp::Error>
        linkObligation(const std::string &tenant_id, const std::string &milestone_id,
                       const std::string &obligation_id, const LinkDraft &link = LinkDraft{});
        /// Recompute every unsettled milestone of a contract from current obligation states
        dp::Result<std::vector<commitment::Milestone>, dp::Error> evaluateMilestones(const std::string &tenant_id,
                                                                                    const std::string &contract_id);
        dp::Result<ReleaseOutcome, dp::Error> releaseMilestone(const std::string &tenant_id,
                                                               const std::string &milestone_id,
                                                               const std::string &released_by);
        dp::Result<commitment::Milestone, dp::Error> cancelMilestone(const std::string &tenant_id,
                                                                    const std::string &milestone_id);
        dp::Result<commitment::Milestone, dp::Error> skipMilestone(const std::string &tenant_id,
                                                                  const std::string &milestone_id);

        dp::Result<commitment::Milestone, dp::Error> milestone(const std::string &tenant_id,
                                                              const std::string &milestone_id) const;
        dp::Result<commitment::EvaluationResult, dp::Error> milestoneEvaluation(const std::string &tenant_id,
                                                                               const std::string &milestone_id) const;
        dp::Result<std::vector<commitment::Milestone>, dp::Error> listMilestones(const std::string &tenant_id,
                                                                                const std::string &contract_id) const;
        dp::Result<std::vector<commitment::MilestoneObligationLink>, dp::Error>
        listLinks(const std::string &tenant_id, const std::string &milestone_id) const;

        // Secured balance accounts
        dp::Result<ledger::SecuredBalanceAccount, dp::Error> openAccount(const ledger::OpenAccountRequest &request);
        dp::Result<ledger::PostingResult, dp::Error> fundAccount(const std::string &tenant_id,
                                                                 const std::string &account_id, Money amount,
                                                                 const FundingSource &source = FundingSource{});
        dp::Result<ledger::PostingResult, dp::Error> holdFunds(const std::string &tenant_id,
                                                               const std::string &account_id, Money amount,
                                                               const FundingSource &source = FundingSource{});
        dp::Result<ledger::PostingResult, dp::Error> forfeitHeld(const std::string &tenant_id,
                                                                 const std::string &contract_id,
                                                                 const HeldAdjustment &adjustment);
        dp::Result<ledger::PostingResult, dp::Error> refundHeld(const std::string &tenant_id,
                                                                const std::string &contract_id,
                                                                const HeldAdjustment &adjustment);
        dp::Result<ledger::PostingResult, dp::Error> reverseFunding(const std::string &tenant_id,
                                                                    const std::string &entry_id,
                                                                    const std::string &reason_code);
        dp::Result<ledger::SecuredBalanceAccount, dp::Error> closeAccount(const std::string &tenant_id,
                                                                         const std::string &account_id);
        /// Snapshot matches the entry fold, the hash chain is intact and,
        /// with a journal attached, the journal fold agrees
        dp::Result<bool, dp::Error> verifyAccount(const std::string &tenant_id, const std::string &account_id) const;

        // Claims
        dp::Result<ClaimOutcome, dp::Error> openClaim(const std::string &tenant_id, const std::string &contract_id,
                                                      const ClaimDraft &draft);
        dp::Result<ClaimOutcome, dp::Error> startClaimReview(const std::string &tenant_id,
                                                             const std::string &claim_id,
                                                             const std::optional<subject::SubjectRef> &actor);
        dp::Result<ClaimOutcome, dp::Error> escalateClaim(const std::string &tenant_id, const std::string &claim_id,
                                                          const std::optional<subject::SubjectRef> &actor,
                                                          const std::string &note);
        dp::Result<ClaimOutcome, dp::Error> proposeResolution(const std::string &tenant_id,
                                                              const std::string &claim_id,
                                                              const claim::ResolutionType &resolution,
                                                              const std::optional<subject::SubjectRef> &actor,
                                                              const std::string &note);
        dp::Result<ClaimOutcome, dp::Error> resolveClaim(const std::string &tenant_id, const std::string &claim_id,
                                                         const ClaimResolution &resolution);
        dp::Result<ClaimOutcome, dp::Error> rejectClaim(const std::string &tenant_id, const std::string &claim_id,
                                                        const std::optional<subject::SubjectRef> &actor,
                                                        const std::string &note);
        dp::Result<ClaimOutcome, dp::Error> cancelClaim(const std::string &tenant_id, const std::string &claim_id,
                                                        const std::optional<subject::SubjectRef> &actor,
                                                        const std::string &note);
        dp::Result<ClaimOutcome, dp::Error> closeClaim(const std::string &tenant_id, const std::string &claim_id,
                                                       const std::optional<subject::SubjectRef> &actor);
        dp::Result<ClaimOutcome, dp::Error> reopenClaim(const std::string &tenant_id, const std::string &claim_id,
                                                        const std::optional<subject::SubjectRef> &actor,
                                                        const std::string &note);
        dp::Result<ClaimOutcome, dp::Error> addClaimNote(const std::string &tenant_id, const std::string &claim_id,
                                                         const std::optional<subject::SubjectRef> &actor,
                                                         const std::string &note);
        dp::Result<ClaimOutcome, dp::Error> addClaimEvidence(const std::string &tenant_id,
                                                             const std::string &claim_id,
                                                             const std::optional<subject::SubjectRef> &actor,
                                                             const std::string &note);
        dp::Result<ClaimOutcome, dp::Error> updateDisputedAmount(const std::string &tenant_id,
                                                                 const std::string &claim_id, Money amount,
                                                                 const std::optional<subject::SubjectRef> &actor);

        dp::Result<claim::Claim, dp::Error> claim(const std::string &tenant_id, const std::string &claim_id) const;
        dp::Result<std::vector<claim::Claim>, dp::Error> listClaims(const std::string &tenant_id,
                                                                    const std::string &contract_id) const;
        /// Timeline in the order events were written
        dp::Result<std::vector<claim::ClaimEvent>, dp::Error> claimEvents(const std::string &tenant_id,
                                                                          const std::string &claim_id) const;

      private:
        using BookPtr = std::shared_ptr<commitment::ContractBook>;
        using BookLock = std::unique_lock<std::timed_mutex>;

        enum class IndexKind : dp::u8 { Obligation, Milestone, Claim };

        // Lookup and locking (engine.cpp)
        static std::string scopedKey(const std::string &tenant_id, const std::string &id);
        std::string nextId(const char *prefix);
        BookPtr findBook(const std::string &tenant_id, const std::string &contract_id) const;
        BookPtr findOwningBook(IndexKind kind, const std::string &tenant_id, const std::string &id) const;
        void indexChild(IndexKind kind, const std::string &tenant_id, const std::string &id,
                        const std::string &contract_id);
        BookLock lockBook(commitment::ContractBook &book) const;
        dp::Error busy(const commitment::ContractBook &book) const;
        Millis now() const;

        // Contract helpers (contracts.cpp)
        dp::Result<commitment::CommitmentContract, dp::Error>
        transitionContract(const std::string &tenant_id, const std::string &contract_id,
                           commitment::ContractStatus from, commitment::ContractStatus to);
        dp::Result<void, dp::Error> reconcileHeldOnCancel(commitment::ContractBook &book);

        // Obligation helpers (obligations.cpp)
        template <typename Fn>
        dp::Result<ObligationUpdate, dp::Error> mutateObligation(const std::string &tenant_id,
                                                                 const std::string &obligation_id, Fn &&fn);

        // Milestone helpers (milestones.cpp)
        commitment::EvaluationOptions evaluationOptions() const;
        /// Re-score milestones and release ready automatic ones. Caller holds the book lock.
        void reevaluate(commitment::ContractBook &book, const std::vector<std::string> &milestone_ids,
                        std::vector<commitment::Milestone> &changed, std::vector<ReleaseOutcome> &releases);
        void drainAutomaticReleases(commitment::ContractBook &book, std::vector<ReleaseOutcome> &releases);
        dp::Result<void, dp::Error> checkReleaseAllowed(const commitment::ContractBook &book,
                                                        const commitment::Milestone &milestone) const;
        dp::Result<ReleaseOutcome, dp::Error> releaseLocked(commitment::ContractBook &book,
                                                            commitment::Milestone &milestone,
                                                            const std::string &released_by);
        dp::Result<commitment::Milestone, dp::Error> settleMilestone(const std::string &tenant_id,
                                                                    const std::string &milestone_id,
                                                                    commitment::MilestoneStatus to);

        // Ledger helpers (ledger_ops.cpp)
        /// Posting request that settles held funds of the contract's account
        dp::Result<ledger::PostingRequest, dp::Error>
        settlementRequest(const commitment::ContractBook &book, ledger::EntryType type, Money amount,
                          const std::string &reason_code, const std::optional<std::string> &idempotency_key,
                          std::vector<ledger::AllocationDraft> allocations, ledger::EntryContext context,
                          std::vector<claim::ClaimEvent> events = {}) const;
        dp::Result<ledger::PostingResult, dp::Error>
        postAgainstContract(commitment::ContractBook &book, ledger::EntryType type, Money amount,
                            const std::string &reason_code, const std::optional<std::string> &idempotency_key,
                            std::vector<ledger::AllocationDraft> allocations, ledger::EntryContext context,
                            std::vector<claim::ClaimEvent> events = {});
        dp::Result<ledger::PostingResult, dp::Error> adjustHeld(const std::string &tenant_id,
                                                                const std::string &contract_id,
                                                                const HeldAdjustment &adjustment,
                                                                ledger::EntryType type);

        // Claim helpers (claims.cpp)
        template <typename Fn>
        dp::Result<ClaimOutcome, dp::Error> mutateClaim(const std::string &tenant_id, const std::string &claim_id,
                                                        Fn &&fn);
        claim::ClaimEvent makeEvent(const commitment::ContractBook &book, const claim::Claim &claim,
                                    claim::ClaimEventType type, const std::optional<subject::SubjectRef> &actor,
                                    const std::string &note);
        dp::Result<void, dp::Error> appendEvent(commitment::ContractBook &book, const claim::ClaimEvent &event);
        dp::Result<ClaimOutcome, dp::Error> claimTransition(const std::string &tenant_id,
                                                            const std::string &claim_id, claim::ClaimStatus to,
                                                            claim::ClaimEventType event_type,
                                                            const std::optional<subject::SubjectRef> &actor,
                                                            const std::string &note);
        void maybeExitDispute(commitment::ContractBook &book);

        const subject::SubjectRegistry &registry_;
        EngineConfig config_;
        ledger::SecuredBalanceLedger ledger_;
        storage::Journal *journal_ = nullptr;

        mutable std::shared_mutex books_mutex_;
        std::unordered_map<std::string, BookPtr> books_;         // tenant/contract -> book
        std::unordered_map<std::string, std::string> children_; // kind:tenant/id -> contract id
        std::atomic<dp::u64> next_id_{0};
    };

} // namespace surety
