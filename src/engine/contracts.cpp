#include <surety/engine/engine.hpp>

#include <algorithm>

namespace surety {

    using commitment::CommitmentContract;
    using commitment::ContractStatus;
    using R = dp::Result<CommitmentContract, dp::Error>;

    // ===========================================
    // Creation
    // ===========================================

    R CommitmentEngine::createContract(const ContractDraft &draft) {
        if (draft.tenant_id.empty())
            return R::err(validation_error("tenant_id is required"));
        if (!isValidCurrency(draft.currency))
            return R::err(validation_error("currency '" + draft.currency + "' is not ISO-4217"));
        auto committed = requireNonNegative(draft.committed_amount, "committed_amount");
        if (!committed.is_ok())
            return R::err(committed.error());
        auto anchor = subject::requireSubject(registry_, draft.tenant_id, draft.anchor, "anchor");
        if (!anchor.is_ok())
            return R::err(anchor.error());
        auto counterparty = subject::requireOptionalSubject(registry_, draft.tenant_id, draft.counterparty, "counterparty");
        if (!counterparty.is_ok())
            return R::err(counterparty.error());

        auto book = std::make_shared<commitment::ContractBook>();
        CommitmentContract &c = book->contract;
        c.id = nextId("ctr-");
        c.tenant_id = draft.tenant_id;
        c.type = draft.type;
        c.status = ContractStatus::Draft;
        c.title = draft.title;
        c.anchor = draft.anchor;
        c.counterparty = draft.counterparty;
        c.currency = draft.currency;
        c.committed_amount = draft.committed_amount;
        c.expires_at = draft.expires_at;
        c.policy = draft.policy;

        {
            std::unique_lock<std::shared_mutex> lock(books_mutex_);
            books_[scopedKey(c.tenant_id, c.id)] = book;
        }
        logInfo(config_.log_level, "created contract " + c.id + " (" + c.type.toString() + ", committed " +
                                       std::to_string(c.committed_amount) + " " + c.currency + ")");
        return R::ok(c);
    }

    // ===========================================
    // Externally driven transitions
    // ===========================================

    R CommitmentEngine::transitionContract(const std::string &tenant_id, const std::string &contract_id,
                                           ContractStatus from, ContractStatus to) {
        auto book = findBook(tenant_id, contract_id);
        if (!book)
            return R::err(not_found("contract " + contract_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));

        CommitmentContract next = book->contract;
        if (next.status != from || !commitment::isLegalContractTransition(from, to)) {
            return R::err(invalid_state("contract " + contract_id + " is " + contractStatusToString(next.status) +
                                        ", cannot move to " + contractStatusToString(to)));
        }

        if (to == ContractStatus::Active && from == ContractStatus::Draft) {
            next.started_at = now();
            if (next.expires_at && *next.expires_at <= *next.started_at)
                return R::err(validation_error("expires_at must be after started_at"));
        }
        if (to == ContractStatus::Completed) {
            if (book->hasOpenObligations())
                return R::err(invalid_state("contract " + contract_id + " still has open obligations"));
            if (book->hasActiveClaims())
                return R::err(invalid_state("contract " + contract_id + " still has open claims"));
            next.completed_at = now();
        }
        next.status = to;

        auto ok = next.checkInvariants();
        if (!ok.is_ok()) {
            logWarn(config_.log_level, errorMessage(ok.error()));
            return R::err(ok.error());
        }
        book->contract = next;
        logInfo(config_.log_level, "contract " + contract_id + " " + contractStatusToString(from) + " -> " +
                                       contractStatusToString(to));

        if (to == ContractStatus::Active) {
            std::vector<ReleaseOutcome> releases;
            drainAutomaticReleases(*book, releases);
        }
        return R::ok(book->contract);
    }

    R CommitmentEngine::activateContract(const std::string &tenant_id, const std::string &contract_id) {
        return transitionContract(tenant_id, contract_id, ContractStatus::Draft, ContractStatus::Active);
    }

    R CommitmentEngine::pauseContract(const std::string &tenant_id, const std::string &contract_id) {
        return transitionContract(tenant_id, contract_id, ContractStatus::Active, ContractStatus::Paused);
    }

    R CommitmentEngine::resumeContract(const std::string &tenant_id, const std::string &contract_id) {
        return transitionContract(tenant_id, contract_id, ContractStatus::Paused, ContractStatus::Active);
    }

    R CommitmentEngine::completeContract(const std::string &tenant_id, const std::string &contract_id) {
        return transitionContract(tenant_id, contract_id, ContractStatus::Active, ContractStatus::Completed);
    }

    R CommitmentEngine::markContractDefaulted(const std::string &tenant_id, const std::string &contract_id) {
        auto book = findBook(tenant_id, contract_id);
        if (!book)
            return R::err(not_found("contract " + contract_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));

        CommitmentContract &c = book->contract;
        if (c.status == ContractStatus::Defaulted)
            return R::ok(c);
        if (!commitment::isLegalContractTransition(c.status, ContractStatus::Defaulted))
            return R::err(invalid_state("contract " + contract_id + " is " + contractStatusToString(c.status) +
                                        ", cannot default"));
        c.status = ContractStatus::Defaulted;
        c.status_before_dispute.reset();
        logInfo(config_.log_level, "contract " + contract_id + " defaulted");
        return R::ok(c);
    }

    R CommitmentEngine::expireContract(const std::string &tenant_id, const std::string &contract_id) {
        auto book = findBook(tenant_id, contract_id);
        if (!book)
            return R::err(not_found("contract " + contract_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));

        CommitmentContract &c = book->contract;
        if (c.status == ContractStatus::Defaulted)
            return R::ok(c);
        if (!commitment::isLegalContractTransition(c.status, ContractStatus::Defaulted))
            return R::err(invalid_state("contract " + contract_id + " is " + contractStatusToString(c.status) +
                                        ", cannot expire"));
        if (!c.expires_at)
            return R::err(invalid_state("contract " + contract_id + " has no expiry"));
        Millis at = now();
        if (at < *c.expires_at)
            return R::err(invalid_state("contract " + contract_id + " expires at " + std::to_string(*c.expires_at) +
                                        ", now is " + std::to_string(at)));

        c.status = ContractStatus::Defaulted;
        c.status_before_dispute.reset();

        std::vector<std::string> touched;
        for (auto &o : book->obligations) {
            if (!o.isOpen())
                continue;
            o.status = commitment::ObligationStatus::Expired;
            o.expired_at = at;
            for (const auto &m : book->milestonesLinkedTo(o.id))
                touched.push_back(m);
        }
        std::vector<commitment::Milestone> changed;
        std::vector<ReleaseOutcome> releases;
        reevaluate(*book, touched, changed, releases);

        logInfo(config_.log_level, "contract " + contract_id + " expired and defaulted");
        return R::ok(c);
    }

    // ===========================================
    // Cancellation
    // ===========================================

    dp::Result<void, dp::Error> CommitmentEngine::reconcileHeldOnCancel(commitment::ContractBook &book) {
        CommitmentContract &c = book.contract;
        auto account = ledger_.accountForContract(c.tenant_id, c.id);
        if (!account.is_ok())
            return dp::Result<void, dp::Error>::ok();

        Money held = account.value().held();
        if (held == 0)
            return dp::Result<void, dp::Error>::ok();

        subject::SubjectRef payee = c.counterparty.value_or(c.anchor);
        Money to_settle = 0;
        ledger::EntryType settle_type = ledger::EntryType::Forfeit;
        switch (c.policy.cancellation) {
        case commitment::CancellationPolicy::ForfeitHeld:
            settle_type = ledger::EntryType::Forfeit;
            to_settle = std::min(held, c.remainingCommitment());
            break;
        case commitment::CancellationPolicy::ReleaseHeld:
            settle_type = ledger::EntryType::Release;
            to_settle = std::min(held, c.remainingCommitment());
            break;
        case commitment::CancellationPolicy::RefundHeld:
            to_settle = 0;
            break;
        }

        ledger::EntryContext context;
        context.contract_id = c.id;

        // Settle and refund legs post together or not at all
        std::vector<ledger::PostingRequest> legs;
        if (to_settle > 0) {
            ledger::AllocationDraft draft;
            draft.type = settle_type == ledger::EntryType::Forfeit ? ledger::AllocationType::Forfeit
                                                                   : ledger::AllocationType::Adjustment;
            draft.amount = to_settle;
            draft.target.subject = payee;
            auto leg = settlementRequest(book, settle_type, to_settle, "contract_cancelled",
                                         c.id + "/cancel/" + ledger::entryTypeToString(settle_type), {draft}, context);
            if (!leg.is_ok())
                return dp::Result<void, dp::Error>::err(leg.error());
            legs.push_back(leg.value());
        }

        Money excess = held - to_settle;
        if (excess > 0) {
            ledger::AllocationDraft draft;
            draft.type = ledger::AllocationType::Refund;
            draft.amount = excess;
            draft.target.subject = c.anchor;
            auto leg = settlementRequest(book, ledger::EntryType::Refund, excess, "contract_cancelled",
                                         c.id + "/cancel/refund", {draft}, context);
            if (!leg.is_ok())
                return dp::Result<void, dp::Error>::err(leg.error());
            legs.push_back(leg.value());
        }

        auto posted = ledger_.postAll(legs);
        if (!posted.is_ok())
            return dp::Result<void, dp::Error>::err(posted.error());
        if (to_settle > 0 && !posted.value().front().already_processed) {
            if (settle_type == ledger::EntryType::Forfeit)
                c.forfeited_amount += to_settle;
            else
                c.released_amount += to_settle;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    R CommitmentEngine::cancelContract(const std::string &tenant_id, const std::string &contract_id) {
        auto book = findBook(tenant_id, contract_id);
        if (!book)
            return R::err(not_found("contract " + contract_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));

        CommitmentContract &c = book->contract;
        if (c.status == ContractStatus::Cancelled)
            return R::ok(c);
        if (!commitment::isLegalContractTransition(c.status, ContractStatus::Cancelled))
            return R::err(invalid_state("contract " + contract_id + " is " + contractStatusToString(c.status) +
                                        ", cannot cancel"));

        auto reconciled = reconcileHeldOnCancel(*book);
        if (!reconciled.is_ok()) {
            logWarn(config_.log_level, "cancel of " + contract_id + " failed to reconcile held funds: " +
                                           errorMessage(reconciled.error()));
            return R::err(reconciled.error());
        }

        Millis at = now();
        for (auto &o : book->obligations) {
            if (o.isOpen()) {
                o.status = commitment::ObligationStatus::Cancelled;
                o.cancelled_at = at;
            }
        }
        for (auto &m : book->milestones) {
            if (!m.isSettled()) {
                m.status = commitment::MilestoneStatus::Cancelled;
                m.cancelled_at = at;
            }
        }
        c.status = ContractStatus::Cancelled;
        c.cancelled_at = at;
        c.status_before_dispute.reset();

        logInfo(config_.log_level, "contract " + contract_id + " cancelled");
        return R::ok(c);
    }

    // ===========================================
    // Reads
    // ===========================================

    R CommitmentEngine::contract(const std::string &tenant_id, const std::string &contract_id) const {
        auto book = findBook(tenant_id, contract_id);
        if (!book)
            return R::err(not_found("contract " + contract_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));
        return R::ok(book->contract);
    }

    std::vector<CommitmentContract> CommitmentEngine::listContracts(const std::string &tenant_id) const {
        std::vector<BookPtr> books;
        {
            std::shared_lock<std::shared_mutex> lock(books_mutex_);
            for (const auto &[_, book] : books_) {
                if (book->contract.tenant_id == tenant_id)
                    books.push_back(book);
            }
        }

        std::vector<CommitmentContract> out;
        for (const auto &book : books) {
            auto lock = lockBook(*book);
            if (lock.owns_lock())
                out.push_back(book->contract);
            else
                logWarn(config_.log_level, "listContracts skipped busy contract " + book->contract.id);
        }
        std::sort(out.begin(), out.end(), [](const CommitmentContract &a, const CommitmentContract &b) {
            return a.id.size() != b.id.size() ? a.id.size() < b.id.size() : a.id < b.id;
        });
        return out;
    }

} // namespace surety
