#include <surety/engine/engine.hpp>

namespace surety {

    using ledger::EntryType;
    using ledger::PostingResult;
    using PR = dp::Result<PostingResult, dp::Error>;

    // ===========================================
    // Posting primitive for contract accounts
    // ===========================================

    dp::Result<ledger::PostingRequest, dp::Error>
    CommitmentEngine::settlementRequest(const commitment::ContractBook &book, EntryType type, Money amount,
                                        const std::string &reason_code,
                                        const std::optional<std::string> &idempotency_key,
                                        std::vector<ledger::AllocationDraft> allocations,
                                        ledger::EntryContext context, std::vector<claim::ClaimEvent> events) const {
        using R = dp::Result<ledger::PostingRequest, dp::Error>;
        const auto &c = book.contract;
        auto account = ledger_.accountForContract(c.tenant_id, c.id);
        if (!account.is_ok())
            return R::err(account.error());

        ledger::PostingRequest request;
        request.tenant_id = c.tenant_id;
        request.account_id = account.value().id;
        request.type = type;
        switch (type) {
        case EntryType::Release:
            request.held_delta = -amount;
            request.balance_delta =
                c.policy.release_posting == commitment::ReleasePosting::DebitBalance ? -amount : 0;
            break;
        case EntryType::Forfeit:
        case EntryType::Refund:
            request.held_delta = -amount;
            request.balance_delta = -amount;
            break;
        default:
            return R::err(validation_error("entry type " + ledger::entryTypeToString(type) +
                                           " cannot settle held funds"));
        }
        request.context = std::move(context);
        request.idempotency_key = idempotency_key;
        request.reason_code = reason_code;
        request.allocations = std::move(allocations);
        request.claim_events = std::move(events);
        return R::ok(request);
    }

    PR CommitmentEngine::postAgainstContract(commitment::ContractBook &book, EntryType type, Money amount,
                                             const std::string &reason_code,
                                             const std::optional<std::string> &idempotency_key,
                                             std::vector<ledger::AllocationDraft> allocations,
                                             ledger::EntryContext context, std::vector<claim::ClaimEvent> events) {
        auto request = settlementRequest(book, type, amount, reason_code, idempotency_key, std::move(allocations),
                                         std::move(context), std::move(events));
        if (!request.is_ok())
            return PR::err(request.error());
        return ledger_.post(request.value());
    }

    // ===========================================
    // Accounts
    // ===========================================

    dp::Result<ledger::SecuredBalanceAccount, dp::Error>
    CommitmentEngine::openAccount(const ledger::OpenAccountRequest &request) {
        using R = dp::Result<ledger::SecuredBalanceAccount, dp::Error>;

        auto owner = subject::requireSubject(registry_, request.tenant_id, request.owner, "owner");
        if (!owner.is_ok())
            return R::err(owner.error());
        auto counterparty =
            subject::requireOptionalSubject(registry_, request.tenant_id, request.counterparty, "counterparty");
        if (!counterparty.is_ok())
            return R::err(counterparty.error());

        if (!request.contract_id)
            return ledger_.openAccount(request);

        auto book = findBook(request.tenant_id, *request.contract_id);
        if (!book)
            return R::err(not_found("contract " + *request.contract_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));
        if (book->contract.isTerminal())
            return R::err(invalid_state("contract " + book->contract.id + " is " +
                                        commitment::contractStatusToString(book->contract.status)));
        if (book->contract.currency != request.currency)
            return R::err(validation_error("account currency " + request.currency + " differs from contract " +
                                           book->contract.currency));
        return ledger_.openAccount(request);
    }

    dp::Result<ledger::SecuredBalanceAccount, dp::Error> CommitmentEngine::closeAccount(const std::string &tenant_id,
                                                                                       const std::string &account_id) {
        auto account = ledger_.account(tenant_id, account_id);
        if (!account.is_ok())
            return account;
        if (!account.value().contract_id)
            return ledger_.closeAccount(tenant_id, account_id);

        auto book = findBook(tenant_id, *account.value().contract_id);
        if (!book)
            return ledger_.closeAccount(tenant_id, account_id);
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return dp::Result<ledger::SecuredBalanceAccount, dp::Error>::err(busy(*book));
        return ledger_.closeAccount(tenant_id, account_id);
    }

    dp::Result<bool, dp::Error> CommitmentEngine::verifyAccount(const std::string &tenant_id,
                                                                const std::string &account_id) const {
        auto fold = ledger_.verifyFold(tenant_id, account_id);
        if (!fold.is_ok() || !fold.value())
            return fold;
        auto chain = ledger_.verifyChain(tenant_id, account_id);
        if (!chain.is_ok() || !chain.value())
            return chain;
        if (journal_)
            return ledger_.verifyAgainstJournal(tenant_id, account_id);
        return dp::Result<bool, dp::Error>::ok(true);
    }

    // ===========================================
    // Funding and holds
    // ===========================================

    namespace {

        /// Shared by fund and hold: context from the account and the source
        ledger::PostingRequest inflowRequest(const ledger::SecuredBalanceAccount &account, EntryType type,
                                             Money amount, const FundingSource &source) {
            ledger::PostingRequest request;
            request.tenant_id = account.tenant_id;
            request.account_id = account.id;
            request.type = type;
            request.balance_delta = type == EntryType::Fund ? amount : 0;
            request.held_delta = amount;
            request.context.contract_id = account.contract_id;
            request.context.external_transaction_id = source.external_transaction_id;
            request.context.source_subject = source.source_subject;
            request.idempotency_key = source.idempotency_key;
            request.reason_code = source.reason_code;
            return request;
        }

    } // namespace

    PR CommitmentEngine::fundAccount(const std::string &tenant_id, const std::string &account_id, Money amount,
                                     const FundingSource &source) {
        auto positive = requirePositive(amount, "funding amount");
        if (!positive.is_ok())
            return PR::err(positive.error());
        auto subject_ok =
            subject::requireOptionalSubject(registry_, tenant_id, source.source_subject, "funding source");
        if (!subject_ok.is_ok())
            return PR::err(subject_ok.error());

        auto account = ledger_.account(tenant_id, account_id);
        if (!account.is_ok())
            return PR::err(account.error());
        auto request = inflowRequest(account.value(), EntryType::Fund, amount, source);

        if (!account.value().contract_id)
            return ledger_.post(request);

        auto book = findBook(tenant_id, *account.value().contract_id);
        if (!book)
            return PR::err(not_found("contract " + *account.value().contract_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return PR::err(busy(*book));
        if (book->contract.isTerminal())
            return PR::err(invalid_state("contract " + book->contract.id + " is " +
                                         commitment::contractStatusToString(book->contract.status) +
                                         ", cannot fund"));

        auto posted = ledger_.post(request);
        if (posted.is_ok() && !posted.value().already_processed) {
            // Automatic releases that were short of funds get another chance
            std::vector<ReleaseOutcome> releases;
            drainAutomaticReleases(*book, releases);
        }
        return posted;
    }

    PR CommitmentEngine::holdFunds(const std::string &tenant_id, const std::string &account_id, Money amount,
                                   const FundingSource &source) {
        auto positive = requirePositive(amount, "hold amount");
        if (!positive.is_ok())
            return PR::err(positive.error());

        auto account = ledger_.account(tenant_id, account_id);
        if (!account.is_ok())
            return PR::err(account.error());
        auto request = inflowRequest(account.value(), EntryType::Hold, amount, source);

        if (!account.value().contract_id)
            return ledger_.post(request);

        auto book = findBook(tenant_id, *account.value().contract_id);
        if (!book)
            return PR::err(not_found("contract " + *account.value().contract_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return PR::err(busy(*book));
        if (book->contract.isTerminal())
            return PR::err(invalid_state("contract " + book->contract.id + " is " +
                                         commitment::contractStatusToString(book->contract.status)));

        auto posted = ledger_.post(request);
        if (posted.is_ok() && !posted.value().already_processed) {
            std::vector<ReleaseOutcome> releases;
            drainAutomaticReleases(*book, releases);
        }
        return posted;
    }

    // ===========================================
    // Forfeit / refund of held funds
    // ===========================================

    PR CommitmentEngine::adjustHeld(const std::string &tenant_id, const std::string &contract_id,
                                    const HeldAdjustment &adjustment, EntryType type) {
        auto positive = requirePositive(adjustment.amount, ledger::entryTypeToString(type) + " amount");
        if (!positive.is_ok())
            return PR::err(positive.error());

        auto book = findBook(tenant_id, contract_id);
        if (!book)
            return PR::err(not_found("contract " + contract_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return PR::err(busy(*book));

        auto &c = book->contract;
        if (adjustment.obligation_id && !book->findObligation(*adjustment.obligation_id))
            return PR::err(not_found("obligation " + *adjustment.obligation_id + " not on contract " + contract_id));
        // Refunds stay open after completion to return what is left held
        if (type == EntryType::Forfeit && (c.status == commitment::ContractStatus::Draft || c.isTerminal()))
            return PR::err(invalid_state("contract " + contract_id + " is " +
                                         commitment::contractStatusToString(c.status) + ", cannot forfeit"));
        if (type == EntryType::Forfeit) {
            auto budget = c.checkBudget(0, adjustment.amount);
            if (!budget.is_ok()) {
                logWarn(config_.log_level, errorMessage(budget.error()));
                return PR::err(budget.error());
            }
        }

        ledger::AllocationDraft draft;
        draft.amount = adjustment.amount;
        if (type == EntryType::Forfeit) {
            draft.type = ledger::AllocationType::Forfeit;
            draft.target.subject = c.counterparty.value_or(c.anchor);
        } else {
            draft.type = ledger::AllocationType::Refund;
            draft.target.subject = c.anchor;
        }
        if (adjustment.obligation_id)
            draft.target.obligation_id = adjustment.obligation_id;

        ledger::EntryContext context;
        context.contract_id = c.id;
        context.obligation_id = adjustment.obligation_id;

        std::string reason = adjustment.reason_code.empty() ? ledger::entryTypeToString(type) : adjustment.reason_code;
        auto posted = postAgainstContract(*book, type, adjustment.amount, reason, adjustment.idempotency_key,
                                          {draft}, context);
        if (!posted.is_ok())
            return posted;
        if (type == EntryType::Forfeit && !posted.value().already_processed)
            c.forfeited_amount += adjustment.amount;
        return posted;
    }

    PR CommitmentEngine::forfeitHeld(const std::string &tenant_id, const std::string &contract_id,
                                     const HeldAdjustment &adjustment) {
        return adjustHeld(tenant_id, contract_id, adjustment, EntryType::Forfeit);
    }

    PR CommitmentEngine::refundHeld(const std::string &tenant_id, const std::string &contract_id,
                                    const HeldAdjustment &adjustment) {
        return adjustHeld(tenant_id, contract_id, adjustment, EntryType::Refund);
    }

    // ===========================================
    // Compensating entries
    // ===========================================

    PR CommitmentEngine::reverseFunding(const std::string &tenant_id, const std::string &entry_id,
                                        const std::string &reason_code) {
        std::string key = "reverse/" + entry_id;
        auto prior = ledger_.findIdempotent(tenant_id, key);
        if (prior)
            return PR::ok(*prior);

        auto original = ledger_.entry(tenant_id, entry_id);
        if (!original.is_ok())
            return PR::err(original.error());
        const auto &e = original.value();
        if (e.type != EntryType::Fund)
            return PR::err(invalid_state("entry " + entry_id + " is a " + ledger::entryTypeToString(e.type) +
                                         " entry; only funding can be reversed"));

        ledger::PostingRequest request;
        request.tenant_id = tenant_id;
        request.account_id = e.account_id;
        request.type = EntryType::Adjustment;
        request.balance_delta = -e.balance_delta;
        request.held_delta = -e.held_delta;
        request.context = e.context;
        request.idempotency_key = key;
        request.reason_code = reason_code.empty() ? "funding_reversal" : reason_code;
        request.reverses_entry_id = entry_id;

        if (!e.context.contract_id)
            return ledger_.post(request);

        auto book = findBook(tenant_id, *e.context.contract_id);
        if (!book)
            return ledger_.post(request);
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return PR::err(busy(*book));
        return ledger_.post(request);
    }

} // namespace surety
