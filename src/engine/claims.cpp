#include <surety/engine/engine.hpp>

namespace surety {

    using claim::Claim;
    using claim::ClaimEvent;
    using claim::ClaimEventType;
    using claim::ClaimStatus;
    using CR = dp::Result<ClaimOutcome, dp::Error>;

    // ===========================================
    // Event trail
    // ===========================================

    ClaimEvent CommitmentEngine::makeEvent(const commitment::ContractBook &book, const Claim &claim,
                                           ClaimEventType type, const std::optional<subject::SubjectRef> &actor,
                                           const std::string &note) {
        ClaimEvent event;
        event.id = nextId("evt-");
        event.tenant_id = book.contract.tenant_id;
        event.contract_id = book.contract.id;
        event.claim_id = claim.id;
        event.type = type;
        event.occurred_at = now();
        event.status_after = claim.status;
        event.actor = actor;
        event.note = note;
        return event;
    }

    dp::Result<void, dp::Error> CommitmentEngine::appendEvent(commitment::ContractBook &book, const ClaimEvent &event) {
        if (journal_) {
            auto journaled = journal_->recordClaimEvent(event);
            if (!journaled.is_ok()) {
                logWarn(config_.log_level, "claim event " + event.id + " not journaled: " +
                                               errorMessage(journaled.error()));
                return journaled;
            }
        }
        book.claim_events.push_back(event);
        return dp::Result<void, dp::Error>::ok();
    }

    void CommitmentEngine::maybeExitDispute(commitment::ContractBook &book) {
        auto &c = book.contract;
        if (c.status != commitment::ContractStatus::Disputed || book.hasActiveClaims())
            return;
        c.status = c.status_before_dispute.value_or(commitment::ContractStatus::Active);
        c.status_before_dispute.reset();
        logInfo(config_.log_level, "contract " + c.id + " left dispute, now " + contractStatusToString(c.status));

        std::vector<ReleaseOutcome> releases;
        drainAutomaticReleases(book, releases);
    }

    // ===========================================
    // Opening
    // ===========================================

    CR CommitmentEngine::openClaim(const std::string &tenant_id, const std::string &contract_id,
                                   const ClaimDraft &draft) {
        auto raised = subject::requireSubject(registry_, tenant_id, draft.raised_by, "raised_by");
        if (!raised.is_ok())
            return CR::err(raised.error());
        auto against = subject::requireOptionalSubject(registry_, tenant_id, draft.against, "against");
        if (!against.is_ok())
            return CR::err(against.error());
        if (draft.disputed_amount) {
            auto amount = requireNonNegative(*draft.disputed_amount, "disputed_amount");
            if (!amount.is_ok())
                return CR::err(amount.error());
        }

        auto book = findBook(tenant_id, contract_id);
        if (!book)
            return CR::err(not_found("contract " + contract_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return CR::err(busy(*book));

        auto &c = book->contract;
        if (c.status != commitment::ContractStatus::Active && c.status != commitment::ContractStatus::Paused &&
            c.status != commitment::ContractStatus::Disputed)
            return CR::err(invalid_state("contract " + contract_id + " is " + contractStatusToString(c.status) +
                                         ", claims cannot be opened"));
        if (draft.currency != c.currency)
            return CR::err(validation_error("claim currency " + draft.currency + " differs from contract " +
                                            c.currency));
        if (draft.disputed_milestone_id && !book->findMilestone(*draft.disputed_milestone_id))
            return CR::err(not_found("milestone " + *draft.disputed_milestone_id + " not on contract " +
                                     contract_id));

        Claim claim;
        claim.id = nextId("clm-");
        claim.tenant_id = tenant_id;
        claim.contract_id = contract_id;
        claim.type = draft.type;
        claim.status = ClaimStatus::Open;
        claim.title = draft.title;
        claim.raised_by = draft.raised_by;
        claim.against = draft.against;
        claim.disputed_milestone_id = draft.disputed_milestone_id;
        claim.opened_at = now();
        claim.respond_by_at = draft.respond_by_at;
        claim.disputed_amount = draft.disputed_amount;
        claim.currency = draft.currency;

        ClaimOutcome outcome;
        outcome.event = makeEvent(*book, claim, ClaimEventType::Opened, draft.raised_by, draft.title);
        auto appended = appendEvent(*book, outcome.event);
        if (!appended.is_ok())
            return CR::err(appended.error());

        book->claims.push_back(claim);
        indexChild(IndexKind::Claim, tenant_id, claim.id, contract_id);

        if (c.status != commitment::ContractStatus::Disputed) {
            c.status_before_dispute = c.status;
            c.status = commitment::ContractStatus::Disputed;
            logInfo(config_.log_level, "contract " + contract_id + " disputed by claim " + claim.id);
        }

        outcome.claim = claim;
        outcome.contract_status = c.status;
        return CR::ok(outcome);
    }

    // ===========================================
    // Generic mutation
    // ===========================================

    /// `fn(ContractBook &, Claim &next) -> Result<ClaimEvent>`. The event is
    /// journaled before `next` replaces the stored claim.
    template <typename Fn>
    CR CommitmentEngine::mutateClaim(const std::string &tenant_id, const std::string &claim_id, Fn &&fn) {
        auto book = findOwningBook(IndexKind::Claim, tenant_id, claim_id);
        if (!book)
            return CR::err(not_found("claim " + claim_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return CR::err(busy(*book));

        Claim *current = book->findClaim(claim_id);
        if (!current)
            return CR::err(not_found("claim " + claim_id + " not found"));

        Claim next = *current;
        dp::Result<ClaimEvent, dp::Error> event = fn(*book, next);
        if (!event.is_ok())
            return CR::err(event.error());
        auto appended = appendEvent(*book, event.value());
        if (!appended.is_ok())
            return CR::err(appended.error());

        ClaimStatus before = current->status;
        *current = next;
        if (before != next.status) {
            logInfo(config_.log_level, "claim " + claim_id + " " + claim::claimStatusToString(before) + " -> " +
                                           claim::claimStatusToString(next.status));
            maybeExitDispute(*book);
        }

        ClaimOutcome outcome;
        outcome.claim = next;
        outcome.event = event.value();
        outcome.contract_status = book->contract.status;
        return CR::ok(outcome);
    }

    CR CommitmentEngine::claimTransition(const std::string &tenant_id, const std::string &claim_id, ClaimStatus to,
                                         ClaimEventType event_type, const std::optional<subject::SubjectRef> &actor,
                                         const std::string &note) {
        return mutateClaim(tenant_id, claim_id, [&](commitment::ContractBook &book, Claim &next) {
            using ER = dp::Result<ClaimEvent, dp::Error>;
            if (!claim::isLegalClaimTransition(next.status, to))
                return ER::err(invalid_state("claim " + next.id + " is " + claim::claimStatusToString(next.status) +
                                             ", cannot move to " + claim::claimStatusToString(to)));
            // Review starts from open or escalated; only a resolved claim is reopened
            bool reopening = next.status == ClaimStatus::Resolved;
            if (event_type == ClaimEventType::Reopened && !reopening)
                return ER::err(invalid_state("claim " + next.id + " is " + claim::claimStatusToString(next.status) +
                                             ", only resolved claims reopen"));
            if (event_type == ClaimEventType::ReviewStarted && reopening)
                return ER::err(invalid_state("claim " + next.id + " is resolved; reopen it instead"));
            Millis at = now();
            if (to == ClaimStatus::Closed) {
                if (!next.resolved_at)
                    return ER::err(invalid_state("claim " + next.id + " must be resolved before closing"));
                next.closed_at = at;
            }
            if (to == ClaimStatus::InReview && reopening) {
                next.resolution.reset();
                next.resolved_at.reset();
            }
            next.status = to;
            return ER::ok(makeEvent(book, next, event_type, actor, note));
        });
    }

    CR CommitmentEngine::startClaimReview(const std::string &tenant_id, const std::string &claim_id,
                                          const std::optional<subject::SubjectRef> &actor) {
        return claimTransition(tenant_id, claim_id, ClaimStatus::InReview, ClaimEventType::ReviewStarted, actor, "");
    }

    CR CommitmentEngine::escalateClaim(const std::string &tenant_id, const std::string &claim_id,
                                       const std::optional<subject::SubjectRef> &actor, const std::string &note) {
        return claimTransition(tenant_id, claim_id, ClaimStatus::Escalated, ClaimEventType::Escalated, actor, note);
    }

    CR CommitmentEngine::rejectClaim(const std::string &tenant_id, const std::string &claim_id,
                                     const std::optional<subject::SubjectRef> &actor, const std::string &note) {
        return claimTransition(tenant_id, claim_id, ClaimStatus::Rejected, ClaimEventType::Rejected, actor, note);
    }

    CR CommitmentEngine::cancelClaim(const std::string &tenant_id, const std::string &claim_id,
                                     const std::optional<subject::SubjectRef> &actor, const std::string &note) {
        return claimTransition(tenant_id, claim_id, ClaimStatus::Cancelled, ClaimEventType::Cancelled, actor, note);
    }

    CR CommitmentEngine::closeClaim(const std::string &tenant_id, const std::string &claim_id,
                                    const std::optional<subject::SubjectRef> &actor) {
        return claimTransition(tenant_id, claim_id, ClaimStatus::Closed, ClaimEventType::Closed, actor, "");
    }

    CR CommitmentEngine::reopenClaim(const std::string &tenant_id, const std::string &claim_id,
                                     const std::optional<subject::SubjectRef> &actor, const std::string &note) {
        return claimTransition(tenant_id, claim_id, ClaimStatus::InReview, ClaimEventType::Reopened, actor, note);
    }

    // ===========================================
    // Timeline-only events
    // ===========================================

    namespace {

        bool acceptsUpdates(const Claim &claim) {
            return claim.status == ClaimStatus::Open || claim.status == ClaimStatus::InReview ||
                   claim.status == ClaimStatus::Escalated;
        }

    } // namespace

    CR CommitmentEngine::addClaimNote(const std::string &tenant_id, const std::string &claim_id,
                                      const std::optional<subject::SubjectRef> &actor, const std::string &note) {
        if (note.empty())
            return CR::err(validation_error("note must not be empty"));
        return mutateClaim(tenant_id, claim_id, [&](commitment::ContractBook &book, Claim &next) {
            return dp::Result<ClaimEvent, dp::Error>::ok(makeEvent(book, next, ClaimEventType::Note, actor, note));
        });
    }

    CR CommitmentEngine::addClaimEvidence(const std::string &tenant_id, const std::string &claim_id,
                                          const std::optional<subject::SubjectRef> &actor, const std::string &note) {
        return mutateClaim(tenant_id, claim_id, [&](commitment::ContractBook &book, Claim &next) {
            using ER = dp::Result<ClaimEvent, dp::Error>;
            if (!acceptsUpdates(next))
                return ER::err(invalid_state("claim " + next.id + " is " + claim::claimStatusToString(next.status)));
            return ER::ok(makeEvent(book, next, ClaimEventType::EvidenceAdded, actor, note));
        });
    }

    CR CommitmentEngine::proposeResolution(const std::string &tenant_id, const std::string &claim_id,
                                           const claim::ResolutionType &resolution,
                                           const std::optional<subject::SubjectRef> &actor, const std::string &note) {
        return mutateClaim(tenant_id, claim_id, [&](commitment::ContractBook &book, Claim &next) {
            using ER = dp::Result<ClaimEvent, dp::Error>;
            if (!acceptsUpdates(next))
                return ER::err(invalid_state("claim " + next.id + " is " + claim::claimStatusToString(next.status)));
            std::string text = "proposed " + resolution.toString();
            if (!note.empty())
                text += ": " + note;
            return ER::ok(makeEvent(book, next, ClaimEventType::ResolutionProposed, actor, text));
        });
    }

    CR CommitmentEngine::updateDisputedAmount(const std::string &tenant_id, const std::string &claim_id,
                                              Money amount, const std::optional<subject::SubjectRef> &actor) {
        auto non_negative = requireNonNegative(amount, "disputed_amount");
        if (!non_negative.is_ok())
            return CR::err(non_negative.error());
        return mutateClaim(tenant_id, claim_id, [&](commitment::ContractBook &book, Claim &next) {
            using ER = dp::Result<ClaimEvent, dp::Error>;
            if (!acceptsUpdates(next))
                return ER::err(invalid_state("claim " + next.id + " is " + claim::claimStatusToString(next.status)));
            std::string before = next.disputed_amount ? std::to_string(*next.disputed_amount) : "unset";
            next.disputed_amount = amount;
            return ER::ok(makeEvent(book, next, ClaimEventType::AmountUpdated, actor,
                                    "disputed amount " + before + " -> " + std::to_string(amount)));
        });
    }

    // ===========================================
    // Resolution and settlement
    // ===========================================

    namespace {

        /// Ledger effect of a resolution; nullopt when it moves no money
        std::optional<ledger::EntryType> settlementEntryType(const claim::ResolutionType &resolution) {
            if (resolution.isCustom())
                return std::nullopt;
            switch (resolution.builtin()) {
            case claim::ResolutionKind::ReleaseFunds:
                return ledger::EntryType::Release;
            case claim::ResolutionKind::Refund:
                return ledger::EntryType::Refund;
            case claim::ResolutionKind::Forfeit:
            case claim::ResolutionKind::PartialSettlement:
                return ledger::EntryType::Forfeit;
            default:
                return std::nullopt;
            }
        }

    } // namespace

    CR CommitmentEngine::resolveClaim(const std::string &tenant_id, const std::string &claim_id,
                                      const ClaimResolution &resolution) {
        if (resolution.settled_amount) {
            auto amount = requireNonNegative(*resolution.settled_amount, "settled_amount");
            if (!amount.is_ok())
                return CR::err(amount.error());
        }

        auto book = findOwningBook(IndexKind::Claim, tenant_id, claim_id);
        if (!book)
            return CR::err(not_found("claim " + claim_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return CR::err(busy(*book));

        Claim *current = book->findClaim(claim_id);
        if (!current)
            return CR::err(not_found("claim " + claim_id + " not found"));
        if (!claim::isLegalClaimTransition(current->status, ClaimStatus::Resolved))
            return CR::err(invalid_state("claim " + claim_id + " is " + claim::claimStatusToString(current->status) +
                                         ", cannot resolve"));
        if (resolution.settled_amount) {
            if (!current->disputed_amount)
                return CR::err(validation_error("claim " + claim_id + " has no disputed amount to settle against"));
            if (*resolution.settled_amount > *current->disputed_amount)
                return CR::err(validation_error("settled amount " + std::to_string(*resolution.settled_amount) +
                                                " exceeds disputed " + std::to_string(*current->disputed_amount)));
        }

        auto &c = book->contract;
        Claim next = *current;
        next.status = ClaimStatus::Resolved;
        next.resolution = resolution.resolution;
        next.settled_amount = resolution.settled_amount;
        next.resolved_at = now();

        ClaimOutcome outcome;
        ClaimEvent event = makeEvent(*book, next, ClaimEventType::Resolved, resolution.actor,
                                     resolution.note.empty() ? resolution.resolution.toString() : resolution.note);

        auto entry_type = settlementEntryType(resolution.resolution);
        Money amount = resolution.settled_amount.value_or(0);
        bool moves_money = entry_type && amount > 0;

        // A reopened claim keeps the settlement it already posted
        if (current->settlement_entry_id) {
            auto prior = ledger_.entry(c.tenant_id, *current->settlement_entry_id);
            if (!prior.is_ok())
                return CR::err(prior.error());
            const auto &settled = prior.value();
            Money settled_amount = -settled.held_delta;
            if (!moves_money || settled.type != *entry_type || settled_amount != amount)
                return CR::err(invalid_state("claim " + claim_id + " was settled by " + settled.id + " (" +
                                             ledger::entryTypeToString(settled.type) + " " +
                                             std::to_string(settled_amount) + "), a new resolution must match it"));
        }

        if (moves_money) {
            Money release = *entry_type == ledger::EntryType::Release ? amount : 0;
            Money forfeit = *entry_type == ledger::EntryType::Forfeit ? amount : 0;
            if (!current->settlement_entry_id) {
                auto budget = c.checkBudget(release, forfeit);
                if (!budget.is_ok()) {
                    logWarn(config_.log_level, errorMessage(budget.error()));
                    return CR::err(budget.error());
                }
            }

            ledger::AllocationDraft draft;
            draft.amount = amount;
            switch (*entry_type) {
            case ledger::EntryType::Release:
                if (next.disputed_milestone_id) {
                    draft.type = ledger::AllocationType::MilestoneRelease;
                    draft.target.milestone_id = next.disputed_milestone_id;
                } else {
                    draft.type = ledger::AllocationType::Adjustment;
                    draft.target.subject = next.against.value_or(next.raised_by);
                }
                break;
            case ledger::EntryType::Refund:
                draft.type = ledger::AllocationType::Refund;
                draft.target.subject = next.raised_by;
                break;
            default:
                draft.type = ledger::AllocationType::Forfeit;
                draft.target.subject = next.raised_by;
                break;
            }

            ledger::EntryContext context;
            context.contract_id = c.id;
            context.claim_id = next.id;
            context.milestone_id = next.disputed_milestone_id;
            auto posted = postAgainstContract(*book, *entry_type, amount, "claim_settlement",
                                              c.id + "/" + next.id + "/settlement", {draft}, context, {event});
            if (!posted.is_ok()) {
                logWarn(config_.log_level, "settlement of claim " + claim_id + " failed: " +
                                               errorMessage(posted.error()));
                return CR::err(posted.error());
            }

            const auto &result = posted.value();
            next.settlement_entry_id = result.entry.id;
            outcome.settlement_entry = result.entry;
            outcome.already_processed = result.already_processed;
            if (result.already_processed) {
                // Re-resolution after a reopen; the money already moved
                event.ledger_entry_id = result.entry.id;
                auto appended = appendEvent(*book, event);
                if (!appended.is_ok())
                    return CR::err(appended.error());
            } else {
                c.released_amount += release;
                c.forfeited_amount += forfeit;
                event = result.claim_events.front();
                book->claim_events.push_back(event);
            }
        } else {
            auto appended = appendEvent(*book, event);
            if (!appended.is_ok())
                return CR::err(appended.error());
        }

        *current = next;
        logInfo(config_.log_level, "claim " + claim_id + " resolved (" + resolution.resolution.toString() + ")");

        outcome.claim = next;
        outcome.event = event;
        outcome.contract_status = c.status;
        return CR::ok(outcome);
    }

    // ===========================================
    // Reads
    // ===========================================

    dp::Result<Claim, dp::Error> CommitmentEngine::claim(const std::string &tenant_id,
                                                         const std::string &claim_id) const {
        using R = dp::Result<Claim, dp::Error>;
        auto book = findOwningBook(IndexKind::Claim, tenant_id, claim_id);
        if (!book)
            return R::err(not_found("claim " + claim_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));
        for (const auto &c : book->claims) {
            if (c.id == claim_id)
                return R::ok(c);
        }
        return R::err(not_found("claim " + claim_id + " not found"));
    }

    dp::Result<std::vector<Claim>, dp::Error> CommitmentEngine::listClaims(const std::string &tenant_id,
                                                                           const std::string &contract_id) const {
        using R = dp::Result<std::vector<Claim>, dp::Error>;
        auto book = findBook(tenant_id, contract_id);
        if (!book)
            return R::err(not_found("contract " + contract_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));
        return R::ok(book->claims);
    }

    dp::Result<std::vector<ClaimEvent>, dp::Error> CommitmentEngine::claimEvents(const std::string &tenant_id,
                                                                                 const std::string &claim_id) const {
        using R = dp::Result<std::vector<ClaimEvent>, dp::Error>;
        auto book = findOwningBook(IndexKind::Claim, tenant_id, claim_id);
        if (!book)
            return R::err(not_found("claim " + claim_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));
        std::vector<ClaimEvent> out;
        for (const auto &e : book->claim_events) {
            if (e.claim_id == claim_id)
                out.push_back(e);
        }
        return R::ok(out);
    }

} // namespace surety
