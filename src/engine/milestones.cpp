#include <surety/engine/engine.hpp>
#include <surety/ledger/allocation.hpp>

#include <algorithm>
#include <set>

namespace surety {

    using commitment::Milestone;
    using commitment::MilestoneStatus;

    commitment::EvaluationOptions CommitmentEngine::evaluationOptions() const {
        commitment::EvaluationOptions opts;
        opts.count_waived_as_satisfied = config_.count_waived_as_satisfied;
        return opts;
    }

    // ===========================================
    // Creation and linking
    // ===========================================

    dp::Result<Milestone, dp::Error> CommitmentEngine::addMilestone(const std::string &tenant_id,
                                                                   const std::string &contract_id,
                                                                   const MilestoneDraft &draft) {
        using R = dp::Result<Milestone, dp::Error>;

        if (draft.code.empty() || draft.code.size() > 80)
            return R::err(validation_error("milestone code must be 1..80 chars"));
        auto amount = requireNonNegative(draft.release_amount, "release_amount");
        if (!amount.is_ok())
            return R::err(amount.error());
        if (draft.evaluation_mode == commitment::EvaluationMode::Threshold &&
            (!draft.min_satisfied_count || *draft.min_satisfied_count <= 0))
            return R::err(validation_error("threshold milestone needs min_satisfied_count > 0"));

        auto book = findBook(tenant_id, contract_id);
        if (!book)
            return R::err(not_found("contract " + contract_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));
        if (book->contract.isTerminal())
            return R::err(invalid_state("contract " + contract_id + " is " +
                                        commitment::contractStatusToString(book->contract.status)));
        if (book->hasMilestoneCode(draft.code))
            return R::err(duplicate("milestone code '" + draft.code + "' already used on contract " + contract_id));

        Milestone m;
        m.id = nextId("ms-");
        m.contract_id = contract_id;
        m.code = draft.code;
        m.title = draft.title;
        m.evaluation_mode = draft.evaluation_mode;
        m.min_satisfied_count = draft.min_satisfied_count;
        m.threshold_convention = draft.threshold_convention.value_or(config_.threshold_convention);
        m.release_mode = draft.release_mode;
        m.release_amount = draft.release_amount;
        m.due_at = draft.due_at;
        m.sort_order = draft.sort_order;
        book->milestones.push_back(m);
        indexChild(IndexKind::Milestone, tenant_id, m.id, contract_id);

        logInfo(config_.log_level, "added milestone " + m.id + " (" + m.code + ", " +
                                       commitment::evaluationModeToString(m.evaluation_mode) + ") to " +
                                       contract_id);
        return R::ok(m);
    }

    dp::Result<commitment::MilestoneObligationLink, dp::Error>
    CommitmentEngine::linkObligation(const std::string &tenant_id, const std::string &milestone_id,
                                     const std::string &obligation_id, const LinkDraft &link) {
        using R = dp::Result<commitment::MilestoneObligationLink, dp::Error>;

        if (link.weight <= 0)
            return R::err(validation_error("link weight must be > 0, got " + std::to_string(link.weight)));

        auto book = findOwningBook(IndexKind::Milestone, tenant_id, milestone_id);
        if (!book)
            return R::err(not_found("milestone " + milestone_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));

        Milestone *m = book->findMilestone(milestone_id);
        if (!m)
            return R::err(not_found("milestone " + milestone_id + " not found"));
        if (!book->findObligation(obligation_id)) {
            if (findOwningBook(IndexKind::Obligation, tenant_id, obligation_id))
                return R::err(validation_error("obligation " + obligation_id + " belongs to another contract than " +
                                               "milestone " + milestone_id));
            return R::err(not_found("obligation " + obligation_id + " not found"));
        }
        if (book->contract.isTerminal())
            return R::err(invalid_state("contract " + book->contract.id + " is " +
                                        commitment::contractStatusToString(book->contract.status)));
        if (m->isSettled())
            return R::err(invalid_state("milestone " + milestone_id + " is " +
                                        commitment::milestoneStatusToString(m->status)));
        if (book->hasLink(milestone_id, obligation_id))
            return R::err(duplicate("obligation " + obligation_id + " already linked to milestone " + milestone_id));

        commitment::MilestoneObligationLink row;
        row.id = nextId("lnk-");
        row.contract_id = book->contract.id;
        row.milestone_id = milestone_id;
        row.obligation_id = obligation_id;
        row.weight = link.weight;
        row.is_required = link.is_required;
        row.sort_order = link.sort_order;
        book->links.push_back(row);

        std::vector<Milestone> changed;
        std::vector<ReleaseOutcome> releases;
        reevaluate(*book, {milestone_id}, changed, releases);
        return R::ok(row);
    }

    // ===========================================
    // Evaluation
    // ===========================================

    void CommitmentEngine::reevaluate(commitment::ContractBook &book, const std::vector<std::string> &milestone_ids,
                                      std::vector<Milestone> &changed, std::vector<ReleaseOutcome> &releases) {
        auto opts = evaluationOptions();
        std::set<std::string> seen;
        for (const auto &id : milestone_ids) {
            if (!seen.insert(id).second)
                continue;
            Milestone *m = book.findMilestone(id);
            if (!m || m->isSettled())
                continue;

            auto result = commitment::MilestoneEvaluator::evaluate(*m, book.linkedStates(id), opts);
            if (result.ready && m->status == MilestoneStatus::Pending) {
                m->status = MilestoneStatus::Ready;
                m->ready_at = now();
                changed.push_back(*m);
                logInfo(config_.log_level, "milestone " + id + " ready (score " +
                                               std::to_string(result.satisfied_score) + ")");
            } else if (!result.ready && m->status == MilestoneStatus::Ready) {
                m->status = MilestoneStatus::Pending;
                m->ready_at.reset();
                changed.push_back(*m);
                logInfo(config_.log_level, "milestone " + id + " back to pending");
            }
        }
        drainAutomaticReleases(book, releases);
    }

    void CommitmentEngine::drainAutomaticReleases(commitment::ContractBook &book,
                                                  std::vector<ReleaseOutcome> &releases) {
        for (auto &m : book.milestones) {
            if (m.status != MilestoneStatus::Ready || m.release_mode != commitment::ReleaseMode::Automatic)
                continue;
            if (!checkReleaseAllowed(book, m).is_ok())
                continue;
            auto released = releaseLocked(book, m, "system:automatic");
            if (released.is_ok()) {
                releases.push_back(released.value());
            } else {
                // Stays ready; retried on the next evaluation, funding or dispute exit
                logWarn(config_.log_level, "automatic release of " + m.id + " failed: " +
                                               errorMessage(released.error()));
            }
        }
    }

    dp::Result<std::vector<Milestone>, dp::Error> CommitmentEngine::evaluateMilestones(const std::string &tenant_id,
                                                                                      const std::string &contract_id) {
        using R = dp::Result<std::vector<Milestone>, dp::Error>;
        auto book = findBook(tenant_id, contract_id);
        if (!book)
            return R::err(not_found("contract " + contract_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));

        std::vector<std::string> ids;
        for (const auto &m : book->milestones)
            ids.push_back(m.id);
        std::vector<Milestone> changed;
        std::vector<ReleaseOutcome> releases;
        reevaluate(*book, ids, changed, releases);
        return R::ok(book->milestones);
    }

    // ===========================================
    // Release
    // ===========================================

    dp::Result<void, dp::Error> CommitmentEngine::checkReleaseAllowed(const commitment::ContractBook &book,
                                                                      const Milestone &milestone) const {
        const auto &c = book.contract;
        if (c.status == commitment::ContractStatus::Active)
            return dp::Result<void, dp::Error>::ok();
        if (c.status == commitment::ContractStatus::Disputed) {
            const claim::Claim *blocking = book.blockingClaim(milestone.id);
            if (!blocking)
                return dp::Result<void, dp::Error>::ok();
            return dp::Result<void, dp::Error>::err(
                invalid_state("release of milestone " + milestone.id + " is frozen by claim " + blocking->id));
        }
        return dp::Result<void, dp::Error>::err(invalid_state(
            "contract " + c.id + " is " + commitment::contractStatusToString(c.status) + ", releases are not allowed"));
    }

    dp::Result<ReleaseOutcome, dp::Error> CommitmentEngine::releaseLocked(commitment::ContractBook &book,
                                                                          Milestone &milestone,
                                                                          const std::string &released_by) {
        using R = dp::Result<ReleaseOutcome, dp::Error>;
        auto &c = book.contract;

        ReleaseOutcome outcome;
        if (milestone.status == MilestoneStatus::Released) {
            outcome.already_processed = true;
            outcome.milestone = milestone;
            if (milestone.release_entry_id) {
                auto entry = ledger_.entry(c.tenant_id, *milestone.release_entry_id);
                if (!entry.is_ok())
                    return R::err(entry.error());
                outcome.entry = entry.value();
                outcome.allocations = ledger_.allocations(c.tenant_id, *milestone.release_entry_id);
            }
            return R::ok(outcome);
        }
        if (milestone.status != MilestoneStatus::Ready)
            return R::err(invalid_state("milestone " + milestone.id + " is " +
                                        commitment::milestoneStatusToString(milestone.status) + ", not ready"));
        auto allowed = checkReleaseAllowed(book, milestone);
        if (!allowed.is_ok())
            return R::err(allowed.error());

        Money amount = milestone.release_amount;
        auto budget = c.checkBudget(amount, 0);
        if (!budget.is_ok()) {
            logWarn(config_.log_level, errorMessage(budget.error()));
            return R::err(budget.error());
        }

        if (amount > 0) {
            std::vector<ledger::AllocationDraft> drafts;
            auto links = book.linksOf(milestone.id);
            if (links.empty()) {
                ledger::AllocationDraft draft;
                draft.type = ledger::AllocationType::MilestoneRelease;
                draft.amount = amount;
                draft.target.milestone_id = milestone.id;
                drafts.push_back(draft);
            } else {
                std::vector<dp::i32> weights;
                for (const auto &l : links)
                    weights.push_back(l.weight);
                auto shares = ledger::distributeByWeight(amount, weights);
                for (size_t i = 0; i < links.size(); ++i) {
                    if (shares[i] == 0)
                        continue;
                    ledger::AllocationDraft draft;
                    draft.type = ledger::AllocationType::MilestoneRelease;
                    draft.amount = shares[i];
                    draft.target.milestone_id = milestone.id;
                    draft.target.obligation_id = links[i].obligation_id;
                    drafts.push_back(draft);
                }
            }

            ledger::EntryContext context;
            context.contract_id = c.id;
            context.milestone_id = milestone.id;
            auto posted = postAgainstContract(book, ledger::EntryType::Release, amount, "milestone_release",
                                              c.id + "/" + milestone.id + "/release", std::move(drafts), context);
            if (!posted.is_ok())
                return R::err(posted.error());

            if (!posted.value().already_processed)
                c.released_amount += amount;
            outcome.entry = posted.value().entry;
            outcome.allocations = posted.value().allocations;
            milestone.release_entry_id = posted.value().entry.id;
        }

        milestone.status = MilestoneStatus::Released;
        milestone.released_at = now();
        milestone.released_by = released_by;
        outcome.milestone = milestone;

        logInfo(config_.log_level, "released milestone " + milestone.id + " (" + std::to_string(amount) + " " +
                                       c.currency + ") by " + released_by);
        return R::ok(outcome);
    }

    dp::Result<ReleaseOutcome, dp::Error> CommitmentEngine::releaseMilestone(const std::string &tenant_id,
                                                                             const std::string &milestone_id,
                                                                             const std::string &released_by) {
        using R = dp::Result<ReleaseOutcome, dp::Error>;
        if (released_by.empty())
            return R::err(validation_error("released_by is required"));

        auto book = findOwningBook(IndexKind::Milestone, tenant_id, milestone_id);
        if (!book)
            return R::err(not_found("milestone " + milestone_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));

        Milestone *m = book->findMilestone(milestone_id);
        if (!m)
            return R::err(not_found("milestone " + milestone_id + " not found"));
        return releaseLocked(*book, *m, released_by);
    }

    // ===========================================
    // Manual settlement without release
    // ===========================================

    dp::Result<Milestone, dp::Error> CommitmentEngine::settleMilestone(const std::string &tenant_id,
                                                                      const std::string &milestone_id,
                                                                      MilestoneStatus to) {
        using R = dp::Result<Milestone, dp::Error>;
        auto book = findOwningBook(IndexKind::Milestone, tenant_id, milestone_id);
        if (!book)
            return R::err(not_found("milestone " + milestone_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));

        Milestone *m = book->findMilestone(milestone_id);
        if (!m)
            return R::err(not_found("milestone " + milestone_id + " not found"));
        if (m->status == to)
            return R::ok(*m);
        if (m->isSettled())
            return R::err(invalid_state("milestone " + milestone_id + " is " +
                                        commitment::milestoneStatusToString(m->status)));

        Millis at = now();
        if (to == MilestoneStatus::Cancelled)
            m->cancelled_at = at;
        else
            m->skipped_at = at;
        m->status = to;
        logInfo(config_.log_level, "milestone " + milestone_id + " " + commitment::milestoneStatusToString(to));
        return R::ok(*m);
    }

    dp::Result<Milestone, dp::Error> CommitmentEngine::cancelMilestone(const std::string &tenant_id,
                                                                      const std::string &milestone_id) {
        return settleMilestone(tenant_id, milestone_id, MilestoneStatus::Cancelled);
    }

    dp::Result<Milestone, dp::Error> CommitmentEngine::skipMilestone(const std::string &tenant_id,
                                                                    const std::string &milestone_id) {
        return settleMilestone(tenant_id, milestone_id, MilestoneStatus::Skipped);
    }

    // ===========================================
    // Reads
    // ===========================================

    dp::Result<Milestone, dp::Error> CommitmentEngine::milestone(const std::string &tenant_id,
                                                                const std::string &milestone_id) const {
        using R = dp::Result<Milestone, dp::Error>;
        auto book = findOwningBook(IndexKind::Milestone, tenant_id, milestone_id);
        if (!book)
            return R::err(not_found("milestone " + milestone_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));
        for (const auto &m : book->milestones) {
            if (m.id == milestone_id)
                return R::ok(m);
        }
        return R::err(not_found("milestone " + milestone_id + " not found"));
    }

    dp::Result<commitment::EvaluationResult, dp::Error>
    CommitmentEngine::milestoneEvaluation(const std::string &tenant_id, const std::string &milestone_id) const {
        using R = dp::Result<commitment::EvaluationResult, dp::Error>;
        auto book = findOwningBook(IndexKind::Milestone, tenant_id, milestone_id);
        if (!book)
            return R::err(not_found("milestone " + milestone_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));
        for (const auto &m : book->milestones) {
            if (m.id == milestone_id)
                return R::ok(commitment::MilestoneEvaluator::evaluate(m, book->linkedStates(milestone_id),
                                                                      evaluationOptions()));
        }
        return R::err(not_found("milestone " + milestone_id + " not found"));
    }

    dp::Result<std::vector<Milestone>, dp::Error> CommitmentEngine::listMilestones(const std::string &tenant_id,
                                                                                  const std::string &contract_id) const {
        using R = dp::Result<std::vector<Milestone>, dp::Error>;
        auto book = findBook(tenant_id, contract_id);
        if (!book)
            return R::err(not_found("contract " + contract_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));
        std::vector<Milestone> out = book->milestones;
        std::stable_sort(out.begin(), out.end(),
                         [](const Milestone &a, const Milestone &b) { return a.sort_order < b.sort_order; });
        return R::ok(out);
    }

    dp::Result<std::vector<commitment::MilestoneObligationLink>, dp::Error>
    CommitmentEngine::listLinks(const std::string &tenant_id, const std::string &milestone_id) const {
        using R = dp::Result<std::vector<commitment::MilestoneObligationLink>, dp::Error>;
        auto book = findOwningBook(IndexKind::Milestone, tenant_id, milestone_id);
        if (!book)
            return R::err(not_found("milestone " + milestone_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));
        return R::ok(book->linksOf(milestone_id));
    }

} // namespace surety
