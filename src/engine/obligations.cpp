#include <surety/engine/engine.hpp>

#include <algorithm>

namespace surety {

    using commitment::Obligation;
    using commitment::ObligationStatus;

    namespace {

        /// Legal-edge check plus the terminal timestamp that goes with `to`
        dp::Result<void, dp::Error> moveObligation(Obligation &o, ObligationStatus to, Millis at) {
            if (!commitment::isLegalObligationTransition(o.status, to)) {
                return dp::Result<void, dp::Error>::err(invalid_state(
                    "obligation " + o.id + " is " + commitment::obligationStatusToString(o.status) +
                    ", cannot move to " + commitment::obligationStatusToString(to)));
            }
            switch (to) {
            case ObligationStatus::Satisfied:
                o.satisfied_at = at;
                break;
            case ObligationStatus::Breached:
                o.breached_at = at;
                break;
            case ObligationStatus::Waived:
                o.waived_at = at;
                break;
            case ObligationStatus::Cancelled:
                o.cancelled_at = at;
                break;
            case ObligationStatus::Expired:
                o.expired_at = at;
                break;
            case ObligationStatus::InProgress:
                o.satisfied_at.reset();
                o.waived_at.reset();
                break;
            default:
                break;
            }
            o.status = to;
            return dp::Result<void, dp::Error>::ok();
        }

    } // namespace

    // ===========================================
    // Creation
    // ===========================================

    dp::Result<Obligation, dp::Error> CommitmentEngine::addObligation(const std::string &tenant_id,
                                                                     const std::string &contract_id,
                                                                     const ObligationDraft &draft) {
        using R = dp::Result<Obligation, dp::Error>;

        if (draft.required_amount) {
            auto amount = requireNonNegative(*draft.required_amount, "required_amount");
            if (!amount.is_ok())
                return R::err(amount.error());
        }
        auto obligor = subject::requireOptionalSubject(registry_, tenant_id, draft.obligor, "obligor");
        if (!obligor.is_ok())
            return R::err(obligor.error());
        auto beneficiary = subject::requireOptionalSubject(registry_, tenant_id, draft.beneficiary, "beneficiary");
        if (!beneficiary.is_ok())
            return R::err(beneficiary.error());

        auto book = findBook(tenant_id, contract_id);
        if (!book)
            return R::err(not_found("contract " + contract_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));
        if (book->contract.isTerminal())
            return R::err(invalid_state("contract " + contract_id + " is " +
                                        commitment::contractStatusToString(book->contract.status)));

        Obligation o;
        o.id = nextId("obl-");
        o.contract_id = contract_id;
        o.type = draft.type;
        o.title = draft.title;
        o.obligor = draft.obligor;
        o.beneficiary = draft.beneficiary;
        o.required_amount = draft.required_amount;
        o.due_at = draft.due_at;
        o.sort_order = draft.sort_order;
        book->obligations.push_back(o);
        indexChild(IndexKind::Obligation, tenant_id, o.id, contract_id);

        logInfo(config_.log_level, "added obligation " + o.id + " (" + o.type.toString() + ") to " + contract_id);
        return R::ok(o);
    }

    // ===========================================
    // Transitions
    // ===========================================

    /// `fn(Obligation &next, Millis at) -> Result<bool>`; false means nothing
    /// changed (idempotent repeat) and skips re-evaluation.
    template <typename Fn>
    dp::Result<ObligationUpdate, dp::Error> CommitmentEngine::mutateObligation(const std::string &tenant_id,
                                                                               const std::string &obligation_id,
                                                                               Fn &&fn) {
        using R = dp::Result<ObligationUpdate, dp::Error>;

        auto book = findOwningBook(IndexKind::Obligation, tenant_id, obligation_id);
        if (!book)
            return R::err(not_found("obligation " + obligation_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));

        Obligation *current = book->findObligation(obligation_id);
        if (!current)
            return R::err(not_found("obligation " + obligation_id + " not found"));

        ObligationUpdate update;
        Obligation next = *current;
        dp::Result<bool, dp::Error> changed = fn(next, now());
        if (!changed.is_ok())
            return R::err(changed.error());
        if (!changed.value()) {
            update.obligation = *current;
            return R::ok(update);
        }
        if (book->contract.isTerminal())
            return R::err(invalid_state("contract " + book->contract.id + " is " +
                                        commitment::contractStatusToString(book->contract.status)));

        ObligationStatus before = current->status;
        *current = next;
        if (before != next.status) {
            logInfo(config_.log_level, "obligation " + obligation_id + " " +
                                           commitment::obligationStatusToString(before) + " -> " +
                                           commitment::obligationStatusToString(next.status));
        }

        reevaluate(*book, book->milestonesLinkedTo(obligation_id), update.milestones_changed, update.releases);
        update.obligation = *book->findObligation(obligation_id);
        return R::ok(update);
    }

    dp::Result<ObligationUpdate, dp::Error> CommitmentEngine::startObligation(const std::string &tenant_id,
                                                                              const std::string &obligation_id) {
        return mutateObligation(tenant_id, obligation_id, [](Obligation &o, Millis at) {
            if (o.status != ObligationStatus::Pending)
                return dp::Result<bool, dp::Error>::err(
                    invalid_state("obligation " + o.id + " is " + commitment::obligationStatusToString(o.status) +
                                  ", only pending obligations can start"));
            auto moved = moveObligation(o, ObligationStatus::InProgress, at);
            if (!moved.is_ok())
                return dp::Result<bool, dp::Error>::err(moved.error());
            return dp::Result<bool, dp::Error>::ok(true);
        });
    }

    dp::Result<ObligationUpdate, dp::Error> CommitmentEngine::recordSatisfaction(const std::string &tenant_id,
                                                                                 const std::string &obligation_id,
                                                                                 Money amount) {
        auto positive = requirePositive(amount, "satisfied amount");
        if (!positive.is_ok())
            return dp::Result<ObligationUpdate, dp::Error>::err(positive.error());

        return mutateObligation(tenant_id, obligation_id, [amount](Obligation &o, Millis at) {
            using B = dp::Result<bool, dp::Error>;
            if (!o.isOpen())
                return B::err(invalid_state("obligation " + o.id + " is " +
                                            commitment::obligationStatusToString(o.status)));
            if (!o.required_amount)
                return B::err(validation_error("obligation " + o.id + " has no required amount to progress toward"));
            Money total = 0;
            if (!checkedAdd(o.satisfied_amount, amount, total) || total > *o.required_amount)
                return B::err(validation_error("satisfied amount " + std::to_string(o.satisfied_amount) + " + " +
                                               std::to_string(amount) + " would exceed required " +
                                               std::to_string(*o.required_amount)));
            if (o.status == ObligationStatus::Pending) {
                auto moved = moveObligation(o, ObligationStatus::InProgress, at);
                if (!moved.is_ok())
                    return B::err(moved.error());
            }
            o.satisfied_amount = total;
            if (o.amountMet()) {
                auto moved = moveObligation(o, ObligationStatus::Satisfied, at);
                if (!moved.is_ok())
                    return B::err(moved.error());
            }
            return B::ok(true);
        });
    }

    dp::Result<ObligationUpdate, dp::Error> CommitmentEngine::satisfyObligation(const std::string &tenant_id,
                                                                                const std::string &obligation_id,
                                                                                std::optional<Money> satisfied_amount) {
        if (satisfied_amount) {
            auto amount = requireNonNegative(*satisfied_amount, "satisfied amount");
            if (!amount.is_ok())
                return dp::Result<ObligationUpdate, dp::Error>::err(amount.error());
        }

        return mutateObligation(tenant_id, obligation_id, [satisfied_amount](Obligation &o, Millis at) {
            using B = dp::Result<bool, dp::Error>;
            if (!o.isOpen())
                return B::err(invalid_state("obligation " + o.id + " is " +
                                            commitment::obligationStatusToString(o.status) + ", cannot satisfy"));
            if (satisfied_amount) {
                if (o.required_amount && *satisfied_amount > *o.required_amount)
                    return B::err(validation_error("satisfied amount " + std::to_string(*satisfied_amount) +
                                                   " exceeds required " + std::to_string(*o.required_amount)));
                o.satisfied_amount = *satisfied_amount;
            }
            if (!o.amountMet())
                return B::err(invalid_state("obligation " + o.id + " has " + std::to_string(o.satisfied_amount) +
                                            " of required " + std::to_string(*o.required_amount)));
            auto moved = moveObligation(o, ObligationStatus::Satisfied, at);
            if (!moved.is_ok())
                return B::err(moved.error());
            return B::ok(true);
        });
    }

    dp::Result<ObligationUpdate, dp::Error> CommitmentEngine::markObligationBreached(const std::string &tenant_id,
                                                                                     const std::string &obligation_id) {
        return mutateObligation(tenant_id, obligation_id, [](Obligation &o, Millis at) {
            if (o.status == ObligationStatus::Breached)
                return dp::Result<bool, dp::Error>::ok(false);
            auto moved = moveObligation(o, ObligationStatus::Breached, at);
            if (!moved.is_ok())
                return dp::Result<bool, dp::Error>::err(moved.error());
            return dp::Result<bool, dp::Error>::ok(true);
        });
    }

    dp::Result<ObligationUpdate, dp::Error> CommitmentEngine::waiveObligation(const std::string &tenant_id,
                                                                              const std::string &obligation_id) {
        return mutateObligation(tenant_id, obligation_id, [](Obligation &o, Millis at) {
            auto moved = moveObligation(o, ObligationStatus::Waived, at);
            if (!moved.is_ok())
                return dp::Result<bool, dp::Error>::err(moved.error());
            return dp::Result<bool, dp::Error>::ok(true);
        });
    }

    dp::Result<ObligationUpdate, dp::Error> CommitmentEngine::cancelObligation(const std::string &tenant_id,
                                                                               const std::string &obligation_id) {
        return mutateObligation(tenant_id, obligation_id, [](Obligation &o, Millis at) {
            auto moved = moveObligation(o, ObligationStatus::Cancelled, at);
            if (!moved.is_ok())
                return dp::Result<bool, dp::Error>::err(moved.error());
            return dp::Result<bool, dp::Error>::ok(true);
        });
    }

    dp::Result<ObligationUpdate, dp::Error> CommitmentEngine::markObligationExpired(const std::string &tenant_id,
                                                                                    const std::string &obligation_id) {
        return mutateObligation(tenant_id, obligation_id, [](Obligation &o, Millis at) {
            if (o.status == ObligationStatus::Expired)
                return dp::Result<bool, dp::Error>::ok(false);
            auto moved = moveObligation(o, ObligationStatus::Expired, at);
            if (!moved.is_ok())
                return dp::Result<bool, dp::Error>::err(moved.error());
            return dp::Result<bool, dp::Error>::ok(true);
        });
    }

    dp::Result<ObligationUpdate, dp::Error> CommitmentEngine::reopenObligation(const std::string &tenant_id,
                                                                               const std::string &obligation_id) {
        return mutateObligation(tenant_id, obligation_id, [](Obligation &o, Millis at) {
            if (o.status != ObligationStatus::Satisfied && o.status != ObligationStatus::Waived)
                return dp::Result<bool, dp::Error>::err(
                    invalid_state("obligation " + o.id + " is " + commitment::obligationStatusToString(o.status) +
                                  ", only satisfied or waived obligations reopen"));
            auto moved = moveObligation(o, ObligationStatus::InProgress, at);
            if (!moved.is_ok())
                return dp::Result<bool, dp::Error>::err(moved.error());
            return dp::Result<bool, dp::Error>::ok(true);
        });
    }

    // ===========================================
    // Reads
    // ===========================================

    dp::Result<Obligation, dp::Error> CommitmentEngine::obligation(const std::string &tenant_id,
                                                                  const std::string &obligation_id) const {
        using R = dp::Result<Obligation, dp::Error>;
        auto book = findOwningBook(IndexKind::Obligation, tenant_id, obligation_id);
        if (!book)
            return R::err(not_found("obligation " + obligation_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));
        for (const auto &o : book->obligations) {
            if (o.id == obligation_id)
                return R::ok(o);
        }
        return R::err(not_found("obligation " + obligation_id + " not found"));
    }

    dp::Result<std::vector<Obligation>, dp::Error>
    CommitmentEngine::listObligations(const std::string &tenant_id, const std::string &contract_id) const {
        using R = dp::Result<std::vector<Obligation>, dp::Error>;
        auto book = findBook(tenant_id, contract_id);
        if (!book)
            return R::err(not_found("contract " + contract_id + " not found"));
        auto lock = lockBook(*book);
        if (!lock.owns_lock())
            return R::err(busy(*book));
        std::vector<Obligation> out = book->obligations;
        std::stable_sort(out.begin(), out.end(),
                         [](const Obligation &a, const Obligation &b) { return a.sort_order < b.sort_order; });
        return R::ok(out);
    }

} // namespace surety
