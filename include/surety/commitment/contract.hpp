#pragma once

#include <surety/common/money.hpp>
#include <surety/common/vocabulary.hpp>
#include <surety/subject/subject.hpp>

#include <optional>
#include <string>

namespace surety {

    namespace commitment {

        enum class ContractKind : dp::u8 {
            Escrow = 0,
            Retainage = 1,
            ServiceCommitment = 2,
            PaymentAssurance = 3,
        };

    } // namespace commitment

    template <> struct VocabularyTraits<commitment::ContractKind> {
        static const char *label() { return "contract type"; }
        static std::string name(commitment::ContractKind value) {
            switch (value) {
            case commitment::ContractKind::Escrow:
                return "escrow";
            case commitment::ContractKind::Retainage:
                return "retainage";
            case commitment::ContractKind::ServiceCommitment:
                return "service_commitment";
            case commitment::ContractKind::PaymentAssurance:
                return "payment_assurance";
            default:
                return "unknown";
            }
        }
        static bool lookup(const std::string &text, commitment::ContractKind &out) {
            if (text == "escrow")
                out = commitment::ContractKind::Escrow;
            else if (text == "retainage")
                out = commitment::ContractKind::Retainage;
            else if (text == "service_commitment" || text == "service")
                out = commitment::ContractKind::ServiceCommitment;
            else if (text == "payment_assurance")
                out = commitment::ContractKind::PaymentAssurance;
            else
                return false;
            return true;
        }
    };

    namespace commitment {

        using ContractType = Vocabulary<ContractKind>;

        enum class ContractStatus : dp::u8 {
            Draft = 0,
            Active = 1,
            Paused = 2,
            Disputed = 3,
            Completed = 4,
            Cancelled = 5,
            Defaulted = 6,
        };

        inline std::string contractStatusToString(ContractStatus status) {
            switch (status) {
            case ContractStatus::Draft:
                return "draft";
            case ContractStatus::Active:
                return "active";
            case ContractStatus::Paused:
                return "paused";
            case ContractStatus::Disputed:
                return "disputed";
            case ContractStatus::Completed:
                return "completed";
            case ContractStatus::Cancelled:
                return "cancelled";
            case ContractStatus::Defaulted:
                return "defaulted";
            default:
                return "unknown";
            }
        }

        inline bool isTerminal(ContractStatus status) {
            return status == ContractStatus::Completed || status == ContractStatus::Cancelled ||
                   status == ContractStatus::Defaulted;
        }

        /// Externally driven edges. Disputed is entered and left by the claim workflow only.
        inline bool isLegalContractTransition(ContractStatus from, ContractStatus to) {
            switch (from) {
            case ContractStatus::Draft:
                return to == ContractStatus::Active || to == ContractStatus::Cancelled;
            case ContractStatus::Active:
                return to == ContractStatus::Paused || to == ContractStatus::Disputed ||
                       to == ContractStatus::Completed || to == ContractStatus::Cancelled ||
                       to == ContractStatus::Defaulted;
            case ContractStatus::Paused:
                return to == ContractStatus::Active || to == ContractStatus::Disputed ||
                       to == ContractStatus::Cancelled || to == ContractStatus::Defaulted;
            case ContractStatus::Disputed:
                return to == ContractStatus::Active || to == ContractStatus::Paused ||
                       to == ContractStatus::Cancelled || to == ContractStatus::Defaulted;
            default:
                return false;
            }
        }

        /// What happens to held funds when a contract is cancelled
        enum class CancellationPolicy : dp::u8 {
            ForfeitHeld = 0,
            ReleaseHeld = 1,
            RefundHeld = 2,
        };

        /// Which milestone releases an active claim blocks
        enum class ClaimFreezePolicy : dp::u8 {
            None = 0,
            FreezeAll = 1,
            FreezeDisputedMilestone = 2,
        };

        /// Shape of the ledger entry written by a milestone release
        enum class ReleasePosting : dp::u8 {
            HoldOnly = 0,     // held -amount, balance unchanged (funds stay until paid out)
            DebitBalance = 1, // balance -amount and held -amount
        };

        struct ContractPolicy {
            CancellationPolicy cancellation = CancellationPolicy::ForfeitHeld;
            ClaimFreezePolicy claim_freeze = ClaimFreezePolicy::FreezeAll;
            ReleasePosting release_posting = ReleasePosting::HoldOnly;
        };

        /// The agreement envelope; owns the committed/released/forfeited totals
        struct CommitmentContract {
            std::string id;
            std::string tenant_id;
            ContractType type;
            ContractStatus status = ContractStatus::Draft;
            std::string title;
            subject::SubjectRef anchor;
            std::optional<subject::SubjectRef> counterparty;
            std::string currency = "USD";
            Money committed_amount = 0;
            Money released_amount = 0;
            Money forfeited_amount = 0;
            std::optional<Millis> started_at;
            std::optional<Millis> expires_at;
            std::optional<Millis> completed_at;
            std::optional<Millis> cancelled_at;
            ContractPolicy policy;
            /// Status to restore when the last active claim closes
            std::optional<ContractStatus> status_before_dispute;

            inline Money remainingCommitment() const { return committed_amount - released_amount - forfeited_amount; }

            inline bool isTerminal() const { return commitment::isTerminal(status); }

            /// Would adding `release` and `forfeit` keep released+forfeited <= committed?
            inline dp::Result<void, dp::Error> checkBudget(Money release, Money forfeit) const {
                Money total = 0;
                if (!checkedAdd(released_amount, forfeited_amount, total) || !checkedAdd(total, release, total) ||
                    !checkedAdd(total, forfeit, total)) {
                    return dp::Result<void, dp::Error>::err(
                        invariant_violation("released+forfeited overflows on contract " + id));
                }
                if (total > committed_amount) {
                    return dp::Result<void, dp::Error>::err(invariant_violation(
                        "released+forfeited would exceed committed on contract " + id + ": " +
                        std::to_string(released_amount) + " + " + std::to_string(forfeited_amount) + " + " +
                        std::to_string(total - released_amount - forfeited_amount) + " > " +
                        std::to_string(committed_amount)));
                }
                return dp::Result<void, dp::Error>::ok();
            }

            /// Full row-shape check
            inline dp::Result<void, dp::Error> checkInvariants() const {
                if (committed_amount < 0 || released_amount < 0 || forfeited_amount < 0) {
                    return dp::Result<void, dp::Error>::err(invariant_violation("contract amounts must be >= 0"));
                }
                if (released_amount + forfeited_amount > committed_amount) {
                    return dp::Result<void, dp::Error>::err(
                        invariant_violation("released+forfeited exceeds committed on contract " + id));
                }
                if (completed_at.has_value() != (status == ContractStatus::Completed)) {
                    return dp::Result<void, dp::Error>::err(
                        invariant_violation("completed_at must be set iff status is completed"));
                }
                if (cancelled_at.has_value() != (status == ContractStatus::Cancelled)) {
                    return dp::Result<void, dp::Error>::err(
                        invariant_violation("cancelled_at must be set iff status is cancelled"));
                }
                if (started_at.has_value() && expires_at.has_value() && *expires_at <= *started_at) {
                    return dp::Result<void, dp::Error>::err(invariant_violation("expires_at must be after started_at"));
                }
                return dp::Result<void, dp::Error>::ok();
            }
        };

    } // namespace commitment

} // namespace surety
