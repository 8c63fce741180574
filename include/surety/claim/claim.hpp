#pragma once

#include <surety/common/money.hpp>
#include <surety/common/vocabulary.hpp>
#include <surety/subject/subject.hpp>

#include <optional>
#include <string>

namespace surety {

    namespace claim {

        enum class ClaimKind : dp::u8 {
            NonDelivery = 0,
            QualityIssue = 1,
            Damage = 2,
            BillingDispute = 3,
            Fraud = 4,
            SlaBreach = 5,
        };

        enum class ResolutionKind : dp::u8 {
            ReleaseFunds = 0,
            Refund = 1,
            Forfeit = 2,
            PartialSettlement = 3,
            ReworkRequired = 4,
            NoAction = 5,
            NoFault = 6,
            Other = 7,
        };

    } // namespace claim

    template <> struct VocabularyTraits<claim::ClaimKind> {
        static const char *label() { return "claim type"; }
        static std::string name(claim::ClaimKind value) {
            switch (value) {
            case claim::ClaimKind::NonDelivery:
                return "non_delivery";
            case claim::ClaimKind::QualityIssue:
                return "quality_issue";
            case claim::ClaimKind::Damage:
                return "damage";
            case claim::ClaimKind::BillingDispute:
                return "billing_dispute";
            case claim::ClaimKind::Fraud:
                return "fraud";
            case claim::ClaimKind::SlaBreach:
                return "sla_breach";
            default:
                return "unknown";
            }
        }
        static bool lookup(const std::string &text, claim::ClaimKind &out) {
            if (text == "non_delivery")
                out = claim::ClaimKind::NonDelivery;
            else if (text == "quality_issue")
                out = claim::ClaimKind::QualityIssue;
            else if (text == "damage")
                out = claim::ClaimKind::Damage;
            else if (text == "billing_dispute")
                out = claim::ClaimKind::BillingDispute;
            else if (text == "fraud")
                out = claim::ClaimKind::Fraud;
            else if (text == "sla_breach")
                out = claim::ClaimKind::SlaBreach;
            else
                return false;
            return true;
        }
    };

    template <> struct VocabularyTraits<claim::ResolutionKind> {
        static const char *label() { return "resolution type"; }
        static std::string name(claim::ResolutionKind value) {
            switch (value) {
            case claim::ResolutionKind::ReleaseFunds:
                return "release_funds";
            case claim::ResolutionKind::Refund:
                return "refund";
            case claim::ResolutionKind::Forfeit:
                return "forfeit";
            case claim::ResolutionKind::PartialSettlement:
                return "partial_settlement";
            case claim::ResolutionKind::ReworkRequired:
                return "rework_required";
            case claim::ResolutionKind::NoAction:
                return "no_action";
            case claim::ResolutionKind::NoFault:
                return "no_fault";
            case claim::ResolutionKind::Other:
                return "other";
            default:
                return "unknown";
            }
        }
        static bool lookup(const std::string &text, claim::ResolutionKind &out) {
            if (text == "release_funds")
                out = claim::ResolutionKind::ReleaseFunds;
            else if (text == "refund")
                out = claim::ResolutionKind::Refund;
            else if (text == "forfeit")
                out = claim::ResolutionKind::Forfeit;
            else if (text == "partial_settlement")
                out = claim::ResolutionKind::PartialSettlement;
            else if (text == "rework_required")
                out = claim::ResolutionKind::ReworkRequired;
            else if (text == "no_action")
                out = claim::ResolutionKind::NoAction;
            else if (text == "no_fault")
                out = claim::ResolutionKind::NoFault;
            else if (text == "other")
                out = claim::ResolutionKind::Other;
            else
                return false;
            return true;
        }
    };

    namespace claim {

        using ClaimType = Vocabulary<ClaimKind>;
        using ResolutionType = Vocabulary<ResolutionKind>;

        enum class ClaimStatus : dp::u8 {
            Open = 0,
            InReview = 1,
            Escalated = 2,
            Resolved = 3,
            Rejected = 4,
            Cancelled = 5,
            Closed = 6,
        };

        inline std::string claimStatusToString(ClaimStatus status) {
            switch (status) {
            case ClaimStatus::Open:
                return "open";
            case ClaimStatus::InReview:
                return "in_review";
            case ClaimStatus::Escalated:
                return "escalated";
            case ClaimStatus::Resolved:
                return "resolved";
            case ClaimStatus::Rejected:
                return "rejected";
            case ClaimStatus::Cancelled:
                return "cancelled";
            case ClaimStatus::Closed:
                return "closed";
            default:
                return "unknown";
            }
        }

        inline bool isLegalClaimTransition(ClaimStatus from, ClaimStatus to) {
            switch (from) {
            case ClaimStatus::Open:
                return to == ClaimStatus::InReview || to == ClaimStatus::Escalated || to == ClaimStatus::Resolved ||
                       to == ClaimStatus::Rejected || to == ClaimStatus::Cancelled;
            case ClaimStatus::InReview:
                return to == ClaimStatus::Escalated || to == ClaimStatus::Resolved || to == ClaimStatus::Rejected ||
                       to == ClaimStatus::Cancelled;
            case ClaimStatus::Escalated:
                return to == ClaimStatus::InReview || to == ClaimStatus::Resolved || to == ClaimStatus::Rejected ||
                       to == ClaimStatus::Cancelled;
            case ClaimStatus::Resolved:
                return to == ClaimStatus::Closed || to == ClaimStatus::InReview;
            default:
                return false;
            }
        }

        /// Timeline event kinds. Every status change writes exactly one.
        enum class ClaimEventType : dp::u8 {
            Opened = 0,
            Note = 1,
            EvidenceAdded = 2,
            AmountUpdated = 3,
            ReviewStarted = 4,
            Escalated = 5,
            ResolutionProposed = 6,
            Resolved = 7,
            Reopened = 8,
            Rejected = 9,
            Cancelled = 10,
            Closed = 11,
        };

        inline std::string claimEventTypeToString(ClaimEventType type) {
            switch (type) {
            case ClaimEventType::Opened:
                return "opened";
            case ClaimEventType::Note:
                return "note";
            case ClaimEventType::EvidenceAdded:
                return "evidence_added";
            case ClaimEventType::AmountUpdated:
                return "amount_updated";
            case ClaimEventType::ReviewStarted:
                return "review_started";
            case ClaimEventType::Escalated:
                return "escalated";
            case ClaimEventType::ResolutionProposed:
                return "resolution_proposed";
            case ClaimEventType::Resolved:
                return "resolved";
            case ClaimEventType::Reopened:
                return "reopened";
            case ClaimEventType::Rejected:
                return "rejected";
            case ClaimEventType::Cancelled:
                return "cancelled";
            case ClaimEventType::Closed:
                return "closed";
            default:
                return "unknown";
            }
        }

        /// Current-state snapshot of a dispute. History lives in ClaimEvent rows.
        struct Claim {
            std::string id;
            std::string tenant_id;
            std::string contract_id;
            ClaimType type;
            ClaimStatus status = ClaimStatus::Open;
            std::optional<ResolutionType> resolution;
            std::string title;
            subject::SubjectRef raised_by;
            std::optional<subject::SubjectRef> against;
            std::optional<std::string> disputed_milestone_id;
            Millis opened_at = 0;
            std::optional<Millis> respond_by_at;
            std::optional<Millis> resolved_at;
            std::optional<Millis> closed_at;
            std::optional<Money> disputed_amount;
            std::optional<Money> settled_amount;
            std::string currency = "USD";
            std::optional<std::string> settlement_entry_id;

            /// Still holds the contract in dispute
            inline bool isActive() const {
                return status == ClaimStatus::Open || status == ClaimStatus::InReview ||
                       status == ClaimStatus::Escalated || status == ClaimStatus::Resolved;
            }
        };

        /// Immutable timeline row
        struct ClaimEvent {
            std::string id;
            std::string tenant_id;
            std::string contract_id;
            std::string claim_id;
            ClaimEventType type = ClaimEventType::Note;
            Millis occurred_at = 0;
            ClaimStatus status_after = ClaimStatus::Open;
            std::optional<subject::SubjectRef> actor;
            std::optional<std::string> ledger_entry_id;
            std::string note;
        };

    } // namespace claim

} // namespace surety
