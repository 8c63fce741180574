#pragma once

#include <surety/common/money.hpp>
#include <surety/common/vocabulary.hpp>
#include <surety/subject/subject.hpp>

#include <optional>
#include <string>

namespace surety {

    namespace commitment {

        enum class ObligationKind : dp::u8 {
            Payment = 0,
            ServiceDelivery = 1,
            EvidenceSubmission = 2,
            InspectionPass = 3,
            Approval = 4,
        };

    } // namespace commitment

    template <> struct VocabularyTraits<commitment::ObligationKind> {
        static const char *label() { return "obligation type"; }
        static std::string name(commitment::ObligationKind value) {
            switch (value) {
            case commitment::ObligationKind::Payment:
                return "payment";
            case commitment::ObligationKind::ServiceDelivery:
                return "service_delivery";
            case commitment::ObligationKind::EvidenceSubmission:
                return "evidence_submission";
            case commitment::ObligationKind::InspectionPass:
                return "inspection_pass";
            case commitment::ObligationKind::Approval:
                return "approval";
            default:
                return "unknown";
            }
        }
        static bool lookup(const std::string &text, commitment::ObligationKind &out) {
            if (text == "payment")
                out = commitment::ObligationKind::Payment;
            else if (text == "service_delivery")
                out = commitment::ObligationKind::ServiceDelivery;
            else if (text == "evidence_submission")
                out = commitment::ObligationKind::EvidenceSubmission;
            else if (text == "inspection_pass")
                out = commitment::ObligationKind::InspectionPass;
            else if (text == "approval")
                out = commitment::ObligationKind::Approval;
            else
                return false;
            return true;
        }
    };

    namespace commitment {

        using ObligationType = Vocabulary<ObligationKind>;

        enum class ObligationStatus : dp::u8 {
            Pending = 0,
            InProgress = 1,
            Satisfied = 2,
            Waived = 3,
            Breached = 4,
            Cancelled = 5,
            Expired = 6,
        };

        inline std::string obligationStatusToString(ObligationStatus status) {
            switch (status) {
            case ObligationStatus::Pending:
                return "pending";
            case ObligationStatus::InProgress:
                return "in_progress";
            case ObligationStatus::Satisfied:
                return "satisfied";
            case ObligationStatus::Waived:
                return "waived";
            case ObligationStatus::Breached:
                return "breached";
            case ObligationStatus::Cancelled:
                return "cancelled";
            case ObligationStatus::Expired:
                return "expired";
            default:
                return "unknown";
            }
        }

        /// Satisfied and waived may be reopened; the rest are final.
        inline bool isLegalObligationTransition(ObligationStatus from, ObligationStatus to) {
            switch (from) {
            case ObligationStatus::Pending:
                return to != ObligationStatus::Pending;
            case ObligationStatus::InProgress:
                return to != ObligationStatus::Pending && to != ObligationStatus::InProgress;
            case ObligationStatus::Satisfied:
            case ObligationStatus::Waived:
                return to == ObligationStatus::InProgress || to == ObligationStatus::Cancelled;
            default:
                return false;
            }
        }

        /// One condition to satisfy under a contract. Never deleted; retired via status.
        struct Obligation {
            std::string id;
            std::string contract_id;
            ObligationType type;
            ObligationStatus status = ObligationStatus::Pending;
            std::string title;
            std::optional<subject::SubjectRef> obligor;
            std::optional<subject::SubjectRef> beneficiary;
            std::optional<Money> required_amount;
            Money satisfied_amount = 0;
            std::optional<Millis> due_at;
            std::optional<Millis> satisfied_at;
            std::optional<Millis> breached_at;
            std::optional<Millis> waived_at;
            std::optional<Millis> cancelled_at;
            std::optional<Millis> expired_at;
            dp::i32 sort_order = 100;

            /// Pending or in progress
            inline bool isOpen() const {
                return status == ObligationStatus::Pending || status == ObligationStatus::InProgress;
            }

            inline bool amountMet() const {
                return !required_amount.has_value() || satisfied_amount == *required_amount;
            }
        };

    } // namespace commitment

} // namespace surety
