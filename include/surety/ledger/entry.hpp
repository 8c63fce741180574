#pragma once

#include <surety/common/money.hpp>
#include <surety/subject/subject.hpp>

#include <optional>
#include <sstream>
#include <string>

namespace surety::ledger {

    enum class EntryType : dp::u8 {
        Fund = 0,
        Hold = 1,
        Release = 2,
        Refund = 3,
        Forfeit = 4,
        Adjustment = 5,
        TransferIn = 6,
        TransferOut = 7,
    };

    inline std::string entryTypeToString(EntryType type) {
        switch (type) {
        case EntryType::Fund:
            return "fund";
        case EntryType::Hold:
            return "hold";
        case EntryType::Release:
            return "release";
        case EntryType::Refund:
            return "refund";
        case EntryType::Forfeit:
            return "forfeit";
        case EntryType::Adjustment:
            return "adjustment";
        case EntryType::TransferIn:
            return "transfer_in";
        case EntryType::TransferOut:
            return "transfer_out";
        default:
            return "unknown";
        }
    }

    enum class EntryStatus : dp::u8 {
        Pending = 0,
        Posted = 1,
        Reversed = 2, // still folded; its compensating entry cancels it out
        Voided = 3,
        Failed = 4,
    };

    inline std::string entryStatusToString(EntryStatus status) {
        switch (status) {
        case EntryStatus::Pending:
            return "pending";
        case EntryStatus::Posted:
            return "posted";
        case EntryStatus::Reversed:
            return "reversed";
        case EntryStatus::Voided:
            return "voided";
        case EntryStatus::Failed:
            return "failed";
        default:
            return "unknown";
        }
    }

    /// Entries whose deltas make up the account balance
    inline bool countsInFold(EntryStatus status) {
        return status == EntryStatus::Posted || status == EntryStatus::Reversed;
    }

    /// Traceability pointers; at least one must be set
    struct EntryContext {
        std::optional<std::string> contract_id;
        std::optional<std::string> milestone_id;
        std::optional<std::string> obligation_id;
        std::optional<std::string> claim_id;
        std::optional<std::string> external_transaction_id;
        std::optional<subject::SubjectRef> source_subject;

        inline bool empty() const {
            return !contract_id && !milestone_id && !obligation_id && !claim_id && !external_transaction_id &&
                   !source_subject;
        }
    };

    /// Immutable posting. Only `status` may later move posted -> reversed.
    struct LedgerEntry {
        std::string id;
        std::string tenant_id;
        std::string account_id;
        EntryType type = EntryType::Fund;
        EntryStatus status = EntryStatus::Posted;
        Millis occurred_at = 0;
        std::string currency = "USD";
        Money balance_delta = 0;
        Money held_delta = 0;
        EntryContext context;
        std::optional<std::string> idempotency_key;
        std::string reason_code;
        std::optional<std::string> reverses_entry_id;
        dp::u64 sequence = 0; // 1-based position in the account log
        std::string previous_hash;
        std::string entry_hash;

        /// Stable text the entry hash is computed over
        inline std::string canonical() const {
            std::ostringstream oss;
            oss << tenant_id << '|' << account_id << '|' << id << '|' << sequence << '|' << entryTypeToString(type)
                << '|' << occurred_at << '|' << currency << '|' << balance_delta << '|' << held_delta << '|'
                << context.contract_id.value_or("") << '|' << context.milestone_id.value_or("") << '|'
                << context.obligation_id.value_or("") << '|' << context.claim_id.value_or("") << '|'
                << context.external_transaction_id.value_or("") << '|'
                << (context.source_subject ? context.source_subject->toString() : "") << '|'
                << idempotency_key.value_or("") << '|' << reason_code << '|' << reverses_entry_id.value_or("");
            return oss.str();
        }
    };

    enum class AllocationType : dp::u8 {
        ObligationSettlement = 0,
        MilestoneRelease = 1,
        Refund = 2,
        Forfeit = 3,
        Adjustment = 4,
    };

    inline std::string allocationTypeToString(AllocationType type) {
        switch (type) {
        case AllocationType::ObligationSettlement:
            return "obligation_settlement";
        case AllocationType::MilestoneRelease:
            return "milestone_release";
        case AllocationType::Refund:
            return "refund";
        case AllocationType::Forfeit:
            return "forfeit";
        case AllocationType::Adjustment:
            return "adjustment";
        default:
            return "unknown";
        }
    }

    struct AllocationTarget {
        std::optional<std::string> obligation_id;
        std::optional<std::string> milestone_id;
        std::optional<std::string> external_line_id;
        std::optional<subject::SubjectRef> subject;

        inline bool empty() const { return !obligation_id && !milestone_id && !external_line_id && !subject; }
    };

    /// Explains which obligation/milestone/line a ledger amount was applied to
    struct Allocation {
        std::string id;
        std::string tenant_id;
        std::string entry_id;
        AllocationType type = AllocationType::MilestoneRelease;
        Money amount = 0;
        std::string currency = "USD";
        AllocationTarget target;
        Millis occurred_at = 0;
    };

    /// Allocation before it is bound to an entry
    struct AllocationDraft {
        AllocationType type = AllocationType::MilestoneRelease;
        Money amount = 0;
        AllocationTarget target;
    };

} // namespace surety::ledger
