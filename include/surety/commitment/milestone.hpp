#pragma once

#include <surety/common/money.hpp>

#include <optional>
#include <string>

namespace surety::commitment {

    enum class MilestoneStatus : dp::u8 {
        Pending = 0,
        Ready = 1,
        Released = 2,
        Skipped = 3,
        Cancelled = 4,
    };

    inline std::string milestoneStatusToString(MilestoneStatus status) {
        switch (status) {
        case MilestoneStatus::Pending:
            return "pending";
        case MilestoneStatus::Ready:
            return "ready";
        case MilestoneStatus::Released:
            return "released";
        case MilestoneStatus::Skipped:
            return "skipped";
        case MilestoneStatus::Cancelled:
            return "cancelled";
        default:
            return "unknown";
        }
    }

    enum class EvaluationMode : dp::u8 {
        All = 0,       // every required link satisfied
        Any = 1,       // at least one required link satisfied
        Threshold = 2, // satisfied score >= min_satisfied_count
    };

    enum class ReleaseMode : dp::u8 {
        Manual = 0,
        Automatic = 1,
    };

    /// How a threshold milestone scores its satisfied links
    enum class ThresholdConvention : dp::u8 {
        WeightSum = 0,       // sum of link weights
        ObligationCount = 1, // one per satisfied obligation
    };

    inline std::string evaluationModeToString(EvaluationMode mode) {
        switch (mode) {
        case EvaluationMode::All:
            return "all";
        case EvaluationMode::Any:
            return "any";
        case EvaluationMode::Threshold:
            return "threshold";
        default:
            return "unknown";
        }
    }

    /// Release gate aggregating obligations
    struct Milestone {
        std::string id;
        std::string contract_id;
        std::string code;
        std::string title;
        MilestoneStatus status = MilestoneStatus::Pending;
        EvaluationMode evaluation_mode = EvaluationMode::All;
        std::optional<dp::i32> min_satisfied_count;
        ThresholdConvention threshold_convention = ThresholdConvention::WeightSum;
        ReleaseMode release_mode = ReleaseMode::Manual;
        Money release_amount = 0; // fixed at creation
        std::optional<Millis> due_at;
        std::optional<Millis> ready_at;
        std::optional<Millis> released_at;
        std::optional<std::string> released_by;
        std::optional<Millis> cancelled_at;
        std::optional<Millis> skipped_at;
        std::optional<std::string> release_entry_id;
        dp::i32 sort_order = 100;

        inline bool isSettled() const {
            return status == MilestoneStatus::Released || status == MilestoneStatus::Skipped ||
                   status == MilestoneStatus::Cancelled;
        }
    };

    /// Weighted many-to-many membership between a milestone and an obligation
    /// of the same contract.
    struct MilestoneObligationLink {
        std::string id;
        std::string contract_id;
        std::string milestone_id;
        std::string obligation_id;
        dp::i32 weight = 1;
        bool is_required = true;
        dp::i32 sort_order = 100;
    };

} // namespace surety::commitment
