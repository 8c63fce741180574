#pragma once

#include <surety/commitment/milestone.hpp>
#include <surety/commitment/obligation.hpp>

#include <vector>

namespace surety::commitment {

    struct EvaluationOptions {
        bool count_waived_as_satisfied = false;
    };

    /// One linked obligation as seen by the evaluator
    struct LinkedObligationState {
        ObligationStatus status = ObligationStatus::Pending;
        dp::i32 weight = 1;
        bool is_required = true;
    };

    struct EvaluationResult {
        bool ready = false;
        dp::i64 satisfied_score = 0; // gating links that count toward readiness
        dp::i64 gating_links = 0;    // links that took part in the decision
    };

    /// Pure readiness decision from current obligation states. Holds no history,
    /// so re-running it without an intervening change gives the same answer.
    class MilestoneEvaluator {
      public:
        inline static bool countsTowardReadiness(ObligationStatus status, const EvaluationOptions &opts) {
            if (status == ObligationStatus::Satisfied)
                return true;
            return opts.count_waived_as_satisfied && status == ObligationStatus::Waived;
        }

        inline static EvaluationResult evaluate(const Milestone &milestone,
                                                const std::vector<LinkedObligationState> &links,
                                                const EvaluationOptions &opts = EvaluationOptions{}) {
            EvaluationResult result;

            switch (milestone.evaluation_mode) {
            case EvaluationMode::All: {
                for (const auto &link : links) {
                    if (!link.is_required)
                        continue;
                    result.gating_links++;
                    if (countsTowardReadiness(link.status, opts))
                        result.satisfied_score++;
                }
                result.ready = result.gating_links > 0 && result.satisfied_score == result.gating_links;
                break;
            }
            case EvaluationMode::Any: {
                for (const auto &link : links) {
                    if (!link.is_required)
                        continue;
                    result.gating_links++;
                    if (countsTowardReadiness(link.status, opts))
                        result.satisfied_score++;
                }
                result.ready = result.satisfied_score > 0;
                break;
            }
            case EvaluationMode::Threshold: {
                for (const auto &link : links) {
                    result.gating_links++;
                    if (!countsTowardReadiness(link.status, opts))
                        continue;
                    result.satisfied_score +=
                        milestone.threshold_convention == ThresholdConvention::WeightSum ? link.weight : 1;
                }
                dp::i64 needed = milestone.min_satisfied_count.value_or(0);
                result.ready = needed > 0 && result.satisfied_score >= needed;
                break;
            }
            }

            return result;
        }
    };

} // namespace surety::commitment
