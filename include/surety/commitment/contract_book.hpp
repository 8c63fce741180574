#pragma once

#include <surety/claim/claim.hpp>
#include <surety/commitment/contract.hpp>
#include <surety/commitment/evaluator.hpp>
#include <surety/commitment/milestone.hpp>
#include <surety/commitment/obligation.hpp>

#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

namespace surety::commitment {

    /// Everything scoped to one contract. Obligations, milestones, links and
    /// claims can only be reached through their contract's book, so a link
    /// between two contracts cannot be expressed. Guarded by `mutex`.
    class ContractBook {
      public:
        CommitmentContract contract;
        std::vector<Obligation> obligations;
        std::vector<Milestone> milestones;
        std::vector<MilestoneObligationLink> links;
        std::vector<claim::Claim> claims;
        std::vector<claim::ClaimEvent> claim_events;

        std::timed_mutex mutex;

        ContractBook() = default;
        ContractBook(const ContractBook &) = delete;
        ContractBook &operator=(const ContractBook &) = delete;

        inline Obligation *findObligation(const std::string &id) {
            for (auto &o : obligations) {
                if (o.id == id)
                    return &o;
            }
            return nullptr;
        }

        inline Milestone *findMilestone(const std::string &id) {
            for (auto &m : milestones) {
                if (m.id == id)
                    return &m;
            }
            return nullptr;
        }

        inline claim::Claim *findClaim(const std::string &id) {
            for (auto &c : claims) {
                if (c.id == id)
                    return &c;
            }
            return nullptr;
        }

        inline bool hasMilestoneCode(const std::string &code) const {
            return std::any_of(milestones.begin(), milestones.end(),
                               [&](const Milestone &m) { return m.code == code; });
        }

        inline bool hasLink(const std::string &milestone_id, const std::string &obligation_id) const {
            return std::any_of(links.begin(), links.end(), [&](const MilestoneObligationLink &l) {
                return l.milestone_id == milestone_id && l.obligation_id == obligation_id;
            });
        }

        /// Links of one milestone in sort order
        inline std::vector<MilestoneObligationLink> linksOf(const std::string &milestone_id) const {
            std::vector<MilestoneObligationLink> out;
            for (const auto &l : links) {
                if (l.milestone_id == milestone_id)
                    out.push_back(l);
            }
            std::stable_sort(out.begin(), out.end(),
                             [](const MilestoneObligationLink &a, const MilestoneObligationLink &b) {
                                 return a.sort_order < b.sort_order;
                             });
            return out;
        }

        /// Current obligation states behind a milestone
        inline std::vector<LinkedObligationState> linkedStates(const std::string &milestone_id) const {
            std::vector<LinkedObligationState> out;
            for (const auto &l : linksOf(milestone_id)) {
                for (const auto &o : obligations) {
                    if (o.id == l.obligation_id) {
                        out.push_back(LinkedObligationState{o.status, l.weight, l.is_required});
                        break;
                    }
                }
            }
            return out;
        }

        inline std::vector<std::string> milestonesLinkedTo(const std::string &obligation_id) const {
            std::vector<std::string> out;
            for (const auto &l : links) {
                if (l.obligation_id == obligation_id)
                    out.push_back(l.milestone_id);
            }
            return out;
        }

        inline bool hasOpenObligations() const {
            return std::any_of(obligations.begin(), obligations.end(), [](const Obligation &o) { return o.isOpen(); });
        }

        inline bool hasActiveClaims() const {
            return std::any_of(claims.begin(), claims.end(), [](const claim::Claim &c) { return c.isActive(); });
        }

        /// First active claim that blocks releasing `milestone_id`, if any
        inline const claim::Claim *blockingClaim(const std::string &milestone_id) const {
            for (const auto &c : claims) {
                if (!c.isActive())
                    continue;
                switch (contract.policy.claim_freeze) {
                case ClaimFreezePolicy::None:
                    return nullptr;
                case ClaimFreezePolicy::FreezeAll:
                    return &c;
                case ClaimFreezePolicy::FreezeDisputedMilestone:
                    if (c.disputed_milestone_id && *c.disputed_milestone_id == milestone_id)
                        return &c;
                    break;
                }
            }
            return nullptr;
        }
    };

} // namespace surety::commitment
