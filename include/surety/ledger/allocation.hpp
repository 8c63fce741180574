#pragma once

#include <surety/common/money.hpp>

#include <algorithm>
#include <numeric>
#include <vector>

namespace surety::ledger {

    /// floor(a * b / d) with the remainder in `rem`, for a < d and b <= d,
    /// without forming the full product. d must stay below 2^63.
    inline dp::u64 mulDivRem(dp::u64 a, dp::u64 b, dp::u64 d, dp::u64 &rem) {
        dp::u64 q = 0;
        rem = 0;
        for (int bit = 63; bit >= 0; --bit) {
            q <<= 1;
            rem <<= 1;
            if (rem >= d) {
                rem -= d;
                ++q;
            }
            if ((b >> bit) & 1u) {
                rem += a;
                if (rem >= d) {
                    rem -= d;
                    ++q;
                }
            }
        }
        return q;
    }

    /// Split `amount` across `weights` proportionally (largest remainder).
    /// Shares sum to exactly `amount`; ties go to the earlier index. Requires all
    /// weights > 0 and amount >= 0.
    inline std::vector<Money> distributeByWeight(Money amount, const std::vector<dp::i32> &weights) {
        std::vector<Money> shares(weights.size(), 0);
        if (weights.empty() || amount <= 0)
            return shares;

        dp::i64 total_weight = 0;
        for (auto w : weights)
            total_weight += w;

        std::vector<std::pair<dp::i64, size_t>> remainders;
        remainders.reserve(weights.size());

        Money assigned = 0;
        for (size_t i = 0; i < weights.size(); ++i) {
            // split so amount * weight is never formed
            Money whole = (amount / total_weight) * weights[i];
            dp::u64 rem = 0;
            whole += static_cast<Money>(mulDivRem(static_cast<dp::u64>(amount % total_weight),
                                                  static_cast<dp::u64>(weights[i]),
                                                  static_cast<dp::u64>(total_weight), rem));
            shares[i] = whole;
            assigned += whole;
            remainders.emplace_back(static_cast<dp::i64>(rem), i);
        }

        std::stable_sort(remainders.begin(), remainders.end(),
                         [](const auto &a, const auto &b) { return a.first > b.first; });

        Money leftover = amount - assigned;
        for (size_t k = 0; leftover > 0 && k < remainders.size(); ++k, --leftover) {
            shares[remainders[k].second] += 1;
        }

        return shares;
    }

} // namespace surety::ledger
