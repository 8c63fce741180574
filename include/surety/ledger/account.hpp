#pragma once

#include <surety/common/money.hpp>
#include <surety/common/vocabulary.hpp>
#include <surety/ledger/entry.hpp>
#include <surety/subject/subject.hpp>

#include <optional>
#include <string>

namespace surety {

    namespace ledger {

        enum class AccountKind : dp::u8 {
            Escrow = 0,
            Retainage = 1,
            Deposit = 2,
            Assurance = 3,
        };

    } // namespace ledger

    template <> struct VocabularyTraits<ledger::AccountKind> {
        static const char *label() { return "account type"; }
        static std::string name(ledger::AccountKind value) {
            switch (value) {
            case ledger::AccountKind::Escrow:
                return "escrow";
            case ledger::AccountKind::Retainage:
                return "retainage";
            case ledger::AccountKind::Deposit:
                return "deposit";
            case ledger::AccountKind::Assurance:
                return "assurance";
            default:
                return "unknown";
            }
        }
        static bool lookup(const std::string &text, ledger::AccountKind &out) {
            if (text == "escrow")
                out = ledger::AccountKind::Escrow;
            else if (text == "retainage")
                out = ledger::AccountKind::Retainage;
            else if (text == "deposit")
                out = ledger::AccountKind::Deposit;
            else if (text == "assurance")
                out = ledger::AccountKind::Assurance;
            else
                return false;
            return true;
        }
    };

    namespace ledger {

        using AccountType = Vocabulary<AccountKind>;

        enum class AccountStatus : dp::u8 {
            Open = 0,
            Locked = 1, // postings rejected until unlocked
            Frozen = 2, // postings rejected (e.g. compliance hold)
            Closed = 3,
            Releasing = 4, // winding down, only postings that pay out
        };

        inline std::string accountStatusToString(AccountStatus status) {
            switch (status) {
            case AccountStatus::Open:
                return "open";
            case AccountStatus::Locked:
                return "locked";
            case AccountStatus::Frozen:
                return "frozen";
            case AccountStatus::Closed:
                return "closed";
            case AccountStatus::Releasing:
                return "releasing";
            default:
                return "unknown";
            }
        }

        class SecuredBalanceLedger;

        /// Money bucket tied to at most one contract. The four amount fields are a
        /// cache of the fold over the account's entries; only the ledger moves them.
        class SecuredBalanceAccount {
          public:
            std::string id;
            std::string tenant_id;
            std::optional<std::string> contract_id;
            AccountType type;
            std::string title;
            std::string currency = "USD";
            subject::SubjectRef owner;
            std::optional<subject::SubjectRef> counterparty;
            Millis opened_at = 0;

            SecuredBalanceAccount() = default;

            inline AccountStatus status() const { return status_; }
            inline std::optional<Millis> closedAt() const { return closed_at_; }

            inline Money balance() const { return balance_; }
            inline Money held() const { return held_; }
            inline Money released() const { return released_; }
            inline Money forfeited() const { return forfeited_; }

            /// Balance not reserved by a hold
            inline Money available() const { return balance_ - held_; }

            /// Open accounts take any entry; a releasing account only takes
            /// entries that add nothing to balance or held
            inline bool acceptsPosting(Money balance_delta, Money held_delta) const {
                if (status_ == AccountStatus::Open)
                    return true;
                return status_ == AccountStatus::Releasing && balance_delta <= 0 && held_delta <= 0;
            }

          private:
            friend class SecuredBalanceLedger;

            /// Fold one entry into the snapshot. Caller has validated the result.
            inline void apply(const LedgerEntry &entry) {
                if (!countsInFold(entry.status))
                    return;
                balance_ += entry.balance_delta;
                held_ += entry.held_delta;
                if (entry.type == EntryType::Release)
                    released_ -= entry.held_delta;
                else if (entry.type == EntryType::Forfeit)
                    forfeited_ -= entry.held_delta;
            }

            AccountStatus status_ = AccountStatus::Open;
            std::optional<Millis> closed_at_;
            Money balance_ = 0;
            Money held_ = 0;
            Money released_ = 0;
            Money forfeited_ = 0;
        };

    } // namespace ledger

} // namespace surety
