#pragma once

#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <unordered_map>

namespace surety::storage {

    using namespace datapod;

    // ===========================================
    // Utility functions
    // ===========================================

    inline i64 currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    inline Vector<u8> computeSHA256(const Vector<u8> &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        std::vector<uint8_t> input(data.begin(), data.end());
        auto result = crypto.hash(input);
        if (!result.success) {
            return Vector<u8>{};
        }
        return Vector<u8>(result.data.begin(), result.data.end());
    }

    inline String hashToHex(const Vector<u8> &hash) {
        std::vector<uint8_t> input(hash.begin(), hash.end());
        return String(keylock::keylock::to_hex(input).c_str());
    }

    /// Hex SHA-256 of a text; empty string when hashing failed
    inline std::string sha256Hex(const std::string &text) {
        Vector<u8> bytes(text.begin(), text.end());
        auto hash = computeSHA256(bytes);
        if (hash.empty())
            return std::string();
        return std::string(hashToHex(hash).c_str());
    }

    inline String toDp(const std::string &s) { return String(s.c_str()); }
    inline std::string fromDp(const String &s) { return std::string(s.c_str()); }

    // ===========================================
    // Records - POD structs with members()
    // ===========================================

    /// Ledger entry as persisted. Empty strings stand for absent optionals.
    struct EntryRecord {
        String entry_id;
        String tenant_id;
        String account_id;
        u8 entry_type = 0;
        u8 status = 0;
        i64 occurred_at = 0;
        String currency;
        i64 balance_delta = 0;
        i64 held_delta = 0;
        String contract_id;
        String milestone_id;
        String obligation_id;
        String claim_id;
        String external_transaction_id;
        String source_subject_kind;
        String source_subject_id;
        String idempotency_key;
        String reason_code;
        String reverses_entry_id;
        i64 sequence = 0;
        String previous_hash;
        String entry_hash;
        i64 created_at = 0;

        auto members() {
            return std::tie(entry_id, tenant_id, account_id, entry_type, status, occurred_at, currency, balance_delta,
                            held_delta, contract_id, milestone_id, obligation_id, claim_id, external_transaction_id,
                            source_subject_kind, source_subject_id, idempotency_key, reason_code, reverses_entry_id,
                            sequence, previous_hash, entry_hash, created_at);
        }
        auto members() const {
            return std::tie(entry_id, tenant_id, account_id, entry_type, status, occurred_at, currency, balance_delta,
                            held_delta, contract_id, milestone_id, obligation_id, claim_id, external_transaction_id,
                            source_subject_kind, source_subject_id, idempotency_key, reason_code, reverses_entry_id,
                            sequence, previous_hash, entry_hash, created_at);
        }
    };

    struct AllocationRecord {
        String allocation_id;
        String tenant_id;
        String entry_id;
        u8 allocation_type = 0;
        i64 amount = 0;
        String currency;
        String obligation_id;
        String milestone_id;
        String external_line_id;
        String target_subject_kind;
        String target_subject_id;
        i64 occurred_at = 0;

        auto members() {
            return std::tie(allocation_id, tenant_id, entry_id, allocation_type, amount, currency, obligation_id,
                            milestone_id, external_line_id, target_subject_kind, target_subject_id, occurred_at);
        }
        auto members() const {
            return std::tie(allocation_id, tenant_id, entry_id, allocation_type, amount, currency, obligation_id,
                            milestone_id, external_line_id, target_subject_kind, target_subject_id, occurred_at);
        }
    };

    struct ClaimEventRecord {
        String event_id;
        String tenant_id;
        String contract_id;
        String claim_id;
        u8 event_type = 0;
        u8 status_after = 0;
        i64 occurred_at = 0;
        String actor_kind;
        String actor_id;
        String ledger_entry_id;
        String note;

        auto members() {
            return std::tie(event_id, tenant_id, contract_id, claim_id, event_type, status_after, occurred_at,
                            actor_kind, actor_id, ledger_entry_id, note);
        }
        auto members() const {
            return std::tie(event_id, tenant_id, contract_id, claim_id, event_type, status_after, occurred_at,
                            actor_kind, actor_id, ledger_entry_id, note);
        }
    };

    /// Append-only status flip for an entry (posted -> reversed). Deltas never change.
    struct StatusChangeRecord {
        String entry_id;
        u8 status = 0;
        i64 changed_at = 0;

        auto members() { return std::tie(entry_id, status, changed_at); }
        auto members() const { return std::tie(entry_id, status, changed_at); }
    };

    /// Result of re-folding an account from disk
    struct AccountFold {
        i64 balance = 0;
        i64 held = 0;
        i64 entry_count = 0;
    };

    /// Storage configuration options
    struct OpenOptions {
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;
    };

    // ===========================================
    // FileStore - append-only ledger journal
    // ===========================================

    /// Not synchronized; wrap in storage::Journal for concurrent use.
    class FileStore {
      public:
        inline FileStore() : is_open_(false), sync_mode_(OpenOptions::Synchronous::NORMAL) {}

        inline ~FileStore() { close(); }

        // Non-copyable, movable
        FileStore(const FileStore &) = delete;
        FileStore &operator=(const FileStore &) = delete;

        inline FileStore(FileStore &&other) noexcept
            : base_path_(std::move(other.base_path_)), is_open_(other.is_open_), sync_mode_(other.sync_mode_),
              entry_index_(std::move(other.entry_index_)), account_entries_(std::move(other.account_entries_)),
              allocation_index_(std::move(other.allocation_index_)),
              claim_event_index_(std::move(other.claim_event_index_)),
              status_overrides_(std::move(other.status_overrides_)) {
            other.is_open_ = false;
        }

        /// Open or create storage at given path (directory)
        inline Result<void, Error> open(const String &path, const OpenOptions &opts = OpenOptions{}) {
            try {
                base_path_ = std::string(path.c_str());
                sync_mode_ = opts.sync_mode;

                std::filesystem::create_directories(base_path_);
                loadIndexes();

                is_open_ = true;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                is_open_ = false;
                return Result<void, Error>::err(Error::io_error(String(e.what())));
            }
        }

        inline void close() { is_open_ = false; }

        inline bool isOpen() const { return is_open_; }

        /// Create the record files if missing. Idempotent.
        inline Result<void, Error> initializeCoreSchema() {
            if (!is_open_)
                return Result<void, Error>::err(Error::invalid_argument("Store not open"));

            try {
                for (const char *name : {"entries.dat", "allocations.dat", "claim_events.dat", "status.dat"}) {
                    auto path = base_path_ / name;
                    if (!std::filesystem::exists(path)) {
                        std::ofstream(path, std::ios::binary).close();
                    }
                }
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                return Result<void, Error>::err(Error::io_error(String(e.what())));
            }
        }

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        class TxGuard {
          public:
            inline explicit TxGuard(FileStore &store) : store_(store), committed_(false) { store_.clearPending(); }

            inline ~TxGuard() {
                if (!committed_)
                    store_.clearPending();
            }

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            /// Flush staged records. On failure nothing staged is indexed.
            inline Result<void, Error> commit() {
                if (committed_)
                    return Result<void, Error>::ok();
                committed_ = true;
                try {
                    store_.flushPending();
                    return Result<void, Error>::ok();
                } catch (const std::exception &e) {
                    store_.clearPending();
                    return Result<void, Error>::err(Error::io_error(String(e.what())));
                }
            }

            inline void rollback() {
                if (!committed_) {
                    store_.clearPending();
                    committed_ = true;
                }
            }

          private:
            FileStore &store_;
            bool committed_;
        };

        inline std::unique_ptr<TxGuard> beginTransaction() { return std::make_unique<TxGuard>(*this); }

        // ===========================================
        // Staging
        // ===========================================

        inline Result<void, Error> storeEntry(const EntryRecord &record) {
            if (!is_open_)
                return Result<void, Error>::err(Error::invalid_argument("Store not open"));
            std::string key(record.entry_id.c_str());
            if (entry_index_.count(key) > 0)
                return Result<void, Error>::err(Error::already_exists("Entry already journaled"));
            pending_entries_.push_back(record);
            pending_entries_.back().created_at = currentTimestamp();
            return Result<void, Error>::ok();
        }

        inline Result<void, Error> storeAllocation(const AllocationRecord &record) {
            if (!is_open_)
                return Result<void, Error>::err(Error::invalid_argument("Store not open"));
            pending_allocations_.push_back(record);
            return Result<void, Error>::ok();
        }

        inline Result<void, Error> storeClaimEvent(const ClaimEventRecord &record) {
            if (!is_open_)
                return Result<void, Error>::err(Error::invalid_argument("Store not open"));
            pending_claim_events_.push_back(record);
            return Result<void, Error>::ok();
        }

        inline Result<void, Error> storeStatusChange(const StatusChangeRecord &record) {
            if (!is_open_)
                return Result<void, Error>::err(Error::invalid_argument("Store not open"));
            pending_status_.push_back(record);
            return Result<void, Error>::ok();
        }

        // ===========================================
        // Queries (committed records only)
        // ===========================================

        /// Entry with its latest status applied
        inline Optional<EntryRecord> getEntry(const String &entry_id) {
            if (!is_open_)
                return Optional<EntryRecord>();

            auto it = entry_index_.find(std::string(entry_id.c_str()));
            if (it == entry_index_.end())
                return Optional<EntryRecord>();

            auto record = readRecordAt<EntryRecord>(base_path_ / "entries.dat", it->second);
            if (!record.has_value())
                return Optional<EntryRecord>();
            applyStatusOverride(*record);
            return record;
        }

        /// All entries of one account ordered by sequence
        inline Vector<EntryRecord> entriesForAccount(const String &tenant_id, const String &account_id) {
            Vector<EntryRecord> entries;
            if (!is_open_)
                return entries;

            auto it = account_entries_.find(accountKey(tenant_id, account_id));
            if (it == account_entries_.end())
                return entries;

            for (const auto &entry_id : it->second) {
                auto record = getEntry(String(entry_id.c_str()));
                if (record.has_value())
                    entries.push_back(*record);
            }

            std::sort(entries.begin(), entries.end(),
                      [](const EntryRecord &a, const EntryRecord &b) { return a.sequence < b.sequence; });
            return entries;
        }

        inline Vector<AllocationRecord> allocationsForEntry(const String &entry_id) {
            Vector<AllocationRecord> allocations;
            if (!is_open_)
                return allocations;

            auto it = allocation_index_.find(std::string(entry_id.c_str()));
            if (it == allocation_index_.end())
                return allocations;

            for (auto offset : it->second) {
                auto record = readRecordAt<AllocationRecord>(base_path_ / "allocations.dat", offset);
                if (record.has_value())
                    allocations.push_back(*record);
            }
            return allocations;
        }

        inline Vector<ClaimEventRecord> claimEventsForClaim(const String &claim_id) {
            Vector<ClaimEventRecord> events;
            if (!is_open_)
                return events;

            auto it = claim_event_index_.find(std::string(claim_id.c_str()));
            if (it == claim_event_index_.end())
                return events;

            for (auto offset : it->second) {
                auto record = readRecordAt<ClaimEventRecord>(base_path_ / "claim_events.dat", offset);
                if (record.has_value())
                    events.push_back(*record);
            }
            return events;
        }

        // ===========================================
        // Verification & Integrity
        // ===========================================

        /// Recompute balance/held from journaled entries. Status values
        /// 1 (posted) and 2 (reversed) are folded; everything else is skipped.
        inline Result<AccountFold, Error> foldAccount(const String &tenant_id, const String &account_id) {
            if (!is_open_)
                return Result<AccountFold, Error>::err(Error::invalid_argument("Store not open"));

            AccountFold fold;
            for (const auto &entry : entriesForAccount(tenant_id, account_id)) {
                if (entry.status != 1 && entry.status != 2)
                    continue;
                fold.balance += entry.balance_delta;
                fold.held += entry.held_delta;
                fold.entry_count++;
            }
            return Result<AccountFold, Error>::ok(fold);
        }

        /// Sequences of one account run 1..n with no gaps
        inline Result<bool, Error> verifySequenceContinuity(const String &tenant_id, const String &account_id) {
            if (!is_open_)
                return Result<bool, Error>::err(Error::invalid_argument("Store not open"));

            i64 expected = 1;
            for (const auto &entry : entriesForAccount(tenant_id, account_id)) {
                if (entry.sequence != expected)
                    return Result<bool, Error>::ok(false);
                expected++;
            }
            return Result<bool, Error>::ok(true);
        }

        // ===========================================
        // Statistics & Diagnostics
        // ===========================================

        inline i64 getEntryCount() const { return is_open_ ? static_cast<i64>(entry_index_.size()) : 0; }

        inline i64 getAllocationCount() const {
            if (!is_open_)
                return 0;
            i64 count = 0;
            for (const auto &[_, offsets] : allocation_index_)
                count += static_cast<i64>(offsets.size());
            return count;
        }

        inline i64 getClaimEventCount() const {
            if (!is_open_)
                return 0;
            i64 count = 0;
            for (const auto &[_, offsets] : claim_event_index_)
                count += static_cast<i64>(offsets.size());
            return count;
        }

        inline Result<bool, Error> quickCheck() {
            if (!is_open_)
                return Result<bool, Error>::err(Error::invalid_argument("Store not open"));

            try {
                bool exists = std::filesystem::exists(base_path_ / "entries.dat") &&
                              std::filesystem::exists(base_path_ / "allocations.dat") &&
                              std::filesystem::exists(base_path_ / "claim_events.dat") &&
                              std::filesystem::exists(base_path_ / "status.dat");
                return Result<bool, Error>::ok(exists);
            } catch (const std::exception &e) {
                return Result<bool, Error>::err(Error::io_error(String(e.what())));
            }
        }

      private:
        // ===========================================
        // File I/O with datapod serialization
        // ===========================================

        inline static std::string accountKey(const String &tenant_id, const String &account_id) {
            return std::string(tenant_id.c_str()) + "/" + std::string(account_id.c_str());
        }

        template <typename T>
        inline void appendRecord(const std::filesystem::path &file, const T &record, u64 &offset) {
            std::ofstream out(file, std::ios::binary | std::ios::app);
            if (!out)
                throw std::runtime_error("Failed to open file for writing");

            offset = out.tellp();

            T mutable_record = record;
            auto buffer = datapod::serialize(mutable_record);
            u32 len = static_cast<u32>(buffer.size());

            out.write(reinterpret_cast<const char *>(&len), sizeof(len));
            out.write(reinterpret_cast<const char *>(buffer.data()), buffer.size());
            if (!out)
                throw std::runtime_error("Failed to append record");

            if (sync_mode_ == OpenOptions::Synchronous::FULL) {
                out.flush();
            }
        }

        template <typename T> inline Optional<T> readRecordAt(const std::filesystem::path &file, u64 offset) {
            std::ifstream in(file, std::ios::binary);
            if (!in)
                return Optional<T>();

            in.seekg(offset);

            u32 len;
            in.read(reinterpret_cast<char *>(&len), sizeof(len));
            if (!in)
                return Optional<T>();

            ByteBuf data(len);
            in.read(reinterpret_cast<char *>(data.data()), len);
            if (!in)
                return Optional<T>();

            return Optional<T>(datapod::deserialize<Mode::NONE, T>(data));
        }

        /// Visit every record of a file with its offset
        template <typename T, typename Fn> inline void scanRecords(const std::filesystem::path &file, Fn &&fn) {
            std::ifstream in(file, std::ios::binary);
            if (!in)
                return;

            while (in) {
                u64 record_offset = in.tellg();

                u32 len;
                in.read(reinterpret_cast<char *>(&len), sizeof(len));
                if (!in)
                    break;

                ByteBuf data(len);
                in.read(reinterpret_cast<char *>(data.data()), len);
                if (!in)
                    break;

                fn(datapod::deserialize<Mode::NONE, T>(data), record_offset);
            }
        }

        inline void applyStatusOverride(EntryRecord &record) const {
            auto it = status_overrides_.find(std::string(record.entry_id.c_str()));
            if (it != status_overrides_.end())
                record.status = it->second;
        }

        // ===========================================
        // Index management
        // ===========================================

        inline void loadIndexes() {
            entry_index_.clear();
            account_entries_.clear();
            allocation_index_.clear();
            claim_event_index_.clear();
            status_overrides_.clear();

            scanRecords<EntryRecord>(base_path_ / "entries.dat", [this](const EntryRecord &record, u64 offset) {
                indexEntry(record, offset);
            });
            scanRecords<AllocationRecord>(base_path_ / "allocations.dat",
                                          [this](const AllocationRecord &record, u64 offset) {
                                              allocation_index_[std::string(record.entry_id.c_str())].push_back(offset);
                                          });
            scanRecords<ClaimEventRecord>(base_path_ / "claim_events.dat",
                                          [this](const ClaimEventRecord &record, u64 offset) {
                                              claim_event_index_[std::string(record.claim_id.c_str())].push_back(offset);
                                          });
            scanRecords<StatusChangeRecord>(base_path_ / "status.dat", [this](const StatusChangeRecord &record, u64) {
                status_overrides_[std::string(record.entry_id.c_str())] = record.status;
            });
        }

        inline void indexEntry(const EntryRecord &record, u64 offset) {
            std::string entry_id(record.entry_id.c_str());
            entry_index_[entry_id] = offset;
            account_entries_[accountKey(record.tenant_id, record.account_id)].push_back(entry_id);
        }

        inline void flushPending() {
            for (const auto &record : pending_entries_) {
                u64 offset;
                appendRecord(base_path_ / "entries.dat", record, offset);
                indexEntry(record, offset);
            }
            pending_entries_.clear();

            for (const auto &record : pending_allocations_) {
                u64 offset;
                appendRecord(base_path_ / "allocations.dat", record, offset);
                allocation_index_[std::string(record.entry_id.c_str())].push_back(offset);
            }
            pending_allocations_.clear();

            for (const auto &record : pending_claim_events_) {
                u64 offset;
                appendRecord(base_path_ / "claim_events.dat", record, offset);
                claim_event_index_[std::string(record.claim_id.c_str())].push_back(offset);
            }
            pending_claim_events_.clear();

            for (const auto &record : pending_status_) {
                u64 offset;
                appendRecord(base_path_ / "status.dat", record, offset);
                status_overrides_[std::string(record.entry_id.c_str())] = record.status;
            }
            pending_status_.clear();
        }

        inline void clearPending() {
            pending_entries_.clear();
            pending_allocations_.clear();
            pending_claim_events_.clear();
            pending_status_.clear();
        }

        // ===========================================
        // Member variables
        // ===========================================

        std::filesystem::path base_path_;
        bool is_open_;
        OpenOptions::Synchronous sync_mode_;

        // In-memory indexes
        std::unordered_map<std::string, u64> entry_index_;
        std::unordered_map<std::string, std::vector<std::string>> account_entries_;
        std::unordered_map<std::string, std::vector<u64>> allocation_index_;
        std::unordered_map<std::string, std::vector<u64>> claim_event_index_;
        std::unordered_map<std::string, u8> status_overrides_;

        // Pending writes
        Vector<EntryRecord> pending_entries_;
        Vector<AllocationRecord> pending_allocations_;
        Vector<ClaimEventRecord> pending_claim_events_;
        Vector<StatusChangeRecord> pending_status_;
    };

} // namespace surety::storage
