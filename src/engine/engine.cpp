#include <surety/engine/engine.hpp>

namespace surety {

    CommitmentEngine::CommitmentEngine(const subject::SubjectRegistry &registry, EngineConfig config)
        : registry_(registry), config_(std::move(config)),
          ledger_(config_.clock ? config_.clock : Clock(currentMillis), config_.log_level) {
        if (!config_.clock)
            config_.clock = currentMillis;
        ledger_.setLockTimeout(std::chrono::milliseconds(config_.lock_timeout_ms));
    }

    void CommitmentEngine::attachJournal(storage::Journal *journal) {
        journal_ = journal;
        ledger_.setJournal(journal);
    }

    std::string CommitmentEngine::scopedKey(const std::string &tenant_id, const std::string &id) {
        return tenant_id + "/" + id;
    }

    std::string CommitmentEngine::nextId(const char *prefix) { return std::string(prefix) + std::to_string(++next_id_); }

    Millis CommitmentEngine::now() const { return config_.clock(); }

    CommitmentEngine::BookPtr CommitmentEngine::findBook(const std::string &tenant_id,
                                                         const std::string &contract_id) const {
        std::shared_lock<std::shared_mutex> lock(books_mutex_);
        auto it = books_.find(scopedKey(tenant_id, contract_id));
        if (it == books_.end())
            return nullptr;
        return it->second;
    }

    CommitmentEngine::BookPtr CommitmentEngine::findOwningBook(IndexKind kind, const std::string &tenant_id,
                                                               const std::string &id) const {
        std::shared_lock<std::shared_mutex> lock(books_mutex_);
        auto child = children_.find(std::to_string(static_cast<int>(kind)) + ":" + scopedKey(tenant_id, id));
        if (child == children_.end())
            return nullptr;
        auto it = books_.find(scopedKey(tenant_id, child->second));
        if (it == books_.end())
            return nullptr;
        return it->second;
    }

    void CommitmentEngine::indexChild(IndexKind kind, const std::string &tenant_id, const std::string &id,
                                      const std::string &contract_id) {
        std::unique_lock<std::shared_mutex> lock(books_mutex_);
        children_[std::to_string(static_cast<int>(kind)) + ":" + scopedKey(tenant_id, id)] = contract_id;
    }

    CommitmentEngine::BookLock CommitmentEngine::lockBook(commitment::ContractBook &book) const {
        BookLock lock(book.mutex, std::defer_lock);
        (void)lock.try_lock_for(std::chrono::milliseconds(config_.lock_timeout_ms));
        return lock;
    }

    dp::Error CommitmentEngine::busy(const commitment::ContractBook &book) const {
        return concurrency_conflict("contract " + book.contract.id + " is busy; retry");
    }

} // namespace surety
