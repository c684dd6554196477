#pragma once

#include "ports/output/ITransferStore.hpp"
#include <algorithm>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace transfer::tests::mocks {

/**
 * @brief In-Memory транзакционное хранилище для unit-тестов
 *
 * Транзакция держит общий mutex до commit()/деструктора и работает с копией
 * состояния; commit() подменяет состояние копией, без commit() копия
 * выбрасывается. CHECK (balance >= 0) моделируется исключением в debit().
 *
 * Общий mutex сериализует транзакции целиком, поэтому блокировки строк
 * только учитываются: lockPair() пишет порядок в pairLocks(), а
 * debit()/credit() по счёту без FOR UPDATE в этой транзакции
 * увеличивают unlockedWrites().
 *
 * Хелперы (addAccount, account, transfers, ...) нельзя вызывать, пока жива транзакция.
 */
class InMemoryTransferStore : public ports::output::ITransferStore {
public:
    struct State {
        std::map<std::string, domain::Account> accounts;
        std::vector<domain::Transfer> transfers;        // порядок вставки
        std::vector<domain::Approval> approvals;
        std::vector<domain::AuditRecord> auditRecords;  // порядок вставки
    };

    std::unique_ptr<ports::output::IUnitOfWork> begin() override {
        return std::make_unique<UnitOfWork>(*this);
    }

    bool ping() override {
        return available_;
    }

    // ------------------------------------------------------------------
    // Настройка
    // ------------------------------------------------------------------

    void addAccount(const domain::Account& account) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.accounts[account.id] = account;
    }

    void setBalance(const std::string& accountId, const domain::Money& balance) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.accounts.at(accountId).balance = balance;
    }

    void deactivate(const std::string& accountId) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.accounts.at(accountId).active = false;
    }

    void setAvailable(bool available) { available_ = available; }

    // Fault injection: операции над счётом бросают исключение до clearFaults()
    void failDebitFor(const std::string& accountId, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        debitFaults_[accountId] = message;
    }

    void failCreditFor(const std::string& accountId, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        creditFaults_[accountId] = message;
    }

    void clearFaults() {
        std::lock_guard<std::mutex> lock(mutex_);
        debitFaults_.clear();
        creditFaults_.clear();
    }

    // ------------------------------------------------------------------
    // Проверки
    // ------------------------------------------------------------------

    domain::Account account(const std::string& accountId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.accounts.at(accountId);
    }

    std::vector<domain::Transfer> transfers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.transfers;
    }

    std::optional<domain::Transfer> transfer(const std::string& transferId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& t : state_.transfers) {
            if (t.id == transferId) return t;
        }
        return std::nullopt;
    }

    std::vector<domain::Approval> approvals() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.approvals;
    }

    std::optional<domain::Approval> approvalFor(const std::string& transferId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& a : state_.approvals) {
            if (a.transferId == transferId) return a;
        }
        return std::nullopt;
    }

    std::vector<domain::AuditRecord> auditRecords() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.auditRecords;
    }

    std::vector<domain::AuditAction> auditActionsFor(const std::string& transferId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::AuditAction> actions;
        for (const auto& r : state_.auditRecords) {
            if (r.transferId == transferId) actions.push_back(r.action);
        }
        return actions;
    }

    domain::Money totalBalance() const {
        std::lock_guard<std::mutex> lock(mutex_);
        domain::Money total;
        for (const auto& [id, a] : state_.accounts) {
            total = total + a.balance;
        }
        return total;
    }

    std::vector<std::vector<std::string>> pairLocks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pairLocks_;
    }

    int unlockedWrites() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return unlockedWrites_;
    }

    int sharedLocks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sharedLocks_;
    }

    int beginCount() const { return beginCount_; }
    int commitCount() const { return commitCount_; }
    int rollbackCount() const { return rollbackCount_; }

private:
    // ------------------------------------------------------------------
    // Репозитории поверх копии состояния
    // ------------------------------------------------------------------

    class AccountRepository : public ports::output::IAccountRepository {
    public:
        AccountRepository(State& state, InMemoryTransferStore& store) : state_(state), store_(store) {}

        std::optional<domain::Account> findById(const std::string& accountId) override {
            auto it = state_.accounts.find(accountId);
            if (it == state_.accounts.end()) return std::nullopt;
            return it->second;
        }

        std::optional<domain::Account> findActiveById(const std::string& accountId) override {
            auto account = findById(accountId);
            if (!account || !account->active) return std::nullopt;
            return account;
        }

        std::optional<domain::Account> lockActiveById(const std::string& accountId) override {
            auto account = findActiveById(accountId);
            if (account) {
                locked_.insert(accountId);
            }
            return account;
        }

        void lockPair(const std::string& firstAccountId, const std::string& secondAccountId) override {
            std::set<std::string> ordered{firstAccountId, secondAccountId};
            std::vector<std::string> taken;
            for (const auto& id : ordered) {
                if (state_.accounts.count(id)) {
                    locked_.insert(id);
                    taken.push_back(id);
                }
            }
            store_.pairLocks_.push_back(taken);
        }

        std::optional<domain::Account> lockSharedById(const std::string& accountId) override {
            ++store_.sharedLocks_;
            return findById(accountId);
        }

        std::vector<domain::Account> findAllActive() override {
            std::vector<domain::Account> result;
            for (const auto& [id, account] : state_.accounts) {
                if (account.active) result.push_back(account);
            }
            std::stable_sort(result.begin(), result.end(),
                [](const domain::Account& a, const domain::Account& b) { return a.name < b.name; });
            return result;
        }

        void debit(const std::string& accountId, const domain::Money& amount) override {
            if (!locked_.count(accountId)) ++store_.unlockedWrites_;
            if (auto fault = store_.debitFaults_.find(accountId); fault != store_.debitFaults_.end()) {
                throw std::runtime_error(fault->second);
            }
            auto it = state_.accounts.find(accountId);
            if (it == state_.accounts.end()) {
                throw std::runtime_error("Account not found: " + accountId);
            }
            auto balance = it->second.balance - amount;
            if (balance < domain::Money()) {
                throw std::runtime_error(
                    "new row for relation \"accounts\" violates check constraint \"positive_balance\"");
            }
            it->second.balance = balance;
        }

        void credit(const std::string& accountId, const domain::Money& amount) override {
            if (!locked_.count(accountId)) ++store_.unlockedWrites_;
            if (auto fault = store_.creditFaults_.find(accountId); fault != store_.creditFaults_.end()) {
                throw std::runtime_error(fault->second);
            }
            auto it = state_.accounts.find(accountId);
            if (it == state_.accounts.end()) {
                throw std::runtime_error("Account not found: " + accountId);
            }
            it->second.balance = it->second.balance + amount;
        }

    private:
        State& state_;
        InMemoryTransferStore& store_;
        std::set<std::string> locked_;  // FOR UPDATE в этой транзакции
    };

    class TransferRepository : public ports::output::ITransferRepository {
    public:
        explicit TransferRepository(State& state) : state_(state) {}

        void insert(const domain::Transfer& transfer) override {
            if (locate(transfer.id)) {
                throw std::runtime_error("duplicate key value violates unique constraint \"transfers_pkey\"");
            }
            state_.transfers.push_back(transfer);
        }

        void save(const domain::Transfer& transfer) override {
            if (auto existing = locate(transfer.id)) {
                *existing = transfer;
            } else {
                state_.transfers.push_back(transfer);
            }
        }

        std::optional<domain::Transfer> findById(const std::string& transferId) override {
            if (auto existing = locate(transferId)) return *existing;
            return std::nullopt;
        }

        std::optional<domain::Transfer> lockById(const std::string& transferId) override {
            return findById(transferId);
        }

        domain::Page<domain::Transfer> find(const domain::TransferFilter& filter) override {
            std::vector<domain::Transfer> matched;
            for (auto it = state_.transfers.rbegin(); it != state_.transfers.rend(); ++it) {
                const auto& t = *it;
                if (filter.accountId && !t.touches(*filter.accountId)) continue;
                if (filter.initiatedBy && t.initiatedBy != *filter.initiatedBy) continue;
                if (filter.status && t.status != *filter.status) continue;
                if (filter.from && t.createdAt < *filter.from) continue;
                if (filter.to && t.createdAt > *filter.to) continue;
                matched.push_back(t);
            }
            std::stable_sort(matched.begin(), matched.end(),
                [](const domain::Transfer& a, const domain::Transfer& b) { return a.createdAt > b.createdAt; });
            return paginate(matched, filter.limit, filter.offset);
        }

        std::vector<domain::Transfer> findAwaitingApproval(const std::string& excludingInitiator) override {
            std::vector<domain::Transfer> result;
            for (const auto& t : state_.transfers) {
                if (t.status != domain::TransferStatus::AWAITING_APPROVAL) continue;
                if (t.initiatedBy == excludingInitiator) continue;
                bool pending = std::any_of(state_.approvals.begin(), state_.approvals.end(),
                    [&t](const domain::Approval& a) {
                        return a.transferId == t.id && a.status == domain::ApprovalStatus::PENDING;
                    });
                if (pending) result.push_back(t);
            }
            std::stable_sort(result.begin(), result.end(),
                [](const domain::Transfer& a, const domain::Transfer& b) { return a.createdAt < b.createdAt; });
            return result;
        }

    private:
        State& state_;

        domain::Transfer* locate(const std::string& transferId) {
            for (auto& t : state_.transfers) {
                if (t.id == transferId) return &t;
            }
            return nullptr;
        }
    };

    class ApprovalRepository : public ports::output::IApprovalRepository {
    public:
        explicit ApprovalRepository(State& state) : state_(state) {}

        void insert(const domain::Approval& approval) override {
            for (const auto& a : state_.approvals) {
                if (a.transferId == approval.transferId) {
                    throw std::runtime_error("duplicate key value violates unique constraint \"approvals_transfer_id_key\"");
                }
            }
            state_.approvals.push_back(approval);
        }

        void update(const domain::Approval& approval) override {
            for (auto& a : state_.approvals) {
                if (a.id == approval.id) {
                    a = approval;
                    return;
                }
            }
            throw std::runtime_error("Approval not found: " + approval.id);
        }

        std::optional<domain::Approval> findByTransferId(const std::string& transferId) override {
            for (const auto& a : state_.approvals) {
                if (a.transferId == transferId) return a;
            }
            return std::nullopt;
        }

    private:
        State& state_;
    };

    class AuditRepository : public ports::output::IAuditRepository {
    public:
        explicit AuditRepository(State& state) : state_(state) {}

        void append(const domain::AuditRecord& record) override {
            state_.auditRecords.push_back(record);
        }

        domain::Page<domain::AuditRecord> find(const domain::AuditRecordFilter& filter) override {
            std::vector<domain::AuditRecord> matched;
            for (auto it = state_.auditRecords.rbegin(); it != state_.auditRecords.rend(); ++it) {
                const auto& r = *it;
                if (filter.actorId && r.actorId != filter.actorId) continue;
                if (filter.transferId && r.transferId != filter.transferId) continue;
                if (filter.accountId && r.accountId != filter.accountId) continue;
                if (!filter.actions.empty() &&
                    std::find(filter.actions.begin(), filter.actions.end(), r.action) == filter.actions.end()) continue;
                if (filter.from && r.createdAt < *filter.from) continue;
                if (filter.to && r.createdAt > *filter.to) continue;
                matched.push_back(r);
            }
            std::stable_sort(matched.begin(), matched.end(),
                [](const domain::AuditRecord& a, const domain::AuditRecord& b) { return a.createdAt > b.createdAt; });
            return paginate(matched, filter.limit, filter.offset);
        }

        std::vector<domain::AuditRecord> findByTransferId(const std::string& transferId) override {
            std::vector<domain::AuditRecord> result;
            for (const auto& r : state_.auditRecords) {
                if (r.transferId == transferId) result.push_back(r);
            }
            std::stable_sort(result.begin(), result.end(),
                [](const domain::AuditRecord& a, const domain::AuditRecord& b) { return a.createdAt < b.createdAt; });
            return result;
        }

    private:
        State& state_;
    };

    class UnitOfWork : public ports::output::IUnitOfWork {
    public:
        explicit UnitOfWork(InMemoryTransferStore& store)
            : store_(store)
            , lock_(store.mutex_)
            , working_(store.state_)
            , accounts_(working_, store)
            , transfers_(working_)
            , approvals_(working_)
            , auditRecords_(working_)
        {
            ++store_.beginCount_;
        }

        ~UnitOfWork() override {
            if (!committed_) {
                ++store_.rollbackCount_;
            }
        }

        ports::output::IAccountRepository& accounts() override { return accounts_; }
        ports::output::ITransferRepository& transfers() override { return transfers_; }
        ports::output::IApprovalRepository& approvals() override { return approvals_; }
        ports::output::IAuditRepository& auditRecords() override { return auditRecords_; }

        void commit() override {
            if (committed_) {
                throw std::logic_error("Transaction already committed");
            }
            store_.state_ = working_;
            committed_ = true;
            ++store_.commitCount_;
        }

    private:
        InMemoryTransferStore& store_;
        std::unique_lock<std::mutex> lock_;
        State working_;
        AccountRepository accounts_;
        TransferRepository transfers_;
        ApprovalRepository approvals_;
        AuditRepository auditRecords_;
        bool committed_ = false;
    };

    template <typename T>
    static domain::Page<T> paginate(const std::vector<T>& items, int limit, int offset) {
        domain::Page<T> page;
        page.total = static_cast<int64_t>(items.size());
        for (size_t i = static_cast<size_t>(offset); i < items.size() && page.items.size() < static_cast<size_t>(limit); ++i) {
            page.items.push_back(items[i]);
        }
        return page;
    }

    mutable std::mutex mutex_;
    State state_;
    std::map<std::string, std::string> debitFaults_;
    std::map<std::string, std::string> creditFaults_;
    std::vector<std::vector<std::string>> pairLocks_;
    int unlockedWrites_ = 0;
    int sharedLocks_ = 0;
    bool available_ = true;
    int beginCount_ = 0;
    int commitCount_ = 0;
    int rollbackCount_ = 0;
};

} // namespace transfer::tests::mocks
