// ARENA - Transactions
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// All-or-nothing boundary around an arena operation. Small state objects
// are snapshotted with Track() before they are touched; stores that keep an
// undo journal are enrolled with Journal(). Calls into external
// collaborators register a compensating action with OnRollback(). If the
// transaction goes out of scope without Commit(), compensations run in
// reverse order and every tracked object is restored.

#ifndef ARENA_ARENA_TRANSACTION_H
#define ARENA_ARENA_TRANSACTION_H

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace arena {

class Transaction {
public:
    explicit Transaction(std::string name);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /// Snapshot state now; it is copied back on rollback
    template<typename T>
    void Track(T& state) {
        auto snapshot = std::make_shared<T>(state);
        T* target = &state;
        restores_.push_back([target, snapshot]() { *target = *snapshot; });
    }

    /// Open the store's undo journal; it is rolled back or committed with
    /// the transaction. T provides BeginJournal, CommitJournal and
    /// RollbackJournal.
    template<typename T>
    void Journal(T& store) {
        store.BeginJournal();
        T* target = &store;
        restores_.push_back([target]() { target->RollbackJournal(); });
        commits_.push_back([target]() { target->CommitJournal(); });
    }

    /// Register the inverse of a collaborator call that has succeeded.
    /// The action returns false when it could not be undone.
    void OnRollback(std::function<bool()> compensation, std::string description);

    /// Keep all changes
    void Commit() noexcept;

    bool IsCommitted() const noexcept { return committed_; }

    const std::string& GetName() const noexcept { return name_; }

    size_t CompensationCount() const noexcept { return compensations_.size(); }

private:
    struct Compensation {
        std::function<bool()> action;
        std::string description;
    };

    void Rollback() noexcept;

    std::string name_;
    std::vector<std::function<void()>> restores_;
    std::vector<std::function<void()>> commits_;
    std::vector<Compensation> compensations_;
    bool committed_{false};
};

} // namespace arena

#endif // ARENA_ARENA_TRANSACTION_H
