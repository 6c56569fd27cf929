// ARENA - Transaction Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/arena/transaction.h"
#include "arena/util/logging.h"

#include <exception>
#include <utility>

namespace arena {

Transaction::Transaction(std::string name) : name_(std::move(name)) {}

Transaction::~Transaction() {
    if (!committed_) {
        Rollback();
    }
}

void Transaction::OnRollback(std::function<bool()> compensation, std::string description) {
    compensations_.push_back({std::move(compensation), std::move(description)});
}

void Transaction::Commit() noexcept {
    if (committed_) {
        return;
    }
    for (auto& commit : commits_) {
        commit();
    }
    committed_ = true;
}

void Transaction::Rollback() noexcept {
    LOG_DEBUG(util::LogCategory::LEDGER) << "Rolling back " << name_ << " ("
                                         << compensations_.size() << " compensations)";

    for (auto it = compensations_.rbegin(); it != compensations_.rend(); ++it) {
        try {
            if (!it->action()) {
                LOG_ERROR(util::LogCategory::LEDGER) << name_ << ": compensation failed: "
                                                     << it->description;
            }
        } catch (const std::exception& e) {
            LOG_ERROR(util::LogCategory::LEDGER) << name_ << ": compensation threw: "
                                                 << it->description << ": " << e.what();
        }
    }

    for (auto it = restores_.rbegin(); it != restores_.rend(); ++it) {
        try {
            (*it)();
        } catch (const std::exception& e) {
            LOG_ERROR(util::LogCategory::LEDGER) << name_ << ": restore threw: " << e.what();
        }
    }
    committed_ = true;
}

} // namespace arena
