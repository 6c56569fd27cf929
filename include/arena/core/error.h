// ARENA - Error Codes
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// Reason codes for rejected arena operations. Every failing operation
// throws an ArenaException carrying one of these codes; the operation
// leaves no partial state behind.

#ifndef ARENA_CORE_ERROR_H
#define ARENA_CORE_ERROR_H

#include <stdexcept>
#include <string>

namespace arena {

// ============================================================================
// Error Codes
// ============================================================================

enum class ArenaError {
    OK = 0,

    // Stage violations
    INVALID_STAGE,

    // Ownership violations
    NOT_OWNER,
    UNAUTHORIZED_CALLER,

    // Invariant violations
    POSITION_NOT_FOUND,
    POSITION_NOT_ACTIVE,
    ZERO_AMOUNT,
    ZOO_EXCEEDS_DAI,
    WITHDRAW_EXCEEDS_INVESTED,
    VOTES_DECREASED,
    NO_VOTES,
    ALREADY_PAIRED,
    PAIR_NOT_FOUND,
    WINNER_ALREADY_CHOSEN,
    COLLECTION_NOT_ELIGIBLE,
    INSUFFICIENT_WEIGHT,
    RANDOM_ALREADY_REQUESTED,
    ARITHMETIC_OVERFLOW,

    // Not ready
    RANDOM_NOT_READY,
    EPOCH_NOT_FINISHED,

    // External collaborator failures
    VAULT_MINT_FAILED,
    VAULT_REDEEM_FAILED,
    TOKEN_TRANSFER_FAILED,
    NFT_TRANSFER_FAILED,
};

/// The five classes of failure an operation can report
enum class ArenaErrorClass {
    None,
    StageViolation,
    OwnershipViolation,
    InvariantViolation,
    NotReady,
    ExternalCollaboratorFailure,
};

/// Convert error to string
const char* ArenaErrorToString(ArenaError err);

/// Convert error class to string
const char* ArenaErrorClassToString(ArenaErrorClass cls);

/// Map a reason code to its class
ArenaErrorClass ClassifyArenaError(ArenaError err);

// ============================================================================
// Exception
// ============================================================================

class ArenaException : public std::runtime_error {
public:
    explicit ArenaException(ArenaError code);
    ArenaException(ArenaError code, const std::string& detail);

    ArenaError GetCode() const noexcept { return code_; }
    ArenaErrorClass GetClass() const noexcept { return ClassifyArenaError(code_); }

private:
    ArenaError code_;
};

/// Throw ArenaException(err) unless condition holds
inline void Require(bool condition, ArenaError err) {
    if (!condition) {
        throw ArenaException(err);
    }
}

inline void Require(bool condition, ArenaError err, const std::string& detail) {
    if (!condition) {
        throw ArenaException(err, detail);
    }
}

} // namespace arena

#endif // ARENA_CORE_ERROR_H
