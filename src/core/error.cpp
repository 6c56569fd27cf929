// ARENA - Error Codes Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/core/error.h"

namespace arena {

const char* ArenaErrorToString(ArenaError err) {
    switch (err) {
        case ArenaError::OK: return "OK";

        case ArenaError::INVALID_STAGE: return "Invalid stage";

        case ArenaError::NOT_OWNER: return "Not the position owner";
        case ArenaError::UNAUTHORIZED_CALLER: return "Unauthorized caller";

        case ArenaError::POSITION_NOT_FOUND: return "Position not found";
        case ArenaError::POSITION_NOT_ACTIVE: return "Position not active";
        case ArenaError::ZERO_AMOUNT: return "Zero amount";
        case ArenaError::ZOO_EXCEEDS_DAI: return "Zoo invested would exceed dai invested";
        case ArenaError::WITHDRAW_EXCEEDS_INVESTED: return "Withdrawal exceeds invested amount";
        case ArenaError::VOTES_DECREASED: return "Recomputed votes are lower";
        case ArenaError::NO_VOTES: return "Position has no votes";
        case ArenaError::ALREADY_PAIRED: return "Position already paired";
        case ArenaError::PAIR_NOT_FOUND: return "Pair not found";
        case ArenaError::WINNER_ALREADY_CHOSEN: return "Winner already chosen";
        case ArenaError::COLLECTION_NOT_ELIGIBLE: return "Collection not eligible";
        case ArenaError::INSUFFICIENT_WEIGHT: return "Insufficient collection weight";
        case ArenaError::RANDOM_ALREADY_REQUESTED: return "Random already requested";
        case ArenaError::ARITHMETIC_OVERFLOW: return "Arithmetic overflow";

        case ArenaError::RANDOM_NOT_READY: return "Random not ready";
        case ArenaError::EPOCH_NOT_FINISHED: return "Epoch not finished";

        case ArenaError::VAULT_MINT_FAILED: return "Vault mint failed";
        case ArenaError::VAULT_REDEEM_FAILED: return "Vault redeem failed";
        case ArenaError::TOKEN_TRANSFER_FAILED: return "Token transfer failed";
        case ArenaError::NFT_TRANSFER_FAILED: return "NFT transfer failed";

        default: return "Unknown error";
    }
}

const char* ArenaErrorClassToString(ArenaErrorClass cls) {
    switch (cls) {
        case ArenaErrorClass::None: return "None";
        case ArenaErrorClass::StageViolation: return "StageViolation";
        case ArenaErrorClass::OwnershipViolation: return "OwnershipViolation";
        case ArenaErrorClass::InvariantViolation: return "InvariantViolation";
        case ArenaErrorClass::NotReady: return "NotReady";
        case ArenaErrorClass::ExternalCollaboratorFailure: return "ExternalCollaboratorFailure";
        default: return "Unknown";
    }
}

ArenaErrorClass ClassifyArenaError(ArenaError err) {
    switch (err) {
        case ArenaError::OK:
            return ArenaErrorClass::None;

        case ArenaError::INVALID_STAGE:
            return ArenaErrorClass::StageViolation;

        case ArenaError::NOT_OWNER:
        case ArenaError::UNAUTHORIZED_CALLER:
            return ArenaErrorClass::OwnershipViolation;

        case ArenaError::RANDOM_NOT_READY:
        case ArenaError::EPOCH_NOT_FINISHED:
            return ArenaErrorClass::NotReady;

        case ArenaError::VAULT_MINT_FAILED:
        case ArenaError::VAULT_REDEEM_FAILED:
        case ArenaError::TOKEN_TRANSFER_FAILED:
        case ArenaError::NFT_TRANSFER_FAILED:
            return ArenaErrorClass::ExternalCollaboratorFailure;

        default:
            return ArenaErrorClass::InvariantViolation;
    }
}

ArenaException::ArenaException(ArenaError code)
    : std::runtime_error(ArenaErrorToString(code)), code_(code) {}

ArenaException::ArenaException(ArenaError code, const std::string& detail)
    : std::runtime_error(std::string(ArenaErrorToString(code)) + ": " + detail),
      code_(code) {}

} // namespace arena
