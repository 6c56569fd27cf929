// ARENA - NFT Voting Position
// Copyright (c) 2024 ARENA Developers
// MIT License

#ifndef ARENA_FRONTEND_VOTING_POSITION_H
#define ARENA_FRONTEND_VOTING_POSITION_H

#include "arena/arena/battle_arena.h"
#include "arena/core/types.h"
#include "arena/interfaces/token.h"

#include <memory>

namespace arena {
namespace frontend {

/**
 * Voting front end. Each voting position is a position NFT owned by the
 * voter; every operation on a position checks ownership of that NFT.
 * Dai and zoo move straight between the voter and the arena, so the voter
 * approves the arena as spender.
 */
class NftVotingPosition {
public:
    NftVotingPosition(const Address& self, std::shared_ptr<NftBattleArena> arena,
                      std::shared_ptr<INonFungibleToken> positionToken);

    PositionId CreateNewVotingPosition(const Address& voter, PositionId stakingId, Amount amount);

    void AddDaiToPosition(const Address& owner, PositionId votingId, Amount amount);

    void AddZooToPosition(const Address& owner, PositionId votingId, Amount amount);

    Amount WithdrawDaiFromVotingPosition(const Address& owner, PositionId votingId,
                                         const Address& beneficiary, Amount amount);

    Amount WithdrawZooFromVotingPosition(const Address& owner, PositionId votingId,
                                         const Address& beneficiary, Amount amount);

    VoterClaim ClaimRewardFromVoting(const Address& owner, PositionId votingId,
                                     const Address& beneficiary);

    Amount ClaimIncentiveVoterReward(const Address& owner, PositionId votingId,
                                     const Address& beneficiary);

    const Address& GetAddress() const { return self_; }

private:
    void RequireOwner(const Address& owner, PositionId votingId) const;

    Address self_;
    std::shared_ptr<NftBattleArena> arena_;
    std::shared_ptr<INonFungibleToken> positionToken_;
};

} // namespace frontend
} // namespace arena

#endif // ARENA_FRONTEND_VOTING_POSITION_H
