// ARENA - NFT Staking Position
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// Staking front end. Takes custody of staked NFTs, represents each staking
// position as a position NFT owned by the staker and forwards position
// operations to the arena after checking ownership of that NFT.

#ifndef ARENA_FRONTEND_STAKING_POSITION_H
#define ARENA_FRONTEND_STAKING_POSITION_H

#include "arena/arena/battle_arena.h"
#include "arena/core/types.h"
#include "arena/interfaces/registry.h"
#include "arena/interfaces/token.h"

#include <map>
#include <memory>
#include <optional>
#include <utility>

namespace arena {
namespace frontend {

/// NFT held in custody for a staking position
struct StakedToken {
    Address collection;
    TokenId tokenId{0};
};

class NftStakingPosition {
public:
    NftStakingPosition(const Address& self, std::shared_ptr<NftBattleArena> arena,
                       std::shared_ptr<ICollectionRegistry> registry,
                       std::shared_ptr<INonFungibleToken> positionToken);

    /// Make a collection's token ledger known; staking still needs the
    /// registry to list the collection
    void AddCollection(const Address& collection, std::shared_ptr<INonFungibleToken> token);

    /**
     * Move tokenId into custody and open a staking position for it. The
     * staker receives a position NFT with the position id.
     *
     * @throws ArenaException COLLECTION_NOT_ELIGIBLE, NOT_OWNER,
     *         NFT_TRANSFER_FAILED, or whatever the arena rejects with
     */
    PositionId StakeNft(const Address& owner, const Address& collection, TokenId tokenId);

    /// Close the position, return the NFT and burn the position NFT
    void UnstakeNft(const Address& owner, PositionId stakingId);

    Amount ClaimRewardFromStaking(const Address& owner, PositionId stakingId,
                                  const Address& beneficiary);

    Amount ClaimIncentiveStakerReward(const Address& owner, PositionId stakingId,
                                      const Address& beneficiary);

    std::optional<StakedToken> GetStakedToken(PositionId stakingId) const;

    const Address& GetAddress() const { return self_; }

private:
    void RequireOwner(const Address& owner, PositionId stakingId) const;

    Address self_;
    std::shared_ptr<NftBattleArena> arena_;
    std::shared_ptr<ICollectionRegistry> registry_;
    std::shared_ptr<INonFungibleToken> positionToken_;
    std::map<Address, std::shared_ptr<INonFungibleToken>> collections_;
    std::map<PositionId, StakedToken> custody_;
};

} // namespace frontend
} // namespace arena

#endif // ARENA_FRONTEND_STAKING_POSITION_H
