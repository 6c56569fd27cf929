// ARENA - NFT Staking Position Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/frontend/staking_position.h"
#include "arena/arena/transaction.h"
#include "arena/core/error.h"
#include "arena/util/logging.h"

#include <stdexcept>

namespace arena {
namespace frontend {

NftStakingPosition::NftStakingPosition(const Address& self,
                                       std::shared_ptr<NftBattleArena> arena,
                                       std::shared_ptr<ICollectionRegistry> registry,
                                       std::shared_ptr<INonFungibleToken> positionToken)
    : self_(self),
      arena_(std::move(arena)),
      registry_(std::move(registry)),
      positionToken_(std::move(positionToken)) {
    if (!arena_ || !registry_ || !positionToken_) {
        throw std::invalid_argument("NftStakingPosition: missing collaborator");
    }
}

void NftStakingPosition::AddCollection(const Address& collection,
                                       std::shared_ptr<INonFungibleToken> token) {
    if (!token) {
        throw std::invalid_argument("NftStakingPosition: null collection token");
    }
    collections_[collection] = std::move(token);
}

void NftStakingPosition::RequireOwner(const Address& owner, PositionId stakingId) const {
    auto holder = positionToken_->OwnerOf(stakingId);
    Require(holder.has_value() && *holder == owner, ArenaError::NOT_OWNER,
            "staking position " + std::to_string(stakingId));
}

PositionId NftStakingPosition::StakeNft(const Address& owner, const Address& collection,
                                        TokenId tokenId) {
    Require(registry_->IsEligible(collection), ArenaError::COLLECTION_NOT_ELIGIBLE);
    auto it = collections_.find(collection);
    Require(it != collections_.end(), ArenaError::COLLECTION_NOT_ELIGIBLE, "unknown collection");
    auto token = it->second;

    auto holder = token->OwnerOf(tokenId);
    Require(holder.has_value() && *holder == owner, ArenaError::NOT_OWNER);

    Transaction tx("StakeNft");
    Require(token->TransferFrom(owner, self_, tokenId), ArenaError::NFT_TRANSFER_FAILED);
    const Address self = self_;
    tx.OnRollback([token, self, owner, tokenId]() { return token->TransferFrom(self, owner, tokenId); },
                  "return staked NFT");

    const PositionId id = arena_->CreateStakerPosition(self_, collection, tokenId);
    Require(positionToken_->Mint(owner, id), ArenaError::NFT_TRANSFER_FAILED,
            "position token " + std::to_string(id));

    custody_[id] = StakedToken{collection, tokenId};
    tx.Commit();
    return id;
}

void NftStakingPosition::UnstakeNft(const Address& owner, PositionId stakingId) {
    RequireOwner(owner, stakingId);
    auto it = custody_.find(stakingId);
    Require(it != custody_.end(), ArenaError::POSITION_NOT_FOUND);
    const StakedToken staked = it->second;
    auto token = collections_.at(staked.collection);

    Transaction tx("UnstakeNft");
    Require(token->TransferFrom(self_, owner, staked.tokenId), ArenaError::NFT_TRANSFER_FAILED);
    const Address self = self_;
    tx.OnRollback([token, self, owner, staked]() {
                      return token->TransferFrom(owner, self, staked.tokenId);
                  },
                  "take back unstaked NFT");

    arena_->RemoveStakerPosition(self_, stakingId);

    if (!positionToken_->Burn(stakingId)) {
        LOG_WARN(util::LogCategory::LEDGER) << "Position token " << stakingId
                                            << " was already burned";
    }
    custody_.erase(it);
    tx.Commit();
}

Amount NftStakingPosition::ClaimRewardFromStaking(const Address& owner, PositionId stakingId,
                                                  const Address& beneficiary) {
    RequireOwner(owner, stakingId);
    return arena_->ClaimRewardFromStaking(self_, stakingId, beneficiary);
}

Amount NftStakingPosition::ClaimIncentiveStakerReward(const Address& owner,
                                                      PositionId stakingId,
                                                      const Address& beneficiary) {
    RequireOwner(owner, stakingId);
    return arena_->ClaimIncentiveStakerReward(self_, stakingId, beneficiary);
}

std::optional<StakedToken> NftStakingPosition::GetStakedToken(PositionId stakingId) const {
    auto it = custody_.find(stakingId);
    if (it == custody_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace frontend
} // namespace arena
