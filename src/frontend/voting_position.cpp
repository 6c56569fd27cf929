// ARENA - NFT Voting Position Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/frontend/voting_position.h"
#include "arena/core/error.h"
#include "arena/util/logging.h"

#include <stdexcept>

namespace arena {
namespace frontend {

NftVotingPosition::NftVotingPosition(const Address& self, std::shared_ptr<NftBattleArena> arena,
                                     std::shared_ptr<INonFungibleToken> positionToken)
    : self_(self), arena_(std::move(arena)), positionToken_(std::move(positionToken)) {
    if (!arena_ || !positionToken_) {
        throw std::invalid_argument("NftVotingPosition: missing collaborator");
    }
}

void NftVotingPosition::RequireOwner(const Address& owner, PositionId votingId) const {
    auto holder = positionToken_->OwnerOf(votingId);
    Require(holder.has_value() && *holder == owner, ArenaError::NOT_OWNER,
            "voting position " + std::to_string(votingId));
}

PositionId NftVotingPosition::CreateNewVotingPosition(const Address& voter, PositionId stakingId,
                                                      Amount amount) {
    const PositionId id = arena_->CreateVotingPosition(self_, stakingId, voter, amount);
    if (!positionToken_->Mint(voter, id)) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Voting position token " << id
                                             << " could not be minted";
        throw ArenaException(ArenaError::NFT_TRANSFER_FAILED, "position token");
    }
    return id;
}

void NftVotingPosition::AddDaiToPosition(const Address& owner, PositionId votingId,
                                         Amount amount) {
    RequireOwner(owner, votingId);
    arena_->AddDaiToVoting(self_, votingId, owner, amount);
}

void NftVotingPosition::AddZooToPosition(const Address& owner, PositionId votingId,
                                         Amount amount) {
    RequireOwner(owner, votingId);
    arena_->AddZooToVoting(self_, votingId, owner, amount);
}

Amount NftVotingPosition::WithdrawDaiFromVotingPosition(const Address& owner, PositionId votingId,
                                                        const Address& beneficiary,
                                                        Amount amount) {
    RequireOwner(owner, votingId);
    return arena_->WithdrawDaiFromVoting(self_, votingId, beneficiary, amount);
}

Amount NftVotingPosition::WithdrawZooFromVotingPosition(const Address& owner, PositionId votingId,
                                                        const Address& beneficiary,
                                                        Amount amount) {
    RequireOwner(owner, votingId);
    return arena_->WithdrawZooFromVoting(self_, votingId, beneficiary, amount);
}

VoterClaim NftVotingPosition::ClaimRewardFromVoting(const Address& owner, PositionId votingId,
                                                    const Address& beneficiary) {
    RequireOwner(owner, votingId);
    return arena_->ClaimRewardFromVoting(self_, votingId, beneficiary);
}

Amount NftVotingPosition::ClaimIncentiveVoterReward(const Address& owner, PositionId votingId,
                                                    const Address& beneficiary) {
    RequireOwner(owner, votingId);
    return arena_->ClaimIncentiveVoterReward(self_, votingId, beneficiary);
}

} // namespace frontend
} // namespace arena
