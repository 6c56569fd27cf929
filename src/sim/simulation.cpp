// ARENA - Epoch Simulation Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/sim/simulation.h"
#include "arena/core/error.h"
#include "arena/core/random.h"
#include "arena/util/logging.h"
#include "arena/util/time.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace arena {
namespace sim {

namespace {

// Actor address ranges
constexpr uint64_t ADDR_ARENA = 0xA000;
constexpr uint64_t ADDR_TREASURY = 0xA001;
constexpr uint64_t ADDR_STAKING_FRONT_END = 0xA002;
constexpr uint64_t ADDR_VOTING_FRONT_END = 0xA003;
constexpr uint64_t ADDR_VAULT = 0xA004;
constexpr uint64_t ADDR_OWNER = 0xA005;
constexpr uint64_t ADDR_COLLECTION = 0xC000;
constexpr uint64_t ADDR_STAKERS = 0x10000;
constexpr uint64_t ADDR_VOTERS = 0x20000;

// Every fourth staker gets no votes and never battles
bool HasVoters(size_t stakerIndex) {
    return stakerIndex % 4 != 3;
}

uint64_t SplitMix64(uint64_t x) {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

} // namespace

std::string SimulationReport::ToString() const {
    std::ostringstream oss;
    oss << "SimulationReport(epochs=" << epochsRun
        << ", battles=" << battles
        << ", arenaBattles=" << arenaBattles
        << ", arenaDefeated=" << arenaDefeated
        << ", daiDeposited=" << daiDeposited
        << ", daiWithdrawn=" << daiWithdrawn
        << ", stakerDai=" << stakerDai
        << ", voterDai=" << voterDai
        << ", voterZoo=" << voterZoo
        << ", incentiveZoo=" << incentiveZoo
        << ", treasuryDai=" << treasuryDai
        << ", sharesLeft=" << sharesLeft << ")";
    return oss.str();
}

// ============================================================================
// Wiring
// ============================================================================

Simulation::Simulation(const ArenaParams& params, Timestamp start)
    : params_(params),
      owner_(Address::FromUint64(ADDR_OWNER)),
      collection_(Address::FromUint64(ADDR_COLLECTION)) {
    if (params_.sim.stakers == 0) {
        throw std::invalid_argument("Simulation needs at least one staker");
    }
    if (params_.sim.deposit <= 0) {
        throw std::invalid_argument("Simulation deposit must be positive");
    }

    util::EnableMockTime();
    util::SetMockTime(start);

    addresses_.self = Address::FromUint64(ADDR_ARENA);
    addresses_.treasury = Address::FromUint64(ADDR_TREASURY);
    addresses_.stakingFrontEnd = Address::FromUint64(ADDR_STAKING_FRONT_END);
    addresses_.votingFrontEnd = Address::FromUint64(ADDR_VOTING_FRONT_END);

    dai_ = std::make_shared<InMemoryToken>("DAI");
    zoo_ = std::make_shared<InMemoryToken>("ZOO");
    vault_ = std::make_shared<InMemoryVault>(dai_, Address::FromUint64(ADDR_VAULT));

    policy_ = std::make_shared<policy::ZooFunctions>(params_.policy);
    if (params_.sim.seed != 0) {
        policy_->SetPseudoRandomSeed(params_.sim.seed);
    }

    clock_ = std::make_shared<EpochStageClock>(policy_->GetStageDurations(), start);
    auto clock = clock_;
    registry_ = std::make_shared<listing::ListingList>(
        owner_, [clock]() { return clock->GetCurrentEpoch(); });
    registry_->AllowNewContractForStaking(owner_, collection_);
    registry_->SetArena(owner_, addresses_.self);

    ArenaCollaborators collaborators;
    collaborators.dai = dai_;
    collaborators.zoo = zoo_;
    collaborators.vault = vault_;
    collaborators.policy = policy_;
    collaborators.registry = registry_;
    collaborators.clock = clock_;
    arena_ = std::make_shared<NftBattleArena>(collaborators, addresses_, params_.incentives);

    // Zoo for arena wins and incentives
    const Amount maxLeagueReward =
        params_.policy.leagueZooRewards.empty()
            ? 0
            : *std::max_element(params_.policy.leagueZooRewards.begin(),
                                params_.policy.leagueZooRewards.end());
    const Amount perEpoch = CheckedAdd(
        CheckedAdd(params_.incentives.baseStakerReward, params_.incentives.baseVoterReward),
        maxLeagueReward * static_cast<Amount>(params_.sim.stakers));
    zoo_->Mint(addresses_.self, perEpoch * static_cast<Amount>(params_.sim.epochs + 1));

    collectionToken_ = std::make_shared<InMemoryNft>("Collection");
    stakingToken_ = std::make_shared<InMemoryNft>("StakingPosition");
    votingToken_ = std::make_shared<InMemoryNft>("VotingPosition");

    stakingFrontEnd_ = std::make_unique<frontend::NftStakingPosition>(
        addresses_.stakingFrontEnd, arena_, registry_, stakingToken_);
    stakingFrontEnd_->AddCollection(collection_, collectionToken_);
    votingFrontEnd_ = std::make_unique<frontend::NftVotingPosition>(
        addresses_.votingFrontEnd, arena_, votingToken_);

    LOG_INFO(util::LogCategory::SIM) << "Simulation wired: " << params_.ToString();
}

void Simulation::MoveToStage(Stage stage) {
    const Timestamp target = clock_->GetStageStart(stage);
    if (util::GetTime() < target) {
        util::SetMockTime(target);
    }
}

uint64_t Simulation::NextRandomWord() {
    if (params_.sim.seed == 0) {
        return GetRandUint64();
    }
    return SplitMix64(params_.sim.seed + randomCounter_++);
}

// ============================================================================
// Steps
// ============================================================================

void Simulation::StakeAll() {
    for (size_t i = 0; i < params_.sim.stakers; ++i) {
        const Address owner = Address::FromUint64(ADDR_STAKERS + i);
        const TokenId tokenId = i + 1;
        Require(collectionToken_->Mint(owner, tokenId), ArenaError::NFT_TRANSFER_FAILED,
                "collection token " + std::to_string(tokenId));
        stakerOwners_.push_back(owner);
        stakingIds_.push_back(stakingFrontEnd_->StakeNft(owner, collection_, tokenId));
    }
}

void Simulation::VoteAll() {
    for (size_t i = 0; i < stakingIds_.size(); ++i) {
        if (!HasVoters(i)) {
            continue;
        }
        // Uneven backing so positions land in different leagues
        const Amount deposit = params_.sim.deposit * static_cast<Amount>(i % 3 + 1);
        for (size_t j = 0; j < params_.sim.voters; ++j) {
            Voter voter;
            voter.owner = Address::FromUint64(ADDR_VOTERS + i * params_.sim.voters + j);
            dai_->Mint(voter.owner, deposit);
            dai_->Approve(voter.owner, addresses_.self, deposit);
            zoo_->Mint(voter.owner, params_.sim.deposit / 2);
            zoo_->Approve(voter.owner, addresses_.self, params_.sim.deposit / 2);

            const Amount first = deposit - deposit / 2;
            voter.votingId =
                votingFrontEnd_->CreateNewVotingPosition(voter.owner, stakingIds_[i], first);
            if (deposit > first) {
                votingFrontEnd_->AddDaiToPosition(voter.owner, voter.votingId, deposit - first);
            }
            report_.daiDeposited += deposit;
            voters_.push_back(voter);
            votingIds_.push_back(voter.votingId);
        }
    }
}

void Simulation::PairAll() {
    const Epoch epoch = clock_->GetCurrentEpoch();
    for (PositionId id : stakingIds_) {
        // Positions paired as an opponent are already in game
        auto partition = arena_->GetLedger().Index().GetPartition(id);
        if (!partition || *partition != Partition::Eligible) {
            continue;
        }
        PositionId opponent = arena_->PairNft(id);
        LogDebugF(util::LogCategory::SIM, "Epoch %llu: %llu paired with %llu",
                  static_cast<unsigned long long>(epoch), static_cast<unsigned long long>(id),
                  static_cast<unsigned long long>(opponent));
    }
}

void Simulation::AddZooVotes() {
    for (const Voter& voter : voters_) {
        auto position = arena_->GetVotingPosition(voter.votingId);
        if (!position || !position->IsActive() || position->zooInvested > 0) {
            continue;
        }
        const Amount amount = std::min(position->daiInvested, params_.sim.deposit / 2);
        if (amount > 0) {
            votingFrontEnd_->AddZooToPosition(voter.owner, voter.votingId, amount);
        }
    }
}

void Simulation::DecideBattles() {
    const Epoch epoch = clock_->GetCurrentEpoch();
    arena_->RequestRandom();
    if (!policy_->IsFulfilled()) {
        policy_->FulfillRandomWords(NextRandomWord());
    }

    const size_t count = arena_->GetPairs(epoch).size();
    for (size_t i = 0; i < count; ++i) {
        BattleOutcome outcome = arena_->ChooseWinnerInPair(i);
        ++report_.battles;
        if (outcome.arenaPair) {
            ++report_.arenaBattles;
            if (outcome.token1Won) {
                ++report_.arenaDefeated;
            }
        }
        LOG_DEBUG(util::LogCategory::SIM) << outcome.ToString();
    }
    arena_->UpdateEpoch();
}

void Simulation::ClaimAll() {
    for (size_t i = 0; i < stakingIds_.size(); ++i) {
        const Address& owner = stakerOwners_[i];
        report_.stakerDai += stakingFrontEnd_->ClaimRewardFromStaking(owner, stakingIds_[i], owner);
        report_.incentiveZoo +=
            stakingFrontEnd_->ClaimIncentiveStakerReward(owner, stakingIds_[i], owner);
    }
    for (const Voter& voter : voters_) {
        VoterClaim claim =
            votingFrontEnd_->ClaimRewardFromVoting(voter.owner, voter.votingId, voter.owner);
        report_.voterDai += claim.assets;
        report_.voterZoo += claim.zoo;
        report_.incentiveZoo +=
            votingFrontEnd_->ClaimIncentiveVoterReward(voter.owner, voter.votingId, voter.owner);
    }
}

void Simulation::LeaveAll() {
    for (const Voter& voter : voters_) {
        auto position = arena_->GetVotingPosition(voter.votingId);
        if (!position || !position->IsActive()) {
            continue;
        }
        report_.daiWithdrawn += votingFrontEnd_->WithdrawDaiFromVotingPosition(
            voter.owner, voter.votingId, voter.owner, position->daiInvested);
    }
    for (size_t i = 0; i < stakingIds_.size(); ++i) {
        stakingFrontEnd_->UnstakeNft(stakerOwners_[i], stakingIds_[i]);
    }
}

// ============================================================================
// Run
// ============================================================================

SimulationReport Simulation::Run() {
    ARENA_LOG_TIMER(util::LogCategory::SIM, "simulation");

    StakeAll();
    VoteAll();

    for (uint64_t n = 0; n < params_.sim.epochs; ++n) {
        const Epoch epoch = clock_->GetCurrentEpoch();
        if (n > 0) {
            ClaimAll();
        }

        MoveToStage(Stage::Pair);
        PairAll();

        MoveToStage(Stage::ZooVote);
        AddZooVotes();
        vault_->AccrueYield(params_.sim.yieldBps);

        MoveToStage(Stage::Winner);
        DecideBattles();
        ++report_.epochsRun;

        LOG_INFO(util::LogCategory::SIM) << "Epoch " << epoch << " done: "
                                         << arena_->GetPairs(epoch).size() << " battles";
    }

    ClaimAll();
    LeaveAll();

    report_.treasuryDai = dai_->BalanceOf(addresses_.treasury);
    report_.sharesLeft = vault_->BalanceOf(addresses_.self);
    LOG_INFO(util::LogCategory::SIM) << report_.ToString();
    return report_;
}

} // namespace sim
} // namespace arena
