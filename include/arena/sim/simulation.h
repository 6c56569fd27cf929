// ARENA - Epoch Simulation
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// Drives a complete arena on in-memory collaborators under mock time:
// stake, vote, pair, battle, claim and withdraw for a number of epochs.

#ifndef ARENA_SIM_SIMULATION_H
#define ARENA_SIM_SIMULATION_H

#include "arena/arena/battle_arena.h"
#include "arena/arena/params.h"
#include "arena/arena/stage_clock.h"
#include "arena/core/types.h"
#include "arena/frontend/staking_position.h"
#include "arena/frontend/voting_position.h"
#include "arena/listing/listing_list.h"
#include "arena/policy/zoo_functions.h"
#include "arena/sim/memory_collaborators.h"

#include <memory>
#include <string>
#include <vector>

namespace arena {
namespace sim {

/// Mock clock start of a simulation
constexpr Timestamp SIM_START_TIME = 1700000000;

struct SimulationReport {
    Epoch epochsRun{0};
    size_t battles{0};
    size_t arenaBattles{0};
    size_t arenaDefeated{0};        // arena battles won by the position

    Amount daiDeposited{0};
    Amount daiWithdrawn{0};
    Amount stakerDai{0};
    Amount voterDai{0};
    Amount voterZoo{0};
    Amount incentiveZoo{0};
    Amount treasuryDai{0};

    /// Vault shares still held by the arena after everyone left
    Amount sharesLeft{0};

    std::string ToString() const;
};

class Simulation {
public:
    /// Enables mock time and wires every collaborator
    explicit Simulation(const ArenaParams& params, Timestamp start = SIM_START_TIME);

    /// Run params.sim.epochs epochs, then claim, withdraw and unstake everything
    SimulationReport Run();

    NftBattleArena& GetArena() { return *arena_; }
    InMemoryToken& GetDai() { return *dai_; }
    InMemoryToken& GetZoo() { return *zoo_; }
    InMemoryVault& GetVault() { return *vault_; }

    const std::vector<PositionId>& GetStakingIds() const { return stakingIds_; }
    const std::vector<PositionId>& GetVotingIds() const { return votingIds_; }

private:
    struct Voter {
        Address owner;
        PositionId votingId{0};
    };

    void MoveToStage(Stage stage);

    void StakeAll();
    void VoteAll();
    void PairAll();
    void AddZooVotes();
    void DecideBattles();
    void ClaimAll();
    void LeaveAll();

    uint64_t NextRandomWord();

    ArenaParams params_;
    SimulationReport report_;

    Address owner_;
    Address collection_;
    ArenaAddresses addresses_;

    std::shared_ptr<InMemoryToken> dai_;
    std::shared_ptr<InMemoryToken> zoo_;
    std::shared_ptr<InMemoryVault> vault_;
    std::shared_ptr<policy::ZooFunctions> policy_;
    std::shared_ptr<EpochStageClock> clock_;
    std::shared_ptr<listing::ListingList> registry_;
    std::shared_ptr<NftBattleArena> arena_;

    std::shared_ptr<InMemoryNft> collectionToken_;
    std::shared_ptr<InMemoryNft> stakingToken_;
    std::shared_ptr<InMemoryNft> votingToken_;
    std::unique_ptr<frontend::NftStakingPosition> stakingFrontEnd_;
    std::unique_ptr<frontend::NftVotingPosition> votingFrontEnd_;

    std::vector<Address> stakerOwners_;
    std::vector<PositionId> stakingIds_;
    std::vector<Voter> voters_;
    std::vector<PositionId> votingIds_;

    uint64_t randomCounter_{0};
};

} // namespace sim
} // namespace arena

#endif // ARENA_SIM_SIMULATION_H
