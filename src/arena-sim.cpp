// ARENA Simulator - Main Entry Point
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// arena-sim runs the battle arena on in-memory tokens, an in-memory vault
// and the reference registry under a mock clock. It provides:
// - Configuration through arena.conf and command-line overrides
// - Stake, vote, pair, battle and claim cycles for a number of epochs
// - A summary of deposits, payouts and treasury income

#include "arena/arena/params.h"
#include "arena/core/error.h"
#include "arena/sim/simulation.h"
#include "arena/util/config.h"
#include "arena/util/logging.h"

#include <iostream>
#include <memory>
#include <string>

namespace arena {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "ARENA Simulator";

// ============================================================================
// Help
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: arena-sim [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Read configuration from FILE\n";
    std::cout << "  -genconf                   Print a sample configuration and exit\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error (default: info)\n";
    std::cout << "  -logfile=FILE              Also write the log to FILE\n";
    std::cout << "  -printtoconsole=0/1        Log to the console (default: 1)\n";
    std::cout << "  -debug=CAT[,CAT...]        Only log these categories\n";
    std::cout << "\nSimulation Options:\n";
    std::cout << "  -sim.epochs=N              Epochs to run (default: 5)\n";
    std::cout << "  -sim.stakers=N             Staked NFTs (default: 8)\n";
    std::cout << "  -sim.voters=N              Voters per backed NFT (default: 3)\n";
    std::cout << "  -sim.yieldbps=N            Vault yield per epoch in bps (default: 100)\n";
    std::cout << "  -sim.deposit=N             Dai per voter, whole tokens (default: 1000)\n";
    std::cout << "  -sim.seed=N                Deterministic randomness (default: 0, OS entropy)\n";
    std::cout << "\nAny [stages], [policy] or [incentives] key can be set the same way,\n";
    std::cout << "for example -stages.stake=60 or -policy.autofulfill=1.\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 ARENA Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Logging
// ============================================================================

void SetupLogging(const util::ConfigManager& config) {
    using namespace util::ConfigKeys;

    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(config.GetString(LOGLEVEL, "info"));
    logger.SetLevel(level);

    if (config.GetBool(PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.showTimestamp = false;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    std::string logPath = config.GetString(LOGFILE, "");
    if (!logPath.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = logPath;
        fileConfig.level = util::LogLevel::Debug;
        logger.AddSink(std::make_shared<util::FileSink>(fileConfig));
    }

    for (const auto& cat : config.GetList(DEBUG)) {
        logger.EnableCategory(cat);
    }
}

// ============================================================================
// Main
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager args;
    util::ConfigParseResult parsed = args.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.errorMessage << "\n";
        return 1;
    }

    if (args.GetBool("help", false) || args.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }
    if (args.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }
    if (args.GetBool("genconf", false)) {
        std::cout << util::ConfigManager::GenerateSampleConfig();
        return 0;
    }

    // File first, command line on top
    util::ConfigManager config;
    if (auto confPath = args.TryGetString(util::ConfigKeys::CONF)) {
        parsed = config.ParseFile(util::ConfigManager::ExpandTilde(*confPath));
        if (!parsed.success) {
            std::cerr << "Error reading " << parsed.errorFile << ":" << parsed.errorLine
                      << ": " << parsed.errorMessage << "\n";
            return 1;
        }
    }
    parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.errorMessage << "\n";
        return 1;
    }

    SetupLogging(config);

    ArenaParams params = ArenaParams::Default();
    parsed = LoadArenaParams(config, params);
    if (!parsed.success) {
        std::cerr << "Invalid configuration: " << parsed.errorMessage << "\n";
        return 1;
    }
    for (const auto& warning : parsed.warnings) {
        LOG_WARN(util::LogCategory::CONFIG) << warning;
    }

    LOG_INFO(util::LogCategory::DEFAULT) << CLIENT_NAME << " v" << VERSION << " starting";

    sim::Simulation simulation(params);
    sim::SimulationReport report = simulation.Run();

    std::cout << "Epochs run:        " << report.epochsRun << "\n";
    std::cout << "Battles:           " << report.battles << " (" << report.arenaBattles
              << " against the arena, " << report.arenaDefeated << " won)\n";
    std::cout << "Dai deposited:     " << report.daiDeposited << "\n";
    std::cout << "Dai withdrawn:     " << report.daiWithdrawn << "\n";
    std::cout << "Staker rewards:    " << report.stakerDai << " dai\n";
    std::cout << "Voter rewards:     " << report.voterDai << " dai, " << report.voterZoo
              << " zoo\n";
    std::cout << "Incentives:        " << report.incentiveZoo << " zoo\n";
    std::cout << "Treasury income:   " << report.treasuryDai << " dai\n";
    std::cout << "Shares left:       " << report.sharesLeft << "\n";

    util::Logger::Instance().Flush();
    return 0;
}

} // namespace arena

int main(int argc, char* argv[]) {
    try {
        return arena::AppMain(argc, argv);
    } catch (const arena::ArenaException& e) {
        std::cerr << "Arena error (" << arena::ArenaErrorClassToString(e.GetClass())
                  << "): " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
