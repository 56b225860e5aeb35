// STAKEVAULT - Command Line Inspector
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Opens the journal in the data directory, replays it and prints the
// keeper and vault state.
//
// Usage: stakevault-cli [options] [command] [args]
//   info              Keeper summary and all vaults (default)
//   vault <address>   Ledger state and checkpoints of one vault
//   sampleconfig      Print a configuration template

#include <stakevault/db/database.h>
#include <stakevault/rewards/keeper.h>
#include <stakevault/service/service.h>
#include <stakevault/util/config.h>
#include <stakevault/util/logging.h>
#include <stakevault/vault/vault.h>

#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <getopt.h>

namespace stakevault {

// ============================================================================
// Version Information
// ============================================================================

static const char* VERSION = "0.1.0";

namespace defaults {
    constexpr const char* JOURNAL_DIRNAME = "journal";
    constexpr const char* LOG_FILENAME = "stakevault.log";
}

// ============================================================================
// Options
// ============================================================================

struct CliOptions {
    std::string configFile;
    std::string dataDir;
    std::map<std::string, std::string> overrides;
    std::vector<std::string> debugCategories;
    std::vector<std::string> args;
    bool logToFile{false};
};

void PrintHelp() {
    std::cout << "STAKEVAULT CLI v" << VERSION << "\n\n";
    std::cout << "Usage: stakevault-cli [options] [command] [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  info                       Keeper summary and vault list (default)\n";
    std::cout << "  vault <address>            Ledger state of one vault\n";
    std::cout << "  sampleconfig               Print a configuration template\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -c, --conf=FILE            Configuration file\n";
    std::cout << "  -d, --datadir=DIR          Data directory\n";
    std::cout << "  --logfile                  Also log to " << defaults::LOG_FILENAME << "\n";
    std::cout << "\nKeeper Options:\n";
    std::cout << "  --rewardsdelay=N           Seconds between rewards updates\n";
    std::cout << "  --rewardsminoracles=N      Signatures required per update\n";
    std::cout << "  --keeperowner=ADDR         Keeper administrator\n";
    std::cout << "\nLogging Options:\n";
    std::cout << "  --debug=CATEGORY           Enable debug for category (can repeat)\n";
    std::cout << "  --loglevel=LEVEL           Log level: trace, debug, info, warn, error\n";
    std::cout << "  --printtoconsole=0/1       Print log to console (default: 0)\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << "STAKEVAULT CLI v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 STAKEVAULT Developers\n";
    std::cout << "MIT License\n";
}

bool ParseCommandLine(int argc, char* argv[], CliOptions& options) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"datadir", required_argument, nullptr, 'd'},
        {"logfile", no_argument, nullptr, 1001},
        {"rewardsdelay", required_argument, nullptr, 1002},
        {"rewardsminoracles", required_argument, nullptr, 1003},
        {"keeperowner", required_argument, nullptr, 1004},
        {"debug", required_argument, nullptr, 1005},
        {"loglevel", required_argument, nullptr, 1006},
        {"printtoconsole", required_argument, nullptr, 1007},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    while ((opt = getopt_long(argc, argv, "hvc:d:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                PrintHelp();
                return false;
            case 'v':
                PrintVersion();
                return false;
            case 'c':
                options.configFile = optarg;
                break;
            case 'd':
                options.dataDir = optarg;
                break;
            case 1001:
                options.logToFile = true;
                break;
            case 1002:
                options.overrides[util::ConfigKeys::REWARDSDELAY] = optarg;
                break;
            case 1003:
                options.overrides[util::ConfigKeys::REWARDSMINORACLES] = optarg;
                break;
            case 1004:
                options.overrides[util::ConfigKeys::KEEPEROWNER] = optarg;
                break;
            case 1005:
                options.debugCategories.push_back(optarg);
                break;
            case 1006:
                options.overrides[util::ConfigKeys::LOGLEVEL] = optarg;
                break;
            case 1007:
                options.overrides[util::ConfigKeys::PRINTTOCONSOLE] = optarg;
                break;
            default:
                std::cerr << "Try 'stakevault-cli --help' for more information.\n";
                return false;
        }
    }

    for (int i = optind; i < argc; ++i) {
        options.args.push_back(argv[i]);
    }
    return true;
}

void SetupLogging(const util::ConfigManager& config, const CliOptions& options,
                  const std::string& dataDir) {
    auto& logger = util::Logger::Instance();
    logger.Initialize();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(
        config.GetString(util::ConfigKeys::LOGLEVEL, "info"));
    logger.SetLevel(level);

    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, false)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.useStderr = true;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    if (options.logToFile) {
        util::FileSink::Config fileConfig;
        fileConfig.path = (std::filesystem::path(dataDir) / defaults::LOG_FILENAME).string();
        fileConfig.level = util::LogLevel::Debug;
        logger.AddSink(std::make_shared<util::FileSink>(fileConfig));
    }

    for (const auto& cat : options.debugCategories) {
        logger.EnableCategory(cat);
    }
}

// ============================================================================
// Output
// ============================================================================

void PrintKeeper(const service::VaultService& svc) {
    const auto& keeper = svc.GetKeeper();
    rewards::RewardsRoot root = keeper.GetRewardsRoot();

    std::cout << "Keeper\n";
    std::cout << "  owner:              " << keeper.GetParams().owner.ToHex() << "\n";
    std::cout << "  oracles:            " << keeper.GetOracles().Size()
              << " (quorum " << keeper.GetRewardsMinOracles() << ")\n";
    std::cout << "  rewards root:       " << root.root.ToHex() << "\n";
    std::cout << "  previous root:      " << root.prevRoot.ToHex() << "\n";
    std::cout << "  nonce:              " << root.nonce << "\n";
    std::cout << "  last update:        " << root.lastUpdateTimestamp << "\n";
    std::cout << "  avg reward/second:  " << root.avgRewardPerSecond << "\n";
    std::cout << "  journal entries:    " << svc.GetJournalHead() << "\n";
}

void PrintVault(const service::VaultService& svc, const VaultId& id) {
    const vault::Vault* v = svc.GetVault(id);
    if (!v) {
        std::cout << "Vault " << id.ToHex() << " not found\n";
        return;
    }

    vault::LedgerState state = v->GetLedgerState();
    std::cout << "Vault " << id.ToHex() << "\n";
    std::cout << "  collateralized:     " << (v->IsCollateralized() ? "yes" : "no") << "\n";
    std::cout << "  escrow:             "
              << vault::MevEscrowModeToString(v->GetParams().escrowMode) << "\n";
    std::cout << "  fee:                " << state.feePercent << " bp\n";
    std::cout << "  total assets:       " << state.totalAssets << "\n";
    std::cout << "  total shares:       " << state.totalShares << "\n";
    std::cout << "  liquid balance:     " << state.liquidBalance << "\n";
    std::cout << "  queued shares:      " << state.queuedShares << "\n";
    std::cout << "  unclaimed assets:   " << state.unclaimedAssets << "\n";
    std::cout << "  tickets issued:     " << state.totalTicketsIssued << "\n";
    std::cout << "  open tickets:       " << state.ticketCount << "\n";
    std::cout << "  checkpoints:        " << state.checkpointCount << "\n";

    for (size_t i = 0; i < state.checkpointCount; ++i) {
        auto cp = v->GetCheckpoint(i);
        if (cp) {
            std::cout << "    [" << i << "] shares " << cp->cumulativeSharesBurned
                      << ", assets " << cp->cumulativeAssetsReleased << "\n";
        }
    }
}

// ============================================================================
// Main Entry
// ============================================================================

int AppMain(int argc, char* argv[]) {
    CliOptions options;
    if (!ParseCommandLine(argc, argv, options)) {
        return 0;
    }

    std::string command = options.args.empty() ? "info" : options.args[0];
    if (command == "sampleconfig") {
        std::cout << util::ConfigManager::GenerateSampleConfig();
        return 0;
    }

    util::ConfigManager config;
    std::string dataDir = options.dataDir.empty()
        ? util::ConfigManager::GetDefaultDataDir()
        : util::ConfigManager::ExpandTilde(options.dataDir);
    config.SetDataDir(dataDir);

    std::string configFile = options.configFile.empty()
        ? (std::filesystem::path(dataDir) / util::DEFAULT_CONFIG_FILENAME).string()
        : options.configFile;
    if (!options.configFile.empty() || std::filesystem::exists(configFile)) {
        auto result = config.ParseFile(configFile);
        if (!result.success) {
            std::cerr << "Error: " << result.ToString() << "\n";
            return 1;
        }
    }
    for (const auto& [key, value] : options.overrides) {
        config.Set(key, value);
    }

    SetupLogging(config, options, dataDir);

    rewards::KeeperParams keeperParams = rewards::KeeperParams::FromConfig(config);

    std::filesystem::path journalPath = std::filesystem::path(dataDir) / defaults::JOURNAL_DIRNAME;
    db::Options dbOptions;
    dbOptions.create_if_missing = true;
    auto [status, database] = db::OpenDatabase(journalPath, dbOptions);
    if (!status.ok()) {
        std::cerr << "Error: cannot open journal at " << journalPath << ": "
                  << status.ToString() << "\n";
        return 1;
    }

    service::VaultService svc(keeperParams, database.get());
    status = svc.Replay();
    if (!status.ok()) {
        std::cerr << "Error: " << status.ToString() << "\n";
        return 1;
    }

    if (command == "info") {
        PrintKeeper(svc);
        std::cout << "\n";
        for (const VaultId& id : svc.GetVaults()) {
            PrintVault(svc, id);
        }
    } else if (command == "vault") {
        if (options.args.size() < 2) {
            std::cerr << "Error: vault requires an address\n";
            return 1;
        }
        PrintVault(svc, Address::FromHex(options.args[1]));
    } else {
        std::cerr << "Error: unknown command '" << command << "'\n";
        return 1;
    }

    util::Logger::Instance().Flush();
    return 0;
}

} // namespace stakevault

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return stakevault::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
