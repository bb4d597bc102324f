// STAKELEDGER Command Line Tool
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Operates a staking contract stored in a local leveldb data directory.
// Supports:
// - Key generation and address derivation
// - Minting test tokens and reading balances
// - Pool initialization and administration
// - Staking, claiming and unstaking
// - Position, pool and pending reward queries
//
// Mutating commands take the caller's private key; the call is signed and
// checked by the contract's authorization provider.

#include "stakeledger/core/checked_math.h"
#include "stakeledger/core/hex.h"
#include "stakeledger/crypto/hash.h"
#include "stakeledger/crypto/keys.h"
#include "stakeledger/db/database.h"
#include "stakeledger/staking/auth.h"
#include "stakeledger/staking/clock.h"
#include "stakeledger/staking/contract.h"
#include "stakeledger/staking/events.h"
#include "stakeledger/staking/ledger.h"
#include "stakeledger/staking/lock_period.h"
#include "stakeledger/util/config.h"
#include "stakeledger/util/logging.h"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

using namespace stakeledger;
using namespace stakeledger::staking;

namespace {

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_FATAL = 2;

// ============================================================================
// Argument Helpers
// ============================================================================

std::optional<int64_t> ParseInt(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        long long value = std::stoll(str, &pos, 10);
        if (pos != str.size()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

/// "30d" is thirty days, a bare number is seconds
std::optional<Duration> ParseLockPeriod(const std::string& str) {
    if (!str.empty() && (str.back() == 'd' || str.back() == 'D')) {
        auto days = ParseInt(str.substr(0, str.size() - 1));
        if (!days) {
            return std::nullopt;
        }
        try {
            return CheckedMul(*days, SECONDS_PER_DAY, "lock period");
        } catch (const ArithmeticFault&) {
            return std::nullopt;
        }
    }
    return ParseInt(str);
}

std::optional<PrivateKey> ParseKey(const std::string& hex) {
    auto key = PrivateKey::FromHex(hex);
    if (!key) {
        std::cerr << "Error: invalid private key\n";
    }
    return key;
}

void PrintLine(char c = '-', int width = 60) {
    std::cout << std::string(width, c) << "\n";
}

int Fail(const StakingStatus& status) {
    std::cerr << "Error: " << status.ToString()
              << " (code " << static_cast<uint32_t>(status.code()) << ")\n";
    return EXIT_ERROR;
}

int Usage(const std::string& message) {
    std::cerr << "Usage: stakeledger-cli " << message << "\n";
    return EXIT_ERROR;
}

// ============================================================================
// Event Output
// ============================================================================

/// Prints each event on stdout and forwards it to the log
class CliEventSink : public EventSink {
public:
    void Publish(const StakingEvent& event) override {
        std::cout << "event: " << event.ToString() << "\n";
        log_.Publish(event);
    }

private:
    LogEventSink log_;
};

// ============================================================================
// Environment
// ============================================================================

/**
 * Everything a command needs: the database, token ledger, clock,
 * authorization and the contract wired to them.
 */
struct Environment {
    std::unique_ptr<db::Database> database;
    std::unique_ptr<DatabaseTokenLedger> ledger;
    std::unique_ptr<Clock> clock;
    SignedCallAuthProvider auth;
    CliEventSink events;
    std::unique_ptr<StakingContract> contract;
    
    /// Sign the call and present it to the authorization provider
    void Authorize(const PrivateKey& key, const std::string& method,
                   const std::vector<uint8_t>& payload) {
        PublicKey pub = key.GetPublicKey();
        Hash256 digest = MakeCallDigest(method, pub.GetHash160(), payload);
        auth.Present(pub, digest, key.Sign(digest));
    }
};

Address DefaultContractAddress() {
    const std::string tag = "stakeledger.contract";
    return ComputeHash160(reinterpret_cast<const Byte*>(tag.data()), tag.size());
}

/// Resolve "contract" to the contract account, else parse a hex address
std::optional<Address> ParseAddress(const std::string& str, const Environment& env) {
    if (str == "contract") {
        return env.contract->GetAddress();
    }
    if (str.size() != Address::SIZE * 2 || !IsValidHex(str)) {
        std::cerr << "Error: invalid address " << str << "\n";
        return std::nullopt;
    }
    return Address::FromHex(str);
}

bool OpenEnvironment(const util::ConfigManager& config, Environment& env) {
    std::string dataDir = config.GetDataDir();
    
    auto [status, database] = db::OpenDatabase(dataDir + "/state");
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Cannot open " << dataDir << ": " << status.ToString();
        std::cerr << "Fatal: cannot open database in " << dataDir << ": " << status.ToString() << "\n";
        return false;
    }
    env.database = std::move(database);
    env.ledger = std::make_unique<DatabaseTokenLedger>(*env.database);
    
    auto mockTime = config.TryGetInt(util::ConfigKeys::MOCKTIME);
    if (mockTime) {
        env.clock = std::make_unique<ManualClock>(*mockTime);
    } else {
        env.clock = std::make_unique<SystemClock>();
    }
    
    Address self = DefaultContractAddress();
    auto contractHex = config.TryGetString(util::ConfigKeys::CONTRACT);
    if (contractHex) {
        if (contractHex->size() != Address::SIZE * 2 || !IsValidHex(*contractHex)) {
            std::cerr << "Fatal: invalid -contract address\n";
            return false;
        }
        self = Address::FromHex(*contractHex);
    }
    
    env.contract = std::make_unique<StakingContract>(*env.database, *env.ledger, env.auth,
                                                     *env.clock, env.events, self);
    return true;
}

// ============================================================================
// Commands: Keys and Tokens
// ============================================================================

int CommandKeygen() {
    PrivateKey key = PrivateKey::Generate();
    PublicKey pub = key.GetPublicKey();
    std::cout << "private: " << key.ToHex() << "\n";
    std::cout << "public:  " << pub.ToHex() << "\n";
    std::cout << "address: " << pub.GetHash160().ToHex() << "\n";
    return EXIT_OK;
}

int CommandAddress(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Usage("address <privkey>");
    }
    auto key = ParseKey(args[0]);
    if (!key) {
        return EXIT_ERROR;
    }
    std::cout << key->GetPublicKey().GetHash160().ToHex() << "\n";
    return EXIT_OK;
}

int CommandMint(Environment& env, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return Usage("mint <address|contract> <amount>");
    }
    auto account = ParseAddress(args[0], env);
    auto amount = ParseInt(args[1]);
    if (!account) {
        return EXIT_ERROR;
    }
    if (!amount || *amount < 0) {
        return Usage("mint <address|contract> <amount>  (amount must be >= 0)");
    }
    env.ledger->Mint(*account, *amount);
    std::cout << "balance: " << env.ledger->Balance(*account) << "\n";
    return EXIT_OK;
}

int CommandBalance(Environment& env, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Usage("balance <address|contract>");
    }
    auto account = ParseAddress(args[0], env);
    if (!account) {
        return EXIT_ERROR;
    }
    std::cout << env.ledger->Balance(*account) << "\n";
    return EXIT_OK;
}

// ============================================================================
// Commands: Administration
// ============================================================================

int CommandInit(Environment& env, const std::vector<std::string>& args) {
    const char* usage = "init <privkey> <token> <rate> <bonus> <min> <max>";
    if (args.size() != 6) {
        return Usage(usage);
    }
    auto key = ParseKey(args[0]);
    auto token = ParseAddress(args[1], env);
    auto rate = ParseInt(args[2]);
    auto bonus = ParseInt(args[3]);
    auto minStake = ParseInt(args[4]);
    auto maxStake = ParseInt(args[5]);
    if (!key || !token) {
        return EXIT_ERROR;
    }
    if (!rate || !bonus || *bonus < 0 || *bonus > UINT32_MAX || !minStake || !maxStake) {
        return Usage(usage);
    }
    
    Address admin = key->GetPublicKey().GetHash160();
    DataStream payload;
    payload << *token << *rate << static_cast<uint32_t>(*bonus) << *minStake << *maxStake;
    env.Authorize(*key, "initialize", payload.ToVector());
    
    StakingStatus status = env.contract->Initialize(admin, *token, *rate,
                                                    static_cast<uint32_t>(*bonus),
                                                    *minStake, *maxStake);
    if (!status.ok()) {
        return Fail(status);
    }
    std::cout << "initialized, admin " << admin.ToHex() << "\n";
    return EXIT_OK;
}

int CommandUpdatePool(Environment& env, const std::vector<std::string>& args) {
    const char* usage = "updatepool <privkey> <rate|-> [bonus|-]";
    if (args.size() < 2 || args.size() > 3) {
        return Usage(usage);
    }
    auto key = ParseKey(args[0]);
    if (!key) {
        return EXIT_ERROR;
    }
    
    std::optional<Amount> rate;
    if (args[1] != "-") {
        rate = ParseInt(args[1]);
        if (!rate) {
            return Usage(usage);
        }
    }
    std::optional<uint32_t> bonus;
    if (args.size() == 3 && args[2] != "-") {
        auto value = ParseInt(args[2]);
        if (!value || *value < 0 || *value > UINT32_MAX) {
            return Usage(usage);
        }
        bonus = static_cast<uint32_t>(*value);
    }
    
    Address admin = key->GetPublicKey().GetHash160();
    DataStream payload;
    payload << rate.has_value() << rate.value_or(0) << bonus.has_value() << bonus.value_or(0);
    env.Authorize(*key, "update_pool", payload.ToVector());
    
    StakingStatus status = env.contract->UpdatePool(admin, rate, bonus);
    return status.ok() ? EXIT_OK : Fail(status);
}

int CommandEmergency(Environment& env, const std::vector<std::string>& args) {
    if (args.size() != 2 || (args[1] != "on" && args[1] != "off")) {
        return Usage("emergency <privkey> on|off");
    }
    auto key = ParseKey(args[0]);
    if (!key) {
        return EXIT_ERROR;
    }
    bool enabled = args[1] == "on";
    
    Address admin = key->GetPublicKey().GetHash160();
    DataStream payload;
    payload << enabled;
    env.Authorize(*key, "set_emergency_mode", payload.ToVector());
    
    StakingStatus status = env.contract->SetEmergencyMode(admin, enabled);
    if (!status.ok()) {
        return Fail(status);
    }
    std::cout << "emergency mode " << (enabled ? "on" : "off") << "\n";
    return EXIT_OK;
}

// ============================================================================
// Commands: Lifecycle
// ============================================================================

int CommandStake(Environment& env, const std::vector<std::string>& args) {
    const char* usage = "stake <privkey> <amount> <lock: 30d|90d|180d|365d|seconds> [periods]";
    if (args.size() < 3 || args.size() > 4) {
        return Usage(usage);
    }
    auto key = ParseKey(args[0]);
    if (!key) {
        return EXIT_ERROR;
    }
    auto amount = ParseInt(args[1]);
    auto lock = ParseLockPeriod(args[2]);
    if (!amount || !lock) {
        return Usage(usage);
    }
    
    VestingOption vesting = NoVesting{};
    uint32_t periods = 0;
    if (args.size() == 4) {
        auto value = ParseInt(args[3]);
        if (!value || *value < 0 || *value > UINT32_MAX) {
            return Usage(usage);
        }
        periods = static_cast<uint32_t>(*value);
        vesting = Vesting{periods};
    }
    
    Address user = key->GetPublicKey().GetHash160();
    DataStream payload;
    payload << *amount << *lock << (args.size() == 4) << periods;
    env.Authorize(*key, "stake", payload.ToVector());
    
    StakingStatus status = env.contract->Stake(user, *amount, *lock, vesting);
    return status.ok() ? EXIT_OK : Fail(status);
}

int CommandUnstake(Environment& env, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Usage("unstake <privkey>");
    }
    auto key = ParseKey(args[0]);
    if (!key) {
        return EXIT_ERROR;
    }
    Address user = key->GetPublicKey().GetHash160();
    env.Authorize(*key, "unstake", {});
    
    Amount rewards = 0;
    StakingStatus status = env.contract->Unstake(user, &rewards);
    if (!status.ok()) {
        return Fail(status);
    }
    std::cout << "rewards: " << rewards << "\n";
    return EXIT_OK;
}

int CommandClaim(Environment& env, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Usage("claim <privkey>");
    }
    auto key = ParseKey(args[0]);
    if (!key) {
        return EXIT_ERROR;
    }
    Address user = key->GetPublicKey().GetHash160();
    env.Authorize(*key, "claim_rewards", {});
    
    Amount rewards = 0;
    StakingStatus status = env.contract->ClaimRewards(user, &rewards);
    if (!status.ok()) {
        return Fail(status);
    }
    std::cout << "rewards: " << rewards << "\n";
    return EXIT_OK;
}

// ============================================================================
// Commands: Queries
// ============================================================================

int CommandPosition(Environment& env, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Usage("position <address>");
    }
    auto user = ParseAddress(args[0], env);
    if (!user) {
        return EXIT_ERROR;
    }
    
    StakingPosition position;
    StakingStatus status = env.contract->GetPosition(*user, &position);
    if (!status.ok()) {
        return Fail(status);
    }
    
    PrintLine('=');
    std::cout << "Owner:          " << position.owner.ToHex() << "\n";
    std::cout << "Amount:         " << position.amount << "\n";
    std::cout << "Started:        " << position.startTime << "\n";
    std::cout << "Last reward:    " << position.lastRewardTime << "\n";
    std::cout << "Lock period:    " << FormatDuration(position.lockPeriod)
              << " (unlocks at " << position.GetUnlockTime() << ")\n";
    std::cout << "Multiplier:     " << position.rewardMultiplier << "%\n";
    if (position.hasVesting) {
        VestingSchedule schedule = position.GetVestingSchedule();
        std::cout << "Vesting:        " << schedule.currentPeriod << "/" << schedule.totalPeriods
                  << " periods of " << FormatDuration(schedule.periodDuration)
                  << ", cliff " << schedule.cliffPercentage << "bps\n";
    } else {
        std::cout << "Vesting:        none\n";
    }
    PrintLine('=');
    return EXIT_OK;
}

int CommandPool(Environment& env) {
    StakingPool pool;
    StakingStatus status = env.contract->GetPoolInfo(&pool);
    if (!status.ok()) {
        return Fail(status);
    }
    
    PrintLine('=');
    std::cout << "Token:          " << pool.token.ToHex() << "\n";
    std::cout << "Total staked:   " << pool.totalStaked << "\n";
    std::cout << "Reward rate:    " << pool.rewardRate << " / " << REWARD_RATE_SCALE << " per second\n";
    std::cout << "Bonus:          " << pool.bonusMultiplier << "\n";
    std::cout << "Stake range:    " << pool.minStake << " .. " << pool.maxStake << "\n";
    std::cout << "Early fee:      " << pool.emergencyWithdrawalFee << " bps\n";
    std::cout << "Emergency:      " << (env.contract->IsEmergencyMode() ? "on" : "off") << "\n";
    std::cout << "Reserve:        " << env.ledger->Balance(env.contract->GetAddress()) << "\n";
    PrintLine('=');
    return EXIT_OK;
}

int CommandPending(Environment& env, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Usage("pending <address>");
    }
    auto user = ParseAddress(args[0], env);
    if (!user) {
        return EXIT_ERROR;
    }
    
    RewardCalculation calc;
    StakingStatus status = env.contract->GetPendingRewards(*user, &calc);
    if (!status.ok()) {
        return Fail(status);
    }
    std::cout << "base:      " << calc.baseRewards << "\n";
    std::cout << "bonus:     " << calc.bonusRewards << "\n";
    std::cout << "total:     " << calc.totalRewards << "\n";
    std::cout << "vested:    " << calc.vestingAmount << "\n";
    std::cout << "claimable: " << calc.claimableAmount << "\n";
    return EXIT_OK;
}

// ============================================================================
// Help and Usage
// ============================================================================

void PrintUsage() {
    std::cout << "STAKELEDGER Command Line Tool v" << VERSION << "\n";
    std::cout << "\n";
    std::cout << "Usage: stakeledger-cli [options] <command> [args]\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  keygen                                   Generate a key pair\n";
    std::cout << "  address <privkey>                        Show the address of a key\n";
    std::cout << "  mint <address|contract> <amount>         Credit test tokens\n";
    std::cout << "  balance <address|contract>               Show token balance\n";
    std::cout << "  init <privkey> <token> <rate> <bonus> <min> <max>\n";
    std::cout << "                                           Create the pool\n";
    std::cout << "  stake <privkey> <amount> <lock> [periods] Open a position\n";
    std::cout << "  unstake <privkey>                        Close the position\n";
    std::cout << "  claim <privkey>                          Claim rewards\n";
    std::cout << "  position <address>                       Show a position\n";
    std::cout << "  pool                                     Show the pool\n";
    std::cout << "  pending <address>                        Show pending rewards\n";
    std::cout << "  updatepool <privkey> <rate|-> [bonus|-]  Change pool parameters\n";
    std::cout << "  emergency <privkey> on|off               Toggle emergency mode\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -datadir=<dir>       Data directory (default: ~/.stakeledger)\n";
    std::cout << "  -conf=<file>         Config file (default: <datadir>/stakeledger.conf)\n";
    std::cout << "  -loglevel=<level>    trace, debug, info, warn, error, off\n";
    std::cout << "  -printtoconsole      Log to stderr\n";
    std::cout << "  -logfile=<file>      Log file (default: <datadir>/debug.log)\n";
    std::cout << "  -contract=<address>  Contract account address\n";
    std::cout << "  -mocktime=<seconds>  Use a fixed clock\n";
    std::cout << "\n";
    std::cout << "Lock periods are 30d, 90d, 180d or 365d (or the same in seconds).\n";
}

void PrintVersion() {
    std::cout << "STAKELEDGER Command Line Tool v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 STAKELEDGER Developers\n";
    std::cout << "MIT License\n";
}

int Dispatch(const std::string& command, const std::vector<std::string>& args,
             Environment& env) {
    if (command == "mint") return CommandMint(env, args);
    if (command == "balance") return CommandBalance(env, args);
    if (command == "init") return CommandInit(env, args);
    if (command == "stake") return CommandStake(env, args);
    if (command == "unstake") return CommandUnstake(env, args);
    if (command == "claim") return CommandClaim(env, args);
    if (command == "position") return CommandPosition(env, args);
    if (command == "pool") return CommandPool(env);
    if (command == "pending") return CommandPending(env, args);
    if (command == "updatepool") return CommandUpdatePool(env, args);
    if (command == "emergency") return CommandEmergency(env, args);
    
    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'stakeledger-cli help' for usage.\n";
    return EXIT_ERROR;
}

} // anonymous namespace

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    util::ConfigManager config;
    util::ConfigParseResult parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return EXIT_ERROR;
    }
    
    if (config.GetBool("version", false)) {
        PrintVersion();
        return EXIT_OK;
    }
    
    const auto& positional = config.GetPositionalArgs();
    if (config.GetBool("help", false) || config.GetBool("h", false) || positional.empty() ||
        positional[0] == "help") {
        PrintUsage();
        return positional.empty() && !config.GetBool("help", false) ? EXIT_ERROR : EXIT_OK;
    }
    
    const std::string& command = positional[0];
    std::vector<std::string> args(positional.begin() + 1, positional.end());
    
    // Commands that need no data directory
    if (command == "keygen") return CommandKeygen();
    if (command == "address") return CommandAddress(args);
    
    parsed = config.LoadConfigFile();
    if (!parsed.success) {
        std::cerr << "Error reading config: " << parsed.ToString() << "\n";
        return EXIT_ERROR;
    }
    
    std::string dataDir = config.GetDataDir();
    util::LogLevel level = util::LogLevelFromString(config.GetString(util::ConfigKeys::LOGLEVEL, "info"));
    std::string logFile = config.GetPath(util::ConfigKeys::LOGFILE, dataDir + "/debug.log");
    
    std::error_code ec;
    std::filesystem::create_directories(dataDir, ec);
    if (ec) {
        std::cerr << "Fatal: cannot create data directory " << dataDir << ": " << ec.message() << "\n";
        return EXIT_FATAL;
    }
    if (!util::InitLogging(level, config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, false),
                           logFile)) {
        std::cerr << "Warning: cannot open log file " << logFile << "\n";
    }
    LOG_DEBUG(util::LogCategory::CONFIG) << "Configuration:\n" << config.Dump();
    
    try {
        Environment env;
        if (!OpenEnvironment(config, env)) {
            return EXIT_FATAL;
        }
        
        int rc = Dispatch(command, args, env);
        util::Logger::Instance().Flush();
        return rc;
    } catch (const ArithmeticFault& e) {
        LOG_ERROR(util::LogCategory::STAKING) << "Arithmetic fault: " << e.what();
        std::cerr << "Fatal: arithmetic fault: " << e.what() << "\n";
    } catch (const StorageFault& e) {
        LOG_ERROR(util::LogCategory::DB) << "Storage fault: " << e.what();
        std::cerr << "Fatal: storage fault: " << e.what() << "\n";
    }
    util::Logger::Instance().Flush();
    return EXIT_FATAL;
}
