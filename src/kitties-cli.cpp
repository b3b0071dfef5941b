// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "args.h"
#include "commands.h"
#include "logging.h"

#include "kitties/balances.hpp"
#include "kitties/errors.hpp"
#include "kitties/events.hpp"
#include "kitties/manager.hpp"
#include "kitties/randomness.hpp"
#include "kitties/registry.hpp"
#include "kitties/serialize.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

static const char DEFAULT_CONF_FILENAME[] = "kitties.conf";
static const char DEFAULT_STATE_FILENAME[] = "kitties.dat";
static const char DEFAULT_DEBUGLOG_FILENAME[] = "debug.log";

using namespace kitties;

static std::string HelpMessage()
{
    std::string strUsage = "Kitties command line tool\n\n";
    strUsage += "Usage:\n";
    strUsage += "  kitties-cli [options] < commands\n\n";
    strUsage += "Options:\n";
    strUsage += "  -?                      This help message\n";
    strUsage += "  -conf=<file>            Specify configuration file (default: <datadir>/" + std::string(DEFAULT_CONF_FILENAME) + ")\n";
    strUsage += "  -datadir=<dir>          Specify data directory (default: .)\n";
    strUsage += "  -statefile=<file>       Registry state kept between runs (default: <datadir>/" + std::string(DEFAULT_STATE_FILENAME) + ")\n";
    strUsage += "  -printtoconsole         Send trace/debug info to console instead of debug.log file\n";
    strUsage += "  -debug=<category>       Output debugging information (default: 0). <category> can be: kitties, genetics, events, 1 (all)\n";
    strUsage += "  -debuglogfile=<file>    Debug log file (default: <datadir>/" + std::string(DEFAULT_DEBUGLOG_FILENAME) + ")\n";
    strUsage += "  -maxowned=<n>           Maximum number of kitties an account can own (default: " + std::to_string(Params::default_max_owned) + ")\n";
    strUsage += "  -balance=<acct>:<n>     Initial free balance of an account, applied when a new state is created (can be repeated)\n\n";
    strUsage += "Commands (one per line):\n";
    strUsage += "  create <acct>\n";
    strUsage += "  breed <acct> <id1> <id2>\n";
    strUsage += "  setprice <acct> <id> [<price>]\n";
    strUsage += "  transfer <acct> <to> <id>\n";
    strUsage += "  buy <acct> <id> <bid>\n";
    strUsage += "  show <id> | owned <acct> | isowner <id> <acct> | count | balance <acct> | newblock\n";
    return strUsage;
}

namespace {

/** Everything the tool keeps in its state file */
struct CliState {
    std::unique_ptr<StorageContext> storage;
    std::unique_ptr<CollectiveFlipRandomness> randomness;
    std::unique_ptr<BalanceLedger> balances;
};

CliState ReadStateFile(const boost::filesystem::path& path, uint32_t nMaxOwned)
{
    boost::filesystem::ifstream file(path, std::ios::binary);
    if (!file)
        throw std::runtime_error("Cannot open state file " + path.string());
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    ByteStream stream(std::move(data));
    CliState state;
    state.storage = std::make_unique<StorageContext>(deserialize, stream, nMaxOwned);
    state.randomness = std::make_unique<CollectiveFlipRandomness>(deserialize, stream);
    state.balances = std::make_unique<BalanceLedger>(deserialize, stream);
    if (!stream.eof())
        throw std::runtime_error("Trailing data in state file " + path.string());
    return state;
}

void WriteStateFile(const boost::filesystem::path& path, const StorageContext& storage, const CollectiveFlipRandomness& randomness, const BalanceLedger& balances)
{
    ByteStream stream;
    stream << storage << randomness << balances;

    // Write to a temporary file first, so a failure never leaves a truncated state behind
    const boost::filesystem::path pathTmp = path.string() + ".new";
    {
        boost::filesystem::ofstream file(pathTmp, std::ios::binary | std::ios::trunc);
        file.write(reinterpret_cast<const char*>(stream.data().data()), stream.size());
        if (!file)
            throw std::runtime_error("Failed to write state file " + pathTmp.string());
    }
    boost::filesystem::rename(pathTmp, path);
}

} // namespace

static int AppInitCli(int argc, char* argv[])
{
    const int nFirstCommand = gArgs.ParseParameters(argc, argv);
    if (nFirstCommand != argc) {
        std::fprintf(stderr, "Error: unexpected argument %s, commands are read from standard input\n", argv[nFirstCommand]);
        return EXIT_FAILURE;
    }
    if (gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        std::fprintf(stdout, "%s", HelpMessage().c_str());
        return EXIT_SUCCESS;
    }

    const boost::filesystem::path pathDataDir = gArgs.GetArg("-datadir", ".");
    if (!boost::filesystem::is_directory(pathDataDir)) {
        std::fprintf(stderr, "Error: Specified data directory \"%s\" does not exist.\n", pathDataDir.string().c_str());
        return EXIT_FAILURE;
    }
    gArgs.ReadConfigFile(boost::filesystem::absolute(gArgs.GetArg("-conf", DEFAULT_CONF_FILENAME), pathDataDir));

    fPrintToConsole = gArgs.GetBoolArg("-printtoconsole", false);
    fPrintToDebugLog = !fPrintToConsole;
    SetLogCategories(gArgs.GetArgs("-debug"));
    if (fPrintToDebugLog)
        OpenDebugLog(boost::filesystem::absolute(gArgs.GetArg("-debuglogfile", DEFAULT_DEBUGLOG_FILENAME), pathDataDir));

    const Params params = params_from_args(gArgs);
    LogPrintf("Kitties starting, max owned per account %d\n", params.max_owned);

    const boost::filesystem::path pathState = boost::filesystem::absolute(gArgs.GetArg("-statefile", DEFAULT_STATE_FILENAME), pathDataDir);
    CliState state;
    if (boost::filesystem::exists(pathState)) {
        state = ReadStateFile(pathState, params.max_owned);
        LogPrintf("Loaded state from %s at block %d\n", pathState.string(), state.randomness->block_number());
    } else {
        state.storage = std::make_unique<StorageContext>(params.max_owned);
        state.randomness = std::make_unique<CollectiveFlipRandomness>();
        state.balances = std::make_unique<BalanceLedger>();
        ApplyInitialBalances(gArgs, *state.balances);
        LogPrintf("No state file at %s, starting afresh\n", pathState.string());
    }

    Registry registry(params, *state.randomness, *state.randomness, *state.balances);
    registry.restore(std::move(*state.storage));
    SignedOriginResolver resolver;
    LoggingEventSink logSink;
    EventRecorder events(logSink);
    Manager manager(registry, resolver, events);
    CommandProcessor processor(manager, *state.randomness, *state.balances);

    int nErrors = 0;
    std::string strLine;
    while (std::getline(std::cin, strLine)) {
        const std::vector<std::string> args = SplitCommandLine(strLine);
        if (args.empty() || args.front()[0] == '#')
            continue;
        try {
            std::cout << processor.Execute(args) << std::endl;
            for (const Event& e : events.take_events())
                std::cout << "event: " << describe(e) << std::endl;
        } catch (const Error& e) {
            ++nErrors;
            std::cout << "error: " << error_code_name(e.code()) << ": " << e.what() << std::endl;
        } catch (const std::exception& e) {
            ++nErrors;
            std::cout << "error: " << e.what() << std::endl;
        }
    }

    WriteStateFile(pathState, registry.snapshot(), *state.randomness, *state.balances);
    LogPrintf("Saved state to %s, %d command(s) failed\n", pathState.string(), nErrors);
    CloseDebugLog();
    return nErrors ? EXIT_FAILURE : EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    try {
        return AppInitCli(argc, argv);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        LogPrintf("EXCEPTION: %s\n", e.what());
    }
    return EXIT_FAILURE;
}
