#include <iostream>
#include <fstream>
#include <memory>

#include "AddressManager.hpp"
#include "AuctionModule.hpp"
#include "AuctionStateStore.hpp"
#include "Clocks.hpp"
#include "CollectNFT.hpp"
#include "CryptoBase.hpp"
#include "InMemoryLedger.hpp"
#include "InMemoryProfiles.hpp"
#include "ModuleConfig.hpp"
#include "ScriptRunner.hpp"

using namespace std;
using namespace auction;

namespace {
    Address namedAddress(const string& name) {
        return AddressManager::getAddressFromBytes(vector<uint8_t>(name.begin(), name.end()));
    }

    ModuleConfig defaultConfig(const string& datadir) {
        ModuleConfig config;
        config.hubAddress = namedAddress("hub");
        config.moduleAddress = namedAddress("auction-module");
        config.collectableTemplate = namedAddress("collect-nft-template");
        config.dataDirectory = datadir;
        return config;
    }
}

int main(int argc, char** argv) {
    ios::sync_with_stdio(false);
    string datadir = "./auction_data";
    string scriptPath;

    if (argc > 1) datadir = argv[1];
    if (argc > 2) scriptPath = argv[2];

    cout << "collect-auction node starting. datadir=" << datadir << endl;

    // Initialize libsodium
    if (!CryptoBase::initialize()) {
        cerr << "Failed to initialize crypto (sodium)." << endl;
        return 1;
    }

    // Initialize storage
    AuctionStateStore store(datadir);
    if (!store.initialize()) {
        cerr << "Failed to initialize storage at " << datadir << endl;
        return 1;
    }

    // Load or create configuration
    const string configPath = datadir + "/module.conf";
    ModuleConfig config = defaultConfig(datadir);
    ifstream existingConfig(configPath);
    if (existingConfig.good()) {
        existingConfig.close();
        if (!ModuleConfig::loadFromFile(configPath, config)) {
            cerr << "Failed to load configuration from " << configPath << endl;
            return 1;
        }
    } else if (!config.saveToFile(configPath)) {
        cerr << "Warning: Could not write default configuration to " << configPath << endl;
    }

    // Reference collaborators
    ManualClock clock(SystemClock().now());
    auto ledger = make_shared<InMemoryLedger>(namedAddress("wmatic"), "WMATIC", 18);
    InMemoryCurrencyRegistry currencies;
    currencies.registerCurrency(ledger);
    InMemoryProfileRegistry profiles;
    InMemoryFollowGraph followGraph;
    StaticGovernance governance(namedAddress("treasury"), 0);
    CollectNFTFactory collectables(profiles);

    AuctionModule module(config, currencies, profiles, followGraph, governance, collectables, clock);
    module.addObserver(make_shared<LoggingObserver>(cout));

    // Previous snapshot (informative: collaborators start empty)
    AuctionSnapshot previous;
    if (store.exists()) {
        if (store.load(previous)) {
            cout << "Found snapshot with " << previous.auctions.size() << " auctions at "
                 << store.snapshotPath() << " (not imported)" << endl;
        } else {
            cerr << "Warning: Ignoring unreadable snapshot " << store.snapshotPath() << endl;
        }
    }

    bool ok = true;
    if (!scriptPath.empty()) {
        ifstream script(scriptPath);
        if (!script) {
            cerr << "Cannot open script " << scriptPath << endl;
            return 1;
        }

        ScriptRunner runner(ScriptEnvironment{module, *ledger, profiles, followGraph, governance, collectables, clock});
        ok = runner.run(script);
        cout << "Script finished with " << runner.failures() << " failed lines" << endl;
    } else {
        cout << "No script given. Usage: " << argv[0] << " [datadir] [script]" << endl;
    }

    if (!store.save(module.exportState())) {
        cerr << "Failed to save auction state to " << store.snapshotPath() << endl;
        return 1;
    }

    cout << "Shutting down..." << endl;
    return ok ? 0 : 2;
}
