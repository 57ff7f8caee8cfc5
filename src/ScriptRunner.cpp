#include "ScriptRunner.hpp"
#include "AddressManager.hpp"
#include "ParamsCodec.hpp"
#include <sstream>

namespace auction {

    namespace {
        std::vector<std::string> tokenize(const std::string& line) {
            std::istringstream stream(line);
            std::vector<std::string> tokens;
            std::string token;
            while (stream >> token) {
                tokens.push_back(token);
            }
            return tokens;
        }
    }

    ScriptRunner::ScriptRunner(ScriptEnvironment env, std::ostream& out, std::ostream& err)
        : env(env), out(out), err(err) {}

    // ------------------------------------------------------------
    // UTILIDADES
    // ------------------------------------------------------------
    Address ScriptRunner::resolveAccount(const std::string& account) {
        if (AddressManager::isValidAddress(account) ||
            (account.size() == ADDRESS_HEX_LENGTH + 2 && account.rfind("0x", 0) == 0)) {
            return AddressManager::normalizeAddress(account);
        }
        return AddressManager::getAddressFromBytes(std::vector<uint8_t>(account.begin(), account.end()));
    }

    Amount ScriptRunner::amountArg(const std::string& text) const {
        return parseAmount(text, env.ledger.decimals());
    }

    uint64_t ScriptRunner::numberArg(const std::string& text) {
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("Expected a number, got '" + text + "'");
        }
        return std::stoull(text);
    }

    std::vector<ProfileId> ScriptRunner::idListArg(const std::string& text) {
        std::vector<ProfileId> ids;
        std::stringstream stream(text);
        std::string item;
        while (std::getline(stream, item, ',')) {
            if (!item.empty()) {
                ids.push_back(numberArg(item));
            }
        }
        return ids;
    }

    void ScriptRunner::requireArgs(const Args& args, size_t count, const std::string& usage) {
        if (args.size() < count) {
            throw std::invalid_argument("usage: " + usage);
        }
    }

    std::string ScriptRunner::displayAmount(const Amount& value) const {
        return amountToString(value) + " " + env.ledger.symbol();
    }

    // ------------------------------------------------------------
    // EJECUCIÓN
    // ------------------------------------------------------------
    bool ScriptRunner::run(std::istream& script) {
        std::string line;
        size_t lineNumber = 0;

        while (std::getline(script, line)) {
            ++lineNumber;
            const size_t comment = line.find('#');
            if (comment != std::string::npos) {
                line = line.substr(0, comment);
            }
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }

            try {
                execute(line);
            } catch (const std::exception& e) {
                ++failedLines;
                err << "Error: line " << lineNumber << ": " << e.what() << std::endl;
            }
        }

        return failedLines == 0;
    }

    void ScriptRunner::execute(const std::string& line) {
        const Args tokens = tokenize(line);
        if (tokens.empty()) {
            return;
        }

        const std::string& command = tokens[0];
        const Args args(tokens.begin() + 1, tokens.end());

        if (command == "mint") cmdMint(args);
        else if (command == "approve") cmdApprove(args);
        else if (command == "profile") cmdProfile(args);
        else if (command == "transfer-profile") cmdTransferProfile(args);
        else if (command == "follow") cmdFollow(args);
        else if (command == "treasury") cmdTreasury(args);
        else if (command == "init") cmdInit(args);
        else if (command == "bid") cmdBid(args);
        else if (command == "advance") cmdAdvance(args);
        else if (command == "claim") cmdClaim(args);
        else if (command == "fee") cmdFee(args);
        else if (command == "show") cmdShow(args);
        else if (command == "balance") cmdBalance(args);
        else throw std::invalid_argument("Unknown command '" + command + "'");
    }

    // ------------------------------------------------------------
    // COMANDOS DE ENTORNO
    // ------------------------------------------------------------
    void ScriptRunner::cmdMint(const Args& args) {
        requireArgs(args, 2, "mint <account> <amount>");
        const Address account = resolveAccount(args[0]);
        env.ledger.mint(account, amountArg(args[1]));
        out << "minted " << args[1] << " " << env.ledger.symbol() << " to " << args[0] << std::endl;
    }

    void ScriptRunner::cmdApprove(const Args& args) {
        requireArgs(args, 2, "approve <account> <amount>");
        env.ledger.approve(resolveAccount(args[0]), env.module.config().moduleAddress, amountArg(args[1]));
        out << args[0] << " approved " << args[1] << " " << env.ledger.symbol() << " to the module" << std::endl;
    }

    void ScriptRunner::cmdProfile(const Args& args) {
        requireArgs(args, 1, "profile <account>");
        const ProfileId profileId = env.profiles.createProfile(resolveAccount(args[0]));
        out << "profile " << profileId << " owned by " << args[0] << std::endl;
    }

    void ScriptRunner::cmdTransferProfile(const Args& args) {
        requireArgs(args, 2, "transfer-profile <profileId> <account>");
        env.profiles.transferProfile(numberArg(args[0]), resolveAccount(args[1]));
        out << "profile " << args[0] << " transferred to " << args[1] << std::endl;
    }

    void ScriptRunner::cmdFollow(const Args& args) {
        requireArgs(args, 2, "follow <followerId> <followedId>");
        env.followGraph.follow(numberArg(args[0]), numberArg(args[1]));
        out << "profile " << args[0] << " follows " << args[1] << std::endl;
    }

    void ScriptRunner::cmdTreasury(const Args& args) {
        requireArgs(args, 2, "treasury <account> <feeBps>");
        const uint64_t feeBps = numberArg(args[1]);
        if (feeBps > BPS_MAX) {
            throw std::invalid_argument("Treasury fee exceeds " + std::to_string(BPS_MAX) + " bps");
        }
        env.governance.setTreasury(resolveAccount(args[0]));
        env.governance.setTreasuryFee(static_cast<uint16_t>(feeBps));
        out << "treasury " << args[0] << " fee " << feeBps << " bps" << std::endl;
    }

    void ScriptRunner::cmdAdvance(const Args& args) {
        requireArgs(args, 1, "advance <seconds>");
        env.clock.advance(numberArg(args[0]));
        out << "time is now " << env.clock.now() << std::endl;
    }

    void ScriptRunner::cmdBalance(const Args& args) {
        requireArgs(args, 1, "balance <account>");
        out << args[0] << ": " << displayAmount(env.ledger.balanceOf(resolveAccount(args[0]))) << std::endl;
    }

    // ------------------------------------------------------------
    // COMANDOS DE SUBASTA
    // ------------------------------------------------------------
    void ScriptRunner::cmdInit(const Args& args) {
        requireArgs(args, 12, "init <creatorId> <contentId> <startsIn> <duration> <minTimeAfterBid> <reserve> "
                              "<minIncrement> <referralBps> <onlyFollowers> <name> <symbol> <royaltyBps> "
                              "<account:bps>...");

        const ProfileId creatorId = numberArg(args[0]);
        const ContentId contentId = numberArg(args[1]);

        InitParams params;
        params.availableSinceTimestamp = env.clock.now() + numberArg(args[2]);
        params.duration = static_cast<uint32_t>(numberArg(args[3]));
        params.minTimeAfterBid = static_cast<uint32_t>(numberArg(args[4]));
        params.reservePrice = amountArg(args[5]);
        params.minBidIncrement = amountArg(args[6]);
        params.referralFeeBps = static_cast<uint16_t>(numberArg(args[7]));
        params.currency = env.ledger.address();
        params.onlyFollowers = numberArg(args[8]) != 0;
        params.tokenData.name = args[9];
        params.tokenData.symbol = args[10];
        params.tokenData.royaltyBps = static_cast<uint16_t>(numberArg(args[11]));

        for (size_t i = 12; i < args.size(); ++i) {
            const size_t colon = args[i].rfind(':');
            if (colon == std::string::npos) {
                throw std::invalid_argument("Recipient must be <account:bps>, got '" + args[i] + "'");
            }
            RecipientData recipient;
            recipient.recipient = resolveAccount(args[i].substr(0, colon));
            recipient.splitBps = static_cast<uint16_t>(numberArg(args[i].substr(colon + 1)));
            params.recipients.push_back(recipient);
        }

        // Mismo camino que el hub: payload codificado
        const std::vector<uint8_t> payload = encodeInitParams(params);
        env.module.initialize(env.module.config().hubAddress, creatorId, contentId,
                              env.profiles.ownerOf(creatorId), payload);
        out << "auction " << creatorId << "/" << contentId << " initialized" << std::endl;
    }

    void ScriptRunner::cmdBid(const Args& args) {
        requireArgs(args, 4, "bid <creatorId> <contentId> <bidderId> <amount> [referrerId,...]");

        BidParams context;
        context.key = AuctionKey{numberArg(args[0]), numberArg(args[1])};
        context.bidderId = numberArg(args[2]);
        context.bidderOwnerAddress = env.profiles.ownerOf(context.bidderId);
        context.transactionExecutor = context.bidderOwnerAddress;
        if (args.size() > 4) {
            context.referrerIds = idListArg(args[4]);
        }

        env.module.bid(env.module.config().hubAddress, context, encodeBidAmount(amountArg(args[3])));
        out << "profile " << args[2] << " bid " << args[3] << " " << env.ledger.symbol()
            << " on " << context.key.toString() << std::endl;
    }

    void ScriptRunner::cmdClaim(const Args& args) {
        requireArgs(args, 2, "claim <creatorId> <contentId>");
        const CollectedEvent event = env.module.claim(numberArg(args[0]), numberArg(args[1]));
        out << "profile " << event.winnerId << " collected token #" << event.tokenId
            << " of " << event.collectable << std::endl;
    }

    void ScriptRunner::cmdFee(const Args& args) {
        requireArgs(args, 2, "fee <creatorId> <contentId>");
        const FeeProcessedEvent event = env.module.processFee(numberArg(args[0]), numberArg(args[1]));
        out << "fees of " << event.key.toString() << " distributed: treasury "
            << displayAmount(event.treasuryAmount) << ", recipients "
            << displayAmount(event.recipientsAmount) << std::endl;
    }

    void ScriptRunner::cmdShow(const Args& args) {
        requireArgs(args, 2, "show <creatorId> <contentId>");
        const ProfileId creatorId = numberArg(args[0]);
        const ContentId contentId = numberArg(args[1]);
        const AuctionData data = env.module.getAuctionData(creatorId, contentId);

        if (data.duration == 0) {
            out << "auction " << creatorId << "/" << contentId << " does not exist" << std::endl;
            return;
        }

        out << "auction " << creatorId << "/" << contentId << " ["
            << auctionStateToString(env.module.stateOf(creatorId, contentId)) << "]" << std::endl;
        out << "  reserve:       " << displayAmount(data.reservePrice) << std::endl;
        out << "  winning bid:   " << displayAmount(data.winningBid) << std::endl;
        out << "  winner:        " << data.winnerId << std::endl;
        out << "  end:           " << data.endTimestamp << std::endl;
        out << "  collected:     " << (data.collected ? "yes" : "no") << std::endl;
        out << "  fee processed: " << (data.feeProcessed ? "yes" : "no") << std::endl;

        for (const auto& recipient : env.module.getRecipients(creatorId, contentId)) {
            out << "  recipient:     " << recipient.recipient << " " << recipient.splitBps << " bps" << std::endl;
        }

        const std::optional<Address> collectable = env.module.getCollectable(creatorId, contentId);
        if (collectable) {
            std::shared_ptr<CollectNFT> token = env.collectables.collectNFT(*collectable);
            out << "  collectable:   " << *collectable;
            if (token) {
                out << " (" << token->name() << "/" << token->symbol() << ", supply " << token->totalSupply() << ")";
            }
            out << std::endl;
        }
    }

} // namespace auction
