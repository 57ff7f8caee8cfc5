#ifndef COLLECT_AUCTION_SCRIPT_RUNNER_HPP
#define COLLECT_AUCTION_SCRIPT_RUNNER_HPP

#include "AuctionModule.hpp"
#include "Clocks.hpp"
#include "CollectNFT.hpp"
#include "InMemoryLedger.hpp"
#include "InMemoryProfiles.hpp"
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace auction {

    /** Colaboradores de referencia sobre los que corren los scripts */
    struct ScriptEnvironment {
        AuctionModule& module;
        InMemoryLedger& ledger;
        InMemoryProfileRegistry& profiles;
        InMemoryFollowGraph& followGraph;
        StaticGovernance& governance;
        CollectNFTFactory& collectables;
        ManualClock& clock;
    };

    /**
     * Intérprete de comandos por línea ('#' para comentarios).
     *
     *   mint <account> <amount>
     *   approve <account> <amount>
     *   profile <account>
     *   transfer-profile <profileId> <account>
     *   follow <followerId> <followedId>
     *   treasury <account> <feeBps>
     *   init <creatorId> <contentId> <startsIn> <duration> <minTimeAfterBid> <reserve>
     *        <minIncrement> <referralBps> <onlyFollowers> <name> <symbol> <royaltyBps>
     *        <account:bps>...
     *   bid <creatorId> <contentId> <bidderId> <amount> [referrerId,...]
     *   advance <seconds>
     *   claim <creatorId> <contentId>
     *   fee <creatorId> <contentId>
     *   show <creatorId> <contentId>
     *   balance <account>
     *
     * Las cuentas son nombres (se derivan a dirección) o direcciones de 40 hex.
     * Los importes admiten decimales según los de la moneda.
     */
    class ScriptRunner {
        public:
            ScriptRunner(ScriptEnvironment env, std::ostream& out = std::cout, std::ostream& err = std::cerr);

            /** Ejecuta todas las líneas; devuelve false si alguna falló */
            bool run(std::istream& script);

            /** Ejecuta una línea; lanza en caso de error */
            void execute(const std::string& line);

            /** Dirección de una cuenta con nombre o literal */
            static Address resolveAccount(const std::string& account);

            size_t failures() const { return failedLines; }

        private:
            using Args = std::vector<std::string>;

            void cmdMint(const Args& args);
            void cmdApprove(const Args& args);
            void cmdProfile(const Args& args);
            void cmdTransferProfile(const Args& args);
            void cmdFollow(const Args& args);
            void cmdTreasury(const Args& args);
            void cmdInit(const Args& args);
            void cmdBid(const Args& args);
            void cmdAdvance(const Args& args);
            void cmdClaim(const Args& args);
            void cmdFee(const Args& args);
            void cmdShow(const Args& args);
            void cmdBalance(const Args& args);

            Amount amountArg(const std::string& text) const;
            static uint64_t numberArg(const std::string& text);
            static std::vector<ProfileId> idListArg(const std::string& text);
            static void requireArgs(const Args& args, size_t count, const std::string& usage);

            std::string displayAmount(const Amount& value) const;

            ScriptEnvironment env;
            std::ostream& out;
            std::ostream& err;
            size_t failedLines = 0;
    };

} // namespace auction

#endif // COLLECT_AUCTION_SCRIPT_RUNNER_HPP
