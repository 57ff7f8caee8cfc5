#ifndef COLLECT_AUCTION_IN_MEMORY_LEDGER_HPP
#define COLLECT_AUCTION_IN_MEMORY_LEDGER_HPP

#include "Collaborators.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>

namespace auction {

    /**
     * Moneda fungible en memoria: saldos, aprobaciones y lista negra.
     * Las cuentas en lista negra no pueden enviar ni recibir fondos.
     */
    class InMemoryLedger : public Currency {
        public:
            InMemoryLedger(const Address& tokenAddress, const std::string& symbol, unsigned decimals = 18);

            const Address& address() const { return tokenAddress; }
            const std::string& symbol() const { return tokenSymbol; }
            unsigned decimals() const { return tokenDecimals; }

            // ==== EMISIÓN Y APROBACIONES ====
            void mint(const Address& to, const Amount& amount);
            void approve(const Address& owner, const Address& spender, const Amount& amount);
            void transfer(const Address& from, const Address& to, const Amount& amount);
            void setBlacklisted(const Address& account, bool blacklisted);
            bool isBlacklisted(const Address& account) const;

            // ==== CURRENCY ====
            Amount balanceOf(const Address& owner) const override;
            Amount allowance(const Address& owner, const Address& spender) const override;
            void settle(const Address& spender, const std::vector<TransferLeg>& legs) override;
            void checkSettle(const Address& spender, const std::vector<TransferLeg>& legs) const override;

            Amount totalSupply() const { return supply; }

        private:
            struct Book {
                std::map<Address, Amount> balances;
                std::map<std::pair<Address, Address>, Amount> allowances;
            };

            // Aplica un movimiento sobre 'book'; lanza sin tocar nada más
            void applyLeg(Book& book, const Address& spender, const TransferLeg& leg) const;

            // Libro resultante de aplicar todos los movimientos sobre una copia
            Book applyLegs(const Address& spender, const std::vector<TransferLeg>& legs) const;

            Address tokenAddress;
            std::string tokenSymbol;
            unsigned tokenDecimals;
            Book book;
            std::set<Address> blacklist;
            Amount supply = 0;
    };

    /** Lista de monedas admitidas */
    class InMemoryCurrencyRegistry : public CurrencyRegistry {
        public:
            void registerCurrency(std::shared_ptr<InMemoryLedger> ledger);

            bool isCurrencyRegistered(const Address& currency) const override;
            Currency& currency(const Address& currency) override;

            /** Ledger concreto; nullptr si no está registrado */
            std::shared_ptr<InMemoryLedger> ledger(const Address& currency) const;

        private:
            std::map<Address, std::shared_ptr<InMemoryLedger>> ledgers;
    };

} // namespace auction

#endif // COLLECT_AUCTION_IN_MEMORY_LEDGER_HPP
