#include "InMemoryLedger.hpp"
#include "AddressManager.hpp"
#include <stdexcept>

namespace auction {

    InMemoryLedger::InMemoryLedger(const Address& tokenAddress, const std::string& symbol, unsigned decimals)
        : tokenAddress(AddressManager::normalizeAddress(tokenAddress)),
          tokenSymbol(symbol),
          tokenDecimals(decimals) {}

    // ------------------------------------------------------------
    // EMISIÓN Y APROBACIONES
    // ------------------------------------------------------------
    void InMemoryLedger::mint(const Address& to, const Amount& amount) {
        const Address account = AddressManager::normalizeAddress(to);
        if (blacklist.count(account)) {
            throw std::runtime_error(tokenSymbol + ": account " + account + " is blacklisted");
        }
        book.balances[account] += amount;
        supply += amount;
    }

    void InMemoryLedger::approve(const Address& owner, const Address& spender, const Amount& amount) {
        book.allowances[{AddressManager::normalizeAddress(owner), AddressManager::normalizeAddress(spender)}] = amount;
    }

    void InMemoryLedger::transfer(const Address& from, const Address& to, const Amount& amount) {
        const Address sender = AddressManager::normalizeAddress(from);
        settle(sender, {TransferLeg{sender, to, amount}});
    }

    void InMemoryLedger::setBlacklisted(const Address& account, bool blacklisted) {
        const Address normalized = AddressManager::normalizeAddress(account);
        if (blacklisted) {
            blacklist.insert(normalized);
        } else {
            blacklist.erase(normalized);
        }
    }

    bool InMemoryLedger::isBlacklisted(const Address& account) const {
        return blacklist.count(AddressManager::normalizeAddress(account)) > 0;
    }

    // ------------------------------------------------------------
    // CONSULTAS
    // ------------------------------------------------------------
    Amount InMemoryLedger::balanceOf(const Address& owner) const {
        auto it = book.balances.find(AddressManager::normalizeAddress(owner));
        return it == book.balances.end() ? Amount(0) : it->second;
    }

    Amount InMemoryLedger::allowance(const Address& owner, const Address& spender) const {
        auto it = book.allowances.find({AddressManager::normalizeAddress(owner),
                                        AddressManager::normalizeAddress(spender)});
        return it == book.allowances.end() ? Amount(0) : it->second;
    }

    // ------------------------------------------------------------
    // LIQUIDACIÓN
    // ------------------------------------------------------------
    void InMemoryLedger::applyLeg(Book& target, const Address& spender, const TransferLeg& leg) const {
        const Address from = AddressManager::normalizeAddress(leg.from);
        const Address to = AddressManager::normalizeAddress(leg.to);

        if (blacklist.count(from) || blacklist.count(to)) {
            throw std::runtime_error(tokenSymbol + ": transfer " + from + " -> " + to + " involves a blacklisted account");
        }

        // transferFrom: consume la aprobación del dueño
        if (from != spender) {
            Amount& approved = target.allowances[{from, spender}];
            if (approved < leg.amount) {
                throw std::runtime_error(tokenSymbol + ": insufficient allowance of " + from + " for " + spender);
            }
            approved -= leg.amount;
        }

        Amount& fromBalance = target.balances[from];
        if (fromBalance < leg.amount) {
            throw std::runtime_error(tokenSymbol + ": insufficient balance of " + from);
        }
        fromBalance -= leg.amount;
        target.balances[to] += leg.amount;
    }

    InMemoryLedger::Book InMemoryLedger::applyLegs(const Address& spender, const std::vector<TransferLeg>& legs) const {
        const Address normalizedSpender = AddressManager::normalizeAddress(spender);

        // Se trabaja sobre una copia: si un movimiento falla, el libro queda intacto
        Book working = book;
        for (const auto& leg : legs) {
            applyLeg(working, normalizedSpender, leg);
        }
        return working;
    }

    void InMemoryLedger::settle(const Address& spender, const std::vector<TransferLeg>& legs) {
        book = applyLegs(spender, legs);
    }

    void InMemoryLedger::checkSettle(const Address& spender, const std::vector<TransferLeg>& legs) const {
        applyLegs(spender, legs);
    }

    // ------------------------------------------------------------
    // REGISTRO DE MONEDAS
    // ------------------------------------------------------------
    void InMemoryCurrencyRegistry::registerCurrency(std::shared_ptr<InMemoryLedger> ledger) {
        if (!ledger) {
            throw std::invalid_argument("Cannot register a null currency");
        }
        ledgers[ledger->address()] = std::move(ledger);
    }

    bool InMemoryCurrencyRegistry::isCurrencyRegistered(const Address& currency) const {
        if (!AddressManager::isValidAddress(currency)) {
            return false;
        }
        return ledgers.count(AddressManager::normalizeAddress(currency)) > 0;
    }

    Currency& InMemoryCurrencyRegistry::currency(const Address& currency) {
        std::shared_ptr<InMemoryLedger> found = ledger(currency);
        if (!found) {
            throw std::invalid_argument("Currency not registered: " + currency);
        }
        return *found;
    }

    std::shared_ptr<InMemoryLedger> InMemoryCurrencyRegistry::ledger(const Address& currency) const {
        if (!AddressManager::isValidAddress(currency)) {
            return nullptr;
        }
        auto it = ledgers.find(AddressManager::normalizeAddress(currency));
        return it == ledgers.end() ? nullptr : it->second;
    }

} // namespace auction
