#include "FeeDistributor.hpp"
#include "AddressManager.hpp"

namespace auction {

    Amount PayoutPlan::totalPaid() const {
        Amount total = 0;
        for (const auto& payout : payouts) {
            total += payout.amount;
        }
        return total;
    }

    FeeDistributor::FeeDistributor(AuctionRegistry& registry,
                                   const ReferralTracker& referrals,
                                   const RecipientSplitValidator& recipients,
                                   CurrencyRegistry& currencies,
                                   const ProfileRegistry& profiles,
                                   const Governance& governance,
                                   const Clock& clock,
                                   const Address& escrowAddress)
        : registry(registry),
          referrals(referrals),
          recipients(recipients),
          currencies(currencies),
          profiles(profiles),
          governance(governance),
          clock(clock),
          escrowAddress(escrowAddress) {}

    PayoutPlan FeeDistributor::computePlan(const Amount& winningBid,
                                           const TreasuryData& treasury,
                                           uint16_t referralFeeBps,
                                           const std::vector<Address>& referrerOwners,
                                           const std::vector<RecipientData>& recipientList) {
        if (treasury.treasuryFeeBps > BPS_MAX || referralFeeBps > BPS_MAX) {
            throw std::invalid_argument("Fee basis points exceed BPS_MAX");
        }

        PayoutPlan plan;
        plan.winningBid = winningBid;

        // 1. Tesorería
        plan.treasuryAmount = bpsOf(winningBid, treasury.treasuryFeeBps);
        if (plan.treasuryAmount > 0) {
            plan.payouts.push_back(Payout{PayoutKind::TREASURY, treasury.treasury, plan.treasuryAmount});
        }

        // 2. Importe ajustado
        Amount adjusted = winningBid - plan.treasuryAmount;

        // 3. Referidos: el total se descuenta entero aunque el reparto trunque
        if (referralFeeBps > 0 && !referrerOwners.empty()) {
            const Amount totalReferral = bpsOf(adjusted, referralFeeBps);
            const Amount perReferral = totalReferral / referrerOwners.size();

            if (perReferral > 0) {
                for (const auto& owner : referrerOwners) {
                    plan.payouts.push_back(Payout{PayoutKind::REFERRAL, owner, perReferral});
                }
            }

            plan.referralAmount = totalReferral;
            adjusted -= totalReferral;
        }

        // 4. Destinatarios en orden
        for (const auto& recipient : recipientList) {
            const Amount amountForRecipient = bpsOf(adjusted, recipient.splitBps);
            if (amountForRecipient > 0) {
                plan.payouts.push_back(Payout{PayoutKind::RECIPIENT, recipient.recipient, amountForRecipient});
                plan.recipientsAmount += amountForRecipient;
            }
        }

        return plan;
    }

    PayoutPlan FeeDistributor::planFor(const AuctionKey& key, const AuctionData& data) const {
        // La tasa de tesorería se lee en el momento del reparto, no en init
        TreasuryData treasury = governance.getTreasuryData();
        if (!AddressManager::isValidAddress(treasury.treasury)) {
            throw std::runtime_error("Governance returned an invalid treasury address");
        }
        treasury.treasury = AddressManager::normalizeAddress(treasury.treasury);

        std::vector<Address> referrerOwners;
        if (data.hasWinner()) {
            for (ProfileId referrer : referrals.referrersOf(key, data.winnerId)) {
                referrerOwners.push_back(profiles.ownerOf(referrer));
            }
        }

        return computePlan(data.winningBid, treasury, data.referralFeeBps, referrerOwners,
                           recipients.recipients(key));
    }

    PreparedDistribution FeeDistributor::prepare(const AuctionKey& key) {
        const AuctionData data = registry.read(key);
        if (data.feeProcessed) {
            throw AuctionError(AuctionErrorCode::FEE_ALREADY_PROCESSED, key.toString());
        }

        PreparedDistribution prepared;
        prepared.key = key;
        prepared.currency = data.currency;
        prepared.plan = planFor(key, data);

        prepared.legs.reserve(prepared.plan.payouts.size());
        for (const auto& payout : prepared.plan.payouts) {
            prepared.legs.push_back(TransferLeg{escrowAddress, payout.to, payout.amount});
        }

        if (!prepared.legs.empty()) {
            currencies.currency(prepared.currency).checkSettle(escrowAddress, prepared.legs);
        }
        return prepared;
    }

    FeeProcessedEvent FeeDistributor::commit(const PreparedDistribution& prepared) {
        if (!prepared.legs.empty()) {
            currencies.currency(prepared.currency).settle(escrowAddress, prepared.legs);
        }

        registry.setFlags(prepared.key, AuctionFlags{std::nullopt, true});

        FeeProcessedEvent event;
        event.key = prepared.key;
        event.winningBid = prepared.plan.winningBid;
        event.treasuryAmount = prepared.plan.treasuryAmount;
        event.referralAmount = prepared.plan.referralAmount;
        event.recipientsAmount = prepared.plan.recipientsAmount;
        event.timestamp = clock.now();
        return event;
    }

    FeeProcessedEvent FeeDistributor::distribute(const AuctionKey& key) {
        return commit(prepare(key));
    }

} // namespace auction
