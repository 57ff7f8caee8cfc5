#include "RecipientSplitValidator.hpp"
#include "AddressManager.hpp"

namespace auction {

    void RecipientSplitValidator::validate(const std::vector<RecipientData>& recipients) {
        if (recipients.empty()) {
            throw AuctionError(AuctionErrorCode::INVALID_RECIPIENT_SPLITS, "at least one recipient is required");
        }

        if (recipients.size() > MAX_RECIPIENTS) {
            throw AuctionError(AuctionErrorCode::TOO_MANY_RECIPIENTS,
                               std::to_string(recipients.size()) + " recipients (max " +
                               std::to_string(MAX_RECIPIENTS) + ")");
        }

        uint32_t totalSplits = 0;
        for (const auto& recipient : recipients) {
            if (!AddressManager::isValidAddress(recipient.recipient)) {
                throw AuctionError(AuctionErrorCode::INIT_PARAMS_INVALID,
                                   "invalid recipient address '" + recipient.recipient + "'");
            }

            if (recipient.splitBps == 0) {
                throw AuctionError(AuctionErrorCode::RECIPIENT_SPLIT_CANNOT_BE_ZERO, recipient.recipient);
            }

            totalSplits += recipient.splitBps;
        }

        if (totalSplits != BPS_MAX) {
            throw AuctionError(AuctionErrorCode::INVALID_RECIPIENT_SPLITS,
                               "splits sum to " + std::to_string(totalSplits));
        }
    }

    void RecipientSplitValidator::store(const AuctionKey& key, const std::vector<RecipientData>& recipients) {
        validate(recipients);

        std::vector<RecipientData> normalized;
        normalized.reserve(recipients.size());
        for (const auto& recipient : recipients) {
            normalized.push_back(RecipientData{AddressManager::normalizeAddress(recipient.recipient),
                                               recipient.splitBps});
        }

        table[key] = std::move(normalized);
    }

    const std::vector<RecipientData>& RecipientSplitValidator::recipients(const AuctionKey& key) const {
        static const std::vector<RecipientData> empty;
        auto it = table.find(key);
        return it == table.end() ? empty : it->second;
    }

    void RecipientSplitValidator::restore(const RecipientTable& snapshot) {
        table = snapshot;
    }

} // namespace auction
