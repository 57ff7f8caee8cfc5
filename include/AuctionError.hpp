#ifndef COLLECT_AUCTION_AUCTION_ERROR_HPP
#define COLLECT_AUCTION_AUCTION_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace auction {

    // ============================================================
    //  CÓDIGOS DE ERROR VISIBLES PARA EL LLAMADOR
    // ============================================================
    enum class AuctionErrorCode : uint8_t {
        INIT_PARAMS_INVALID           = 1,
        TOO_MANY_RECIPIENTS           = 2,
        RECIPIENT_SPLIT_CANNOT_BE_ZERO = 3,
        INVALID_RECIPIENT_SPLITS      = 4,
        UNAVAILABLE_AUCTION           = 5,
        ONGOING_AUCTION               = 6,
        INSUFFICIENT_BID_AMOUNT       = 7,
        COLLECT_ALREADY_PROCESSED     = 8,
        FEE_ALREADY_PROCESSED         = 9,
        NOT_FOLLOWING                 = 10,
        NOT_HUB                       = 11,
        REENTRANT_CALL                = 12,
        INVALID_PAYLOAD               = 13
    };

    /** Convierte un AuctionErrorCode en string (útil para logs) */
    std::string errorCodeToString(AuctionErrorCode code);

    /**
     * Error de negocio de la subasta. La operación que lo lanza no deja
     * ningún cambio de estado aplicado.
     */
    class AuctionError : public std::runtime_error {
        public:
            AuctionError(AuctionErrorCode code, const std::string& detail = "");

            AuctionErrorCode code() const noexcept { return code_; }

        private:
            AuctionErrorCode code_;
    };

} // namespace auction

#endif // COLLECT_AUCTION_AUCTION_ERROR_HPP
