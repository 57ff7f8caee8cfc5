#ifndef COLLECT_AUCTION_MODULE_CONFIG_HPP
#define COLLECT_AUCTION_MODULE_CONFIG_HPP

#include "AuctionTypes.hpp"
#include <string>

namespace auction {

    /**
     * Configuración inmutable del módulo, inyectada al construirlo.
     *
     * Formato de archivo (una clave por línea, '#' para comentarios):
     *   hub=<address>
     *   module=<address>
     *   collectable_template=<address>
     *   data_dir=<path>
     */
    struct ModuleConfig {
        Address hubAddress;          // Único llamador autorizado para initialize/bid
        Address moduleAddress;       // Cuenta que custodia los fondos
        Address collectableTemplate; // Plantilla de la que se clonan los coleccionables
        std::string dataDirectory = "auction_data";

        bool isValid() const;

        static bool loadFromFile(const std::string& filename, ModuleConfig& config);
        bool saveToFile(const std::string& filename) const;
    };

} // namespace auction

#endif // COLLECT_AUCTION_MODULE_CONFIG_HPP
