#include "pulsescan/QueryCatalog.hpp"
#include "pulsescan/ErrorHandling.hpp"

namespace PulseScan {

QueryCatalog::QueryCatalog(std::vector<QuerySpec> entries) : specs(std::move(entries)) {
    if (specs.empty()) {
        throw ErrorHandling::ConfigException("Query catalog must not be empty");
    }
}

const QueryCatalog& QueryCatalog::standard() {
    static const QueryCatalog catalog({
        {"gtme_web", 0, "MAC Address", "Dirección MAC"},
        {"bver", 0, "Build Version", "Información de la versión"},
        {"temp", 1, "CPU Temp (degC)", "CPU temperatura (degC)"},
        {"link", 0, "Link Info", "Enlace información"},
        {"up_dhm", 0, "System UpTime", "El tiempo de actividad"},
        {"batt", 2, "Voltage - Battery", "Voltaje - Batería"},
        {"poev", 2, "Voltage - PoE", "Voltaje - PoE"},
        {"gurl", 0, "Gemini Cloud URL", "Gemini Cloud URL"},
        {"mach", 0, "Machine Hardware Name", "Máquina nombre de hardware"},
        {"sw_port", 3, "Nearest Switch - Port", "Conmutador de red - Identificador de puerto"},
        {"sw_addr", 0, "Nearest Switch - IP/MAC", "Conmutador de red - Dirección (IP/MAC)"},
        {"sw_name", 0, "Nearest Switch - Name", "Conmutador de red - Nombre"},
        {"free", 4, "Memory Information...", "Información de la memoria..."},
    });
    return catalog;
}

const QuerySpec* QueryCatalog::find(const std::string& key) const {
    for (const auto& spec : specs) {
        if (spec.key == key) {
            return &spec;
        }
    }
    return nullptr;
}

std::vector<std::string> QueryCatalog::plannedKeys(int displayLevel, QueryGating gating) const {
    std::vector<std::string> keys;
    for (const auto& spec : specs) {
        if (spec.minDisplayLevel > displayLevel) {
            if (gating == QueryGating::TRUNCATE) {
                break;
            }
            continue;
        }
        keys.push_back(spec.key);
    }
    return keys;
}

} // namespace PulseScan
