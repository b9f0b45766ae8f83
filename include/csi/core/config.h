#ifndef CSI_CORE_CONFIG_H_
#define CSI_CORE_CONFIG_H_

#include <string>
#include <vector>

namespace csi {
namespace core {

/**
 * @brief Configuration for building the client-side index from a store scan
 */
struct IndexConfig {
    std::vector<std::string> tables;    // Tables enumerated for distinct row ids, in order
    std::string log_level;              // spdlog level name ("trace" .. "off")

    IndexConfig() = default;

    static IndexConfig Default() {
        IndexConfig config;
        config.tables = {
            "series_bigint",
            "series_float",
            "series_double",
            "series_boolean",
            "series_blob"
        };
        config.log_level = "info";
        return config;
    }
};

} // namespace core
} // namespace csi

#endif // CSI_CORE_CONFIG_H_
