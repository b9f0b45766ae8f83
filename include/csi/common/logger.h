#ifndef CSI_COMMON_LOGGER_H_
#define CSI_COMMON_LOGGER_H_

#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace csi {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);
    // Accepts spdlog level names; unknown names leave the level unchanged.
    static bool SetLevel(const std::string& level_name);
};

} // namespace common
} // namespace csi

// Macros for convenient logging
#define CSI_TRACE(...) spdlog::trace(__VA_ARGS__)
#define CSI_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define CSI_INFO(...)  spdlog::info(__VA_ARGS__)
#define CSI_WARN(...)  spdlog::warn(__VA_ARGS__)
#define CSI_ERROR(...) spdlog::error(__VA_ARGS__)
#define CSI_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // CSI_COMMON_LOGGER_H_
