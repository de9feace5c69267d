#ifndef ZAP_LOG_HPP
#define ZAP_LOG_HPP

#include <string>

namespace zap {

// Installs the "lxzap" colour console logger as spdlog's default logger.
// Levels: trace, debug, info, warn, error, off (anything else = info).
void setup_logging(const std::string& log_level);

} // namespace zap

#endif // ZAP_LOG_HPP
