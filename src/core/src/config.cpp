/**
 * @file config.cpp
 * @brief Glue between Config and the logger / decode options
 */

#include "../include/lnp_config.hpp"
#include "../include/lnp_logger.hpp"
#include "../include/lnp_wire.hpp"

namespace lnp {

bool apply_logging_config(const Config& cfg) {
    Logger& log = Logger::instance();
    log.setLevel(Logger::levelFromString(cfg.get("log.level", "info")));
    log.setConsoleOutput(cfg.getBool("log.console", true));

    std::string path = cfg.get("log.file");
    if (path.empty()) {
        log.closeFileOutput();
        return true;
    }
    if (!log.setFileOutput(path)) {
        LNP_LOG_WARN("cannot open log file " + path);
        return false;
    }
    return true;
}

DecodeOptions DecodeOptions::from_config(const Config& cfg) {
    DecodeOptions opts;
    uint64_t max_len = cfg.getUInt64("presentation.max_record_len", LNP_MSG_MAX_LEN);
    if (max_len > SIZE_MAX) max_len = SIZE_MAX;
    opts.max_record_len = static_cast<size_t>(max_len);
    opts.enforce_even_odd = cfg.getBool("presentation.enforce_even_odd", true);
    return opts;
}

} // namespace lnp
