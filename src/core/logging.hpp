#pragma once

#include "core/configuration.hpp"

namespace flash_amm::core {

/**
 * @brief Install the process-wide spdlog logger
 *
 * Colour console sink plus a plain file sink at SystemConfig::log_file,
 * both at SystemConfig::log_level.
 *
 * @throws spdlog::spdlog_ex if the log file cannot be opened
 */
void init_logging(const SystemConfig& config);

}  // namespace flash_amm::core
