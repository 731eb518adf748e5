#pragma once

/**
 * @file version.hpp
 * @brief Firmware version information
 *
 * Shown in the console welcome banner.
 *
 * VERSION FORMAT: MAJOR.MINOR.PATCH[-SUFFIX]
 */

namespace app {

constexpr const char* kFirmwareVersion = "0.3.0";

constexpr const char* kProjectName = "Pomotodo";

/**
 * @brief Full version string for display, e.g. "Pomotodo Firmware v0.3.0"
 */
constexpr const char* kFullVersionString = "Pomotodo Firmware v0.3.0";

}  // namespace app
