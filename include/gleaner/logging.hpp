#pragma once

/** \file logging.hpp
 *  \brief Library logger: one named spdlog logger shared by every component.
 *
 * Components prefix their lines with a bracketed tag, e.g. "[ingest]".
 */

#include <expected>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "gleaner/error.hpp"

namespace gleaner::log {

inline constexpr const char* LOGGER_NAME = "gleaner";

struct logging_settings {
  std::string level{"info"};  /**< trace|debug|info|warn|error|critical|off */
  std::string file;           /**< empty: colored stderr */
};

/** \brief (Re)installs the library logger. config_invalid on an unknown level. */
auto configure(const logging_settings& s) -> std::expected<void, core::error>;

/** \brief The library logger; created lazily on stderr at info if never configured. */
auto get() -> std::shared_ptr<spdlog::logger>;

} // namespace gleaner::log
