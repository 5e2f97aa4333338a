#pragma once
/**
 * @file sfh_base.hpp
 * @brief Base layer umbrella header: fmt, formatting tools, Result and the Logger.
 *
 * Every translation unit of the library includes this header first.
 */

#include "sfhost_export.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/logger.hpp"
#include "utils/result.hpp"
