#pragma once

/**
 * @file pathsafe.hpp
 * @brief Filename and file path validation and sanitization
 *
 * Umbrella header for the library API. JSON entry points live in
 * <pathsafe/json.hpp>, CLI11 validators in <pathsafe/cli11.hpp>.
 */

#include "pathsafe/engine_config.hpp"
#include "pathsafe/filename.hpp"
#include "pathsafe/filepath.hpp"
#include "pathsafe/null_value_handler.hpp"
#include "pathsafe/path_utils.hpp"
#include "pathsafe/platform.hpp"
#include "pathsafe/result.hpp"
#include "pathsafe/types.hpp"
