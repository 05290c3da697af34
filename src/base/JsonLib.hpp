#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Exposes `nlohmann::json` as `json` for the wire codec.
 */
using json = nlohmann::json;
