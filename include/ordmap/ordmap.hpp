#pragma once

/// @file ordmap.hpp
/// @brief Main header file for the ordmap library.

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"
#include "value.hpp"
#include "decode_options.hpp"
#include "writer.hpp"
#include "reader.hpp"
#include "conversion.hpp"
#include "ordered_map.hpp"
#include "ordered_map_json.hpp"
