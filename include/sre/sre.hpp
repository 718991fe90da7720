#pragma once

/// @file sre.hpp
/// @brief Umbrella header: version information and the core Result type.

#include "sre/core/result.hpp"
#include "sre/version.hpp"
