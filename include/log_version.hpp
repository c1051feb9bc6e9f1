/**
 * @file log_version.hpp
 * @brief Version information for the tagsink logging library
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

namespace tagsink
{

#ifndef TAGSINK_VERSION_STRING
    #define TAGSINK_VERSION_STRING "dev"
#endif

inline constexpr const char *VERSION = TAGSINK_VERSION_STRING;

} // namespace tagsink
