/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcarrier_LogLevel_hpp
#define libcarrier_LogLevel_hpp

#include <string>

namespace libcarrier {

enum class LogLevel {DEBUG, INFO, WARN, ERROR, GENERAL};

std::string logLevelToString(LogLevel);

}

#endif
