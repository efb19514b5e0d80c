/*
 * Carrier
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libcarrier_Utility_hpp
#define libcarrier_Utility_hpp


#include "libcarrier/utility/base64.hpp"
#include "libcarrier/utility/filesystem.hpp"
#include "libcarrier/utility/json.hpp"
#include "libcarrier/utility/logging.hpp"
#include "libcarrier/utility/process.hpp"
#include "libcarrier/utility/string.hpp"

#endif
