//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/xpresso/version.hpp
// Purpose: Release version of the X-presso front end and tools.
// Key invariants: XPRESSO_VERSION_STR matches the MAJOR.MINOR.PATCH macros.
// Ownership/Lifetime: N/A.
//
//===----------------------------------------------------------------------===//

#pragma once

#define XPRESSO_VERSION_MAJOR 0
#define XPRESSO_VERSION_MINOR 3
#define XPRESSO_VERSION_PATCH 0
#define XPRESSO_VERSION_STR "0.3.0"
