#pragma once

// Keepsake - Main header
// Include this in a host application

#include <keepsake/context.h>
#include <keepsake/content.h>
#include <keepsake/experience.h>

namespace keepsake {

#define KEEPSAKE_VERSION_MAJOR 0
#define KEEPSAKE_VERSION_MINOR 1
#define KEEPSAKE_VERSION_PATCH 0

// Default profile key inside a storage file
#define KEEPSAKE_PROFILE_KEY "keepsake_profile_v1"

} // namespace keepsake
