/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef RELEASE_H
#define RELEASE_H

#include <string>

#define SCREENWATCH_VERSION_MAJOR 0
#define SCREENWATCH_VERSION_MINOR 2
#define SCREENWATCH_VERSION_PATCH 0
#define SCREENWATCH_VERSION_TWEAK 0

#define SW__STRINGIFY(x) #x
#define SW_STRINGIFY(x) SW__STRINGIFY(x)

#define SCREENWATCH_VERSION_STRING \
SW_STRINGIFY(SCREENWATCH_VERSION_MAJOR) "." \
    SW_STRINGIFY(SCREENWATCH_VERSION_MINOR) "." \
    SW_STRINGIFY(SCREENWATCH_VERSION_PATCH) "." \
    SW_STRINGIFY(SCREENWATCH_VERSION_TWEAK)

const std::string g_version_datetime = "20261019";

const std::string g_version = std::string("version ") + std::string(SCREENWATCH_VERSION_STRING) + " - " + g_version_datetime;

#endif // RELEASE_H
