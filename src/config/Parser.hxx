// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <chrono>

/**
 * Parse a string as a boolean value ("yes", "no", "true", "false",
 * "0", "1").
 *
 * Throws on error.
 */
bool
ParseBool(const char *value);

/**
 * Throws on error.
 */
long
ParseLong(const char *s);

/**
 * Throws on error.
 */
unsigned
ParseUnsigned(const char *s);

/**
 * Parse a positive integer (greater than zero).
 *
 * Throws on error.
 */
unsigned
ParsePositive(const char *s);

/**
 * Parse a duration in milliseconds.  The suffixes "ms" and "s" are
 * accepted.
 *
 * Throws on error.
 */
std::chrono::milliseconds
ParseDuration(const char *s);
