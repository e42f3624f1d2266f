/*
 * Fallback version header for sieve
 *
 * The build system passes SIEVE_VERSION_* definitions on the compile line; these
 * defaults keep the tree compiling when it does not.
 */

#pragma once

#ifndef SIEVE_VERSION_MAJOR
#define SIEVE_VERSION_MAJOR 0
#endif

#ifndef SIEVE_VERSION_MINOR
#define SIEVE_VERSION_MINOR 0
#endif

#ifndef SIEVE_VERSION_PATCH
#define SIEVE_VERSION_PATCH 0
#endif

#ifndef SIEVE_VERSION_STRING
#define SIEVE_VERSION_STRING "0.0.0+dev"
#endif
