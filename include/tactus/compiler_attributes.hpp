#pragma once

/*
 * This file defines macros to apply compiler attributes.
 *
 * The purpose is to allow Tactus to one day be cross-compiler if necessary; for now these are GCC/Clang spellings.
 * */

/*
 * This function is printf-like. Argument m (1-based) is the format string, argument n is the first argument to be used
 * for formatting.
 *
 * Note: don't use this on class methods.
 * */
#define PRINTF_LIKE(m, n) [[gnu::format(printf, m, n)]]
