/*
 * Include this file to use assert in test programs. This allows the
 * use of assert and ensures that NDEBUG is undefined (which would
 * cause spurious test passes).
 */

#ifndef PDFSCRUB_ASSERT_TEST_H
#define PDFSCRUB_ASSERT_TEST_H

#ifdef NDEBUG
# undef NDEBUG
#endif
#include <assert.h>

#endif /* PDFSCRUB_ASSERT_TEST_H */
