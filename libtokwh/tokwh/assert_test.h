/*
 * Include this file to use assert in test code. It ensures that
 * NDEBUG is undefined so that release builds of the tests still
 * check their assertions.
 */

#ifndef TOKWH_ASSERT_TEST_H
#define TOKWH_ASSERT_TEST_H

#ifdef NDEBUG
# undef NDEBUG
#endif
#include <assert.h>

#endif /* TOKWH_ASSERT_TEST_H */
