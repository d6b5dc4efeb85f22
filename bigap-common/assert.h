/*******************************************************************************
 * Assertion levels to be used with KASSERT().
 *
 * @file:   assert.h
 * @date:   02.03.2026
 ******************************************************************************/
#pragma once

#ifdef BIGAP_KASSERT_FOUND

#include <kassert/kassert.hpp> // IWYU pragma: export

#else

// Builds without kassert turn every KASSERT() into an assert() and drop the assertion level as
// well as the error message
#include <cassert>
#define KASSERT(x, ...) assert((x))
#define KASSERT_ENABLED(x) 0
#define KASSERT_ASSERTION_LEVEL 0

#endif

namespace bigap::assert {

#define ASSERTION_LEVEL_ALWAYS 0
constexpr int always = ASSERTION_LEVEL_ALWAYS;
#define ASSERTION_LEVEL_LIGHT 10
constexpr int light = ASSERTION_LEVEL_LIGHT;
#define ASSERTION_LEVEL_NORMAL 30
constexpr int normal = ASSERTION_LEVEL_NORMAL;
#define ASSERTION_LEVEL_HEAVY 40
constexpr int heavy = ASSERTION_LEVEL_HEAVY;

} // namespace bigap::assert
