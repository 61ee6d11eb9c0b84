/**
 * @file gsl.hpp
 * @brief Internal bridge header for gsl-lite v1.
 *
 * Provides a scoped namespace alias for gsl-lite so its use stays
 * explicit and greppable (chip8::gsl::span, gsl_Expects).
 *
 * gsl-lite v1 uses:
 *   - Namespace: gsl_lite (not gsl)
 *   - Header: <gsl-lite/gsl-lite.hpp> (not <gsl/gsl>)
 *
 * Contract violations are configured to throw
 * (gsl_CONFIG_CONTRACT_VIOLATION_THROWS, set by CMake) so tests can
 * observe them with EXPECT_THROW.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gsl-lite/gsl-lite.hpp>

namespace chip8 {

namespace gsl = ::gsl_lite;

} // namespace chip8
