/*******************************************************************************
 * Prints a detailed version message including the build configuration.
 *
 * @file:   version.h
 * @date:   08.03.2026
 ******************************************************************************/
#pragma once

namespace bigap {

void print_version();

} // namespace bigap
