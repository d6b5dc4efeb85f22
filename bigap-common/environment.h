/*******************************************************************************
 * Build information passed in from CMake.
 *
 * @file:   environment.h
 * @date:   02.03.2026
 ******************************************************************************/
#pragma once

#include <string>

namespace bigap {
struct Environment {
  static const std::string GIT_SHA1;
  static const std::string HOSTNAME;
};
} // namespace bigap
