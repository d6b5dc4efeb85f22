/*******************************************************************************
 * Helper functions for console IO.
 *
 * @file:   console_io.h
 * @date:   02.03.2026
 ******************************************************************************/
#pragma once

#include <string>

#include "bigap-common/logger.h"

namespace bigap::cio {

void print_delimiter(const std::string &caption = "", char ch = '#');
void print_bigap_banner();
void print_build_identifier();

template <typename NodeID, typename EdgeID> void print_build_datatypes() {
  LOG << "Types:                        NID: " << sizeof(NodeID) << ", EID: " << sizeof(EdgeID);
}

} // namespace bigap::cio
