//@HEADER
// ************************************************************************
//
//                        Kokkos v. 4.0
//       Copyright (2022) National Technology & Engineering
//               Solutions of Sandia, LLC (NTESS).
//
// Under the terms of Contract DE-NA0003525 with NTESS,
// the U.S. Government retains certain rights in this software.
//
// Part of Kokkos, under the Apache License v2.0 with LLVM Exceptions.
// See https://kokkos.org/LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//@HEADER

#include "StrideBlas_PrintConfiguration.hpp"
#include "StrideBlas_config.h"

#include <iostream>
#include <list>
#include <string>

namespace {
void print_instantiated_scalars(std::ostream& os) {
  std::list<std::string> scalars;
#ifdef STRIDEBLAS_INST_FLOAT
  scalars.emplace_back("float");
#endif
#ifdef STRIDEBLAS_INST_DOUBLE
  scalars.emplace_back("double");
#endif
  if (!scalars.empty()) {
    auto it = scalars.cbegin();
    os << *it;
    ++it;
    for (; it != scalars.cend(); ++it) {
      os << ";" << *it;
    }
  }
}

const char* on_off(bool enabled) { return enabled ? "ON" : "OFF"; }

}  // namespace

void StrideBlas::print_configuration(std::ostream& os) {
  os << VersionKey << ": " << STRIDEBLAS_VERSION << '\n';

  os << InstantiatedScalarsKey << ": ";
  print_instantiated_scalars(os);
  os << '\n';

#ifdef STRIDEBLAS_ETI_ONLY
  os << EtiOnlyKey << ": " << on_off(true) << '\n';
#else
  os << EtiOnlyKey << ": " << on_off(false) << '\n';
#endif

#ifdef STRIDEBLAS_ENABLE_DEBUG_BOUNDS_CHECK
  os << DebugBoundsCheckKey << ": " << on_off(true) << '\n';
#else
  os << DebugBoundsCheckKey << ": " << on_off(false) << '\n';
#endif
}
