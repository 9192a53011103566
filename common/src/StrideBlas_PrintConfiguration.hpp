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

#ifndef STRIDEBLAS_PRINT_CONFIGURATION_HPP_
#define STRIDEBLAS_PRINT_CONFIGURATION_HPP_

#include <iosfwd>
#include <string_view>

namespace StrideBlas {
constexpr std::string_view VersionKey              = "StrideBlas Version";
constexpr std::string_view InstantiatedScalarsKey  = "Instantiated scalars";
constexpr std::string_view EtiOnlyKey              = "ETI only";
constexpr std::string_view DebugBoundsCheckKey     = "Debug bounds check";

/// \brief Print the version and the build options StrideBlas was
///   configured with, one "key: value" pair per line.
void print_configuration(std::ostream& os);

}  // namespace StrideBlas
#endif  // STRIDEBLAS_PRINT_CONFIGURATION_HPP_
