//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_INT_TYPES_HPP
#define TLM_INT_TYPES_HPP

#include <batteries/int_types.hpp>

namespace tlm {

namespace int_types {

using namespace batt::int_types;

}  // namespace int_types

using namespace int_types;

}  // namespace tlm

#endif  // TLM_INT_TYPES_HPP
