//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_OPTIONAL_HPP
#define TLM_OPTIONAL_HPP

#include <batteries/optional.hpp>

namespace tlm {

using ::batt::None;
using ::batt::Optional;

}  // namespace tlm

#endif  // TLM_OPTIONAL_HPP
