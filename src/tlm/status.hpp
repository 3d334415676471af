//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_STATUS_HPP
#define TLM_STATUS_HPP

#include <tlm/logging.hpp>
#include <tlm/status_code.hpp>

#include <batteries/optional.hpp>
#include <batteries/status.hpp>

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/stringize.hpp>

namespace tlm {

using batt::OkStatus;
using batt::Status;
using batt::StatusOr;

#define TLM_WARN_IF_NOT_OK(expr)                                                                   \
  for (auto BOOST_PP_CAT(tlm_TmpStatusResult, __LINE__) = ::batt::make_optional((expr));           \
       BATT_HINT_FALSE(BOOST_PP_CAT(tlm_TmpStatusResult, __LINE__) &&                              \
                       !BOOST_PP_CAT(tlm_TmpStatusResult, __LINE__)->ok());                        \
       BOOST_PP_CAT(tlm_TmpStatusResult, __LINE__) = ::batt::None)                                 \
  TLM_LOG_WARNING() << "Expected OK result, but got: \n\n"                                         \
                    << BOOST_PP_STRINGIZE((expr)) << " == "                                        \
                                                  << BOOST_PP_CAT(tlm_TmpStatusResult, __LINE__)   \
                                                  << "\n\n"

}  // namespace tlm

#endif  // TLM_STATUS_HPP
