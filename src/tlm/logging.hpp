//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -
//
#pragma once
#ifndef TLM_LOGGING_HPP
#define TLM_LOGGING_HPP

#include <tlm/config.hpp>

#include <glog/logging.h>

namespace tlm {

#define TLM_LOG_ERROR_IMPL() LOG(ERROR)
#define TLM_LOG_WARNING_IMPL() LOG(WARNING)
#define TLM_LOG_INFO() LOG(INFO)
#define TLM_VLOG(verbosity) VLOG((verbosity))

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++

// ERROR and WARNING output is dropped while `suppress_log_output_for_test()` is set, so that
// tests which provoke failures on purpose don't flood the console.
//
#define TLM_LOG_ERROR()                                                                            \
  if (!::tlm::suppress_log_output_for_test())                                                      \
  TLM_LOG_ERROR_IMPL()

#define TLM_LOG_WARNING()                                                                          \
  if (!::tlm::suppress_log_output_for_test())                                                      \
  TLM_LOG_WARNING_IMPL()

}  // namespace tlm

#endif  // TLM_LOGGING_HPP
