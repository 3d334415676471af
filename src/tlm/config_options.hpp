//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_CONFIG_OPTIONS_HPP
#define TLM_CONFIG_OPTIONS_HPP

#include <tlm/config.hpp>
//
#include <tlm/int_types.hpp>
#include <tlm/optional.hpp>
#include <tlm/status.hpp>

#include <initializer_list>
#include <map>
#include <string>
#include <string_view>

namespace tlm {

// The string-keyed option bag handed to backend factories at startup.  Each backend converts it
// into its own typed options struct (see `from_config`) exactly once, at construction.
//
using ConfigOptions = std::map<std::string, std::string>;

/** \brief Fails with StatusCode::kMissingConfigOption if any of `keys` is absent from `options`.
 */
Status require_config_keys(const ConfigOptions& options, std::initializer_list<std::string_view> keys,
                           std::string_view backend_name);

/** \brief Fails with StatusCode::kUnknownConfigOption if `options` contains a key that is not in
 * `known_keys`.
 */
Status reject_unknown_config_keys(const ConfigOptions& options,
                                  std::initializer_list<std::string_view> known_keys,
                                  std::string_view backend_name);

/** \brief Returns the value for `key`, or None if it is not set.
 */
Optional<std::string> get_config_string(const ConfigOptions& options, std::string_view key);

/** \brief Returns the value for `key` parsed as a (base 10) integer, `default_value` if it is not
 * set, or StatusCode::kInvalidConfigValue if it is set but malformed or less than `min_value`.
 */
StatusOr<i64> get_config_int(const ConfigOptions& options, std::string_view key, i64 default_value,
                             i64 min_value = 0);

}  // namespace tlm

#endif  // TLM_CONFIG_OPTIONS_HPP
