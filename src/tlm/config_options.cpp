//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <tlm/config_options.hpp>
//

#include <boost/lexical_cast.hpp>

#include <algorithm>

namespace tlm {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status require_config_keys(const ConfigOptions& options, std::initializer_list<std::string_view> keys,
                           std::string_view backend_name)
{
  for (std::string_view key : keys) {
    if (options.count(std::string{key}) == 0) {
      TLM_LOG_ERROR() << backend_name << ": the " << key << " option must be specified";
      return make_status(StatusCode::kMissingConfigOption);
    }
  }
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status reject_unknown_config_keys(const ConfigOptions& options,
                                  std::initializer_list<std::string_view> known_keys,
                                  std::string_view backend_name)
{
  for (const auto& [key, value] : options) {
    (void)value;
    if (std::find(known_keys.begin(), known_keys.end(), key) == known_keys.end()) {
      TLM_LOG_ERROR() << backend_name << ": unknown option " << key;
      return make_status(StatusCode::kUnknownConfigOption);
    }
  }
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Optional<std::string> get_config_string(const ConfigOptions& options, std::string_view key)
{
  auto iter = options.find(std::string{key});
  if (iter == options.end()) {
    return None;
  }
  return iter->second;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> get_config_int(const ConfigOptions& options, std::string_view key, i64 default_value,
                             i64 min_value)
{
  Optional<std::string> str = get_config_string(options, key);
  if (!str) {
    return default_value;
  }

  i64 value = 0;
  if (!boost::conversion::try_lexical_convert(*str, value) || value < min_value) {
    TLM_LOG_ERROR() << "bad value for option " << key << ": " << *str;
    return make_status(StatusCode::kInvalidConfigValue);
  }
  return value;
}

}  // namespace tlm
