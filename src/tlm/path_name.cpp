//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <tlm/path_name.hpp>
//

#include <boost/algorithm/string/split.hpp>

#include <vector>

namespace tlm {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<PathName> PathName::parse(std::string_view str)
{
  if (str.empty() || str.front() != '/') {
    return make_status(StatusCode::kInvalidPath);
  }

  std::vector<std::string> parts;
  boost::algorithm::split(parts, str, [](char ch) {
    return ch == '/';
  });

  std::string normalized;
  for (const std::string& part : parts) {
    if (part.empty()) {
      continue;
    }
    if (part == "." || part == "..") {
      return make_status(StatusCode::kInvalidPath);
    }
    normalized += '/';
    normalized += part;
  }
  if (normalized.empty()) {
    normalized = "/";
  }

  return PathName{std::move(normalized)};
}

}  // namespace tlm
