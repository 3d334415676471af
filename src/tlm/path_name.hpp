//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_PATH_NAME_HPP
#define TLM_PATH_NAME_HPP

#include <tlm/config.hpp>
//
#include <tlm/status.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace tlm {

/** \brief A normalized, absolute, slash-separated logical path in the tree index (e.g.
 * "/projects/run42/part-0001").
 *
 * Repeated and trailing slashes are collapsed; empty input, relative paths and "." or ".."
 * components are rejected with StatusCode::kInvalidPath.
 */
class PathName
{
 public:
  static StatusOr<PathName> parse(std::string_view str);

  const std::string& str() const
  {
    return this->str_;
  }

  bool is_root() const
  {
    return this->str_ == "/";
  }

 private:
  explicit PathName(std::string&& str) noexcept : str_{std::move(str)}
  {
  }

  std::string str_;
};

inline bool operator==(const PathName& l, const PathName& r)
{
  return l.str() == r.str();
}

inline bool operator!=(const PathName& l, const PathName& r)
{
  return !(l == r);
}

inline bool operator<(const PathName& l, const PathName& r)
{
  return l.str() < r.str();
}

inline std::ostream& operator<<(std::ostream& out, const PathName& t)
{
  return out << t.str();
}

}  // namespace tlm

#endif  // TLM_PATH_NAME_HPP
