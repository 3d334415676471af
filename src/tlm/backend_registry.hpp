//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_BACKEND_REGISTRY_HPP
#define TLM_BACKEND_REGISTRY_HPP

#include <tlm/config.hpp>
//
#include <tlm/config_options.hpp>
#include <tlm/logging.hpp>
#include <tlm/status.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tlm {

/** \brief A map from backend name to factory function, built once at process startup and passed to
 * whatever needs to instantiate a backend.
 *
 * \tparam T The abstract interface the registered backends implement (e.g., Changer).
 */
template <typename T>
class BackendRegistry
{
 public:
  using Factory = std::function<StatusOr<std::unique_ptr<T>>(const ConfigOptions&)>;

  /** \brief Registers `factory` under `name`; fails with StatusCode::kAlreadyExists if the name is
   * taken.
   */
  Status add(std::string_view name, Factory factory)
  {
    auto [iter, inserted] = this->factories_.emplace(std::string{name}, std::move(factory));
    (void)iter;
    if (!inserted) {
      return make_status(StatusCode::kAlreadyExists);
    }
    return OkStatus();
  }

  bool contains(std::string_view name) const
  {
    return this->factories_.find(name) != this->factories_.end();
  }

  /** \brief Returns the registered names in sorted order.
   */
  std::vector<std::string> names() const
  {
    std::vector<std::string> result;
    for (const auto& [name, factory] : this->factories_) {
      (void)factory;
      result.emplace_back(name);
    }
    return result;
  }

  /** \brief Instantiates the backend registered as `name`, passing it `options`.
   *
   * Fails with StatusCode::kUnknownBackend if nothing is registered under `name`; otherwise returns
   * whatever the factory returns (including configuration errors).
   */
  StatusOr<std::unique_ptr<T>> create(std::string_view name, const ConfigOptions& options) const
  {
    auto iter = this->factories_.find(name);
    if (iter == this->factories_.end()) {
      TLM_LOG_ERROR() << "no backend registered as '" << name << "'";
      return make_status(StatusCode::kUnknownBackend);
    }
    return iter->second(options);
  }

 private:
  std::map<std::string, Factory, std::less<>> factories_;
};

}  // namespace tlm

#endif  // TLM_BACKEND_REGISTRY_HPP
