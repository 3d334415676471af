//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_FAKE_CHANGER_HPP
#define TLM_FAKE_CHANGER_HPP

#include <tlm/config.hpp>
//
#include <tlm/changer.hpp>
#include <tlm/config_options.hpp>

#include <atomic>
#include <memory>

namespace tlm {

struct FakeChangerOptions {
  /** \brief The fake changer accepts (and ignores) any option.
   */
  static StatusOr<FakeChangerOptions> from_config(const ConfigOptions& options);
};

/** \brief A null changer: performs no physical action and reports success for every move.
 *
 * Used to exercise the Inventory's bookkeeping without hardware.  status() reports an empty
 * library.
 */
class FakeChanger : public Changer
{
 public:
  static StatusOr<std::unique_ptr<Changer>> make(const ConfigOptions& options);

  explicit FakeChanger(const FakeChangerOptions& options = {}) noexcept;

  StatusOr<SlotStatus> status() override;

  Status load(const Location& src, const Location& dst) override;

  Status unload(const Location& src, const Location& dst) override;

  Status transfer(const Location& src, const Location& dst) override;

  /** \brief The number of move operations (of any kind) performed so far.
   */
  usize move_count() const
  {
    return this->move_count_.load();
  }

 private:
  std::atomic<usize> move_count_{0};
};

}  // namespace tlm

#endif  // TLM_FAKE_CHANGER_HPP
