//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <tlm/fake_changer.hpp>
//

namespace tlm {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<FakeChangerOptions> FakeChangerOptions::from_config(const ConfigOptions&)
{
  return FakeChangerOptions{};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<std::unique_ptr<Changer>> FakeChanger::make(const ConfigOptions& options)
{
  BATT_ASSIGN_OK_RESULT(FakeChangerOptions fake_options, FakeChangerOptions::from_config(options));

  std::unique_ptr<Changer> changer = std::make_unique<FakeChanger>(fake_options);
  return changer;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
FakeChanger::FakeChanger(const FakeChangerOptions&) noexcept
{
  initialize_status_codes();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<SlotStatus> FakeChanger::status()
{
  return SlotStatus{};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status FakeChanger::load(const Location& src, const Location& dst)
{
  TLM_VLOG(1) << "FakeChanger::load(" << src << " -> " << dst << ")";
  this->move_count_.fetch_add(1);
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status FakeChanger::unload(const Location& src, const Location& dst)
{
  TLM_VLOG(1) << "FakeChanger::unload(" << src << " -> " << dst << ")";
  this->move_count_.fetch_add(1);
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status FakeChanger::transfer(const Location& src, const Location& dst)
{
  TLM_VLOG(1) << "FakeChanger::transfer(" << src << " -> " << dst << ")";
  this->move_count_.fetch_add(1);
  return OkStatus();
}

}  // namespace tlm
