//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the TLM Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef TLM_VOLUME_FLAGS_HPP
#define TLM_VOLUME_FLAGS_HPP

#include <tlm/config.hpp>
//
#include <tlm/int_types.hpp>

#include <array>
#include <ostream>
#include <string>
#include <string_view>

namespace tlm {

/** \brief A single condition bit of a volume.  The numeric values are the persisted bit positions.
 */
enum struct VolumeFlag : u32 {
  // The volume is being moved by the media changer; set when a move commits its intent and cleared
  // when the move is finalized.
  //
  kTransfering = u32{1} << 0,

  // The volume sits in (or is on its way to) a transfer slot.
  //
  kMounted = u32{1} << 1,

  kNeedsCleaning = u32{1} << 2,

  // The volume has already been formatted.
  //
  kFormatted = u32{1} << 3,
};

/** \brief Flags in their stable display order.
 */
constexpr std::array<VolumeFlag, 4> kAllVolumeFlags = {
    VolumeFlag::kTransfering,
    VolumeFlag::kMounted,
    VolumeFlag::kNeedsCleaning,
    VolumeFlag::kFormatted,
};

std::string_view to_string(VolumeFlag flag);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief The set of VolumeFlag conditions of a volume.
 *
 * This is the only place where flag bits are interpreted; everything else goes through set, clear
 * and test.
 */
class VolumeFlags
{
 public:
  static constexpr u32 kAllBits = 0xf;

  static VolumeFlags from_bits(u32 bits)
  {
    return VolumeFlags{bits};
  }

  VolumeFlags() = default;

  VolumeFlags& set(VolumeFlag flag)
  {
    this->bits_ |= static_cast<u32>(flag);
    return *this;
  }

  VolumeFlags& clear(VolumeFlag flag)
  {
    this->bits_ &= ~static_cast<u32>(flag);
    return *this;
  }

  /** \brief Sets `flag` if `on` is true, clears it otherwise.
   */
  VolumeFlags& assign(VolumeFlag flag, bool on)
  {
    return on ? this->set(flag) : this->clear(flag);
  }

  bool test(VolumeFlag flag) const
  {
    return (this->bits_ & static_cast<u32>(flag)) != 0;
  }

  bool empty() const
  {
    return this->bits_ == 0;
  }

  u32 bits() const
  {
    return this->bits_;
  }

  /** \brief Returns a comma-separated list of the set flags in display order
   * ("transfering,mounted,needs-cleaning,formatted"), or "none" if no flag is set.
   */
  std::string to_string() const;

 private:
  explicit VolumeFlags(u32 bits) noexcept : bits_{bits}
  {
  }

  u32 bits_ = 0;
};

inline bool operator==(const VolumeFlags& l, const VolumeFlags& r)
{
  return l.bits() == r.bits();
}

inline bool operator!=(const VolumeFlags& l, const VolumeFlags& r)
{
  return !(l == r);
}

std::ostream& operator<<(std::ostream& out, const VolumeFlags& t);

}  // namespace tlm

#endif  // TLM_VOLUME_FLAGS_HPP
