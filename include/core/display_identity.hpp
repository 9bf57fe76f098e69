#pragma once

#include <cstdint>
#include <string>

#include "core/frame.hpp"

/*
    Stable display identity. Runtime display handles change across reboots and re-plugs, so frames
    are tagged with an id hashed from the monitor's vendor/model/serial instead.

    Fingerprint rules:
      - vendor, model and serial all zero: "runtime:<handle>" (only stable for this session)
      - serial non-zero:                   "vendor:model:serial"
      - serial zero:                       "vendor:model:WxH" so identical panels on one machine differ
    Numbers are decimal and the resolution is written without spaces ("1552:41240:3024x1964").
    Persisted ids depend on this exact text, so it must not change.
    The fingerprint is hashed with 32-bit FNV-1a, masked to 31 bits so it fits a signed 32-bit
    column, and 0 is remapped to 1 (0 means unknown).
*/

namespace rwc {

std::uint32_t Fnv1a32(const std::string& data);

std::string DisplayFingerprint(const DisplayHardwareInfo& hw, std::uint32_t runtime_id);

std::uint32_t StableDisplayId(const DisplayHardwareInfo& hw, std::uint32_t runtime_id);

// True when the hardware reported nothing, i.e. the id is session scoped
bool IsSessionScopedIdentity(const DisplayHardwareInfo& hw);

} // namespace rwc
