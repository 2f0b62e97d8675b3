// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The stm32cxx Authors

#include <array>

#include <stm32cxx/periph.hpp>

namespace stm32cxx {
namespace periph {
namespace details {

namespace {

/* Base addresses of claimed peripherals.  Zero marks a free slot. */
std::array<uintptr_t, STM32CXX_PERIPH_CLAIM_SLOTS> claims;

} // anonymous

void
claim_registry::claim (uintptr_t base)
{
  uintptr_t* freep = nullptr;
  for (auto& slot : claims) {
    if (base == slot) {
      failsafe(FailSafeCode::RESOURCE_VIOLATION);
    }
    if ((!slot) && (!freep)) {
      freep = &slot;
    }
  }
  if (!freep) {
    failsafe(FailSafeCode::RESOURCE_VIOLATION);
  }
  *freep = base;
}

void
claim_registry::unclaim (uintptr_t base)
{
  for (auto& slot : claims) {
    if (base == slot) {
      slot = 0;
      return;
    }
  }
}

bool
claim_registry::claimed (uintptr_t base)
{
  for (auto slot : claims) {
    if (base == slot) {
      return true;
    }
  }
  return false;
}

} // namespace details
} // namespace periph
} // namespace stm32cxx
