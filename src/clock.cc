// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The stm32cxx Authors

#include <stm32cxx/clock.hpp>

namespace stm32cxx {
namespace clock {

namespace {

/* AHB prescaler encodings 0b1000 through 0b1111.  Note that there is
 * no divide-by-32 setting. */
constexpr uint16_t hpre_divisors[] = {2, 4, 8, 16, 64, 128, 256, 512};

unsigned int
decode_hpre (uint32_t cfgr)
{
  using namespace stm32f4;
  unsigned int v = (cfgr & RCC_CFGR_HPRE_Msk) >> RCC_CFGR_HPRE_Pos;
  if (!(0x08 & v)) {
    return 1;
  }
  return hpre_divisors[v & 0x07];
}

/* APB prescalers divide by 2 through 16 for encodings 0b100 through
 * 0b111. */
unsigned int
decode_ppre (unsigned int v)
{
  if (!(0x04 & v)) {
    return 1;
  }
  return 2U << (v & 0x03);
}

stm32f4::reg32_type*
enable_register (stm32f4::bus_type bus)
{
  using namespace stm32f4;
  switch (bus) {
    case bus_type::AHB1:
      return &stm32f4::rcc->AHB1ENR;
    case bus_type::APB1:
      return &stm32f4::rcc->APB1ENR;
    case bus_type::APB2:
      return &stm32f4::rcc->APB2ENR;
    default:
      break;
  }
  return nullptr;
}

stm32f4::reg32_type*
reset_register (stm32f4::bus_type bus)
{
  using namespace stm32f4;
  switch (bus) {
    case bus_type::AHB1:
      return &stm32f4::rcc->AHB1RSTR;
    case bus_type::APB1:
      return &stm32f4::rcc->APB1RSTR;
    case bus_type::APB2:
      return &stm32f4::rcc->APB2RSTR;
    default:
      break;
  }
  return nullptr;
}

} // ns anonymous

clocks
clocks::from_rcc (unsigned int hse_Hz)
{
  using namespace stm32f4;

  uint32_t cfgr = stm32f4::rcc->CFGR;
  unsigned int sysclk_Hz = HSI_Hz;
  switch (cfgr & RCC_CFGR_SWS_Msk) {
    case RCC_CFGR_SWS_HSE:
      sysclk_Hz = hse_Hz;
      break;
    case RCC_CFGR_SWS_PLL: {
      uint32_t pllcfgr = stm32f4::rcc->PLLCFGR;
      unsigned int src_Hz = (pllcfgr & RCC_PLLCFGR_PLLSRC_HSE) ? hse_Hz : HSI_Hz;
      unsigned int pllm = (pllcfgr & RCC_PLLCFGR_PLLM_Msk) >> RCC_PLLCFGR_PLLM_Pos;
      unsigned int plln = (pllcfgr & RCC_PLLCFGR_PLLN_Msk) >> RCC_PLLCFGR_PLLN_Pos;
      unsigned int pllp = 2 * (1 + ((pllcfgr & RCC_PLLCFGR_PLLP_Msk) >> RCC_PLLCFGR_PLLP_Pos));
      if (!pllm) {
        /* PLLM values 0 and 1 are invalid; a zero here means the
         * register was never configured. */
        failsafe(FailSafeCode::INTERNAL_ERROR);
      }
      uint64_t vco_Hz = (static_cast<uint64_t>(src_Hz) * plln) / pllm;
      sysclk_Hz = static_cast<unsigned int>(vco_Hz / pllp);
      break;
    }
    default:
      break;
  }
  return clocks{sysclk_Hz,
                decode_hpre(cfgr),
                decode_ppre((cfgr & RCC_CFGR_PPRE1_Msk) >> RCC_CFGR_PPRE1_Pos),
                decode_ppre((cfgr & RCC_CFGR_PPRE2_Msk) >> RCC_CFGR_PPRE2_Pos)};
}

void
rcc::set_enabled_ (stm32f4::bus_type bus,
                   unsigned int bit,
                   bool enabled)
{
  auto enr = enable_register(bus);
  if (!enr) {
    return;
  }
  if (enabled) {
    *enr |= (1U << bit);
  } else {
    *enr &= ~(1U << bit);
  }
}

bool
rcc::enabled_ (stm32f4::bus_type bus,
               unsigned int bit)
{
  auto enr = enable_register(bus);
  if (!enr) {
    return true;
  }
  return (1U << bit) & *enr;
}

void
rcc::reset_ (stm32f4::bus_type bus,
             unsigned int bit)
{
  auto rstr = reset_register(bus);
  if (!rstr) {
    return;
  }
  *rstr |= (1U << bit);
  *rstr &= ~(1U << bit);
}

} // namespace clock
} // namespace stm32cxx
