// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The stm32cxx Authors

/* Register banks backing the peripheral instances of host builds.
 */

#include <new>

#include <stm32cxx/core.hpp>

namespace stm32cxx {
namespace faked {

RCC_Regs rcc;
GPIO_Regs gpioa;
GPIO_Regs gpiob;
GPIO_Regs gpioc;
SPI_Regs spi1;
SPI_Regs spi2;
SPI_Regs spi3;
TIM_Regs tim2;
TIM_Regs tim3;
SYST_Regs syst;

namespace {

/* Registers cannot be copied, so a bank is returned to its initial
 * state by reconstructing it in place. */
template <typename T>
T&
reconstruct (T& regs)
{
  regs.~T();
  return *new (&regs) T();
}

void
reset_spi (SPI_Regs& spi)
{
  reconstruct(spi);
  spi.SR.raw(SPI_SR_TXE);
  spi.CRCPR.raw(7);
  spi.I2SPR.raw(2);
}

void
reset_tim (TIM_Regs& tim,
           uint32_t arr)
{
  reconstruct(tim);
  tim.ARR.raw(arr);
}

} // ns anonymous

void
reset ()
{
  reconstruct(rcc);
  rcc.CR.raw(0x00000083);
  rcc.PLLCFGR.raw(0x24003010);

  /* PA13-PA15 and PB3-PB4 are the debug port out of reset. */
  reconstruct(gpioa);
  gpioa.MODER.raw(0xA8000000);
  gpioa.OSPEEDR.raw(0x0C000000);
  gpioa.PUPDR.raw(0x64000000);
  reconstruct(gpiob);
  gpiob.MODER.raw(0x00000280);
  gpiob.OSPEEDR.raw(0x000000C0);
  gpiob.PUPDR.raw(0x00000100);
  reconstruct(gpioc);

  reset_spi(spi1);
  reset_spi(spi2);
  reset_spi(spi3);

  reset_tim(tim2, UINT32_MAX);
  reset_tim(tim3, UINT16_MAX);

  reconstruct(syst);
  syst.CALIB.raw(0x40000000);
}

namespace {

/* Start from the reset state without requiring a call to reset(). */
struct power_on
{
  power_on ()
  {
    reset();
  }
} const power_on_reset;

} // ns anonymous

} // namespace faked
} // namespace stm32cxx
