/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2026 The stm32cxx Authors */

/** Core clock-related functionality
 *
 * @file */
#ifndef STM32CXX_CLOCK_HPP
#define STM32CXX_CLOCK_HPP
#pragma once

#include <stm32cxx/impl.hpp>

namespace stm32cxx {

/** Functions and classes related to clocks and peripheral clock
 * gating */
namespace clock {

/** The frozen clock tree of the device.
 *
 * An instance is created once at boot, after the clock tree has been
 * configured, and passed by reference to every driver constructor
 * that must derive a register value (a baud-rate divisor, a
 * prescaler) from a bus frequency.  Instances are immutable. */
class clocks
{
public:
  /** Frequency of the internal RC oscillator, which is the system
   * clock out of reset. */
  constexpr static unsigned int HSI_Hz = 16'000'000;

  /** Construct from a system clock and the bus prescaler divisors.
   *
   * @param sysclk_Hz the SYSCLK frequency
   *
   * @param hpre the AHB prescaler (1, 2, 4, ..., 512)
   *
   * @param ppre1 the APB1 prescaler (1, 2, 4, 8, 16)
   *
   * @param ppre2 the APB2 prescaler (1, 2, 4, 8, 16) */
  constexpr clocks (unsigned int sysclk_Hz,
                    unsigned int hpre = 1,
                    unsigned int ppre1 = 1,
                    unsigned int ppre2 = 1) :
    sysclk_Hz_{sysclk_Hz},
    hpre_{hpre},
    ppre1_{ppre1},
    ppre2_{ppre2}
  { }

  /** The clock tree out of reset: HSI with all prescalers at 1. */
  static constexpr clocks hsi_default ()
  {
    return clocks{HSI_Hz};
  }

  /** Decode the clock tree from the current RCC configuration.
   *
   * @param hse_Hz the frequency of the external oscillator, used when
   * SYSCLK or the PLL input is HSE.
   *
   * @note The configuration is read once; a later change to the RCC
   * registers is not reflected in the returned value. */
  static clocks from_rcc (unsigned int hse_Hz);

  /** The system clock frequency. */
  constexpr unsigned int sysclk_Hz () const
  {
    return sysclk_Hz_;
  }

  /** The AHB (core, SysTick) clock frequency. */
  constexpr unsigned int hclk_Hz () const
  {
    return sysclk_Hz_ / hpre_;
  }

  /** The APB1 peripheral clock frequency. */
  constexpr unsigned int pclk1_Hz () const
  {
    return hclk_Hz() / ppre1_;
  }

  /** The APB2 peripheral clock frequency. */
  constexpr unsigned int pclk2_Hz () const
  {
    return hclk_Hz() / ppre2_;
  }

  /** The peripheral clock frequency for a bus. */
  constexpr unsigned int pclk_Hz (stm32f4::bus_type bus) const
  {
    return (stm32f4::bus_type::APB1 == bus) ? pclk1_Hz()
      : (stm32f4::bus_type::APB2 == bus) ? pclk2_Hz()
      : hclk_Hz();
  }

  /** The timer kernel clock frequency for a bus.
   *
   * Timers on an APB bus whose prescaler is not 1 are clocked at twice
   * the bus frequency. */
  constexpr unsigned int timclk_Hz (stm32f4::bus_type bus) const
  {
    return (((stm32f4::bus_type::APB1 == bus) && (1 != ppre1_))
            || ((stm32f4::bus_type::APB2 == bus) && (1 != ppre2_)))
      ? 2 * pclk_Hz(bus)
      : pclk_Hz(bus);
  }

private:
  unsigned int sysclk_Hz_;
  unsigned int hpre_;
  unsigned int ppre1_;
  unsigned int ppre2_;
};

/** Peripheral clock gating and reset through RCC.
 *
 * @note This is a data type for visibility management only; all
 * members are static and it is not possible to create or manipulate
 * instances of the type. */
class rcc
{
  rcc () = delete;
  ~rcc () = delete;
  rcc (const rcc&) = delete;
  rcc& operator= (const rcc&) = delete;
  rcc (rcc&& ) = delete;
  rcc& operator= (rcc&) = delete;

public:
  /** Enable the bus clock of @p periph. */
  template <typename S>
  static void enable (const stm32f4::peripheral<S>& periph)
  {
    set_enabled_(periph.BUS, periph.RCC_BIT, true);
  }

  /** Disable the bus clock of @p periph. */
  template <typename S>
  static void disable (const stm32f4::peripheral<S>& periph)
  {
    set_enabled_(periph.BUS, periph.RCC_BIT, false);
  }

  /** Return @c true iff the bus clock of @p periph is enabled. */
  template <typename S>
  static bool enabled (const stm32f4::peripheral<S>& periph)
  {
    return enabled_(periph.BUS, periph.RCC_BIT);
  }

  /** Reset @p periph by pulsing its bus reset bit.
   *
   * All registers of the peripheral return to their reset values. */
  template <typename S>
  static void reset (const stm32f4::peripheral<S>& periph)
  {
    reset_(periph.BUS, periph.RCC_BIT);
  }

private:
  static void set_enabled_ (stm32f4::bus_type bus,
                            unsigned int bit,
                            bool enabled);
  static bool enabled_ (stm32f4::bus_type bus,
                        unsigned int bit);
  static void reset_ (stm32f4::bus_type bus,
                      unsigned int bit);
};

} // ns clock
} // ns stm32cxx

#endif /* STM32CXX_CLOCK_HPP */
