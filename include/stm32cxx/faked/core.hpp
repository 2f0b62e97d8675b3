/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2026 The stm32cxx Authors */

/** API specific to the faked host-based unit testing supporting <stm32cxx/core.hpp>.
 *
 * Bit definitions and interrupt numbers come from the same CMSIS
 * device header used on hardware.  The register blocks are replaced
 * by ones where each register is an ordinary memory word that can
 * carry read and write hooks.  Tests install
 * hooks to model hardware side effects (a read of `SPI->DR` clearing
 * `RXNE`, a write of `TIM->EGR` reloading the counter) and drive the
 * unmodified driver implementations against them.
 *
 * The peripheral instances declared here reference register banks
 * defined in `src/faked/core.cc` rather than device addresses.
 *
 * @file */

#ifndef STM32CXX_FAKED_CORE_HPP
#define STM32CXX_FAKED_CORE_HPP
#pragma once

#include <cstdint>
#include <functional>
#include <utility>

#include <stm32f4xx.h>

namespace stm32cxx {

/** Material supporting host-based testing. */
namespace faked {

/** A 32-bit register with optional side-effect hooks.
 *
 * Without hooks the register behaves as a memory word.  A read hook
 * receives the stored value and returns the value observed by the
 * reader; a write hook receives the stored and the written values
 * and returns the value to be stored. */
class register_type
{
public:
  using read_hook_type = std::function<uint32_t (uint32_t stored)>;
  using write_hook_type = std::function<uint32_t (uint32_t stored,
                                                  uint32_t written)>;

  register_type () = default;
  register_type (const register_type&) = delete;
  register_type (register_type&&) = delete;
  register_type& operator= (register_type&&) = delete;

  operator uint32_t () const
  {
    if (on_read_) {
      return on_read_(value_);
    }
    return value_;
  }

  register_type& operator= (uint32_t value)
  {
    if (on_write_) {
      value_ = on_write_(value_, value);
    } else {
      value_ = value;
    }
    return *this;
  }

  /** Register-to-register assignment is a read followed by a write,
   * as it would be for `volatile` words. */
  register_type& operator= (const register_type& other)
  {
    return *this = static_cast<uint32_t>(other);
  }

  register_type& operator|= (uint32_t bits)
  {
    return *this = (static_cast<uint32_t>(*this) | bits);
  }

  register_type& operator&= (uint32_t bits)
  {
    return *this = (static_cast<uint32_t>(*this) & bits);
  }

  /** Return the stored value without invoking the read hook. */
  uint32_t raw () const
  {
    return value_;
  }

  /** Replace the stored value without invoking the write hook. */
  void raw (uint32_t value)
  {
    value_ = value;
  }

  /** Install (or with an empty function, remove) the read hook. */
  void on_read (read_hook_type hook)
  {
    on_read_ = std::move(hook);
  }

  /** Install (or with an empty function, remove) the write hook. */
  void on_write (write_hook_type hook)
  {
    on_write_ = std::move(hook);
  }

private:
  uint32_t value_ = 0;
  read_hook_type on_read_;
  write_hook_type on_write_;
};

/** @cond DOXYGEN_EXCLUDE */
/* Register blocks mirroring the CMSIS layouts member for member, as
 * far as the drivers reach into them. */

struct RCC_Regs
{
  register_type CR;
  register_type PLLCFGR;
  register_type CFGR;
  register_type CIR;
  register_type AHB1RSTR;
  register_type AHB2RSTR;
  register_type AHB3RSTR;
  register_type RESERVED0;
  register_type APB1RSTR;
  register_type APB2RSTR;
  register_type RESERVED1[2];
  register_type AHB1ENR;
  register_type AHB2ENR;
  register_type AHB3ENR;
  register_type RESERVED2;
  register_type APB1ENR;
  register_type APB2ENR;
};

struct GPIO_Regs
{
  register_type MODER;
  register_type OTYPER;
  register_type OSPEEDR;
  register_type PUPDR;
  register_type IDR;
  register_type ODR;
  register_type BSRR;
  register_type LCKR;
  register_type AFR[2];
};

struct SPI_Regs
{
  register_type CR1;
  register_type CR2;
  register_type SR;
  register_type DR;
  register_type CRCPR;
  register_type RXCRCR;
  register_type TXCRCR;
  register_type I2SCFGR;
  register_type I2SPR;
};

struct TIM_Regs
{
  register_type CR1;
  register_type CR2;
  register_type SMCR;
  register_type DIER;
  register_type SR;
  register_type EGR;
  register_type CCMR1;
  register_type CCMR2;
  register_type CCER;
  register_type CNT;
  register_type PSC;
  register_type ARR;
  register_type RCR;
  register_type CCR1;
  register_type CCR2;
  register_type CCR3;
  register_type CCR4;
  register_type BDTR;
  register_type DCR;
  register_type DMAR;
  register_type OR;
};

struct SYST_Regs
{
  register_type CTRL;
  register_type LOAD;
  register_type VAL;
  register_type CALIB;
};

extern RCC_Regs rcc;
extern GPIO_Regs gpioa;
extern GPIO_Regs gpiob;
extern GPIO_Regs gpioc;
extern SPI_Regs spi1;
extern SPI_Regs spi2;
extern SPI_Regs spi3;
extern TIM_Regs tim2;
extern TIM_Regs tim3;
extern SYST_Regs syst;
/** @endcond */

/** Return every faked register bank to its documented reset value,
 * removing all hooks. */
void reset ();

template <typename S>
inline uintptr_t base_of (S& regs)
{
  return reinterpret_cast<uintptr_t>(&regs);
}

} // ns faked

namespace stm32f4 {

/** Faked registers are simulation-capable memory words. */
using reg32_type = faked::register_type;

using RCC_Regs = faked::RCC_Regs;
using GPIO_Regs = faked::GPIO_Regs;
using SPI_Regs = faked::SPI_Regs;
using TIM_Regs = faked::TIM_Regs;
using SYST_Regs = faked::SYST_Regs;

using RCC_Type = peripheral<RCC_Regs>;
using GPIO_Type = peripheral<GPIO_Regs>;
using SPI_Type = peripheral<SPI_Regs>;
using TIM_Type = peripheral<TIM_Regs>;
using SYST_Type = peripheral<SYST_Regs>;

inline const RCC_Type rcc{faked::base_of(faked::rcc)};

inline const GPIO_Type gpioa{faked::base_of(faked::gpioa), GPIO_Type::NO_IRQ, 0, 16, bus_type::AHB1, RCC_AHB1ENR_GPIOAEN_Pos};
inline const GPIO_Type gpiob{faked::base_of(faked::gpiob), GPIO_Type::NO_IRQ, 1, 16, bus_type::AHB1, RCC_AHB1ENR_GPIOBEN_Pos};
inline const GPIO_Type gpioc{faked::base_of(faked::gpioc), GPIO_Type::NO_IRQ, 2, 16, bus_type::AHB1, RCC_AHB1ENR_GPIOCEN_Pos};

inline const SPI_Type spi1{faked::base_of(faked::spi1), SPI1_IRQn, 1, 0, bus_type::APB2, RCC_APB2ENR_SPI1EN_Pos};
inline const SPI_Type spi2{faked::base_of(faked::spi2), SPI2_IRQn, 2, 0, bus_type::APB1, RCC_APB1ENR_SPI2EN_Pos};
inline const SPI_Type spi3{faked::base_of(faked::spi3), SPI3_IRQn, 3, 0, bus_type::APB1, RCC_APB1ENR_SPI3EN_Pos};

inline const TIM_Type tim2{faked::base_of(faked::tim2), TIM2_IRQn, 2, 32, bus_type::APB1, RCC_APB1ENR_TIM2EN_Pos};
inline const TIM_Type tim3{faked::base_of(faked::tim3), TIM3_IRQn, 3, 16, bus_type::APB1, RCC_APB1ENR_TIM3EN_Pos};

inline const SYST_Type syst{faked::base_of(faked::syst), SysTick_IRQn};

namespace series {

inline const GPIO_Type* const GPIO_PORTS[] = {
  &gpioa, &gpiob, &gpioc, nullptr, nullptr, nullptr, nullptr, nullptr,
};

} // ns series

} // ns stm32f4
} // ns stm32cxx

#endif /* STM32CXX_FAKED_CORE_HPP */
