/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2026 The stm32cxx Authors */

/** Primary header for stm32cxx interface dependencies.
 *
 * Including this module introduces a dependency on the CMSIS device
 * header `<stm32f4xx.h>`, which supplies the register layouts, bit
 * definitions and interrupt numbers (on host builds the layouts are
 * replaced by faked equivalents).  It
 * declares the peripheral descriptor used by every driver, the
 * fail-safe infrastructure, and a few helpers shared by all
 * peripheral abstractions.
 *
 * The ::stm32cxx::stm32f4 namespace defines stm32f4::peripheral
 * instances for all peripherals supported by the library, such as
 * `spi1`, `tim2`, `gpioa`, or `syst`.  These are lower case because
 * the device header claims the upper-case names as macros.
 *
 * @file */

#ifndef STM32CXX_CORE_HPP
#define STM32CXX_CORE_HPP
#pragma once

#include <cstddef>
#include <cstdint>

#ifndef STM32CXX_FAKED
/** Macro defined to preprocessor true for host-based testing.
 *
 * When defined to a non-zero value the register map is built from
 * simulation-capable registers held in ordinary memory rather than
 * from `volatile` words at the device addresses.  This allows the
 * driver implementations to be exercised without hardware.
 *
 * In that situation #STM32CXX_CROSS_COMPILING should be a preprocessor
 * false (i.e. 0). */
#define STM32CXX_FAKED 0
#endif /* STM32CXX_FAKED */

#ifndef STM32CXX_CROSS_COMPILING
/** Macro defined to preprocessor true when cross-compiling.
 *
 * This is defined to preprocessor false when building on a host for
 * non-embedded testing of implementation. */
#define STM32CXX_CROSS_COMPILING 1
#endif /* STM32CXX_CROSS_COMPILING */

/** Primary namespace for stm32cxx functionality */
namespace stm32cxx {

/** Namespace holding board-specific configuration data.
 *
 * Most material is put into this namespace through the board-specific
 * <stm32cxx/board.hpp> header. */
namespace board {
} // ns board

/** Namespace holding support for bare STM32F4 peripheral instances.
 *
 * STM32 peripherals are described by register block structures
 * (`SPI_TypeDef`) at fixed addresses, with an interrupt number and a
 * clock-enable bit on one of the RCC buses.  This namespace provides
 * the types and constant values that allow generic reference to a
 * peripheral, so that driver code accesses the instance registers as
 * `spi1->CR1` without needing to know which instance it was handed. */
namespace stm32f4 {

/** The RCC bus on which a peripheral clock is gated. */
enum class bus_type : uint8_t
{
  /** Core peripherals like SysTick that have no RCC gate. */
  NONE,
  AHB1,
  APB1,
  APB2,
};

/** Capture information about an STM32F4 peripheral instance.
 *
 * Instances provided by the series-specific header are `static
 * constexpr` so with standard optimization there is no data object
 * taking up space and requiring memory access to get the peripheral
 * address.  Drivers capture the instance by reference.  Detecting
 * whether two descriptors refer to the same peripheral should be done
 * by comparing the #BASE field.
 *
 * @tparam S the type describing the peripheral register block,
 * e.g. `SPI_TypeDef`. */
template <typename S>
struct peripheral {
  /** The structure describing the instance content, such as
   * `SPI_TypeDef` or `TIM_TypeDef`. */
  using Type = S;

  /** Flag value for #IRQn indicating that the peripheral does
   * not have an assigned interrupt vector entry. */
  static constexpr int8_t NO_IRQ = -128;

  /** Flag value for #INSTANCE indicating that the peripheral
   * does not have enumerated instances (e.g. `rcc`, as compared to
   * `tim2`). */
  static constexpr uint8_t NO_INSTANCE = 255;

  /** Create an object referencing a peripheral instance.
   *
   * @param base initializes #BASE
   * @param irqn initializes #IRQn
   * @param instance initializes #INSTANCE
   * @param aux initializes #AUX
   * @param bus initializes #BUS
   * @param rcc_bit initializes #RCC_BIT */
  constexpr explicit peripheral (uintptr_t base,
                                 int8_t irqn = NO_IRQ,
                                 uint8_t instance = NO_INSTANCE,
                                 uint8_t aux = 0,
                                 bus_type bus = bus_type::NONE,
                                 uint8_t rcc_bit = 0) :
    BASE{base},
    IRQn{irqn},
    INSTANCE{instance},
    AUX{aux},
    BUS{bus},
    RCC_BIT{rcc_bit}
  { }

  /** Get a type-correct pointer to the peripheral
   * structure. */
  Type* instance () const
  {
    return reinterpret_cast<Type*>(BASE);
  }

  /** Allow dereferencing the instance as though it were a
   * pointer to the peripheral structure. */
  Type* operator-> () const
  {
    return instance();
  }

  /** The address of the instance. */
  const uintptr_t BASE;

  /** The interrupt number associated with the instance, or #NO_IRQ
   * if the instance has no dedicated interrupt.  Core exceptions
   * (SysTick) use their negative CMSIS exception number. */
  const int8_t IRQn;

  /** The peripheral instance, for peripherals like `SPI` that have
   * multiple instances.
   *
   * #NO_INSTANCE is used for peripherals that have no instances, such
   * as `RCC`. */
  const uint8_t INSTANCE;

  /** Auxiliary information relevant to the specific peripheral
   * and type.
   *
   * * `TIM` instances use this field to specify the width of the
   *   counter and auto-reload registers in bits (16 or 32).
   * * `GPIO` instances specify the number of pins in the port.
   *
   * * For other peripherals the value is zero. */
  const uint8_t AUX;

  /** The bus through which RCC gates the peripheral clock. */
  const bus_type BUS;

  /** The bit position of the peripheral in the RCC enable and reset
   * registers for #BUS. */
  const uint8_t RCC_BIT;
};

} // ns stm32f4

/** Enumerated constants used in failsafe() calls.
 *
 * The values of codes listed here are public API and shall not
 * change. */
enum class FailSafeCode : unsigned int
{
  /** Base for system-assigned fail-safe codes. */
  SYSTEM_BASE = 0xbad00000,

  /** Application attempted to retrieve a non-existent
   * peripheral instance. */
  NO_SUCH_PERIPHERAL = SYSTEM_BASE + 1,

  /** Unspecified internal error. */
  INTERNAL_ERROR = SYSTEM_BASE + 6,

  /** Application attempted to allocate more resources than available.
   *
   * An example would be constructing a second driver over a
   * peripheral instance that is already owned by a live driver. */
  RESOURCE_VIOLATION = SYSTEM_BASE + 8,

  /** Application tried something that isn't allowed.
   *
   * Examples are requesting a SysTick period that needs more than 24
   * reload bits, or a timer tick frequency whose prescaler does not
   * fit the 16-bit prescaler register. */
  API_VIOLATION = SYSTEM_BASE + 9,

  /** Base for application-assigned fail-safe codes.
   *
   * Type-correct application code values can be obtained by adding to
   * this value, as with:
   *
   *     FailSafeCode mycode{FailSafeCode::APPLICATION_BASE + 2}
   */
  APPLICATION_BASE = 0xbad10000,
};

static inline
FailSafeCode operator+ (const FailSafeCode& lhs,
                        unsigned int incr)
{
  return static_cast<FailSafeCode>(static_cast<unsigned int>(lhs) + incr);
}

/** Record a critical system failure and reset the system.
 *
 * This API should be used in situations where normal operation
 * followed a path that led to an unrecoverable fatal error, such as a
 * configuration computed at startup that cannot be represented by the
 * hardware.
 *
 * On hardware the code is retained in uninitialized memory (see
 * last_failsafe_code()) and the core is reset through
 * `NVIC_SystemReset()`.  On host builds the code is written to the standard
 * error stream and the process aborts. */
[[noreturn]]
void failsafe (FailSafeCode code);

/** Variant of failsafe() for raw application codes. */
[[noreturn]]
void failsafe (unsigned int code);

/** Return the code passed to the failsafe() that caused the most
 * recent reset, or zero if the last reset was not a fail-safe
 * reset.
 *
 * The value is cleared once read. */
unsigned int last_failsafe_code ();

/** Invoke a non-blocking operation until it completes.
 *
 * @p fn is an operation following the non-blocking contract: it
 * returns a non-negative result, a negative encoded error, or the
 * encoded value @p would_block to indicate that it should be invoked
 * again.  No yield occurs between invocations.
 *
 * @return the first result of @p fn that is not @p would_block. */
template <typename FN>
inline auto
poll_blocking (FN fn,
               int would_block) -> decltype(fn())
{
  decltype(fn()) rc;
  do {
    rc = fn();
  } while (would_block == rc);
  return rc;
}

} // ns stm32cxx

#if (STM32CXX_CROSS_COMPILING - 0)
#include <stm32cxx/stm32f4/core.hpp>
#elif (STM32CXX_FAKED - 0)
#include <stm32cxx/faked/core.hpp>
#else
#error stm32cxx requires either STM32CXX_CROSS_COMPILING or STM32CXX_FAKED
#endif /* STM32CXX_CROSS_COMPILING */

#endif /* STM32CXX_CORE_HPP */
