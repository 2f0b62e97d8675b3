/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2026 The stm32cxx Authors */

/** Core GPIO functionality.
 *
 * Only the capability consumed by the peripheral drivers is provided:
 * routing a pin to an alternate function and restoring it to its reset
 * configuration.
 *
 * @file */
#ifndef STM32CXX_GPIO_HPP
#define STM32CXX_GPIO_HPP
#pragma once

#include <stm32cxx/impl.hpp>

namespace stm32cxx {

/** Abstractions and constants around GPIO capability */
namespace gpio {

/** Pin selector value for a signal that is not connected.
 *
 * Operations on a pin holding this selector have no effect. */
constexpr int NO_PSEL = STM32CXX_BOARD_PSEL_NONE;

/** `MODER` field values. */
constexpr uint32_t MODE_INPUT = 0;
constexpr uint32_t MODE_OUTPUT = 1;
constexpr uint32_t MODE_ALTERNATE = 2;
constexpr uint32_t MODE_ANALOG = 3;

/** `OSPEEDR` field value for the fastest edges. */
constexpr uint32_t SPEED_VERY_HIGH = 3;

/** Number of pins in each GPIO port. */
constexpr int PINS_PER_PORT = 16;

/** Construct a pin selector from a port index (`A` is 0) and a pin
 * number within the port. */
constexpr int psel_for (unsigned int port,
                        unsigned int pin)
{
  return static_cast<int>(PINS_PER_PORT * port + pin);
}

/** Determine the GPIO port associated with a given pin selector.
 *
 * @return the port index starting from zero, or negative if the
 * selector is not supported on the device. */
static constexpr int instance_for_psel (int psel)
{
  constexpr int nports = sizeof(stm32f4::series::GPIO_PORTS) / sizeof(*stm32f4::series::GPIO_PORTS);
  if ((0 > psel)
      || (psel >= (nports * PINS_PER_PORT))
      || (!stm32f4::series::GPIO_PORTS[psel / PINS_PER_PORT])) {
    return -1;
  }
  return psel / PINS_PER_PORT;
}

/** Reference to a GPIO pin abstracted from its port.
 *
 * This provides the two-bit field accesses on `MODER`, `OSPEEDR`,
 * `PUPDR`, and the four-bit `AFR` fields, for a specific pin. */
class pin_reference
{
public:
  /** The pin selector index across all GPIO ports. */
  uint8_t const global_psel;

  /** The pin index within #peripheral. */
  uint8_t const local_psel;

  /** Reference to the GPIO port to which the pin belongs. */
  const stm32f4::GPIO_Type& peripheral;

  /** Construct the instance for the given global GPIO pin.
   *
   * @warning An attempt to create an instance for a psel that does
   * not exist on the device will produce
   * FailSafeCode::NO_SUCH_PERIPHERAL.
   *
   * @param psel a valid pin selector. */
  static pin_reference create (int psel);

  /** Set the `MODER` field for the pin to one of the `MODE_`
   * values. */
  void mode (uint32_t mode) const
  {
    field2_(peripheral->MODER, mode);
  }

  /** Read the `MODER` field for the pin. */
  uint32_t mode () const
  {
    return 3U & (peripheral->MODER >> (2 * local_psel));
  }

  /** Select push-pull (@c false) or open-drain (@c true) output. */
  void open_drain (bool enabled) const
  {
    uint32_t bit = 1U << local_psel;
    uint32_t v = peripheral->OTYPER;
    peripheral->OTYPER = enabled ? (v | bit) : (v & ~bit);
  }

  /** Set the `OSPEEDR` field for the pin. */
  void speed (uint32_t speed) const
  {
    field2_(peripheral->OSPEEDR, speed);
  }

  /** Set the `PUPDR` field for the pin.  Zero disables both pulls. */
  void pull (uint32_t pull) const
  {
    field2_(peripheral->PUPDR, pull);
  }

  /** Set the alternate function number (0 through 15) for the pin. */
  void alternate_function (unsigned int af) const
  {
    auto& afr = peripheral->AFR[local_psel / 8];
    unsigned int shift = 4 * (local_psel % 8);
    afr = (afr & ~(0xFU << shift)) | ((0xFU & af) << shift);
  }

  /** Read the alternate function number for the pin. */
  unsigned int alternate_function () const
  {
    unsigned int shift = 4 * (local_psel % 8);
    return 0xF & (peripheral->AFR[local_psel / 8] >> shift);
  }

private:
  pin_reference (const stm32f4::GPIO_Type& peripheral,
                 int psel) :
    global_psel(psel),
    local_psel(psel % PINS_PER_PORT),
    peripheral(peripheral)
  { }

  void field2_ (stm32f4::reg32_type& reg,
                uint32_t value) const
  {
    unsigned int shift = 2 * local_psel;
    reg = (reg & ~(3U << shift)) | ((3U & value) << shift);
  }
};

/** A pin to be routed to a peripheral through an alternate function.
 *
 * Instances are move-only: a pin is given to a driver on construction
 * and given back when the driver is released.  An instance whose
 * selector is #NO_PSEL is a placeholder for an unused signal. */
class af_pin
{
public:
  /** Construct a placeholder pin. */
  af_pin () = default;

  /** Construct a pin for a selector and the alternate function that
   * connects it to the intended peripheral. */
  constexpr af_pin (int psel,
                    uint8_t af) :
    psel_{psel},
    af_{af}
  { }

  af_pin (af_pin&& from) noexcept :
    psel_{from.psel_},
    af_{from.af_}
  {
    from.psel_ = NO_PSEL;
  }

  af_pin& operator= (af_pin&& from) noexcept
  {
    psel_ = from.psel_;
    af_ = from.af_;
    from.psel_ = NO_PSEL;
    return *this;
  }

  af_pin (const af_pin&) = delete;
  af_pin& operator= (const af_pin&) = delete;

  /** The pin selector, or #NO_PSEL. */
  int psel () const
  {
    return psel_;
  }

  /** The alternate function number used by set_alt_mode(). */
  uint8_t af () const
  {
    return af_;
  }

  /** @c true iff the pin is a placeholder. */
  bool unused () const
  {
    return NO_PSEL == psel_;
  }

  /** Route the pin to its alternate function.
   *
   * The port clock is enabled and the pin configured as a push-pull
   * alternate-function pin at very high speed with no pull. */
  void set_alt_mode () const;

  /** Return the pin to its reset configuration: input, AF0, no
   * pull. */
  void restore_mode () const;

private:
  int psel_ = NO_PSEL;
  uint8_t af_ = 0;
};

/** The pins used by an SPI peripheral.
 *
 * Any of the pins may be a placeholder, such as MISO for a
 * transmit-only bus. */
struct spi_pins
{
  af_pin sck;
  af_pin miso;
  af_pin mosi;
};

} // ns gpio
} // ns stm32cxx

#endif /* STM32CXX_GPIO_HPP */
