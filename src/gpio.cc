// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The stm32cxx Authors

#include <stm32cxx/gpio.hpp>
#include <stm32cxx/clock.hpp>

namespace stm32cxx {
namespace gpio {

pin_reference
pin_reference::create (int psel)
{
  auto port = instance_for_psel(psel);
  if (0 > port) {
    failsafe(FailSafeCode::NO_SUCH_PERIPHERAL);
  }
  return pin_reference(*stm32f4::series::GPIO_PORTS[port], psel);
}

void
af_pin::set_alt_mode () const
{
  if (unused()) {
    return;
  }
  auto pin = pin_reference::create(psel_);
  clock::rcc::enable(pin.peripheral);
  pin.alternate_function(af_);
  pin.open_drain(false);
  pin.speed(SPEED_VERY_HIGH);
  pin.pull(0);
  pin.mode(MODE_ALTERNATE);
}

void
af_pin::restore_mode () const
{
  if (unused()) {
    return;
  }
  auto pin = pin_reference::create(psel_);
  pin.mode(MODE_INPUT);
  pin.alternate_function(0);
  pin.pull(0);
}

} // namespace gpio
} // namespace stm32cxx
