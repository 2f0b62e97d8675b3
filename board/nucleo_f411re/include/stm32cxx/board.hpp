/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2026 The stm32cxx Authors */

/** Board-specific header for NUCLEO-F411RE
 *
 * The external clock is the 8 MHz MCO output of the on-board ST-LINK
 * (HSE bypass).
 *
 * SPI1 uses the Arduino header signals D13 (SCK), D12 (MISO) and D11
 * (MOSI).  Note that D13 (PA5) also drives the user LED LD2.  SPI2 is
 * on the morpho header.
 *
 * Signal | SCK   | MISO  | MOSI  | AF
 * :----- | :---- | :---- | :---- | :-
 * SPI1   | PA5   | PA6   | PA7   | 5
 * SPI2   | PB13  | PB14  | PB15  | 5
 *
 * @file */

#ifndef STM32CXX_BOARD_HPP
#define STM32CXX_BOARD_HPP
#pragma once

namespace stm32cxx {
namespace board {

#define STM32CXX_BOARD_PSEL_SPI1_SCK 5
#define STM32CXX_BOARD_PSEL_SPI1_MISO 6
#define STM32CXX_BOARD_PSEL_SPI1_MOSI 7
#define STM32CXX_BOARD_AF_SPI1 5

#define STM32CXX_BOARD_PSEL_SPI2_SCK 29
#define STM32CXX_BOARD_PSEL_SPI2_MISO 30
#define STM32CXX_BOARD_PSEL_SPI2_MOSI 31
#define STM32CXX_BOARD_AF_SPI2 5

/** Frequency of the external oscillator. */
constexpr unsigned int hse_Hz = 8'000'000;

} // namespace board
} // namespace stm32cxx
#endif /* STM32CXX_BOARD_HPP */
