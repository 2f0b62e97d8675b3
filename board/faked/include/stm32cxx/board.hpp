/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2026 The stm32cxx Authors */

/** Board-specific header for host-based unit tests (based on
 * NUCLEO-F411RE)
 *
 * Only the ports modeled by the faked register map (A, B, C) are used.
 * SPI1 uses the Arduino D11-D13 signals; SPI2 and SPI3 use morpho
 * header pins.
 *
 * Signal | SCK   | MISO  | MOSI  | AF
 * :----- | :---- | :---- | :---- | :-
 * SPI1   | PA5   | PA6   | PA7   | 5
 * SPI2   | PB13  | PB14  | PB15  | 5
 * SPI3   | PC10  | PC11  | PC12  | 6
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

#define STM32CXX_BOARD_PSEL_SPI3_SCK 42
#define STM32CXX_BOARD_PSEL_SPI3_MISO 43
#define STM32CXX_BOARD_PSEL_SPI3_MOSI 44
#define STM32CXX_BOARD_AF_SPI3 6

/** Frequency of the external oscillator. */
constexpr unsigned int hse_Hz = 8'000'000;

} // namespace board
} // namespace stm32cxx
#endif /* STM32CXX_BOARD_HPP */
