/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2026 The stm32cxx Authors */

/** Primary header for stm32cxx implementation dependencies
 *
 * This header is included in implementation files and any headers
 * that require direct access to STM32F4 peripheral resources or the
 * board configuration.
 *
 * @file */

#ifndef STM32CXX_IMPL_HPP
#define STM32CXX_IMPL_HPP
#pragma once

#include <stm32cxx/core.hpp>
#include <stm32cxx/board.hpp>

/** Pin selection specification for an unused signal.
 *
 * Boards define macros with names like `STM32CXX_BOARD_PSEL_SPI1_MISO`
 * with values `16 * port + pin`.  A board that does not route a signal
 * defines the corresponding macro to this value. */
#define STM32CXX_BOARD_PSEL_NONE -1

#endif /* STM32CXX_IMPL_HPP */
