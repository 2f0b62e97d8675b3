/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2026 The stm32cxx Authors */

/** Module that declares the checksums computed by STM32F4
 * peripherals.
 *
 * @file */

#ifndef STM32CXX_CRC_HPP
#define STM32CXX_CRC_HPP
#pragma once

#include <pabigot/crc.hpp>

#include <stm32cxx/core.hpp>

namespace stm32cxx {

/** Namespace providing pre-defined checksum algorithms.
 * @see http://reveng.sourceforge.net/crc-catalogue/1-15.htm
 */
namespace crc {

/** CRC-8 as computed by the SPI CRC unit at its reset polynomial.
 *
 * The SPI unit shifts each frame MSB first into a register cleared
 * when CRC calculation is enabled, with no output inversion.  The
 * check value (over `"123456789"`) is 0xF4.
 *
 * @see http://reveng.sourceforge.net/crc-catalogue/1-15.htm#crc.cat.crc-8-smbus
 */
using spi_crc8_type = pabigot::crc::crc<8, 0x07, false, false, 0, 0>;

/** The tabler to use for the SPI CRC-8.
 *
 * Use this to predict the content of `SPI->TXCRCR` and `SPI->RXCRCR`,
 * or to compute the octet a peer should transmit after
 * periph::spi_base::crc_next(). */
extern spi_crc8_type::tabler_type spi_crc8;

} // ns crc
} // ns stm32cxx

#endif /* STM32CXX_CRC_HPP */
