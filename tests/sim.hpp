/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2026 The stm32cxx Authors */

/** Simulated peripheral behavior for host-based tests.
 *
 * Each simulator installs read and write hooks on a faked register
 * bank to reproduce the side effects the drivers depend on, and
 * removes them when destroyed.
 *
 * @file */

#ifndef STM32CXX_TESTS_SIM_HPP
#define STM32CXX_TESTS_SIM_HPP
#pragma once

#include <vector>

#include <stm32cxx/core.hpp>
#include <stm32cxx/crc.hpp>

namespace sim {

/** An SPI peripheral whose MOSI is wired to its MISO.
 *
 * Every octet written to DR while the line is not a bidirectional
 * output is shifted straight back into the receive register.
 *
 * * A DR read clears RXNE, and clears OVR if set (the SR read that
 *   completes the hardware sequence is assumed).
 * * Receiving while RXNE is set raises OVR and discards the octet.
 * * A CR1 write clears MODF.
 * * SR ignores writes except for clearing CRCERR.
 * * Setting CRCEN resets both CRC registers, which then track the CRC
 *   of the octets transmitted and received. */
class spi_loopback
{
public:
  explicit spi_loopback (stm32cxx::stm32f4::SPI_Regs& regs,
                         bool loopback = true) :
    regs_{regs},
    loopback_{loopback}
  {
    using namespace stm32cxx::stm32f4;

    regs_.DR.on_write([this] (uint32_t stored, uint32_t written) {
        uint8_t octet = 0xFF & written;
        sent.push_back(octet);
        if (crc_enabled_()) {
          tx_crc_data_.push_back(octet);
          regs_.TXCRCR.raw(crc_of_(tx_crc_data_));
        }
        uint32_t cr1 = regs_.CR1.raw();
        bool bidi_output = (SPI_CR1_BIDIMODE & cr1) && (SPI_CR1_BIDIOE & cr1);
        if (loopback_ && !bidi_output) {
          if (deliver_(octet)) {
            return static_cast<uint32_t>(octet);
          }
        }
        return stored;
      });
    regs_.DR.on_read([this] (uint32_t stored) {
        regs_.SR.raw(regs_.SR.raw() & ~(SPI_SR_RXNE | SPI_SR_OVR));
        ++dr_reads;
        return 0xFF & stored;
      });
    regs_.SR.on_write([] (uint32_t stored, uint32_t written) {
        return (stored & ~SPI_SR_CRCERR) | (stored & written & SPI_SR_CRCERR);
      });
    regs_.CR1.on_write([this] (uint32_t stored, uint32_t written) {
        if ((!(SPI_CR1_CRCEN & stored)) && (SPI_CR1_CRCEN & written)) {
          tx_crc_data_.clear();
          rx_crc_data_.clear();
          regs_.TXCRCR.raw(0);
          regs_.RXCRCR.raw(0);
        }
        regs_.SR.raw(regs_.SR.raw() & ~SPI_SR_MODF);
        cr1_writes.push_back(written);
        return written;
      });
  }

  ~spi_loopback ()
  {
    regs_.DR.on_write(nullptr);
    regs_.DR.on_read(nullptr);
    regs_.SR.on_write(nullptr);
    regs_.CR1.on_write(nullptr);
  }

  /** Present an octet from the remote device on MISO. */
  void inject (uint8_t octet)
  {
    if (deliver_(octet)) {
      regs_.DR.raw(octet);
    }
  }

  /** Octets written to DR. */
  std::vector<uint8_t> sent;

  /** Values written to CR1, in order. */
  std::vector<uint32_t> cr1_writes;

  /** Number of DR reads. */
  unsigned int dr_reads = 0;

private:
  bool crc_enabled_ () const
  {
    return SPI_CR1_CRCEN & regs_.CR1.raw();
  }

  static uint32_t crc_of_ (const std::vector<uint8_t>& data)
  {
    auto& tabler = stm32cxx::crc::spi_crc8;
    return tabler.finalize(tabler.append(data.data(), data.data() + data.size()));
  }

  /* Returns true iff the octet was latched into DR. */
  bool deliver_ (uint8_t octet)
  {
    using namespace stm32cxx::stm32f4;
    uint32_t sr = regs_.SR.raw();
    if (SPI_SR_RXNE & sr) {
      regs_.SR.raw(sr | SPI_SR_OVR);
      return false;
    }
    if (crc_enabled_()) {
      rx_crc_data_.push_back(octet);
      regs_.RXCRCR.raw(crc_of_(rx_crc_data_));
    }
    regs_.SR.raw(sr | SPI_SR_RXNE);
    return true;
  }

  stm32cxx::stm32f4::SPI_Regs& regs_;
  bool loopback_;
  std::vector<uint8_t> tx_crc_data_;
  std::vector<uint8_t> rx_crc_data_;
};

/** An up-counting general-purpose timer.
 *
 * Time advances only through advance(), in counter ticks (after the
 * prescaler).
 *
 * * A UG write to EGR clears the counter and, unless CR1.URS is set,
 *   raises UIF.
 * * SR bits are cleared by writing zero (rc_w0).
 * * A counter passing ARR wraps to zero and raises UIF. */
class tim_counter
{
public:
  explicit tim_counter (stm32cxx::stm32f4::TIM_Regs& regs) :
    regs_{regs}
  {
    using namespace stm32cxx::stm32f4;

    regs_.EGR.on_write([this] (uint32_t, uint32_t written) {
        if (TIM_EGR_UG & written) {
          ++updates;
          regs_.CNT.raw(0);
          if (!(TIM_CR1_URS & regs_.CR1.raw())) {
            regs_.SR.raw(regs_.SR.raw() | TIM_SR_UIF);
          }
        }
        return 0U;
      });
    regs_.SR.on_write([] (uint32_t stored, uint32_t written) {
        return stored & written;
      });
  }

  ~tim_counter ()
  {
    regs_.EGR.on_write(nullptr);
    regs_.SR.on_write(nullptr);
  }

  /** Let @p ticks counter ticks elapse. */
  void advance (uint64_t ticks)
  {
    using namespace stm32cxx::stm32f4;
    while (ticks--) {
      if (!(TIM_CR1_CEN & regs_.CR1.raw())) {
        return;
      }
      uint32_t cnt = regs_.CNT.raw();
      if (cnt >= regs_.ARR.raw()) {
        regs_.CNT.raw(0);
        regs_.SR.raw(regs_.SR.raw() | TIM_SR_UIF);
      } else {
        regs_.CNT.raw(cnt + 1);
      }
    }
  }

  /** Number of software update events. */
  unsigned int updates = 0;

private:
  stm32cxx::stm32f4::TIM_Regs& regs_;
};

/** The SysTick down-counter.
 *
 * * Reading CTRL clears COUNTFLAG.
 * * Any write to VAL clears it and COUNTFLAG.
 * * Each cycle a zero counter reloads from LOAD; otherwise it
 *   decrements, raising COUNTFLAG when it reaches zero. */
class systick
{
public:
  explicit systick (stm32cxx::stm32f4::SYST_Regs& regs) :
    regs_{regs}
  {
    using namespace stm32cxx::stm32f4;

    regs_.CTRL.on_read([this] (uint32_t stored) {
        regs_.CTRL.raw(stored & ~SysTick_CTRL_COUNTFLAG_Msk);
        return stored;
      });
    regs_.CTRL.on_write([] (uint32_t stored, uint32_t written) {
        return (written & ~SysTick_CTRL_COUNTFLAG_Msk) | (stored & SysTick_CTRL_COUNTFLAG_Msk);
      });
    regs_.VAL.on_write([this] (uint32_t, uint32_t) {
        regs_.CTRL.raw(regs_.CTRL.raw() & ~SysTick_CTRL_COUNTFLAG_Msk);
        return 0U;
      });
  }

  ~systick ()
  {
    regs_.CTRL.on_read(nullptr);
    regs_.CTRL.on_write(nullptr);
    regs_.VAL.on_write(nullptr);
  }

  /** Let @p cycles processor clock cycles elapse. */
  void advance (uint64_t cycles)
  {
    using namespace stm32cxx::stm32f4;
    while (cycles--) {
      uint32_t ctrl = regs_.CTRL.raw();
      if (!(SysTick_CTRL_ENABLE_Msk & ctrl)) {
        return;
      }
      uint32_t val = regs_.VAL.raw();
      if (!val) {
        regs_.VAL.raw(SysTick_LOAD_RELOAD_Msk & regs_.LOAD.raw());
      } else if (!--val) {
        regs_.VAL.raw(0);
        regs_.CTRL.raw(ctrl | SysTick_CTRL_COUNTFLAG_Msk);
      } else {
        regs_.VAL.raw(val);
      }
    }
  }

private:
  stm32cxx::stm32f4::SYST_Regs& regs_;
};

} // ns sim

#endif /* STM32CXX_TESTS_SIM_HPP */
