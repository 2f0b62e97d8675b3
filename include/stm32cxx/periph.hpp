/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2026 The stm32cxx Authors */

/** Abstraction of STM32F4 communication peripherals.
 * @file */

#ifndef STM32CXX_PERIPH_HPP
#define STM32CXX_PERIPH_HPP
#pragma once

#include <type_traits>
#include <utility>

#include <stm32cxx/impl.hpp>
#include <stm32cxx/clock.hpp>
#include <stm32cxx/gpio.hpp>

#ifndef STM32CXX_PERIPH_CLAIM_SLOTS
/** The maximum number of peripheral instances that may be owned by
 * live drivers at any one time. */
#define STM32CXX_PERIPH_CLAIM_SLOTS 16
#endif /* STM32CXX_PERIPH_CLAIM_SLOTS */

namespace stm32cxx {

/** Abstractions of STM32F4 peripherals */
namespace periph {

/** Material supporting peripheral drivers, not intended for direct
 * use by applications. */
namespace details {

/** Material supporting error return values for peripheral drivers.
 *
 * Operations that can fail return a #ssize_type.  Non-negative values
 * are results: a received octet, a transfer length, or zero.  Negative
 * values encode an #error_type bit set, recovered with
 * error_decoded(). */
class error_support
{
public:

  /** The type used for transfer sizes (unsigned) */
  using size_type = unsigned int;

  /** The type used for transfer sizes (non-negative) or errors
   * (negative).
   *
   * @see error_type*/
  using ssize_type = int;

  /** The type used to encode peripheral errors.
   *
   * Errors are returned as negative #ssize_type values.  Details of
   * the error are obtained by converting this value to an
   * #error_type value using error_decoded().
   *
   * The low byte holds at most one SPI status error (#ERR_OVERRUN,
   * #ERR_MODE_FAULT, #ERR_CRC); the remaining bits describe
   * driver-level conditions.
   *
   * @see error_decoded */
  using error_type = unsigned int;

  /** Received data was lost because the previous octet had not been
   * read (SPI `SR.OVR`). */
  constexpr static unsigned int ERR_OVERRUN = 0x001;

  /** A master detected another master driving NSS (SPI `SR.MODF`). */
  constexpr static unsigned int ERR_MODE_FAULT = 0x002;

  /** The received CRC did not match (SPI `SR.CRCERR`). */
  constexpr static unsigned int ERR_CRC = 0x004;

  /** Bit set in an error code when a non-blocking operation cannot
   * complete yet and should be invoked again. */
  constexpr static unsigned int ERR_WOULDBLOCK = 0x100;

  /** Bit set in an error code when the operation requires a running
   * peripheral and the peripheral is stopped. */
  constexpr static unsigned int ERR_DISABLED = 0x200;

  /** Bit set in an error code when a requested value cannot be
   * represented in the width of the corresponding register. */
  constexpr static unsigned int ERR_RANGE = 0x400;

  /** Bit set in an error code to indicate that a parameter was
   * invalid. */
  constexpr static unsigned int ERR_INVALID = 0x800;

  /** Extract an encoded error value from an API return value.
   *
   * @param rc a result code, which is negative if it represents an
   * error.
   *
   * @return Zero if @p rc does not represent an error, otherwise the
   * corresponding #error_type value. */
  constexpr static error_type
  error_decoded (ssize_type rc)
  {
    return (0 <= rc) ? 0 : (static_cast<unsigned int>(-rc) - 1);
  }

  /** Pack an error value into a negative return value.
   *
   * @return Zero if @p ec is zero, otherwise the encoded error
   * value. */
  constexpr static ssize_type
  error_encoded (error_type ec)
  {
    return ec ? (-1 - static_cast<ssize_type>(ec)) : 0;
  }

  /** The encoded result of a non-blocking operation that cannot
   * complete yet. */
  constexpr static ssize_type
  would_block ()
  {
    return error_encoded(ERR_WOULDBLOCK);
  }
};

/** Translate an SPI status register value into the single error it
 * reports.
 *
 * When several error flags are set the most severe is reported:
 * overrun, then mode fault, then CRC.
 *
 * @return one of error_support::ERR_OVERRUN,
 * error_support::ERR_MODE_FAULT, error_support::ERR_CRC, or zero if
 * @p sr reports no error. */
constexpr error_support::error_type
spi_error_from_status (uint32_t sr)
{
  using namespace stm32f4;
  return (SPI_SR_OVR & sr) ? error_support::ERR_OVERRUN
    : (SPI_SR_MODF & sr) ? error_support::ERR_MODE_FAULT
    : (SPI_SR_CRCERR & sr) ? error_support::ERR_CRC
    : 0;
}

/** Table of peripheral instances currently owned by a driver.
 *
 * Each driver claims its peripheral on construction and releases it on
 * destruction, so two live drivers can never reference the same
 * peripheral.  Instances are identified by their base address.
 *
 * @note This is a data type for visibility management only; all
 * members are static and it is not possible to create or manipulate
 * instances of the type. */
class claim_registry
{
  claim_registry () = delete;
  ~claim_registry () = delete;
  claim_registry (const claim_registry&) = delete;
  claim_registry& operator= (const claim_registry&) = delete;

public:
  /** Record ownership of the peripheral at @p base.
   *
   * @warning Claiming a peripheral that is already claimed, or
   * claiming more than #STM32CXX_PERIPH_CLAIM_SLOTS peripherals, will
   * produce FailSafeCode::RESOURCE_VIOLATION. */
  static void claim (uintptr_t base);

  /** Remove the ownership record for @p base.  No effect if the
   * peripheral is not claimed. */
  static void unclaim (uintptr_t base);

  /** @c true iff the peripheral at @p base is claimed. */
  static bool claimed (uintptr_t base);
};

/** Exclusive ownership of a peripheral instance.
 *
 * This is the handle every driver holds.  It can be moved but not
 * copied; the moved-from handle references nothing.
 *
 * @tparam S the register block type, e.g. `SPI_Regs`. */
template <typename S>
class owned_peripheral
{
public:
  /** The descriptor type of the owned peripheral. */
  using peripheral_type = stm32f4::peripheral<S>;

  /** Take ownership of @p periph.
   *
   * @warning See claim_registry::claim(). */
  explicit owned_peripheral (const peripheral_type& periph) :
    periph_{&periph}
  {
    claim_registry::claim(periph.BASE);
  }

  owned_peripheral (owned_peripheral&& from) noexcept :
    periph_{from.periph_}
  {
    from.periph_ = nullptr;
  }

  owned_peripheral (const owned_peripheral&) = delete;
  owned_peripheral& operator= (const owned_peripheral&) = delete;
  owned_peripheral& operator= (owned_peripheral&&) = delete;

  ~owned_peripheral ()
  {
    if (periph_) {
      claim_registry::unclaim(periph_->BASE);
    }
  }

  /** @c true unless the handle has been moved from, released, or
   * detached. */
  explicit operator bool () const
  {
    return periph_;
  }

  /** Reference the owned peripheral descriptor. */
  const peripheral_type& peripheral () const
  {
    return *periph_;
  }

  /** Access the owned peripheral registers. */
  S* operator-> () const
  {
    return periph_->instance();
  }

  /** Give up ownership, allowing a new driver to be constructed on
   * the peripheral.
   *
   * @return the descriptor of the peripheral that was owned. */
  const peripheral_type& release ()
  {
    auto periph = take_();
    claim_registry::unclaim(periph->BASE);
    return *periph;
  }

  /** Give up the handle without giving up the claim.
   *
   * This is used when control of the peripheral passes to something
   * that is not a driver, such as a DMA stream.  The peripheral can
   * never be claimed again.
   *
   * @return the descriptor of the peripheral that was owned. */
  const peripheral_type& detach ()
  {
    return *take_();
  }

private:
  const peripheral_type* take_ ()
  {
    auto periph = periph_;
    if (!periph) {
      failsafe(FailSafeCode::INTERNAL_ERROR);
    }
    periph_ = nullptr;
    return periph;
  }

  const peripheral_type* periph_;
};

} // ns details

/** Tags for the compile-time state of an SPI driver. */
namespace spi_state {

/** Full-duplex transfer on separate MOSI and MISO lines. */
struct normal { };

/** Half-duplex transfer on a single data line. */
struct bidi { };

/** The driver generates the bus clock. */
struct master { };

/** The bus clock is generated by another device. */
struct slave { };

} // ns spi_state

/** Material common to all SPI driver states.
 *
 * This holds the peripheral and its pins and implements every
 * operation whose behavior does not depend on the transfer or
 * operation mode.  Applications use the SPI template. */
class spi_base : public details::error_support
{
public:
  /** Clock level when the bus is idle (`CR1.CPOL`). */
  enum class polarity_type : uint8_t
  {
    IDLE_LOW,
    IDLE_HIGH,
  };

  /** Clock edge on which data is captured (`CR1.CPHA`). */
  enum class phase_type : uint8_t
  {
    CAPTURE_ON_FIRST_TRANSITION,
    CAPTURE_ON_SECOND_TRANSITION,
  };

  /** Clock polarity and phase of the bus. */
  struct mode_type
  {
    polarity_type polarity;
    phase_type phase;
  };

  /** CPOL=0, CPHA=0 */
  static constexpr mode_type MODE_0{polarity_type::IDLE_LOW, phase_type::CAPTURE_ON_FIRST_TRANSITION};

  /** CPOL=0, CPHA=1 */
  static constexpr mode_type MODE_1{polarity_type::IDLE_LOW, phase_type::CAPTURE_ON_SECOND_TRANSITION};

  /** CPOL=1, CPHA=0 */
  static constexpr mode_type MODE_2{polarity_type::IDLE_HIGH, phase_type::CAPTURE_ON_FIRST_TRANSITION};

  /** CPOL=1, CPHA=1 */
  static constexpr mode_type MODE_3{polarity_type::IDLE_HIGH, phase_type::CAPTURE_ON_SECOND_TRANSITION};

  /** Events that can generate an interrupt. */
  enum class event_type : uint8_t
  {
    /** Received data is available (`SR.RXNE`, `CR2.RXNEIE`). */
    RXNE,
    /** The transmit register is empty (`SR.TXE`, `CR2.TXEIE`). */
    TXE,
    /** Overrun, mode fault, or CRC error (`CR2.ERRIE`). */
    ERROR,
  };

  /** The step of a transactional sequence. */
  struct operation
  {
    enum kind_type : uint8_t
    {
      /** Transmit #len octets from #data, discarding received data. */
      WRITE,
      /** Transmit #len octets from #data, replacing each with the
       * octet received in its place. */
      TRANSFER,
    };
    kind_type kind;
    uint8_t* data;
    size_type len;
  };

  /** What release() hands back to the caller. */
  struct release_type
  {
    /** The peripheral, which is no longer owned. */
    const stm32f4::SPI_Type& spi;

    /** The pins, restored to their reset configuration. */
    gpio::spi_pins pins;
  };

  class dma_builder;

  /** A DMA request line on the SPI data register.
   *
   * Instances carry what a DMA stream needs to be configured against
   * the peripheral: the peripheral address and the transfer size.
   *
   * @tparam DMAEN the `CR2` bit that routes the request. */
  template <uint32_t DMAEN>
  class dma_channel
  {
  public:
    /** The memory-side element type. */
    using mem_type = uint8_t;

    /** Size of one transfer element in octets. */
    static constexpr size_type mem_size = sizeof(mem_type);

    /** The address of the data register, for the DMA peripheral
     * address register. */
    uintptr_t address () const
    {
      return reinterpret_cast<uintptr_t>(&spi_->DR);
    }

    /** Reference the underlying peripheral. */
    const stm32f4::SPI_Type& peripheral () const
    {
      return spi_;
    }

  private:
    friend class dma_builder;

    explicit dma_channel (const stm32f4::SPI_Type& spi) :
      spi_{spi}
    {
      spi_->CR2 |= DMAEN;
    }

    const stm32f4::SPI_Type& spi_;
  };

  /** Transmit requests (`CR2.TXDMAEN`). */
  using dma_tx = dma_channel<SPI_CR2_TXDMAEN>;

  /** Receive requests (`CR2.RXDMAEN`). */
  using dma_rx = dma_channel<SPI_CR2_RXDMAEN>;

  /** Selects which DMA requests are enabled once the driver has been
   * given up by SPI::use_dma().
   *
   * The builder is consumed by one of its members. */
  class dma_builder
  {
  public:
    dma_builder (dma_builder&&) = default;
    dma_builder (const dma_builder&) = delete;
    dma_builder& operator= (const dma_builder&) = delete;

    /** Enable transmit requests only. */
    dma_tx tx () &&
    {
      return dma_tx{spi_};
    }

    /** Enable receive requests only. */
    dma_rx rx () &&
    {
      return dma_rx{spi_};
    }

    /** Enable both transmit and receive requests. */
    std::pair<dma_tx, dma_rx> txrx () &&
    {
      return {dma_tx{spi_}, dma_rx{spi_}};
    }

  private:
    friend class spi_base;

    explicit dma_builder (const stm32f4::SPI_Type& spi) :
      spi_{spi}
    { }

    const stm32f4::SPI_Type& spi_;
  };

  /** Calculate the `CR1.BR` value for a bus frequency.
   *
   * The result is the smallest `br` for which the peripheral clock
   * divided by `2^(br+1)` does not exceed @p freq_Hz.  Requests slower
   * than the peripheral clock divided by 256 produce the maximum
   * divisor.
   *
   * @warning A zero @p freq_Hz will produce
   * FailSafeCode::API_VIOLATION. */
  static constexpr unsigned int
  baud_rate_divisor (unsigned int clock_Hz,
                     unsigned int freq_Hz)
  {
    if (!freq_Hz) {
      failsafe(FailSafeCode::API_VIOLATION);
    }
    unsigned int br = 0;
    while ((7 > br)
           && (clock_Hz > (static_cast<uint64_t>(freq_Hz) << (br + 1)))) {
      ++br;
    }
    return br;
  }

  spi_base (const spi_base&) = delete;
  spi_base& operator= (const spi_base&) = delete;
  spi_base& operator= (spi_base&&) = delete;

  /** Reference the underlying peripheral. */
  const stm32f4::SPI_Type& peripheral () const
  {
    return spi_.peripheral();
  }

  /** Return @c true iff the peripheral is enabled (`CR1.SPE`). */
  bool enabled () const
  {
    return SPI_CR1_SPE & spi_->CR1;
  }

  /** Enable or disable the peripheral. */
  void enable (bool enabled);

  /** Return @c true iff the transmit register can accept an octet. */
  bool is_txe () const
  {
    return SPI_SR_TXE & spi_->SR;
  }

  /** Return @c true iff a received octet is available. */
  bool is_rxne () const
  {
    return SPI_SR_RXNE & spi_->SR;
  }

  /** Return @c true iff a master mode fault has been detected. */
  bool is_modf () const
  {
    return SPI_SR_MODF & spi_->SR;
  }

  /** Return @c true iff a received octet was lost. */
  bool is_ovr () const
  {
    return SPI_SR_OVR & spi_->SR;
  }

  /** Enable the interrupt for @p event. */
  void listen (event_type event);

  /** Disable the interrupt for @p event. */
  void unlisten (event_type event);

  /** Clear the condition that raises @p event.
   *
   * For event_type::RXNE the pending octet is read and discarded.  For
   * event_type::ERROR each flagged error is cleared using its
   * hardware clearing sequence.  event_type::TXE is cleared only by
   * writing data and is unaffected. */
  void clear_interrupt (event_type event);

  /** Enable hardware CRC calculation.
   *
   * The peripheral is disabled while the polynomial is written, which
   * also resets both CRC registers, then restored to its previous
   * enabled state.
   *
   * @param polynomial the CRC polynomial (`CRCPR`); the reset value is
   * 7. */
  void crc_configure (uint8_t polynomial = 7);

  /** Request that the next octet transmitted be the CRC
   * (`CR1.CRCNEXT`). */
  void crc_next ()
  {
    spi_->CR1 |= SPI_CR1_CRCNEXT;
  }

  /** The CRC of data received since the CRC was configured. */
  uint8_t rx_crc () const
  {
    return spi_->RXCRCR;
  }

  /** The CRC of data transmitted since the CRC was configured. */
  uint8_t tx_crc () const
  {
    return spi_->TXCRCR;
  }

protected:
  spi_base (const stm32f4::SPI_Type& spi,
            gpio::spi_pins&& pins,
            mode_type mode,
            unsigned int freq_Hz,
            const clock::clocks& clocks,
            bool master,
            bool bidi);

  spi_base (spi_base&& ) = default;

  /** Rewrite the mode-defining bits of `CR1` with the peripheral
   * disabled, then enable it. */
  void init_ (bool bidi,
              bool master);

  /** Inspect the status register and return a received octet, an
   * error, or #ERR_WOULDBLOCK. */
  ssize_type check_read_ ();

  /** Inspect the status register and transmit @p byte if possible,
   * returning zero, an error, or #ERR_WOULDBLOCK. */
  ssize_type check_send_ (uint8_t byte);

  release_type release_ ();

  dma_builder use_dma_ ()
  {
    return dma_builder{spi_.detach()};
  }

  void set_bidioe_ (bool output)
  {
    if (output) {
      spi_->CR1 |= SPI_CR1_BIDIOE;
    } else {
      spi_->CR1 &= ~SPI_CR1_BIDIOE;
    }
  }

private:
  /** Run the clearing sequence for an error reported by the status
   * register. */
  void clear_error_ (error_type ec);

  details::owned_peripheral<stm32f4::SPI_Regs> spi_;
  gpio::spi_pins pins_;
};

/** Polled and DMA access to an SPI peripheral with 8-bit frames.
 *
 * The transfer mode and operation are part of the type.  A driver is
 * changed to a different mode by consuming it with one of the
 * conversion members, which produce a driver of the new type:
 *
 *     auto spi = periph::SPI<>{spi1, std::move(pins), spi_base::MODE_0,
 *                              1'000'000, clocks};
 *     auto bidi = std::move(spi).to_bidi_transfer_mode();
 *
 * Conversions that do not change the state (e.g. to_bidi_transfer_mode()
 * on a bidirectional driver) are rejected at compile time.
 *
 * The driver owns the peripheral: constructing a second driver on the
 * same peripheral while the first is live will produce
 * FailSafeCode::RESOURCE_VIOLATION.
 *
 * Software slave management is always enabled, leaving the NSS pin
 * free for other uses.
 *
 * @tparam TRANSFER_MODE spi_state::normal or spi_state::bidi
 *
 * @tparam OPERATION spi_state::master or spi_state::slave */
template <typename TRANSFER_MODE = spi_state::normal,
          typename OPERATION = spi_state::master>
class SPI : public spi_base
{
  static_assert(std::is_same<TRANSFER_MODE, spi_state::normal>::value
                || std::is_same<TRANSFER_MODE, spi_state::bidi>::value,
                "invalid SPI transfer mode");
  static_assert(std::is_same<OPERATION, spi_state::master>::value
                || std::is_same<OPERATION, spi_state::slave>::value,
                "invalid SPI operation");

public:
  using transfer_mode_type = TRANSFER_MODE;
  using operation_type = OPERATION;

  /** @c true for half-duplex drivers. */
  static constexpr bool is_bidi = std::is_same<TRANSFER_MODE, spi_state::bidi>::value;

  /** @c true for drivers that generate the clock. */
  static constexpr bool is_master = std::is_same<OPERATION, spi_state::master>::value;

  /** Take ownership of a peripheral and configure it.
   *
   * The peripheral clock is enabled and the peripheral reset, the pins
   * are routed to it, and the peripheral is configured and enabled.
   *
   * @param spi the peripheral instance.
   *
   * @param pins the bus pins, moved into the driver until release().
   *
   * @param mode the clock polarity and phase.
   *
   * @param freq_Hz the desired bus frequency.  The closest frequency
   * that does not exceed this is used.
   *
   * @param clocks the clock tree from which the bus peripheral clock is
   * obtained. */
  SPI (const stm32f4::SPI_Type& spi,
       gpio::spi_pins&& pins,
       mode_type mode,
       unsigned int freq_Hz,
       const clock::clocks& clocks) :
    spi_base(spi, std::move(pins), mode, freq_Hz, clocks, is_master, is_bidi)
  { }

  SPI (SPI&&) = default;

  SPI<spi_state::bidi, OPERATION> to_bidi_transfer_mode () &&
  {
    static_assert(!is_bidi, "SPI is already in bidirectional transfer mode");
    return SPI<spi_state::bidi, OPERATION>{std::move(*this)};
  }

  SPI<spi_state::normal, OPERATION> to_normal_transfer_mode () &&
  {
    static_assert(is_bidi, "SPI is already in normal transfer mode");
    return SPI<spi_state::normal, OPERATION>{std::move(*this)};
  }

  SPI<TRANSFER_MODE, spi_state::slave> to_slave_operation () &&
  {
    static_assert(is_master, "SPI is already a slave");
    return SPI<TRANSFER_MODE, spi_state::slave>{std::move(*this)};
  }

  SPI<TRANSFER_MODE, spi_state::master> to_master_operation () &&
  {
    static_assert(!is_master, "SPI is already a master");
    return SPI<TRANSFER_MODE, spi_state::master>{std::move(*this)};
  }

  /** Non-blocking read of a received octet.
   *
   * In bidirectional mode the data line is first switched to input.
   *
   * @return the received octet, or a negative encoded error which is
   * #ERR_WOULDBLOCK if no octet is available yet. */
  ssize_type read ()
  {
    if constexpr (is_bidi) {
      set_bidioe_(false);
    }
    return check_read_();
  }

  /** Non-blocking transmission of an octet.
   *
   * In bidirectional mode the data line is first switched to output.
   *
   * @return zero if @p byte was accepted, or a negative encoded error
   * which is #ERR_WOULDBLOCK if the transmit register is full. */
  ssize_type send (uint8_t byte)
  {
    if constexpr (is_bidi) {
      set_bidioe_(true);
    }
    return check_send_(byte);
  }

  /** Full-duplex exchange of @p len octets in place.
   *
   * Each octet of @p buf is transmitted and replaced by the octet
   * received while it was shifted out.  The operation stops at the
   * first error.
   *
   * @return @p len, or a negative encoded error. */
  ssize_type transfer (uint8_t* buf,
                       size_type len)
  {
    for (size_type i = 0; i < len; ++i) {
      auto rc = send_blocking_(buf[i]);
      if (0 > rc) {
        return rc;
      }
      rc = read_blocking_();
      if (0 > rc) {
        return rc;
      }
      buf[i] = static_cast<uint8_t>(rc);
    }
    return len;
  }

  /** Transmit @p len octets.
   *
   * In normal mode every octet shifted in is read and discarded, so no
   * stale octet remains once the call returns.  In bidirectional mode
   * the line is only driven.
   *
   * @return @p len, or a negative encoded error. */
  ssize_type write (const uint8_t* buf,
                    size_type len)
  {
    return write_iter(buf, buf + len);
  }

  /** Transmit the octets of a sequence.
   *
   * @see write() */
  template <typename ITER>
  ssize_type write_iter (ITER first,
                         ITER last)
  {
    ssize_type n = 0;
    while (first != last) {
      auto rc = send_blocking_(*first);
      if (0 > rc) {
        return rc;
      }
      if constexpr (!is_bidi) {
        rc = read_blocking_();
        if (0 > rc) {
          return rc;
        }
      }
      ++first;
      ++n;
    }
    return n;
  }

  /** Execute a sequence of operations, stopping at the first error.
   *
   * @return the total number of octets transmitted, or a negative
   * encoded error. */
  ssize_type exec (operation* ops,
                   size_type count)
  {
    ssize_type total = 0;
    for (size_type i = 0; i < count; ++i) {
      ssize_type rc;
      if (operation::TRANSFER == ops[i].kind) {
        rc = transfer(ops[i].data, ops[i].len);
      } else {
        rc = write(ops[i].data, ops[i].len);
      }
      if (0 > rc) {
        return rc;
      }
      total += rc;
    }
    return total;
  }

  /** Hand the data register over to DMA.
   *
   * The driver is consumed.  The peripheral remains configured and
   * enabled and stays claimed permanently; the pins remain routed to
   * it. */
  dma_builder use_dma () &&
  {
    return use_dma_();
  }

  /** Give up the peripheral and the pins.
   *
   * The pins are restored to their reset configuration and the
   * peripheral may be used to construct a new driver. */
  release_type release () &&
  {
    return release_();
  }

private:
  template <typename, typename> friend class SPI;

  template <typename T2, typename O2>
  explicit SPI (SPI<T2, O2>&& from) :
    spi_base(std::move(from))
  {
    init_(is_bidi, is_master);
  }

  ssize_type send_blocking_ (uint8_t byte)
  {
    return poll_blocking([this, byte]() { return send(byte); },
                         would_block());
  }

  ssize_type read_blocking_ ()
  {
    return poll_blocking([this]() { return read(); },
                         would_block());
  }
};

} // ns periph
} // ns stm32cxx

#endif /* STM32CXX_PERIPH_HPP */
