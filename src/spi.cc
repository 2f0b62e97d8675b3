// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The stm32cxx Authors

/* Implementation for STM32F4 series SPI peripheral interface.
 */

#include <stm32cxx/periph.hpp>

namespace stm32cxx {
namespace periph {

using namespace stm32f4;

spi_base::spi_base (const SPI_Type& spi,
                    gpio::spi_pins&& pins,
                    mode_type mode,
                    unsigned int freq_Hz,
                    const clock::clocks& clocks,
                    bool master,
                    bool bidi) :
  spi_{spi},
  pins_(std::move(pins))
{
  clock::rcc::enable(spi);
  clock::rcc::reset(spi);

  pins_.sck.set_alt_mode();
  pins_.miso.set_alt_mode();
  pins_.mosi.set_alt_mode();

  uint32_t br = baud_rate_divisor(clocks.pclk_Hz(spi.BUS), freq_Hz);

  /* NSS output is not used: slave select is managed in software. */
  spi_->CR2 = 0;

  /* MSB first, 8-bit frames, full-duplex reception. */
  uint32_t cr1 = (SPI_CR1_BR_Msk & (br << SPI_CR1_BR_Pos)) | SPI_CR1_SSM;
  if (phase_type::CAPTURE_ON_SECOND_TRANSITION == mode.phase) {
    cr1 |= SPI_CR1_CPHA;
  }
  if (polarity_type::IDLE_HIGH == mode.polarity) {
    cr1 |= SPI_CR1_CPOL;
  }
  if (master) {
    cr1 |= SPI_CR1_MSTR | SPI_CR1_SSI;
  }
  spi_->CR1 = cr1;

  init_(bidi, master);
}

void
spi_base::init_ (bool bidi,
                 bool master)
{
  uint32_t cr1 = spi_->CR1 & ~(SPI_CR1_SPE
                               | SPI_CR1_BIDIMODE
                               | SPI_CR1_BIDIOE
                               | SPI_CR1_MSTR
                               | SPI_CR1_SSI);
  spi_->CR1 = cr1;
  if (bidi) {
    cr1 |= SPI_CR1_BIDIMODE | SPI_CR1_BIDIOE;
  }
  if (master) {
    cr1 |= SPI_CR1_MSTR | SPI_CR1_SSI;
  }
  spi_->CR1 = cr1;
  spi_->CR1 = cr1 | SPI_CR1_SPE;
}

void
spi_base::enable (bool enabled)
{
  if (enabled) {
    spi_->CR1 |= SPI_CR1_SPE;
  } else {
    spi_->CR1 &= ~SPI_CR1_SPE;
  }
}

void
spi_base::listen (event_type event)
{
  switch (event) {
    case event_type::RXNE:
      spi_->CR2 |= SPI_CR2_RXNEIE;
      break;
    case event_type::TXE:
      spi_->CR2 |= SPI_CR2_TXEIE;
      break;
    case event_type::ERROR:
      spi_->CR2 |= SPI_CR2_ERRIE;
      break;
  }
}

void
spi_base::unlisten (event_type event)
{
  switch (event) {
    case event_type::RXNE:
      spi_->CR2 &= ~SPI_CR2_RXNEIE;
      break;
    case event_type::TXE:
      spi_->CR2 &= ~SPI_CR2_TXEIE;
      break;
    case event_type::ERROR:
      spi_->CR2 &= ~SPI_CR2_ERRIE;
      break;
  }
}

void
spi_base::clear_interrupt (event_type event)
{
  switch (event) {
    case event_type::RXNE: {
      uint32_t dr = spi_->DR;
      (void)dr;
      break;
    }
    case event_type::TXE:
      break;
    case event_type::ERROR: {
      uint32_t sr = spi_->SR;
      if (SPI_SR_OVR & sr) {
        clear_error_(ERR_OVERRUN);
      }
      if (SPI_SR_MODF & sr) {
        clear_error_(ERR_MODE_FAULT);
      }
      if (SPI_SR_CRCERR & sr) {
        clear_error_(ERR_CRC);
      }
      break;
    }
  }
}

void
spi_base::crc_configure (uint8_t polynomial)
{
  uint32_t cr1 = spi_->CR1;
  spi_->CR1 = cr1 & ~(SPI_CR1_SPE | SPI_CR1_CRCEN);
  spi_->CRCPR = polynomial;
  spi_->CR1 = (cr1 & ~SPI_CR1_SPE) | SPI_CR1_CRCEN;
  if (SPI_CR1_SPE & cr1) {
    spi_->CR1 |= SPI_CR1_SPE;
  }
}

void
spi_base::clear_error_ (error_type ec)
{
  switch (ec) {
    case ERR_OVERRUN: {
      /* OVR clears on a read of DR followed by a read of SR. */
      uint32_t dr = spi_->DR;
      uint32_t sr = spi_->SR;
      (void)dr;
      (void)sr;
      break;
    }
    case ERR_MODE_FAULT:
      /* MODF clears on a read of SR (already done) followed by a write
       * of CR1. */
      spi_->CR1 = spi_->CR1;
      break;
    case ERR_CRC:
      spi_->SR &= ~SPI_SR_CRCERR;
      break;
    default:
      break;
  }
}

spi_base::ssize_type
spi_base::check_read_ ()
{
  uint32_t sr = spi_->SR;
  auto ec = details::spi_error_from_status(sr);
  if (ec) {
    /* For an overrun the clearing sequence is the data register read
     * this call would have made anyway; the stale octet is lost. */
    clear_error_(ec);
    return error_encoded(ec);
  }
  if (SPI_SR_RXNE & sr) {
    return static_cast<uint8_t>(spi_->DR);
  }
  return would_block();
}

spi_base::ssize_type
spi_base::check_send_ (uint8_t byte)
{
  uint32_t sr = spi_->SR;
  auto ec = details::spi_error_from_status(sr);
  if (ec) {
    clear_error_(ec);
    return error_encoded(ec);
  }
  if (SPI_SR_TXE & sr) {
    spi_->DR = byte;
    return 0;
  }
  return would_block();
}

spi_base::release_type
spi_base::release_ ()
{
  pins_.sck.restore_mode();
  pins_.miso.restore_mode();
  pins_.mosi.restore_mode();
  return {spi_.release(), std::move(pins_)};
}

} // namespace periph
} // namespace stm32cxx
