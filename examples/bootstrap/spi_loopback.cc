// SPDX-License-Identifier: CC-BY-SA-4.0
// Copyright 2026 The stm32cxx Authors

/** Exercise SPI1 with MOSI jumpered to MISO.
 *
 * On NUCLEO-F411RE connect Arduino D11 to D12.  Every octet sent is
 * received back, so transfers echo their input, and the receive and
 * transmit CRCs match.  The bus is then switched to bidirectional mode
 * and back to show the driver state conversions. */

#include <cstring>

#include <stm32cxx/periph.hpp>
#include <stm32cxx/crc.hpp>
#include <stm32cxx/console/cstdio.hpp>

int
main (void)
{
  using namespace stm32cxx;
  using periph::spi_base;

  csetvbuf();
  cputs("\n\n" __FILE__ " " __DATE__ " " __TIME__);

  auto clocks = clock::clocks::from_rcc(board::hse_Hz);
  cprintf("SYSCLK %u Hz, PCLK2 %u Hz\n", clocks.sysclk_Hz(), clocks.pclk2_Hz());

  gpio::spi_pins pins{
    {STM32CXX_BOARD_PSEL_SPI1_SCK, STM32CXX_BOARD_AF_SPI1},
    {STM32CXX_BOARD_PSEL_SPI1_MISO, STM32CXX_BOARD_AF_SPI1},
    {STM32CXX_BOARD_PSEL_SPI1_MOSI, STM32CXX_BOARD_AF_SPI1},
  };
  periph::SPI<> spi{stm32f4::spi1, std::move(pins), spi_base::MODE_0, 1'000'000, clocks};

  spi.crc_configure();

  uint8_t buf[] = "123456789";
  const size_t len = strlen(reinterpret_cast<const char*>(buf));
  auto rc = spi.transfer(buf, len);
  creport("transfer", rc);
  cprintf("echo: %s\n", (0 == memcmp(buf, "123456789", len)) ? "ok" : "MISMATCH");

  auto expect = crc::spi_crc8.finalize(crc::spi_crc8.append(buf, buf + len));
  cprintf("CRC tx %02x rx %02x expect %02x\n", spi.tx_crc(), spi.rx_crc(), expect);

  // Nothing is read back in bidirectional mode, and nothing is left
  // pending when returning to normal mode.
  auto bidi = std::move(spi).to_bidi_transfer_mode();
  creport("bidi write", bidi.write(buf, len));
  auto normal = std::move(bidi).to_normal_transfer_mode();
  creport("read after bidi", normal.read());

  creport("send", normal.send(0xA5));
  creport("read", poll_blocking([&normal]() { return normal.read(); },
                                spi_base::would_block()));

  auto parts = std::move(normal).release();
  cprintf("released SPI%u\n", parts.spi.INSTANCE);

  while (true) {
  }
  return 0;
}
