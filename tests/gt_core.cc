// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The stm32cxx Authors

#include <cstring>
#include <string>

#include <gtest/gtest.h>

#include <stm32cxx/periph.hpp>
#include <stm32cxx/crc.hpp>
#include <stm32cxx/console/cstdio.hpp>

namespace {

using namespace stm32cxx;
using periph::details::claim_registry;
using periph::details::owned_peripheral;
using es = periph::details::error_support;

static_assert(0xbad00009 == static_cast<unsigned int>(FailSafeCode::API_VIOLATION),
              "fail-safe codes are public API");

TEST(Core, LastFailsafeCode)
{
  ASSERT_EQ(0U, last_failsafe_code());
}

TEST(Core, Failsafe)
{
  EXPECT_DEATH(failsafe(FailSafeCode::APPLICATION_BASE + 3), "failsafe 0xbad10003");
  EXPECT_DEATH(failsafe(0x1234U), "failsafe 0x00001234");
}

TEST(Core, PollBlocking)
{
  int calls = 0;
  auto rc = poll_blocking([&calls]() {
      return (3 > calls++) ? es::would_block() : 7;
    }, es::would_block());
  ASSERT_EQ(7, rc);
  ASSERT_EQ(4, calls);

  calls = 0;
  rc = poll_blocking([&calls]() {
      ++calls;
      return es::error_encoded(es::ERR_OVERRUN);
    }, es::would_block());
  ASSERT_EQ(es::error_encoded(es::ERR_OVERRUN), rc);
  ASSERT_EQ(1, calls);
}

TEST(ClaimRegistry, ClaimUnclaim)
{
  const uintptr_t base = 0x40099000;
  ASSERT_FALSE(claim_registry::claimed(base));
  claim_registry::claim(base);
  ASSERT_TRUE(claim_registry::claimed(base));
  claim_registry::unclaim(base);
  ASSERT_FALSE(claim_registry::claimed(base));

  // Unclaiming something not claimed is harmless.
  claim_registry::unclaim(base);
  ASSERT_FALSE(claim_registry::claimed(base));
}

void
claim_too_many ()
{
  for (uintptr_t i = 1; i <= STM32CXX_PERIPH_CLAIM_SLOTS + 1; ++i) {
    claim_registry::claim(0x50000000 + 0x400 * i);
  }
}

TEST(ClaimRegistry, Exhausted)
{
  EXPECT_DEATH(claim_too_many(), "failsafe 0xbad00008");
}

TEST(OwnedPeripheral, Lifecycle)
{
  const stm32f4::SPI_Type spi{0x40098000};

  {
    owned_peripheral<stm32f4::SPI_Regs> owner{spi};
    ASSERT_TRUE(static_cast<bool>(owner));
    ASSERT_EQ(&spi, &owner.peripheral());
    ASSERT_TRUE(claim_registry::claimed(spi.BASE));

    owned_peripheral<stm32f4::SPI_Regs> moved{std::move(owner)};
    ASSERT_FALSE(static_cast<bool>(owner));
    ASSERT_TRUE(static_cast<bool>(moved));
    ASSERT_TRUE(claim_registry::claimed(spi.BASE));

    auto& released = moved.release();
    ASSERT_EQ(&spi, &released);
    ASSERT_FALSE(static_cast<bool>(moved));
    ASSERT_FALSE(claim_registry::claimed(spi.BASE));
  }
  ASSERT_FALSE(claim_registry::claimed(spi.BASE));

  {
    owned_peripheral<stm32f4::SPI_Regs> owner{spi};
  }
  ASSERT_FALSE(claim_registry::claimed(spi.BASE));
}

TEST(OwnedPeripheral, Detach)
{
  const stm32f4::SPI_Type spi{0x40097000};
  {
    owned_peripheral<stm32f4::SPI_Regs> owner{spi};
    auto& detached = owner.detach();
    ASSERT_EQ(&spi, &detached);
    ASSERT_FALSE(static_cast<bool>(owner));
  }
  ASSERT_TRUE(claim_registry::claimed(spi.BASE));

  // Keep the table usable for other tests.
  claim_registry::unclaim(spi.BASE);
}

void
release_twice ()
{
  const stm32f4::SPI_Type spi{0x40096000};
  owned_peripheral<stm32f4::SPI_Regs> owner{spi};
  owner.release();
  owner.release();
}

TEST(OwnedPeripheral, ReleaseTwice)
{
  EXPECT_DEATH(release_twice(), "failsafe 0xbad00006");
}

TEST(Crc, SpiCrc8)
{
  const char* check = "123456789";
  auto bp = reinterpret_cast<const uint8_t*>(check);
  auto& tabler = crc::spi_crc8;
  ASSERT_EQ(0xF4, tabler.finalize(tabler.append(bp, bp + strlen(check))));

  // Appending in pieces gives the same result.
  auto partial = tabler.append(bp, bp + 4);
  ASSERT_EQ(0xF4, tabler.finalize(tabler.append(bp + 4, bp + 9, partial)));
}

TEST(Console, Report)
{
  testing::internal::CaptureStdout();
  creport("rx", 42);
  creport("rx", es::error_encoded(es::ERR_MODE_FAULT));
  creport("tmr", es::error_encoded(es::ERR_DISABLED));
  creport("tx", es::error_encoded(es::ERR_OVERRUN | es::ERR_CRC));
  std::string out = testing::internal::GetCapturedStdout();
  ASSERT_EQ("rx: 42\n"
            "rx: err 0x2 mode-fault\n"
            "tmr: err 0x200 disabled\n"
            "tx: err 0x5 overrun crc\n", out);
  ASSERT_TRUE(cisstdio());
}

} // ns anonymous
