// SPDX-License-Identifier: CC-BY-SA-4.0
// Copyright 2026 The stm32cxx Authors

/** Busy-wait delays using SysTick.
 *
 * SysTick can only time periods of 2^24 processor cycles, so longer
 * delays are made up of repeated shorter ones. */

#include <stm32cxx/timer.hpp>
#include <stm32cxx/console/cstdio.hpp>

namespace {

void
delay (stm32cxx::timer::SysCountDownTimer& systick,
       unsigned int count,
       std::chrono::microseconds period)
{
  using es = stm32cxx::periph::details::error_support;
  while (count--) {
    systick.start(period);
    stm32cxx::poll_blocking([&systick]() { return systick.wait(); },
                            es::would_block());
  }
}

} // ns anonymous

int
main (void)
{
  using namespace stm32cxx;
  using namespace std::chrono_literals;

  csetvbuf();
  cputs("\n\n" __FILE__ " " __DATE__ " " __TIME__);

  auto clocks = clock::clocks::from_rcc(board::hse_Hz);
  cprintf("HCLK %u Hz: longest period %u us\n", clocks.hclk_Hz(),
          static_cast<unsigned int>((1U << 24) / (clocks.hclk_Hz() / 1'000'000)));

  timer::SysCountDownTimer systick{stm32f4::syst, clocks};
  creport("cancel idle", systick.cancel());

  unsigned int seconds = 0;
  while (true) {
    delay(systick, 100, 10ms);
    cprintf("%u s\n", ++seconds);
  }
  return 0;
}
