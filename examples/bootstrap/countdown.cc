// SPDX-License-Identifier: CC-BY-SA-4.0
// Copyright 2026 The stm32cxx Authors

/** Use a general-purpose timer as a periodic count-down.
 *
 * TIM3 counts milliseconds and TIM2 microseconds.  The millisecond
 * timer paces the loop; the microsecond timer is checked each pass to
 * show how many of its periods elapse in the same time.  Halfway
 * through the millisecond timer is restarted with a shorter period,
 * and at the end it is cancelled. */

#include <stm32cxx/timer.hpp>

#if 1
#include <stm32cxx/console/cstdio.hpp>
#else
#include <stm32cxx/console/null.hpp>
#endif

int
main (void)
{
  using namespace stm32cxx;
  using namespace std::chrono_literals;

  csetvbuf();
  cputs("\n\n" __FILE__ " " __DATE__ " " __TIME__);

  auto clocks = clock::clocks::from_rcc(board::hse_Hz);
  cprintf("TIM3 kernel clock %u Hz\n", clocks.timclk_Hz(stm32f4::tim3.BUS));

  timer::CountDownTimerMs ms{stm32f4::tim3, clocks};
  timer::CountDownTimerUs us{stm32f4::tim2, clocks};

  creport("start 0ms", ms.start(0ms));
  creport("start 500ms", ms.start(500ms));
  creport("start 250us", us.start(250us));

  unsigned int pass = 0;
  unsigned int fast = 0;
  while (true) {
    if (0 == us.wait()) {
      ++fast;
    }
    auto rc = ms.wait();
    if (0 == rc) {
      cprintf("pass %u: %u fast periods\n", ++pass, fast);
      fast = 0;
      if (5 == pass) {
        // Restart at a shorter period.
        creport("start 250ms", ms.start(250ms));
      } else if (10 == pass) {
        creport("cancel", ms.cancel());
        creport("cancel again", ms.cancel());
        break;
      }
    } else if (ms.would_block() != rc) {
      creport("wait", rc);
    }
  }
  auto& tim = std::move(us).release();
  cprintf("released TIM%u\n", tim.INSTANCE);

  while (true) {
  }
  return 0;
}
