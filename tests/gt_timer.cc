// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The stm32cxx Authors

#include <chrono>
#include <type_traits>

#include <gtest/gtest.h>

#include <stm32cxx/timer.hpp>

#include "sim.hpp"

namespace {

using namespace stm32cxx;
using namespace std::chrono_literals;
using es = periph::details::error_support;

static_assert(timer::is_periodic_v<timer::CountDownTimerMs>, "hardware timer restarts");
static_assert(timer::is_periodic_v<timer::CountDownTimer<32768>>, "any frequency");
static_assert(!timer::is_periodic_v<timer::SysCountDownTimer>, "SysTick is not periodic");
static_assert(!timer::is_periodic_v<int>, "not a timer");
static_assert(!std::is_copy_constructible<timer::CountDownTimerUs>::value, "timers are unique");

TEST(CountDownTimer, Prescaler)
{
  using namespace stm32f4;

  timer::CountDownTimerMs ms{tim3, clock::clocks::hsi_default()};
  ASSERT_EQ(15999U, faked::tim3.PSC.raw());
  ASSERT_TRUE(clock::rcc::enabled(tim3));
  ASSERT_EQ(1U << 1, faked::rcc.APB1ENR.raw());
  ASSERT_FALSE(ms.running());
  ASSERT_EQ(uint32_t{UINT16_MAX}, ms.max_reload());

  // APB1 at half of HCLK: the timer kernel clock is doubled.
  timer::CountDownTimerUs us{tim2, clock::clocks{100'000'000, 1, 2, 1}};
  ASSERT_EQ(99U, faked::tim2.PSC.raw());
  ASSERT_EQ(UINT32_MAX, us.max_reload());
}

void
prescaler_overflow ()
{
  timer::CountDownTimerMs ms{stm32f4::tim2, clock::clocks{100'000'000, 1, 2, 1}};
}

void
frequency_too_high ()
{
  timer::CountDownTimer<20'000'000> fast{stm32f4::tim3, clock::clocks::hsi_default()};
}

TEST(CountDownTimer, PrescalerRange)
{
  EXPECT_DEATH(prescaler_overflow(), "failsafe 0xbad00009");
  EXPECT_DEATH(frequency_too_high(), "failsafe 0xbad00009");
}

TEST(CountDownTimer, Start)
{
  using namespace stm32f4;
  sim::tim_counter sim{faked::tim3};
  timer::CountDownTimerMs tmr{tim3, clock::clocks::hsi_default()};

  faked::tim3.CNT.raw(1234);
  ASSERT_EQ(0, tmr.start(10ms));
  ASSERT_EQ(9U, faked::tim3.ARR.raw());
  ASSERT_EQ(0U, faked::tim3.CNT.raw());
  ASSERT_TRUE(tmr.running());
  ASSERT_EQ(TIM_CR1_CEN, faked::tim3.CR1.raw());
  ASSERT_EQ(0U, faked::tim3.SR.raw());
  ASSERT_EQ(1U, sim.updates);

  // Durations are converted to whole ticks.
  ASSERT_EQ(0, tmr.start(2s));
  ASSERT_EQ(1999U, faked::tim3.ARR.raw());
  ASSERT_EQ(0, tmr.start(std::chrono::microseconds{2500}));
  ASSERT_EQ(1U, faked::tim3.ARR.raw());
  ASSERT_EQ(3U, sim.updates);
}

TEST(CountDownTimer, StartRange)
{
  using namespace stm32f4;
  sim::tim_counter sim{faked::tim3};
  timer::CountDownTimerMs tmr{tim3, clock::clocks::hsi_default()};

  ASSERT_EQ(0, tmr.start(5ms));
  ASSERT_EQ(es::error_encoded(es::ERR_RANGE), tmr.start(0ms));
  ASSERT_FALSE(tmr.running());
  ASSERT_EQ(es::error_encoded(es::ERR_RANGE), tmr.start(-3ms));
  ASSERT_EQ(es::error_encoded(es::ERR_RANGE), tmr.start(500us));
  ASSERT_EQ(es::error_encoded(es::ERR_RANGE), tmr.start(70s));
  ASSERT_FALSE(tmr.running());

  // Durations whose tick count does not fit 64 bits are rejected, not
  // wrapped.
  ASSERT_EQ(0, tmr.start(5ms));
  ASSERT_EQ(es::error_encoded(es::ERR_RANGE), tmr.start(std::chrono::hours{3'000'000'000'000}));
  ASSERT_FALSE(tmr.running());

  ASSERT_EQ(0, tmr.start(65536ms));
  ASSERT_EQ(65535U, faked::tim3.ARR.raw());
}

TEST(CountDownTimer, WideCounter)
{
  using namespace stm32f4;
  sim::tim_counter sim{faked::tim2};
  timer::CountDownTimerUs tmr{tim2, clock::clocks::hsi_default()};

  ASSERT_EQ(15U, faked::tim2.PSC.raw());
  ASSERT_EQ(0, tmr.start(1h));
  ASSERT_EQ(3'599'999'999U, faked::tim2.ARR.raw());
  ASSERT_EQ(es::error_encoded(es::ERR_RANGE), tmr.start(2h));

  // 2^64 + 448384 microseconds
  ASSERT_EQ(0, tmr.start(1s));
  ASSERT_EQ(es::error_encoded(es::ERR_RANGE), tmr.start(std::chrono::seconds{18'446'744'073'710}));
  ASSERT_FALSE(tmr.running());
  ASSERT_EQ(999'999U, faked::tim2.ARR.raw());
}

TEST(CountDownTimer, PeriodicWait)
{
  using namespace stm32f4;
  sim::tim_counter sim{faked::tim3};
  timer::CountDownTimerMs tmr{tim3, clock::clocks::hsi_default()};

  ASSERT_EQ(0, tmr.start(10ms));
  ASSERT_EQ(es::would_block(), tmr.wait());
  sim.advance(9);
  ASSERT_EQ(es::would_block(), tmr.wait());
  sim.advance(1);
  ASSERT_EQ(0, tmr.wait());
  ASSERT_EQ(es::would_block(), tmr.wait());
  ASSERT_TRUE(tmr.running());

  sim.advance(5);
  ASSERT_EQ(es::would_block(), tmr.wait());
  sim.advance(5);
  ASSERT_EQ(0, tmr.wait());
  ASSERT_EQ(es::would_block(), tmr.wait());

  // Two periods elapsing unobserved report a single expiry.
  sim.advance(20);
  ASSERT_EQ(0, tmr.wait());
  ASSERT_EQ(es::would_block(), tmr.wait());
}

TEST(CountDownTimer, Restart)
{
  using namespace stm32f4;
  sim::tim_counter sim{faked::tim3};
  timer::CountDownTimerMs tmr{tim3, clock::clocks::hsi_default()};

  ASSERT_EQ(0, tmr.start(10ms));
  sim.advance(8);
  ASSERT_EQ(0, tmr.start(4ms));
  ASSERT_EQ(0U, faked::tim3.CNT.raw());
  sim.advance(3);
  ASSERT_EQ(es::would_block(), tmr.wait());
  sim.advance(1);
  ASSERT_EQ(0, tmr.wait());
}

TEST(CountDownTimer, Cancel)
{
  using namespace stm32f4;
  sim::tim_counter sim{faked::tim3};
  timer::CountDownTimerMs tmr{tim3, clock::clocks::hsi_default()};

  ASSERT_EQ(es::error_encoded(es::ERR_DISABLED), tmr.cancel());

  ASSERT_EQ(0, tmr.start(3ms));
  sim.advance(3);
  ASSERT_EQ(0, tmr.cancel());
  ASSERT_FALSE(tmr.running());
  ASSERT_EQ(es::error_encoded(es::ERR_DISABLED), tmr.cancel());

  // The expiry that preceded the cancel remains visible.
  ASSERT_EQ(0, tmr.wait());

  // A stopped counter never expires.
  sim.advance(100);
  ASSERT_EQ(es::would_block(), tmr.wait());
}

TEST(CountDownTimer, Interrupts)
{
  using namespace stm32f4;
  sim::tim_counter sim{faked::tim3};
  timer::CountDownTimerMs tmr{tim3, clock::clocks::hsi_default()};

  tmr.listen(timer::event_type::TIMEOUT);
  ASSERT_EQ(TIM_DIER_UIE, faked::tim3.DIER.raw());

  ASSERT_EQ(0, tmr.start(2ms));
  sim.advance(2);
  ASSERT_EQ(TIM_SR_UIF, faked::tim3.SR.raw());
  tmr.clear_interrupt(timer::event_type::TIMEOUT);
  ASSERT_EQ(0U, faked::tim3.SR.raw());
  ASSERT_EQ(es::would_block(), tmr.wait());

  tmr.unlisten(timer::event_type::TIMEOUT);
  ASSERT_EQ(0U, faked::tim3.DIER.raw());
}

TEST(CountDownTimer, Release)
{
  using namespace stm32f4;
  sim::tim_counter sim{faked::tim3};
  timer::CountDownTimerMs tmr{tim3, clock::clocks::hsi_default()};
  ASSERT_TRUE(periph::details::claim_registry::claimed(tim3.BASE));

  ASSERT_EQ(0, tmr.start(2ms));
  auto moved = std::move(tmr);
  ASSERT_TRUE(moved.running());

  auto& tim = std::move(moved).release();
  ASSERT_EQ(&tim3, &tim);
  ASSERT_EQ(0U, TIM_CR1_CEN & faked::tim3.CR1.raw());
  ASSERT_FALSE(periph::details::claim_registry::claimed(tim3.BASE));

  timer::CountDownTimerUs again{tim, clock::clocks::hsi_default()};
  ASSERT_EQ(15U, faked::tim3.PSC.raw());
}

void
claim_tim3_twice ()
{
  timer::CountDownTimerMs first{stm32f4::tim3, clock::clocks::hsi_default()};
  timer::CountDownTimerUs second{stm32f4::tim3, clock::clocks::hsi_default()};
}

TEST(CountDownTimer, ClaimConflict)
{
  EXPECT_DEATH(claim_tim3_twice(), "failsafe 0xbad00008");
}

TEST(SysCountDownTimer, Construct)
{
  using namespace stm32f4;
  faked::syst.CTRL.raw(SysTick_CTRL_ENABLE_Msk | SysTick_CTRL_TICKINT_Msk);
  timer::SysCountDownTimer tmr{syst, clock::clocks::hsi_default()};
  ASSERT_EQ(SysTick_CTRL_CLKSOURCE_Msk, faked::syst.CTRL.raw());
  ASSERT_EQ(&syst, &tmr.peripheral());
  ASSERT_TRUE(periph::details::claim_registry::claimed(syst.BASE));
}

TEST(SysCountDownTimer, StartWait)
{
  using namespace stm32f4;
  sim::systick sim{faked::syst};
  timer::SysCountDownTimer tmr{syst, clock::clocks::hsi_default()};

  faked::syst.VAL.raw(77);
  ASSERT_EQ(0, tmr.start(1000us));
  ASSERT_EQ(15999U, faked::syst.LOAD.raw());
  ASSERT_EQ(0U, faked::syst.VAL.raw());
  ASSERT_EQ(SysTick_CTRL_CLKSOURCE_Msk | SysTick_CTRL_ENABLE_Msk, faked::syst.CTRL.raw());

  ASSERT_EQ(es::would_block(), tmr.wait());
  sim.advance(15999);
  ASSERT_EQ(es::would_block(), tmr.wait());
  sim.advance(1);
  ASSERT_EQ(0, tmr.wait());
  ASSERT_EQ(es::would_block(), tmr.wait());

  // The counter reloads and the next period has the same length.
  sim.advance(16000);
  ASSERT_EQ(0, tmr.wait());
}

TEST(SysCountDownTimer, ScaledClock)
{
  using namespace stm32f4;
  timer::SysCountDownTimer tmr{syst, clock::clocks{100'000'000, 2}};

  ASSERT_EQ(0, tmr.start(std::chrono::milliseconds{100}));
  ASSERT_EQ(4'999'999U, faked::syst.LOAD.raw());
}

void
systick_too_long ()
{
  timer::SysCountDownTimer tmr{stm32f4::syst, clock::clocks::hsi_default()};
  tmr.start(std::chrono::microseconds{1'048'577});
}

void
systick_zero ()
{
  timer::SysCountDownTimer tmr{stm32f4::syst, clock::clocks::hsi_default()};
  tmr.start(std::chrono::microseconds{0});
}

void
systick_cycles_overflow ()
{
  timer::SysCountDownTimer tmr{stm32f4::syst, clock::clocks::hsi_default()};
  // At 16 MHz the cycle count is 2^64 + 16.
  tmr.start(std::chrono::microseconds{(1LL << 60) + 1});
}

TEST(SysCountDownTimer, StartRange)
{
  using namespace stm32f4;

  EXPECT_DEATH(systick_too_long(), "failsafe 0xbad00009");
  EXPECT_DEATH(systick_zero(), "failsafe 0xbad00009");
  EXPECT_DEATH(systick_cycles_overflow(), "failsafe 0xbad00009");

  timer::SysCountDownTimer tmr{syst, clock::clocks::hsi_default()};
  ASSERT_EQ(0, tmr.start(std::chrono::microseconds{1'048'576}));
  ASSERT_EQ(SysTick_LOAD_RELOAD_Msk, faked::syst.LOAD.raw());
}

TEST(SysCountDownTimer, Cancel)
{
  using namespace stm32f4;
  sim::systick sim{faked::syst};
  timer::SysCountDownTimer tmr{syst, clock::clocks::hsi_default()};

  ASSERT_EQ(es::error_encoded(es::ERR_DISABLED), tmr.cancel());
  ASSERT_EQ(0, tmr.start(10us));
  ASSERT_EQ(0, tmr.cancel());
  ASSERT_EQ(0U, SysTick_CTRL_ENABLE_Msk & faked::syst.CTRL.raw());
  ASSERT_EQ(es::error_encoded(es::ERR_DISABLED), tmr.cancel());

  sim.advance(1000);
  ASSERT_EQ(es::would_block(), tmr.wait());
}

TEST(SysCountDownTimer, InterruptsAndRelease)
{
  using namespace stm32f4;
  timer::SysCountDownTimer tmr{syst, clock::clocks::hsi_default()};

  tmr.listen(timer::event_type::TIMEOUT);
  ASSERT_EQ(SysTick_CTRL_CLKSOURCE_Msk | SysTick_CTRL_TICKINT_Msk, faked::syst.CTRL.raw());
  tmr.unlisten(timer::event_type::TIMEOUT);
  ASSERT_EQ(SysTick_CTRL_CLKSOURCE_Msk, faked::syst.CTRL.raw());

  ASSERT_EQ(0, tmr.start(1ms));
  tmr.listen(timer::event_type::TIMEOUT);
  auto& released = std::move(tmr).release();
  ASSERT_EQ(&syst, &released);
  ASSERT_EQ(SysTick_CTRL_CLKSOURCE_Msk, faked::syst.CTRL.raw());
  ASSERT_FALSE(periph::details::claim_registry::claimed(syst.BASE));
}

} // ns anonymous
