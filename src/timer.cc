// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The stm32cxx Authors

#include <stm32cxx/timer.hpp>

namespace stm32cxx {
namespace timer {

using namespace stm32f4;

namespace details {

timer_base::timer_base (const TIM_Type& tim,
                        const clock::clocks& clocks,
                        unsigned int freq_Hz) :
  tim_{tim}
{
  clock::rcc::enable(tim);
  clock::rcc::reset(tim);

  unsigned int div = clocks.timclk_Hz(tim.BUS) / freq_Hz;
  if ((!div) || (UINT16_MAX < (div - 1))) {
    failsafe(FailSafeCode::API_VIOLATION);
  }
  tim_->PSC = div - 1;
}

timer_base::ssize_type
timer_base::start_ticks_ (uint64_t ticks)
{
  tim_->CR1 &= ~TIM_CR1_CEN;
  tim_->CNT = 0;

  if ((!ticks)
      || (max_reload() < (ticks - 1))) {
    return error_encoded(ERR_RANGE);
  }
  tim_->ARR = static_cast<uint32_t>(ticks - 1);

  /* Latch the prescaler and reload now.  URS keeps the software update
   * from raising UIF. */
  tim_->CR1 |= TIM_CR1_URS;
  tim_->EGR = TIM_EGR_UG;
  tim_->CR1 &= ~TIM_CR1_URS;

  tim_->CR1 |= TIM_CR1_CEN;
  return 0;
}

timer_base::ssize_type
timer_base::wait ()
{
  if (!(TIM_SR_UIF & tim_->SR)) {
    return would_block();
  }
  tim_->SR = ~TIM_SR_UIF;
  return 0;
}

timer_base::ssize_type
timer_base::cancel ()
{
  if (!running()) {
    return error_encoded(ERR_DISABLED);
  }
  tim_->CR1 &= ~TIM_CR1_CEN;
  return 0;
}

void
timer_base::listen (event_type event)
{
  switch (event) {
    case event_type::TIMEOUT:
      tim_->DIER |= TIM_DIER_UIE;
      break;
  }
}

void
timer_base::unlisten (event_type event)
{
  switch (event) {
    case event_type::TIMEOUT:
      tim_->DIER &= ~TIM_DIER_UIE;
      break;
  }
}

void
timer_base::clear_interrupt (event_type event)
{
  switch (event) {
    case event_type::TIMEOUT:
      tim_->SR = ~TIM_SR_UIF;
      break;
  }
}

const TIM_Type&
timer_base::release_ ()
{
  tim_->CR1 &= ~TIM_CR1_CEN;
  return tim_.release();
}

} // namespace details

SysCountDownTimer::SysCountDownTimer (const SYST_Type& syst,
                                      const clock::clocks& clocks) :
  syst_{syst},
  hclk_Hz_{clocks.hclk_Hz()}
{
  syst_->CTRL = SysTick_CTRL_CLKSOURCE_Msk;
}

SysCountDownTimer::ssize_type
SysCountDownTimer::start (std::chrono::microseconds timeout)
{
  uint64_t mul = hclk_Hz_ / 1'000'000;
  if ((0 >= timeout.count())
      || (!mul)
      || (((SysTick_LOAD_RELOAD_Msk + 1ULL) / mul) < static_cast<uint64_t>(timeout.count()))) {
    failsafe(FailSafeCode::API_VIOLATION);
  }
  syst_->LOAD = static_cast<uint32_t>(timeout.count() * mul - 1);
  syst_->VAL = 0;
  syst_->CTRL |= SysTick_CTRL_ENABLE_Msk;
  return 0;
}

SysCountDownTimer::ssize_type
SysCountDownTimer::wait ()
{
  /* COUNTFLAG clears when CTRL is read. */
  if (SysTick_CTRL_COUNTFLAG_Msk & syst_->CTRL) {
    return 0;
  }
  return would_block();
}

SysCountDownTimer::ssize_type
SysCountDownTimer::cancel ()
{
  if (!(SysTick_CTRL_ENABLE_Msk & syst_->CTRL)) {
    return error_encoded(ERR_DISABLED);
  }
  syst_->CTRL &= ~SysTick_CTRL_ENABLE_Msk;
  return 0;
}

void
SysCountDownTimer::listen (event_type event)
{
  switch (event) {
    case event_type::TIMEOUT:
      syst_->CTRL |= SysTick_CTRL_TICKINT_Msk;
      break;
  }
}

void
SysCountDownTimer::unlisten (event_type event)
{
  switch (event) {
    case event_type::TIMEOUT:
      syst_->CTRL &= ~SysTick_CTRL_TICKINT_Msk;
      break;
  }
}

const SYST_Type&
SysCountDownTimer::release () &&
{
  syst_->CTRL &= ~(SysTick_CTRL_ENABLE_Msk | SysTick_CTRL_TICKINT_Msk);
  return syst_.release();
}

} // namespace timer
} // namespace stm32cxx
