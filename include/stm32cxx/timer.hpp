/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2026 The stm32cxx Authors */

/** Count-down timers on the general-purpose timers and SysTick.
 *
 * Both timer kinds follow the non-blocking contract of the peripheral
 * drivers: start() arms the timer, wait() reports whether the period
 * has elapsed and returns #ERR_WOULDBLOCK until it has, and cancel()
 * stops it.
 *
 * @file */
#ifndef STM32CXX_TIMER_HPP
#define STM32CXX_TIMER_HPP
#pragma once

#include <chrono>
#include <ratio>
#include <type_traits>

#include <stm32cxx/periph.hpp>

namespace stm32cxx {

/** Count-down timer abstractions */
namespace timer {

/** Events that can generate a timer interrupt. */
enum class event_type : uint8_t
{
  /** The period elapsed (update event, or SysTick wrap). */
  TIMEOUT,
};

namespace details {

/** Material common to all CountDownTimer frequencies. */
class timer_base : public periph::details::error_support
{
public:
  timer_base (const timer_base&) = delete;
  timer_base& operator= (const timer_base&) = delete;
  timer_base& operator= (timer_base&&) = delete;

  /** Reference the underlying peripheral. */
  const stm32f4::TIM_Type& peripheral () const
  {
    return tim_.peripheral();
  }

  /** @c true iff the counter is running (`CR1.CEN`). */
  bool running () const
  {
    return TIM_CR1_CEN & tim_->CR1;
  }

  /** The largest auto-reload value supported by the counter.
   *
   * TIM2 and TIM5 have 32-bit counters; the others have 16-bit
   * counters. */
  uint32_t max_reload () const
  {
    return (32 <= tim_.peripheral().AUX) ? UINT32_MAX : UINT16_MAX;
  }

  /** Non-blocking check for expiry of the current period.
   *
   * If the update flag is set it is cleared and zero is returned, so
   * each expiry is reported exactly once.
   *
   * @return zero, or #ERR_WOULDBLOCK encoded if the period has not
   * elapsed. */
  ssize_type wait ();

  /** Stop the counter.
   *
   * A pending expiry is not cleared.
   *
   * @return zero, or #ERR_DISABLED encoded if the counter was not
   * running. */
  ssize_type cancel ();

  /** Enable the update interrupt. */
  void listen (event_type event);

  /** Disable the update interrupt. */
  void unlisten (event_type event);

  /** Clear the update flag.  This must be done by the interrupt handler
   * or the interrupt retriggers immediately. */
  void clear_interrupt (event_type event);

protected:
  timer_base (const stm32f4::TIM_Type& tim,
              const clock::clocks& clocks,
              unsigned int freq_Hz);

  timer_base (timer_base&&) = default;

  ssize_type start_ticks_ (uint64_t ticks);

  const stm32f4::TIM_Type& release_ ();

private:
  periph::details::owned_peripheral<stm32f4::TIM_Regs> tim_;
};

} // ns details

/** A periodic count-down timer on a general-purpose timer.
 *
 * The counter ticks at @p FREQ_Hz.  When a period elapses the counter
 * reloads without software intervention and the next period begins.
 *
 * @warning Construction will produce FailSafeCode::API_VIOLATION if
 * the timer kernel clock divided by @p FREQ_Hz does not fit the 16-bit
 * prescaler, e.g. a 1 kHz tick on a timer clocked above 65.536 MHz.
 *
 * @tparam FREQ_Hz the tick frequency. */
template <unsigned int FREQ_Hz>
class CountDownTimer : public details::timer_base
{
  static_assert(0 < FREQ_Hz, "timer frequency must be positive");

public:
  /** The tick frequency. */
  static constexpr unsigned int frequency_Hz = FREQ_Hz;

  /** Duration measured in timer ticks. */
  using duration_type = std::chrono::duration<uint64_t, std::ratio<1, FREQ_Hz>>;

  /** Take ownership of a timer, enable and reset it, and commit the
   * prescaler.  The counter is not started. */
  CountDownTimer (const stm32f4::TIM_Type& tim,
                  const clock::clocks& clocks) :
    timer_base(tim, clocks, FREQ_Hz)
  { }

  CountDownTimer (CountDownTimer&&) = default;

  /** Start a new count-down.
   *
   * The counter is stopped and cleared, the reload value for @p
   * timeout is latched, and the counter restarted.  Any previous
   * count-down is abandoned.
   *
   * @param timeout the period.  It is truncated to whole ticks.
   *
   * @return zero, or #ERR_RANGE encoded if @p timeout is shorter than
   * one tick or longer than the counter can represent.  The counter is
   * left stopped on error. */
  template <typename REP, typename PERIOD>
  ssize_type start (std::chrono::duration<REP, PERIOD> timeout)
  {
    /* Range-check in floating point so an oversized timeout cannot
     * wrap during conversion to ticks. */
    using fticks_type = std::chrono::duration<double, std::ratio<1, FREQ_Hz>>;
    uint64_t ticks = 0;
    if (0 < timeout.count()) {
      if (std::chrono::duration_cast<fticks_type>(timeout).count() < (2.0 + max_reload())) {
        ticks = std::chrono::duration_cast<duration_type>(timeout).count();
      } else {
        ticks = UINT64_MAX;
      }
    }
    return start_ticks_(ticks);
  }

  /** Stop the counter and give up the timer. */
  const stm32f4::TIM_Type& release () &&
  {
    return release_();
  }
};

/** CountDownTimer ticking at 1 MHz */
using CountDownTimerUs = CountDownTimer<1'000'000>;

/** CountDownTimer ticking at 1 kHz.
 *
 * @note Not usable with timer kernel clocks above 65.536 MHz. */
using CountDownTimerMs = CountDownTimer<1'000>;

/** A count-down timer on the Cortex-M SysTick.
 *
 * SysTick counts HCLK cycles and has a 24-bit reload register, so the
 * longest period is 2^24 cycles (about 0.16 s at 100 MHz).
 *
 * @note This timer is not periodic in the sense of is_periodic.
 * Calling wait() again after it has returned zero, without an
 * intervening start(), is a caller error with unspecified result. */
class SysCountDownTimer : public periph::details::error_support
{
public:
  /** Take ownership of SysTick and select the processor clock.  The
   * counter is not started. */
  SysCountDownTimer (const stm32f4::SYST_Type& syst,
                     const clock::clocks& clocks);

  SysCountDownTimer (SysCountDownTimer&&) = default;
  SysCountDownTimer (const SysCountDownTimer&) = delete;
  SysCountDownTimer& operator= (const SysCountDownTimer&) = delete;

  /** Reference the underlying peripheral. */
  const stm32f4::SYST_Type& peripheral () const
  {
    return syst_.peripheral();
  }

  /** Start a new count-down.
   *
   * @warning A @p timeout that is not positive, or that needs more
   * than 24 bits of reload value at the processor clock, will produce
   * FailSafeCode::API_VIOLATION.
   *
   * @return zero */
  ssize_type start (std::chrono::microseconds timeout);

  /** Non-blocking check for expiry.
   *
   * @return zero, or #ERR_WOULDBLOCK encoded if the counter has not
   * reached zero since the last check. */
  ssize_type wait ();

  /** Stop the counter.
   *
   * @return zero, or #ERR_DISABLED encoded if the counter was not
   * running. */
  ssize_type cancel ();

  /** Enable the SysTick exception. */
  void listen (event_type event);

  /** Disable the SysTick exception. */
  void unlisten (event_type event);

  /** Stop the counter and give up SysTick. */
  const stm32f4::SYST_Type& release () &&;

private:
  periph::details::owned_peripheral<stm32f4::SYST_Regs> syst_;
  unsigned int hclk_Hz_;
};

/** Trait identifying timers that restart automatically after each
 * expiry, so wait() may be called repeatedly. */
template <typename T>
struct is_periodic : std::false_type
{ };

/** @cond DOXYGEN_EXCLUDE */
template <unsigned int FREQ_Hz>
struct is_periodic<CountDownTimer<FREQ_Hz>> : std::true_type
{ };
/** @endcond */

template <typename T>
constexpr bool is_periodic_v = is_periodic<T>::value;

} // ns timer
} // ns stm32cxx

#endif /* STM32CXX_TIMER_HPP */
