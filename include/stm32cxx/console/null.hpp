/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2026 The stm32cxx Authors */

/** Functions that discard all console output.
 *
 * This file should be included in place of
 * <stm32cxx/console/cstdio.hpp> in a build where output is not
 * desired, such as an image for a board without a debug UART.
 *
 * @file */

#ifndef STM32CXX_CONSOLE_HPP
#define STM32CXX_CONSOLE_HPP
#pragma once

/** @cond DOXYGEN_EXCLUDE */

namespace {

inline void csetvbuf ()
{ }

template <typename ...Args>
inline void cprintf (const char*, Args...)
{ }

inline void cputs (const char*)
{ }

inline int cputchar (int ch)
{
  return ch;
}

inline void creport (const char*,
                     int)
{ }

inline bool cisstdio ()
{
  return false;
}

} // ns anonymous

/** @endcond */

#endif /* STM32CXX_CONSOLE_HPP */
