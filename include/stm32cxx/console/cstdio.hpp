/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2026 The stm32cxx Authors */

/** Functions supporting console output using cstdio.
 *
 * This file should be included into application implementation files
 * for which console output using C stdio is desired.  On target the
 * output goes wherever the newlib system calls send it, such as
 * semihosting; on host builds it is the process stdout.
 *
 * @file */

#ifndef STM32CXX_CONSOLE_HPP
#define STM32CXX_CONSOLE_HPP
#pragma once

#include <cstdio>

#include <stm32cxx/periph.hpp>

namespace {

/** Disable buffering on stdout.
 *
 * This reduces heap usage by about 1 KiBy. */
inline void csetvbuf ()
{
  setvbuf(stdout, NULL, _IONBF, 0);
}

/** Formatted printf. */
template <typename ...Args>
inline void cprintf (const char* format, Args... args)
{
  printf(format, args...);
}

/** Pure text output with added newline. */
inline void cputs (const char* text)
{
  puts(text);
}

/** Output a single character. */
inline int cputchar (int ch)
{
  return putchar(ch);
}

/** Display the result of a driver operation.
 *
 * Non-negative results are shown as values.  Negative results are
 * shown as the decoded error bits with the names of the SPI status
 * errors they include. */
inline void creport (const char* tag,
                     int rc)
{
  using es = stm32cxx::periph::details::error_support;
  if (0 <= rc) {
    printf("%s: %d\n", tag, rc);
    return;
  }
  auto ec = es::error_decoded(rc);
  printf("%s: err %#x%s%s%s%s\n", tag, ec,
         (es::ERR_OVERRUN & ec) ? " overrun" : "",
         (es::ERR_MODE_FAULT & ec) ? " mode-fault" : "",
         (es::ERR_CRC & ec) ? " crc" : "",
         (es::ERR_DISABLED & ec) ? " disabled" : "");
}

/** Indicate whether console selection is cstdio or null */
inline bool cisstdio ()
{
  return true;
}

} // ns anonymous

#endif /* STM32CXX_CONSOLE_HPP */
