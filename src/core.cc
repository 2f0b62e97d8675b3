// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The stm32cxx Authors

#include <cstdio>
#include <cstdlib>

#include <stm32cxx/impl.hpp>

namespace stm32cxx {

namespace {

/** Value held in #failsafe_marker when #failsafe_code is valid. */
constexpr unsigned int FAILSAFE_MAGIC = 0x46534146; // "FASF"

#if (STM32CXX_CROSS_COMPILING - 0)
/* Preserved across the reset that failsafe() requests. */
__attribute__((__section__(".noinit.failsafe")))
volatile unsigned int failsafe_marker;
__attribute__((__section__(".noinit.failsafe")))
volatile unsigned int failsafe_code;
#else /* STM32CXX_CROSS_COMPILING */
unsigned int failsafe_marker;
unsigned int failsafe_code;
#endif /* STM32CXX_CROSS_COMPILING */

} // ns anonymous

void
failsafe (unsigned int code)
{
  failsafe_code = code;
  failsafe_marker = FAILSAFE_MAGIC;
#if (STM32CXX_CROSS_COMPILING - 0)
  NVIC_SystemReset();
#else /* STM32CXX_CROSS_COMPILING */
  fprintf(stderr, "failsafe 0x%08x\n", code);
  fflush(stderr);
  abort();
#endif /* STM32CXX_CROSS_COMPILING */
}

void
failsafe (FailSafeCode code)
{
  failsafe(static_cast<unsigned int>(code));
}

unsigned int
last_failsafe_code ()
{
  unsigned int rv = 0;
  if (FAILSAFE_MAGIC == failsafe_marker) {
    rv = failsafe_code;
  }
  failsafe_marker = 0;
  return rv;
}

} // namespace stm32cxx
