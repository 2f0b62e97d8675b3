// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The stm32cxx Authors

#include <stm32cxx/crc.hpp>

namespace stm32cxx {
namespace crc {

spi_crc8_type::tabler_type spi_crc8{spi_crc8_type::instantiate_tabler()};

} // ns crc
} // ns stm32cxx
