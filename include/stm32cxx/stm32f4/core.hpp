/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2026 The stm32cxx Authors */

/** API specific to the STM32F4 series supporting <stm32cxx/core.hpp>.
 *
 * Register layouts, bit definitions, base addresses and interrupt
 * numbers come from the CMSIS device header for the part selected by
 * the build (e.g. `STM32F411xE`).
 *
 * @file */

#ifndef STM32CXX_STM32F4_CORE_HPP
#define STM32CXX_STM32F4_CORE_HPP
#pragma once

#include <stm32f4xx.h>

/** @cond DOXYGEN_EXCLUDE */
/* Forward declarations for IRQ handlers. */
extern "C" {
void SysTick_Handler ();
void TIM1_BRK_TIM9_IRQHandler ();
void TIM1_UP_TIM10_IRQHandler ();
void TIM1_TRG_COM_TIM11_IRQHandler ();
void TIM2_IRQHandler ();
void TIM3_IRQHandler ();
void TIM4_IRQHandler ();
void TIM5_IRQHandler ();
void SPI1_IRQHandler ();
void SPI2_IRQHandler ();
void SPI3_IRQHandler ();
void SPI4_IRQHandler ();
void SPI5_IRQHandler ();
}
/** @endcond */

namespace stm32cxx {
namespace stm32f4 {

/** Hardware registers are CMSIS `__IO` words. */
using reg32_type = __IO uint32_t;

using RCC_Regs = ::RCC_TypeDef;
using GPIO_Regs = ::GPIO_TypeDef;
using SPI_Regs = ::SPI_TypeDef;
using TIM_Regs = ::TIM_TypeDef;
using SYST_Regs = ::SysTick_Type;

using RCC_Type = peripheral<RCC_Regs>;
using GPIO_Type = peripheral<GPIO_Regs>;
using SPI_Type = peripheral<SPI_Regs>;
using TIM_Type = peripheral<TIM_Regs>;
using SYST_Type = peripheral<SYST_Regs>;

static constexpr RCC_Type rcc{RCC_BASE};

static constexpr GPIO_Type gpioa{GPIOA_BASE, GPIO_Type::NO_IRQ, 0, 16, bus_type::AHB1, RCC_AHB1ENR_GPIOAEN_Pos};
static constexpr GPIO_Type gpiob{GPIOB_BASE, GPIO_Type::NO_IRQ, 1, 16, bus_type::AHB1, RCC_AHB1ENR_GPIOBEN_Pos};
static constexpr GPIO_Type gpioc{GPIOC_BASE, GPIO_Type::NO_IRQ, 2, 16, bus_type::AHB1, RCC_AHB1ENR_GPIOCEN_Pos};
static constexpr GPIO_Type gpiod{GPIOD_BASE, GPIO_Type::NO_IRQ, 3, 16, bus_type::AHB1, RCC_AHB1ENR_GPIODEN_Pos};
static constexpr GPIO_Type gpioe{GPIOE_BASE, GPIO_Type::NO_IRQ, 4, 16, bus_type::AHB1, RCC_AHB1ENR_GPIOEEN_Pos};
static constexpr GPIO_Type gpioh{GPIOH_BASE, GPIO_Type::NO_IRQ, 7, 16, bus_type::AHB1, RCC_AHB1ENR_GPIOHEN_Pos};

static constexpr SPI_Type spi1{SPI1_BASE, SPI1_IRQn, 1, 0, bus_type::APB2, RCC_APB2ENR_SPI1EN_Pos};
static constexpr SPI_Type spi2{SPI2_BASE, SPI2_IRQn, 2, 0, bus_type::APB1, RCC_APB1ENR_SPI2EN_Pos};
static constexpr SPI_Type spi3{SPI3_BASE, SPI3_IRQn, 3, 0, bus_type::APB1, RCC_APB1ENR_SPI3EN_Pos};
static constexpr SPI_Type spi4{SPI4_BASE, SPI4_IRQn, 4, 0, bus_type::APB2, RCC_APB2ENR_SPI4EN_Pos};
static constexpr SPI_Type spi5{SPI5_BASE, SPI5_IRQn, 5, 0, bus_type::APB2, RCC_APB2ENR_SPI5EN_Pos};

static constexpr TIM_Type tim2{TIM2_BASE, TIM2_IRQn, 2, 32, bus_type::APB1, RCC_APB1ENR_TIM2EN_Pos};
static constexpr TIM_Type tim3{TIM3_BASE, TIM3_IRQn, 3, 16, bus_type::APB1, RCC_APB1ENR_TIM3EN_Pos};
static constexpr TIM_Type tim4{TIM4_BASE, TIM4_IRQn, 4, 16, bus_type::APB1, RCC_APB1ENR_TIM4EN_Pos};
static constexpr TIM_Type tim5{TIM5_BASE, TIM5_IRQn, 5, 32, bus_type::APB1, RCC_APB1ENR_TIM5EN_Pos};
static constexpr TIM_Type tim9{TIM9_BASE, TIM1_BRK_TIM9_IRQn, 9, 16, bus_type::APB2, RCC_APB2ENR_TIM9EN_Pos};
static constexpr TIM_Type tim10{TIM10_BASE, TIM1_UP_TIM10_IRQn, 10, 16, bus_type::APB2, RCC_APB2ENR_TIM10EN_Pos};
static constexpr TIM_Type tim11{TIM11_BASE, TIM1_TRG_COM_TIM11_IRQn, 11, 16, bus_type::APB2, RCC_APB2ENR_TIM11EN_Pos};

static constexpr SYST_Type syst{SysTick_BASE, SysTick_IRQn};

/** Namespace holding series-specific material. */
namespace series {

/** Ports present on the largest supported package.  Pin selectors
 * for ports without an instance are rejected. */
static constexpr const GPIO_Type* GPIO_PORTS[] = {
  &gpioa, &gpiob, &gpioc, &gpiod, &gpioe, nullptr, nullptr, &gpioh,
};

} // ns series

} // ns stm32f4
} // ns stm32cxx

#endif /* STM32CXX_STM32F4_CORE_HPP */
