/**
 * @file BoardConfig.h
 * @brief Example wiring for an ENS160 breakout on ESP32-S2 / ESP32-S3.
 *
 * NOT part of the library API. The driver never touches pins; everything
 * it needs arrives through ENS160::Config callbacks.
 */

#pragma once

#include <stdint.h>

#include "common/I2cTransport.h"

namespace board {

/// @brief I2C SDA pin. Example default for ESP32-S2/S3.
static constexpr int I2C_SDA = 8;

/// @brief I2C SCL pin. Example default for ESP32-S2/S3.
static constexpr int I2C_SCL = 9;

/// @brief I2C clock frequency in Hz. ENS160 supports up to 1 MHz.
static constexpr uint32_t I2C_FREQ_HZ = 400000;

/// @brief I2C timeout in milliseconds for example transactions.
static constexpr uint16_t I2C_TIMEOUT_MS = 50;

/// @brief ENS160 address. 0x53 with ADDR tied high (breakout default), 0x52 with ADDR low.
static constexpr uint8_t ENS160_ADDR = 0x53;

/// @brief Polling period for the "watch" command.
static constexpr uint32_t POLL_INTERVAL_MS = 1000;

/// @brief Initialize I2C for examples using the default config.
inline bool initI2c() {
  return transport::initWire(I2C_SDA, I2C_SCL, I2C_FREQ_HZ, I2C_TIMEOUT_MS);
}

}  // namespace board
