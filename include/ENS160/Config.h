/// @file Config.h
/// @brief Configuration structure for ENS160 driver
#pragma once

#include <cstddef>
#include <cstdint>
#include "ENS160/Status.h"

namespace ENS160 {

/// I2C write callback signature
/// @param addr     I2C device address (7-bit)
/// @param data     Pointer to data to write (register address first)
/// @param len      Number of bytes to write
/// @param timeoutMs Maximum time to wait for completion
/// @param user     User context pointer passed through from Config
/// @return Status indicating success or failure. Transport failures MUST use
///         one of Err::I2C_ERROR, I2C_NACK_ADDR, I2C_NACK_DATA, I2C_TIMEOUT,
///         I2C_BUS.
using I2cWriteFn = Status (*)(uint8_t addr, const uint8_t* data, size_t len,
                              uint32_t timeoutMs, void* user);

/// I2C write-then-read callback signature (register read)
/// @param addr     I2C device address (7-bit)
/// @param txData   Register address to read from
/// @param txLen    Number of bytes to write (1 for ENS160)
/// @param rxData   Pointer to buffer for read data
/// @param rxLen    Number of bytes to read
/// @param timeoutMs Maximum time to wait for completion
/// @param user     User context pointer passed through from Config
/// @return Status indicating success or failure. A short read MUST be
///         reported as an error; rxData is only valid on success.
using I2cWriteReadFn = Status (*)(uint8_t addr, const uint8_t* txData, size_t txLen,
                                  uint8_t* rxData, size_t rxLen, uint32_t timeoutMs,
                                  void* user);

/// Blocking delay callback signature
/// @param ms   Milliseconds to block
/// @param user User context pointer passed through from Config
using DelayMsFn = void (*)(uint32_t ms, void* user);

/// Millisecond clock callback signature (health timestamps only)
/// @param user User context pointer passed through from Config
/// @return Monotonic time in milliseconds (may wrap)
using NowMsFn = uint32_t (*)(void* user);

/// Device operating mode (OPMODE register values)
enum class Mode : uint8_t {
  SLEEP = 0x00,     ///< Deep sleep, lowest power
  IDLE = 0x01,      ///< Low power; command register accepted only here
  STANDARD = 0x02,  ///< Continuous gas sensing
  RESET = 0xF0      ///< Soft reset request
};

/// Configuration for ENS160 driver
struct Config {
  // === I2C Transport (required) ===
  I2cWriteFn i2cWrite = nullptr;        ///< I2C write function pointer
  I2cWriteReadFn i2cWriteRead = nullptr; ///< I2C write-read function pointer
  void* i2cUser = nullptr;               ///< User context for all callbacks

  // === Timing ===
  DelayMsFn delayMs = nullptr;           ///< Blocking delay (required)
  NowMsFn nowMs = nullptr;               ///< Optional clock for health timestamps

  // === Device Settings ===
  uint8_t i2cAddress = 0x53;             ///< 0x53 (ADDR=VDD) or 0x52 (ADDR=GND)
  uint32_t i2cTimeoutMs = 50;            ///< I2C transaction timeout in ms

  // === Compensation applied by begin() ===
  bool applyDefaultCompensation = true;  ///< Write defaults after entering STANDARD
  float defaultTemperatureC = 25.5f;     ///< Ambient temperature default
  float defaultHumidityPct = 51.0f;      ///< Ambient relative humidity default

  // === Health Tracking ===
  uint8_t offlineThreshold = 5;          ///< Consecutive failures before OFFLINE
};

} // namespace ENS160
