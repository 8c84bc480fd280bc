/// @file I2cTransport.h
/// @brief Wire-based I2C transport and timing adapters for examples
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>
#include <Wire.h>
#include "ENS160/Status.h"

namespace transport {

using ENS160::Status;
using ENS160::Err;

/// Initialize Wire for examples
/// @param sda SDA pin
/// @param scl SCL pin
/// @param freqHz I2C clock frequency
/// @param timeoutMs Wire timeout in milliseconds
/// @return true if initialized
inline bool initWire(int sda, int scl, uint32_t freqHz, uint32_t timeoutMs) {
  // Example-only convenience. In a managed bus, the manager should own these settings.
  Wire.begin(sda, scl);
  Wire.setClock(freqHz);
  Wire.setTimeOut(timeoutMs);
  return true;
}

/// Map an Arduino Wire endTransmission() result to a driver status
inline Status mapWireResult(uint8_t result, const char* fallbackMsg) {
  // Arduino Wire error codes (core-dependent): 1=data too long, 2=NACK addr, 3=NACK data,
  // 4=other, 5=timeout (ESP32 Arduino core).
  switch (result) {
    case 0: return Status::Ok();
    case 1: return Status::Error(Err::INVALID_PARAM, "I2C write too long", result);
    case 2: return Status::Error(Err::I2C_NACK_ADDR, "I2C NACK addr", result);
    case 3: return Status::Error(Err::I2C_NACK_DATA, "I2C NACK data", result);
    case 4: return Status::Error(Err::I2C_BUS, "I2C bus error", result);
    case 5: return Status::Error(Err::I2C_TIMEOUT, "I2C timeout", result);
    default: return Status::Error(Err::I2C_ERROR, fallbackMsg, result);
  }
}

/// I2C write callback using Wire library
/// @param addr I2C device address (7-bit)
/// @param data Register address followed by payload
/// @param len Number of bytes to write
/// @param timeoutMs Timeout requested by the driver (manager-owned in shared buses)
/// @param user User context (unused)
/// @return Status indicating success or failure
inline Status wireWrite(uint8_t addr, const uint8_t* data, size_t len,
                        uint32_t timeoutMs, void* user) {
  (void)user;
  (void)timeoutMs;

  Wire.beginTransmission(addr);
  size_t written = Wire.write(data, len);
  uint8_t result = Wire.endTransmission(true);

  if (result != 0) {
    return mapWireResult(result, "I2C write failed");
  }
  if (written != len) {
    return Status::Error(Err::I2C_ERROR, "I2C write incomplete", static_cast<int32_t>(written));
  }

  return Status::Ok();
}

/// I2C register read callback using Wire library
/// Writes the register address with a repeated START, then reads rxLen bytes.
/// @param addr I2C device address (7-bit)
/// @param txData Register address
/// @param txLen Number of bytes to write (1 for ENS160)
/// @param rxData Buffer for read data
/// @param rxLen Number of bytes to read
/// @param timeoutMs Timeout requested by the driver (manager-owned in shared buses)
/// @param user User context (unused)
/// @return Status indicating success or failure
inline Status wireWriteRead(uint8_t addr, const uint8_t* txData, size_t txLen,
                            uint8_t* rxData, size_t rxLen,
                            uint32_t timeoutMs, void* user) {
  (void)user;
  (void)timeoutMs;

  if (txData == nullptr || txLen == 0) {
    return Status::Error(Err::INVALID_PARAM, "Register address required");
  }

  Wire.beginTransmission(addr);
  size_t written = Wire.write(txData, txLen);
  uint8_t result = Wire.endTransmission(false);
  if (result != 0) {
    return mapWireResult(result, "I2C register select failed");
  }
  if (written != txLen) {
    return Status::Error(Err::I2C_ERROR, "I2C write incomplete", static_cast<int32_t>(written));
  }

  if (rxLen == 0) {
    return Status::Ok();
  }

  size_t received = Wire.requestFrom(addr, rxLen);
  if (received != rxLen) {
    // Drain so the next transaction starts clean; never hand back a partial read.
    for (size_t i = 0; i < received; i++) {
      (void)Wire.read();
    }
    return Status::Error(Err::I2C_ERROR, "I2C read incomplete", static_cast<int32_t>(received));
  }

  for (size_t i = 0; i < rxLen; i++) {
    rxData[i] = static_cast<uint8_t>(Wire.read());
  }

  return Status::Ok();
}

/// Blocking delay callback using Arduino delay()
inline void arduinoDelayMs(uint32_t ms, void* user) {
  (void)user;
  delay(ms);
}

/// Clock callback using Arduino millis()
inline uint32_t arduinoNowMs(void* user) {
  (void)user;
  return millis();
}

} // namespace transport
