/// @file Status.h
/// @brief Error codes and status handling for ENS160 driver
#pragma once

#include <cstdint>

namespace ENS160 {

/// Error codes for all ENS160 operations
enum class Err : uint8_t {
  OK = 0,                 ///< Operation successful
  NOT_INITIALIZED,        ///< begin() not called
  INVALID_CONFIG,         ///< Invalid configuration parameter
  I2C_ERROR,              ///< I2C communication failure (unspecified)
  I2C_NACK_ADDR,          ///< Address not acknowledged
  I2C_NACK_DATA,          ///< Data byte not acknowledged
  I2C_TIMEOUT,            ///< I2C transaction timed out
  I2C_BUS,                ///< Bus or arbitration error
  INVALID_PARAM,          ///< Invalid parameter value
  INVALID_MODE,           ///< Operating mode outside SLEEP/IDLE/STANDARD/RESET
  DEVICE_NOT_FOUND,       ///< Device not detected during begin() or probe()
  PART_ID_MISMATCH        ///< PART_ID != 0x0160 (not an ENS160)
};

/// @return true if the code reports a transport-level failure
inline constexpr bool isBusError(Err code) {
  return code == Err::I2C_ERROR || code == Err::I2C_NACK_ADDR ||
         code == Err::I2C_NACK_DATA || code == Err::I2C_TIMEOUT ||
         code == Err::I2C_BUS;
}

/// Status structure returned by all fallible operations
struct Status {
  Err code = Err::OK;
  int32_t detail = 0;        ///< Implementation-specific detail (e.g., I2C error code)
  const char* msg = "";      ///< Static string describing the error

  constexpr Status() = default;
  constexpr Status(Err c, int32_t d, const char* m) : code(c), detail(d), msg(m) {}

  /// @return true if operation succeeded
  constexpr bool ok() const { return code == Err::OK; }

  /// Create a success status
  static constexpr Status Ok() { return Status{Err::OK, 0, "OK"}; }

  /// Create an error status
  static constexpr Status Error(Err err, const char* message, int32_t detailCode = 0) {
    return Status{err, detailCode, message};
  }
};

} // namespace ENS160
