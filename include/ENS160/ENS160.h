/// @file ENS160.h
/// @brief Main driver class for ENS160
#pragma once

#include <cstddef>
#include <cstdint>
#include "ENS160/Status.h"
#include "ENS160/Config.h"
#include "ENS160/CommandTable.h"
#include "ENS160/Version.h"

namespace ENS160 {

/// Driver state for health monitoring
enum class DriverState : uint8_t {
  UNINIT,    ///< begin() not called, failed, or end() called
  READY,     ///< Operational, consecutiveFailures == 0
  DEGRADED,  ///< 1 <= consecutiveFailures < offlineThreshold
  OFFLINE    ///< consecutiveFailures >= offlineThreshold
};

/// Output validity reported in DEVICE_STATUS bits 3..2
enum class Validity : uint8_t {
  NORMAL = 0,   ///< Normal operation
  WARMUP = 1,   ///< Warm-up phase (first 3 minutes after power-on)
  STARTUP = 2,  ///< Initial start-up phase (first hour of operation)
  INVALID = 3   ///< Invalid output
};

/// Decoded DEVICE_STATUS register
struct StatusSnapshot {
  uint8_t raw = 0;
  bool operatingMode = false;  ///< STATAS: an operating mode is running
  bool error = false;          ///< STATER: error detected (e.g. invalid mode)
  Validity validity = Validity::INVALID;
  bool newData = false;        ///< NEWDAT: data registers hold a new sample
  bool newGpr = false;         ///< NEWGPR: GPR_READ holds a new result
};

/// Raw contents of the general purpose read registers
struct GeneralPurposeRegisters {
  uint8_t bytes[cmd::GPR_READ_LEN] = {};
};

/// Application firmware version reported by GET_APPVER
struct FirmwareVersion {
  uint8_t major = 0;
  uint8_t minor = 0;
  uint8_t patch = 0;
};

/// One pass over the data registers
struct Measurement {
  StatusSnapshot status;
  uint8_t aqi = 0;       ///< UBA air quality index (1..5)
  uint16_t tvocPpb = 0;  ///< Total VOC in ppb (0..65000)
  uint16_t eco2Ppm = 0;  ///< Equivalent CO2 in ppm (400..65000)
};

/// ENS160 driver class
///
/// Not thread-safe: at most one operation may be in flight per instance.
/// Callers sharing an instance across tasks must serialize access.
class ENS160 {
public:
  // =========================================================================
  // Lifecycle
  // =========================================================================

  /// Initialize the driver and bring the device into STANDARD mode
  /// Sequence: startup delay, RESET, PART_ID check, IDLE, clear GPR,
  /// STANDARD, default compensation. Any failure leaves the driver UNINIT;
  /// call begin() again to restart from the first step.
  /// @param config Configuration including transport and delay callbacks
  /// @return Status::Ok() on success, error otherwise
  Status begin(const Config& config);

  /// Shutdown the driver (no bus traffic)
  void end();

  // =========================================================================
  // Diagnostics
  // =========================================================================

  /// Check if device is present on the bus (no health tracking)
  /// @return Status::Ok() if device responds with the ENS160 part ID
  Status probe();

  /// Attempt to recover from DEGRADED/OFFLINE state
  /// @return Status::Ok() if device now responsive, error otherwise
  Status recover();

  // =========================================================================
  // Driver State
  // =========================================================================

  /// Get current driver state
  DriverState state() const { return _driverState; }

  /// Check if driver is ready for operations
  bool isOnline() const {
    return _driverState == DriverState::READY ||
           _driverState == DriverState::DEGRADED;
  }

  // =========================================================================
  // Health Tracking
  // =========================================================================

  /// Timestamp of last successful I2C operation
  uint32_t lastOkMs() const { return _lastOkMs; }

  /// Timestamp of last failed I2C operation
  uint32_t lastErrorMs() const { return _lastErrorMs; }

  /// Most recent error status
  Status lastError() const { return _lastError; }

  /// Consecutive failures since last success
  uint8_t consecutiveFailures() const { return _consecutiveFailures; }

  /// Total failure count (lifetime)
  uint32_t totalFailures() const { return _totalFailures; }

  /// Total success count (lifetime)
  uint32_t totalSuccess() const { return _totalSuccess; }

  // =========================================================================
  // Identity / Operating Mode
  // =========================================================================

  /// Verify PART_ID == 0x0160
  /// @return PART_ID_MISMATCH (detail = value read) if another part answers
  Status check();

  /// Write OPMODE and wait the mode settle time
  /// @return INVALID_MODE without bus access if mode is not a defined value
  Status setMode(Mode mode);

  /// Read OPMODE from the device
  /// The value is not validated; a faulty device may report an undefined mode.
  Status getMode(Mode& out);

  /// Soft reset (OPMODE = RESET)
  Status reset();

  // =========================================================================
  // Command / General Purpose Registers
  // =========================================================================

  /// Write NOP then CLRGPR to COMMAND and wait the command settle time
  /// @note The device accepts commands in IDLE mode only.
  Status clearCommand();

  /// Read the 8-byte GPR_READ bank
  Status readGeneralPurpose(GeneralPurposeRegisters& out);

  /// Query application firmware version (GET_APPVER)
  /// Switches to IDLE for the exchange; the previous mode is restored on
  /// every path once it has been read.
  Status readFirmwareVersion(FirmwareVersion& out);

  // =========================================================================
  // Compensation
  // =========================================================================

  /// Write ambient temperature used by the gas algorithm
  Status setTemperatureCompensation(float tempC);

  /// Write ambient relative humidity used by the gas algorithm
  Status setHumidityCompensation(float humidityPct);

  /// Read back the temperature in use (0.1 degC resolution)
  Status getTemperatureCompensation(float& tempC);

  /// Read back the relative humidity in use (0.1 %RH resolution)
  Status getHumidityCompensation(float& humidityPct);

  // =========================================================================
  // Measurement API
  // =========================================================================

  /// Read air quality index (UBA, 1..5)
  Status readAqi(uint8_t& aqi);

  /// Read TVOC concentration (ppb)
  Status readTvoc(uint16_t& ppb);

  /// Read equivalent CO2 concentration (ppm)
  Status readEco2(uint16_t& ppm);

  /// Read and decode DEVICE_STATUS
  Status readStatus(StatusSnapshot& out);

  /// Read status, AQI, TVOC and eCO2 in one call
  /// out is only written if every read succeeds.
  Status readMeasurement(Measurement& out);

  // =========================================================================
  // Helpers
  // =========================================================================

  /// @return true for SLEEP, IDLE, STANDARD and RESET
  static bool isValidMode(Mode mode);

  /// Encode temperature as ceil((degC + 273.15) * 64), clamped to 16 bits
  static uint16_t encodeTemperature(float tempC);

  /// Decode temperature register to degC, rounded to 0.1
  static float decodeTemperature(uint16_t raw);

  /// Encode relative humidity as ceil(%RH * 512), clamped to 16 bits
  static uint16_t encodeHumidity(float humidityPct);

  /// Decode humidity register to %RH, rounded to 0.1
  static float decodeHumidity(uint16_t raw);

  /// Decode DEVICE_STATUS byte
  static StatusSnapshot decodeStatus(uint8_t raw);

  /// Extract GET_APPVER result from a GPR bank
  static FirmwareVersion decodeFirmwareVersion(const GeneralPurposeRegisters& gpr);

  /// Format version as "major.minor.patch"
  /// @return Number of characters written (excluding NUL), 0 if buf too small
  static size_t formatFirmwareVersion(const FirmwareVersion& version, char* buf, size_t len);

private:
  class ModeRestore;

  // =========================================================================
  // Transport Wrappers
  // =========================================================================

  /// Raw I2C write-read (no health tracking)
  Status _i2cWriteReadRaw(const uint8_t* txBuf, size_t txLen,
                          uint8_t* rxBuf, size_t rxLen);

  /// Raw I2C write (no health tracking)
  Status _i2cWriteRaw(const uint8_t* buf, size_t len);

  /// Tracked I2C write-read (updates health)
  Status _i2cWriteReadTracked(const uint8_t* txBuf, size_t txLen,
                              uint8_t* rxBuf, size_t rxLen);

  /// Tracked I2C write (updates health)
  Status _i2cWriteTracked(const uint8_t* buf, size_t len);

  // =========================================================================
  // Register Access
  // =========================================================================

  Status readRegs(uint8_t startReg, uint8_t* buf, size_t len);
  Status writeRegs(uint8_t startReg, const uint8_t* buf, size_t len);
  Status readRegister(uint8_t reg, uint8_t& value);
  Status writeRegister(uint8_t reg, uint8_t value);
  Status _readPartIdRaw(uint16_t& partId);

  // =========================================================================
  // Health Management
  // =========================================================================

  /// Update health counters and state based on operation result
  /// Called ONLY from tracked transport wrappers
  Status _updateHealth(const Status& st);

  // =========================================================================
  // Protocol Steps (no init check)
  // =========================================================================

  Status _check();
  Status _setMode(Mode mode);
  Status _getMode(Mode& out);
  Status _clearCommand();
  Status _readGeneralPurpose(GeneralPurposeRegisters& out);
  Status _writeWord(uint8_t reg, uint16_t value);
  Status _readWordLe(uint8_t reg, uint16_t& value);
  Status _readWordBe(uint8_t reg, uint16_t& value);
  Status _setTemperatureCompensation(float tempC);
  Status _setHumidityCompensation(float humidityPct);
  void _waitMs(uint32_t ms);
  uint32_t _nowMs() const;

  static bool _isEncodableTemperature(float tempC);
  static bool _isEncodableHumidity(float humidityPct);

  // =========================================================================
  // State
  // =========================================================================

  Config _config;
  bool _initialized = false;
  DriverState _driverState = DriverState::UNINIT;

  // Health counters
  uint32_t _lastOkMs = 0;
  uint32_t _lastErrorMs = 0;
  Status _lastError = Status::Ok();
  uint8_t _consecutiveFailures = 0;
  uint32_t _totalFailures = 0;
  uint32_t _totalSuccess = 0;
};

} // namespace ENS160
