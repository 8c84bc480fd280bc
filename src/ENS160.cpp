/**
 * @file ENS160.cpp
 * @brief ENS160 driver implementation.
 */

#include "ENS160/ENS160.h"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <limits>

namespace ENS160 {
namespace {

static constexpr size_t MAX_WRITE_LEN = 8;
static constexpr double U16_MAX = 65535.0;

static double roundToTenth(double value) {
  return std::round(value * 10.0) / 10.0;
}

static uint16_t clampToU16(double value) {
  if (value <= 0.0) {
    return 0;
  }
  if (value >= U16_MAX) {
    return 0xFFFF;
  }
  return static_cast<uint16_t>(value);
}

static double temperatureTicks(float tempC) {
  return std::ceil((static_cast<double>(tempC) + cmd::KELVIN_OFFSET) * cmd::TEMP_SCALE);
}

static double humidityTicks(float humidityPct) {
  return std::ceil(static_cast<double>(humidityPct) * cmd::RH_SCALE);
}

}  // namespace

// ============================================================================
// Mode restore guard
// ============================================================================

/// Restores a saved OPMODE when the owning scope exits.
/// restore() runs the write once and reports its status; the destructor
/// covers early returns.
class ENS160::ModeRestore {
public:
  ModeRestore(ENS160& device, Mode saved) : _device(device), _saved(saved) {}
  ModeRestore(const ModeRestore&) = delete;
  ModeRestore& operator=(const ModeRestore&) = delete;

  ~ModeRestore() {
    if (!_done) {
      // Caller is already returning an earlier error; a failed write here
      // still lands in lastError() through health tracking.
      (void)restore();
    }
  }

  Status restore() {
    if (!_done) {
      _done = true;
      _result = _device._setMode(_saved);
    }
    return _result;
  }

private:
  ENS160& _device;
  Mode _saved;
  bool _done = false;
  Status _result = Status::Ok();
};

// ============================================================================
// Lifecycle
// ============================================================================

Status ENS160::begin(const Config& config) {
  _initialized = false;
  _driverState = DriverState::UNINIT;

  _lastOkMs = 0;
  _lastErrorMs = 0;
  _lastError = Status::Ok();
  _consecutiveFailures = 0;
  _totalFailures = 0;
  _totalSuccess = 0;

  if (config.i2cWrite == nullptr || config.i2cWriteRead == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C callbacks not set");
  }
  if (config.delayMs == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "Delay callback not set");
  }
  if (config.i2cTimeoutMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "I2C timeout must be > 0");
  }
  if (config.i2cAddress != cmd::I2C_ADDR_LOW && config.i2cAddress != cmd::I2C_ADDR_HIGH) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid I2C address");
  }
  if (config.applyDefaultCompensation &&
      (!_isEncodableTemperature(config.defaultTemperatureC) ||
       !_isEncodableHumidity(config.defaultHumidityPct))) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid default compensation");
  }

  _config = config;
  if (_config.offlineThreshold == 0) {
    _config.offlineThreshold = 1;
  }

  _waitMs(cmd::STARTUP_DELAY_MS);

  Status st = _setMode(Mode::RESET);
  if (!st.ok()) {
    return st;
  }

  st = _check();
  if (st.code == Err::PART_ID_MISMATCH) {
    return Status::Error(Err::DEVICE_NOT_FOUND, "ENS160 not detected", st.detail);
  }
  if (!st.ok()) {
    return st;
  }

  st = _setMode(Mode::IDLE);
  if (!st.ok()) {
    return st;
  }

  st = _clearCommand();
  if (!st.ok()) {
    return st;
  }

  st = _setMode(Mode::STANDARD);
  if (!st.ok()) {
    return st;
  }

  if (_config.applyDefaultCompensation) {
    st = _setTemperatureCompensation(_config.defaultTemperatureC);
    if (!st.ok()) {
      return st;
    }
    st = _setHumidityCompensation(_config.defaultHumidityPct);
    if (!st.ok()) {
      return st;
    }
  }

  _initialized = true;
  _driverState = DriverState::READY;

  return Status::Ok();
}

void ENS160::end() {
  _initialized = false;
  _driverState = DriverState::UNINIT;
}

// ============================================================================
// Diagnostics
// ============================================================================

Status ENS160::probe() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  uint16_t partId = 0;
  Status st = _readPartIdRaw(partId);
  if (!st.ok()) {
    if (isBusError(st.code)) {
      return Status::Error(Err::DEVICE_NOT_FOUND, "Device not responding", st.detail);
    }
    return st;
  }
  if (partId != cmd::PART_ID_ENS160) {
    return Status::Error(Err::PART_ID_MISMATCH, "Part ID mismatch", partId);
  }

  return Status::Ok();
}

Status ENS160::recover() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  return _check();
}

// ============================================================================
// Identity / Operating Mode
// ============================================================================

Status ENS160::check() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  return _check();
}

Status ENS160::setMode(Mode mode) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  return _setMode(mode);
}

Status ENS160::getMode(Mode& out) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  return _getMode(out);
}

Status ENS160::reset() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  return _setMode(Mode::RESET);
}

// ============================================================================
// Command / General Purpose Registers
// ============================================================================

Status ENS160::clearCommand() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  return _clearCommand();
}

Status ENS160::readGeneralPurpose(GeneralPurposeRegisters& out) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  return _readGeneralPurpose(out);
}

Status ENS160::readFirmwareVersion(FirmwareVersion& out) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  Mode saved = Mode::IDLE;
  Status st = _getMode(saved);
  if (!st.ok()) {
    return st;
  }

  ModeRestore restore(*this, saved);

  st = _setMode(Mode::IDLE);
  if (!st.ok()) {
    return st;
  }

  st = _clearCommand();
  if (!st.ok()) {
    return st;
  }
  _waitMs(cmd::COMMAND_SETTLE_MS);

  st = writeRegister(cmd::REG_COMMAND, cmd::CMD_GET_APPVER);
  if (!st.ok()) {
    return st;
  }

  GeneralPurposeRegisters gpr;
  st = _readGeneralPurpose(gpr);
  if (!st.ok()) {
    return st;
  }

  st = restore.restore();
  if (!st.ok()) {
    return st;
  }

  out = decodeFirmwareVersion(gpr);
  return Status::Ok();
}

// ============================================================================
// Compensation
// ============================================================================

Status ENS160::setTemperatureCompensation(float tempC) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  return _setTemperatureCompensation(tempC);
}

Status ENS160::setHumidityCompensation(float humidityPct) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  return _setHumidityCompensation(humidityPct);
}

Status ENS160::getTemperatureCompensation(float& tempC) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  uint16_t raw = 0;
  Status st = _readWordBe(cmd::REG_DATA_T, raw);
  if (!st.ok()) {
    return st;
  }

  tempC = decodeTemperature(raw);
  return Status::Ok();
}

Status ENS160::getHumidityCompensation(float& humidityPct) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  uint16_t raw = 0;
  Status st = _readWordBe(cmd::REG_DATA_RH, raw);
  if (!st.ok()) {
    return st;
  }

  humidityPct = decodeHumidity(raw);
  return Status::Ok();
}

// ============================================================================
// Measurement API
// ============================================================================

Status ENS160::readAqi(uint8_t& aqi) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  return readRegister(cmd::REG_DATA_AQI, aqi);
}

Status ENS160::readTvoc(uint16_t& ppb) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  return _readWordLe(cmd::REG_DATA_TVOC, ppb);
}

Status ENS160::readEco2(uint16_t& ppm) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  return _readWordLe(cmd::REG_DATA_ECO2, ppm);
}

Status ENS160::readStatus(StatusSnapshot& out) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  uint8_t raw = 0;
  Status st = readRegister(cmd::REG_DEVICE_STATUS, raw);
  if (!st.ok()) {
    return st;
  }

  out = decodeStatus(raw);
  return Status::Ok();
}

Status ENS160::readMeasurement(Measurement& out) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }

  Measurement m;
  uint8_t statusRaw = 0;
  Status st = readRegister(cmd::REG_DEVICE_STATUS, statusRaw);
  if (!st.ok()) {
    return st;
  }
  m.status = decodeStatus(statusRaw);

  st = readRegister(cmd::REG_DATA_AQI, m.aqi);
  if (!st.ok()) {
    return st;
  }
  st = _readWordLe(cmd::REG_DATA_TVOC, m.tvocPpb);
  if (!st.ok()) {
    return st;
  }
  st = _readWordLe(cmd::REG_DATA_ECO2, m.eco2Ppm);
  if (!st.ok()) {
    return st;
  }

  out = m;
  return Status::Ok();
}

// ============================================================================
// Helpers
// ============================================================================

bool ENS160::isValidMode(Mode mode) {
  return mode == Mode::SLEEP || mode == Mode::IDLE ||
         mode == Mode::STANDARD || mode == Mode::RESET;
}

uint16_t ENS160::encodeTemperature(float tempC) {
  if (std::isnan(tempC)) {
    return 0;
  }
  return clampToU16(temperatureTicks(tempC));
}

float ENS160::decodeTemperature(uint16_t raw) {
  const double kelvin = static_cast<double>(raw) / cmd::TEMP_SCALE;
  return static_cast<float>(roundToTenth(kelvin - cmd::KELVIN_OFFSET));
}

uint16_t ENS160::encodeHumidity(float humidityPct) {
  if (std::isnan(humidityPct)) {
    return 0;
  }
  return clampToU16(humidityTicks(humidityPct));
}

float ENS160::decodeHumidity(uint16_t raw) {
  return static_cast<float>(roundToTenth(static_cast<double>(raw) / cmd::RH_SCALE));
}

StatusSnapshot ENS160::decodeStatus(uint8_t raw) {
  StatusSnapshot out;
  out.raw = raw;
  out.operatingMode = (raw & cmd::MASK_STATUS_STATAS) != 0;
  out.error = (raw & cmd::MASK_STATUS_STATER) != 0;
  out.newData = (raw & cmd::MASK_STATUS_NEWDAT) != 0;
  out.newGpr = (raw & cmd::MASK_STATUS_NEWGPR) != 0;

  const uint8_t validity =
      static_cast<uint8_t>((raw & cmd::MASK_STATUS_VALIDITY) >> cmd::BIT_STATUS_VALIDITY);
  switch (validity) {
    case 0: out.validity = Validity::NORMAL; break;
    case 1: out.validity = Validity::WARMUP; break;
    case 2: out.validity = Validity::STARTUP; break;
    default: out.validity = Validity::INVALID; break;
  }
  return out;
}

FirmwareVersion ENS160::decodeFirmwareVersion(const GeneralPurposeRegisters& gpr) {
  FirmwareVersion v;
  v.major = gpr.bytes[cmd::GPR_APPVER_MAJOR];
  v.minor = gpr.bytes[cmd::GPR_APPVER_MINOR];
  v.patch = gpr.bytes[cmd::GPR_APPVER_PATCH];
  return v;
}

size_t ENS160::formatFirmwareVersion(const FirmwareVersion& version, char* buf, size_t len) {
  if (buf == nullptr || len == 0) {
    return 0;
  }

  const int n = std::snprintf(buf, len, "%u.%u.%u",
                              static_cast<unsigned>(version.major),
                              static_cast<unsigned>(version.minor),
                              static_cast<unsigned>(version.patch));
  if (n < 0 || static_cast<size_t>(n) >= len) {
    buf[0] = '\0';
    return 0;
  }
  return static_cast<size_t>(n);
}

// ============================================================================
// Transport Wrappers
// ============================================================================

Status ENS160::_i2cWriteReadRaw(const uint8_t* txBuf, size_t txLen,
                                uint8_t* rxBuf, size_t rxLen) {
  if (_config.i2cWriteRead == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C write-read not set");
  }
  return _config.i2cWriteRead(_config.i2cAddress, txBuf, txLen, rxBuf, rxLen,
                              _config.i2cTimeoutMs, _config.i2cUser);
}

Status ENS160::_i2cWriteRaw(const uint8_t* buf, size_t len) {
  if (_config.i2cWrite == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C write not set");
  }
  return _config.i2cWrite(_config.i2cAddress, buf, len, _config.i2cTimeoutMs,
                          _config.i2cUser);
}

Status ENS160::_i2cWriteReadTracked(const uint8_t* txBuf, size_t txLen,
                                    uint8_t* rxBuf, size_t rxLen) {
  if (txBuf == nullptr || txLen == 0 || rxBuf == nullptr || rxLen == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C buffer");
  }

  Status st = _i2cWriteReadRaw(txBuf, txLen, rxBuf, rxLen);
  if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
    return st;
  }
  return _updateHealth(st);
}

Status ENS160::_i2cWriteTracked(const uint8_t* buf, size_t len) {
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C buffer");
  }

  Status st = _i2cWriteRaw(buf, len);
  if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
    return st;
  }
  return _updateHealth(st);
}

// ============================================================================
// Register Access
// ============================================================================

Status ENS160::readRegs(uint8_t startReg, uint8_t* buf, size_t len) {
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid read buffer");
  }

  uint8_t reg = startReg;
  return _i2cWriteReadTracked(&reg, 1, buf, len);
}

Status ENS160::writeRegs(uint8_t startReg, const uint8_t* buf, size_t len) {
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid write buffer");
  }
  if (len > MAX_WRITE_LEN) {
    return Status::Error(Err::INVALID_PARAM, "Write length too large");
  }

  uint8_t payload[MAX_WRITE_LEN + 1] = {};
  payload[0] = startReg;
  std::memcpy(&payload[1], buf, len);

  return _i2cWriteTracked(payload, len + 1);
}

Status ENS160::readRegister(uint8_t reg, uint8_t& value) {
  return readRegs(reg, &value, 1);
}

Status ENS160::writeRegister(uint8_t reg, uint8_t value) {
  return writeRegs(reg, &value, 1);
}

Status ENS160::_readPartIdRaw(uint16_t& partId) {
  uint8_t reg = cmd::REG_PART_ID;
  uint8_t buf[cmd::PART_ID_LEN] = {};
  Status st = _i2cWriteReadRaw(&reg, 1, buf, sizeof(buf));
  if (!st.ok()) {
    return st;
  }
  partId = static_cast<uint16_t>((buf[1] << 8) | buf[0]);
  return Status::Ok();
}

// ============================================================================
// Health Management
// ============================================================================

Status ENS160::_updateHealth(const Status& st) {
  if (!_initialized) {
    return st;
  }

  const uint32_t now = _nowMs();
  const uint32_t maxU32 = std::numeric_limits<uint32_t>::max();
  const uint8_t maxU8 = std::numeric_limits<uint8_t>::max();

  if (st.ok()) {
    _lastOkMs = now;
    if (_totalSuccess < maxU32) {
      _totalSuccess++;
    }
    _consecutiveFailures = 0;
    _driverState = DriverState::READY;
    return st;
  }

  _lastError = st;
  _lastErrorMs = now;
  if (_totalFailures < maxU32) {
    _totalFailures++;
  }
  if (_consecutiveFailures < maxU8) {
    _consecutiveFailures++;
  }

  if (_consecutiveFailures >= _config.offlineThreshold) {
    _driverState = DriverState::OFFLINE;
  } else {
    _driverState = DriverState::DEGRADED;
  }

  return st;
}

// ============================================================================
// Protocol Steps
// ============================================================================

Status ENS160::_check() {
  uint16_t partId = 0;
  Status st = _readWordLe(cmd::REG_PART_ID, partId);
  if (!st.ok()) {
    return st;
  }
  if (partId != cmd::PART_ID_ENS160) {
    return Status::Error(Err::PART_ID_MISMATCH, "Part ID mismatch", partId);
  }
  return Status::Ok();
}

Status ENS160::_setMode(Mode mode) {
  if (!isValidMode(mode)) {
    return Status::Error(Err::INVALID_MODE, "Invalid mode", static_cast<uint8_t>(mode));
  }

  Status st = writeRegister(cmd::REG_OPMODE, static_cast<uint8_t>(mode));
  if (!st.ok()) {
    return st;
  }

  _waitMs(cmd::MODE_SETTLE_MS);
  return Status::Ok();
}

Status ENS160::_getMode(Mode& out) {
  uint8_t raw = 0;
  Status st = readRegister(cmd::REG_OPMODE, raw);
  if (!st.ok()) {
    return st;
  }
  out = static_cast<Mode>(raw);
  return Status::Ok();
}

Status ENS160::_clearCommand() {
  // NOP first: CLRGPR alone is not reliably latched.
  Status st = writeRegister(cmd::REG_COMMAND, cmd::CMD_NOP);
  if (!st.ok()) {
    return st;
  }
  st = writeRegister(cmd::REG_COMMAND, cmd::CMD_CLRGPR);
  if (!st.ok()) {
    return st;
  }

  _waitMs(cmd::COMMAND_SETTLE_MS);
  return Status::Ok();
}

Status ENS160::_readGeneralPurpose(GeneralPurposeRegisters& out) {
  GeneralPurposeRegisters gpr;
  Status st = readRegs(cmd::REG_GPR_READ, gpr.bytes, sizeof(gpr.bytes));
  if (!st.ok()) {
    return st;
  }
  out = gpr;
  return Status::Ok();
}

Status ENS160::_writeWord(uint8_t reg, uint16_t value) {
  const uint8_t buf[2] = {
    static_cast<uint8_t>(value & 0xFF),
    static_cast<uint8_t>((value >> 8) & 0xFF)
  };
  return writeRegs(reg, buf, sizeof(buf));
}

Status ENS160::_readWordLe(uint8_t reg, uint16_t& value) {
  uint8_t buf[cmd::DATA_WORD_LEN] = {};
  Status st = readRegs(reg, buf, sizeof(buf));
  if (!st.ok()) {
    return st;
  }
  value = static_cast<uint16_t>((buf[1] << 8) | buf[0]);
  return Status::Ok();
}

// DATA_T / DATA_RH read back MSB first, unlike TEMP_IN / RH_IN.
Status ENS160::_readWordBe(uint8_t reg, uint16_t& value) {
  uint8_t buf[cmd::DATA_WORD_LEN] = {};
  Status st = readRegs(reg, buf, sizeof(buf));
  if (!st.ok()) {
    return st;
  }
  value = static_cast<uint16_t>((buf[0] << 8) | buf[1]);
  return Status::Ok();
}

Status ENS160::_setTemperatureCompensation(float tempC) {
  if (!_isEncodableTemperature(tempC)) {
    return Status::Error(Err::INVALID_PARAM, "Temperature out of range");
  }
  return _writeWord(cmd::REG_TEMP_IN, encodeTemperature(tempC));
}

Status ENS160::_setHumidityCompensation(float humidityPct) {
  if (!_isEncodableHumidity(humidityPct)) {
    return Status::Error(Err::INVALID_PARAM, "Humidity out of range");
  }
  return _writeWord(cmd::REG_RH_IN, encodeHumidity(humidityPct));
}

void ENS160::_waitMs(uint32_t ms) {
  if (ms == 0 || _config.delayMs == nullptr) {
    return;
  }
  _config.delayMs(ms, _config.i2cUser);
}

uint32_t ENS160::_nowMs() const {
  if (_config.nowMs == nullptr) {
    return 0;
  }
  return _config.nowMs(_config.i2cUser);
}

bool ENS160::_isEncodableTemperature(float tempC) {
  if (!std::isfinite(tempC)) {
    return false;
  }
  const double ticks = temperatureTicks(tempC);
  return ticks >= 0.0 && ticks <= U16_MAX;
}

bool ENS160::_isEncodableHumidity(float humidityPct) {
  if (!std::isfinite(humidityPct)) {
    return false;
  }
  const double ticks = humidityTicks(humidityPct);
  return ticks >= 0.0 && ticks <= U16_MAX;
}

}  // namespace ENS160
