/// @file test_protocol.cpp
/// @brief Driver tests against a simulated ENS160 register file

#include <unity.h>

#include <cmath>
#include <limits>

#include "ENS160/ENS160.h"
#include "SimDevice.h"

using ENS160::Config;
using ENS160::DriverState;
using ENS160::Err;
using ENS160::FirmwareVersion;
using ENS160::GeneralPurposeRegisters;
using ENS160::Measurement;
using ENS160::Mode;
using ENS160::Status;
using ENS160::StatusSnapshot;
using ENS160::Validity;
using Device = ::ENS160::ENS160;

namespace cmd = ENS160::cmd;

// ============================================================================
// Test Helpers
// ============================================================================

static sim::Device gSim;

static Config makeConfig() {
  Config cfg;
  cfg.i2cWrite = sim::write;
  cfg.i2cWriteRead = sim::writeRead;
  cfg.delayMs = sim::delayMs;
  cfg.nowMs = sim::nowMs;
  cfg.i2cUser = &gSim;
  return cfg;
}

static void assertWrite(size_t index, uint8_t reg, uint8_t value) {
  TEST_ASSERT_TRUE(index < gSim.writeCount);
  TEST_ASSERT_EQUAL_HEX8(reg, gSim.writes[index].reg);
  TEST_ASSERT_EQUAL_UINT32(1u, static_cast<uint32_t>(gSim.writes[index].len));
  TEST_ASSERT_EQUAL_HEX8(value, gSim.writes[index].data[0]);
}

static void beginOk(Device& dev) {
  Status st = dev.begin(makeConfig());
  TEST_ASSERT_TRUE(st.ok());
  gSim.clearLog();
}

void setUp() {
  gSim = sim::Device();
}

void tearDown() {}

// ============================================================================
// Lifecycle
// ============================================================================

void test_begin_sequence() {
  Device dev;
  Status st = dev.begin(makeConfig());
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL(DriverState::READY, dev.state());
  TEST_ASSERT_TRUE(dev.isOnline());

  TEST_ASSERT_EQUAL_UINT32(7u, static_cast<uint32_t>(gSim.writeCount));
  assertWrite(0, cmd::REG_OPMODE, cmd::OPMODE_RESET);
  assertWrite(1, cmd::REG_OPMODE, cmd::OPMODE_IDLE);
  assertWrite(2, cmd::REG_COMMAND, cmd::CMD_NOP);
  assertWrite(3, cmd::REG_COMMAND, cmd::CMD_CLRGPR);
  assertWrite(4, cmd::REG_OPMODE, cmd::OPMODE_STANDARD);

  // 25.5 degC -> 19114 = 0x4AAA, little-endian on the wire
  TEST_ASSERT_EQUAL_HEX8(cmd::REG_TEMP_IN, gSim.writes[5].reg);
  TEST_ASSERT_EQUAL_UINT32(2u, static_cast<uint32_t>(gSim.writes[5].len));
  TEST_ASSERT_EQUAL_HEX8(0xAA, gSim.writes[5].data[0]);
  TEST_ASSERT_EQUAL_HEX8(0x4A, gSim.writes[5].data[1]);

  // 51 %RH -> 26112 = 0x6600
  TEST_ASSERT_EQUAL_HEX8(cmd::REG_RH_IN, gSim.writes[6].reg);
  TEST_ASSERT_EQUAL_UINT32(2u, static_cast<uint32_t>(gSim.writes[6].len));
  TEST_ASSERT_EQUAL_HEX8(0x00, gSim.writes[6].data[0]);
  TEST_ASSERT_EQUAL_HEX8(0x66, gSim.writes[6].data[1]);

  TEST_ASSERT_TRUE(gSim.delayCount >= 1);
  TEST_ASSERT_EQUAL_UINT32(cmd::STARTUP_DELAY_MS, gSim.delays[0]);
  TEST_ASSERT_EQUAL_HEX8(cmd::OPMODE_STANDARD, gSim.regs[cmd::REG_OPMODE]);
}

void test_begin_without_default_compensation() {
  Device dev;
  Config cfg = makeConfig();
  cfg.applyDefaultCompensation = false;
  TEST_ASSERT_TRUE(dev.begin(cfg).ok());
  TEST_ASSERT_EQUAL_UINT32(5u, static_cast<uint32_t>(gSim.writeCount));
  TEST_ASSERT_EQUAL_UINT32(0u, static_cast<uint32_t>(gSim.writesTo(cmd::REG_TEMP_IN)));
  TEST_ASSERT_EQUAL_UINT32(0u, static_cast<uint32_t>(gSim.writesTo(cmd::REG_RH_IN)));
}

void test_begin_part_id_mismatch() {
  gSim.regs[cmd::REG_PART_ID] = 0x01;
  gSim.regs[cmd::REG_PART_ID + 1] = 0x60;

  Device dev;
  Status st = dev.begin(makeConfig());
  TEST_ASSERT_EQUAL(Err::DEVICE_NOT_FOUND, st.code);
  TEST_ASSERT_EQUAL_INT32(0x6001, st.detail);
  TEST_ASSERT_EQUAL(DriverState::UNINIT, dev.state());
  TEST_ASSERT_FALSE(dev.isOnline());

  // Only the reset write went out; the sequence stopped at the check.
  TEST_ASSERT_EQUAL_UINT32(1u, static_cast<uint32_t>(gSim.writeCount));
  assertWrite(0, cmd::REG_OPMODE, cmd::OPMODE_RESET);
}

void test_begin_bus_error_propagates() {
  gSim.failWriteReg = cmd::REG_OPMODE;

  Device dev;
  Status st = dev.begin(makeConfig());
  TEST_ASSERT_EQUAL(Err::I2C_NACK_ADDR, st.code);
  TEST_ASSERT_EQUAL_INT32(2, st.detail);
  TEST_ASSERT_EQUAL(DriverState::UNINIT, dev.state());
  TEST_ASSERT_EQUAL_UINT32(0u, static_cast<uint32_t>(gSim.readCount));
}

void test_begin_can_be_retried() {
  gSim.failReadReg = cmd::REG_PART_ID;

  Device dev;
  TEST_ASSERT_FALSE(dev.begin(makeConfig()).ok());

  gSim.failReadReg = -1;
  gSim.clearLog();
  TEST_ASSERT_TRUE(dev.begin(makeConfig()).ok());
  assertWrite(0, cmd::REG_OPMODE, cmd::OPMODE_RESET);
  TEST_ASSERT_EQUAL(DriverState::READY, dev.state());
}

void test_begin_invalid_config() {
  Device dev;

  Config cfg = makeConfig();
  cfg.i2cWrite = nullptr;
  TEST_ASSERT_EQUAL(Err::INVALID_CONFIG, dev.begin(cfg).code);

  cfg = makeConfig();
  cfg.delayMs = nullptr;
  TEST_ASSERT_EQUAL(Err::INVALID_CONFIG, dev.begin(cfg).code);

  cfg = makeConfig();
  cfg.i2cAddress = 0x40;
  TEST_ASSERT_EQUAL(Err::INVALID_CONFIG, dev.begin(cfg).code);

  cfg = makeConfig();
  cfg.i2cTimeoutMs = 0;
  TEST_ASSERT_EQUAL(Err::INVALID_CONFIG, dev.begin(cfg).code);

  cfg = makeConfig();
  cfg.defaultTemperatureC = std::numeric_limits<float>::quiet_NaN();
  TEST_ASSERT_EQUAL(Err::INVALID_CONFIG, dev.begin(cfg).code);

  TEST_ASSERT_EQUAL_UINT32(0u, static_cast<uint32_t>(gSim.writeCount));
  TEST_ASSERT_EQUAL(DriverState::UNINIT, dev.state());
}

void test_not_initialized() {
  Device dev;
  uint8_t aqi = 0;
  uint16_t word = 0;
  Mode mode = Mode::IDLE;
  FirmwareVersion fw;

  TEST_ASSERT_EQUAL(Err::NOT_INITIALIZED, dev.check().code);
  TEST_ASSERT_EQUAL(Err::NOT_INITIALIZED, dev.setMode(Mode::IDLE).code);
  TEST_ASSERT_EQUAL(Err::NOT_INITIALIZED, dev.getMode(mode).code);
  TEST_ASSERT_EQUAL(Err::NOT_INITIALIZED, dev.readAqi(aqi).code);
  TEST_ASSERT_EQUAL(Err::NOT_INITIALIZED, dev.readTvoc(word).code);
  TEST_ASSERT_EQUAL(Err::NOT_INITIALIZED, dev.readFirmwareVersion(fw).code);
  TEST_ASSERT_EQUAL(Err::NOT_INITIALIZED, dev.probe().code);
  TEST_ASSERT_EQUAL_UINT32(0u, static_cast<uint32_t>(gSim.writeCount));
  TEST_ASSERT_EQUAL_UINT32(0u, static_cast<uint32_t>(gSim.readCount));
}

void test_end_returns_to_uninit() {
  Device dev;
  beginOk(dev);
  dev.end();
  TEST_ASSERT_EQUAL(DriverState::UNINIT, dev.state());
  uint8_t aqi = 0;
  TEST_ASSERT_EQUAL(Err::NOT_INITIALIZED, dev.readAqi(aqi).code);
  TEST_ASSERT_EQUAL_UINT32(0u, static_cast<uint32_t>(gSim.readCount));
}

// ============================================================================
// Identity / Operating Mode
// ============================================================================

void test_check_part_id() {
  Device dev;
  beginOk(dev);
  TEST_ASSERT_TRUE(dev.check().ok());

  gSim.regs[cmd::REG_PART_ID] = 0x01;
  gSim.regs[cmd::REG_PART_ID + 1] = 0x60;
  Status st = dev.check();
  TEST_ASSERT_EQUAL(Err::PART_ID_MISMATCH, st.code);
  TEST_ASSERT_EQUAL_INT32(0x6001, st.detail);
}

void test_mode_roundtrip() {
  Device dev;
  beginOk(dev);

  const Mode modes[] = {Mode::SLEEP, Mode::IDLE, Mode::STANDARD, Mode::RESET};
  for (Mode m : modes) {
    TEST_ASSERT_TRUE(dev.setMode(m).ok());
    Mode readBack = Mode::IDLE;
    TEST_ASSERT_TRUE(dev.getMode(readBack).ok());
    TEST_ASSERT_EQUAL_HEX8(static_cast<uint8_t>(m), static_cast<uint8_t>(readBack));
  }
  TEST_ASSERT_EQUAL_UINT32(4u, static_cast<uint32_t>(gSim.writesTo(cmd::REG_OPMODE)));
  TEST_ASSERT_EQUAL_UINT32(cmd::MODE_SETTLE_MS, gSim.delays[0]);
}

void test_invalid_mode_rejected_without_io() {
  Device dev;
  beginOk(dev);

  Status st = dev.setMode(static_cast<Mode>(0x03));
  TEST_ASSERT_EQUAL(Err::INVALID_MODE, st.code);
  TEST_ASSERT_EQUAL_UINT32(0u, static_cast<uint32_t>(gSim.writeCount));
  TEST_ASSERT_EQUAL_UINT32(0u, static_cast<uint32_t>(gSim.delayCount));
  TEST_ASSERT_EQUAL(DriverState::READY, dev.state());
}

void test_get_mode_passes_undefined_value() {
  Device dev;
  beginOk(dev);

  gSim.regs[cmd::REG_OPMODE] = 0x07;
  Mode m = Mode::IDLE;
  TEST_ASSERT_TRUE(dev.getMode(m).ok());
  TEST_ASSERT_EQUAL_HEX8(0x07, static_cast<uint8_t>(m));
}

void test_reset_writes_reset_mode() {
  Device dev;
  beginOk(dev);
  TEST_ASSERT_TRUE(dev.reset().ok());
  TEST_ASSERT_EQUAL_UINT32(1u, static_cast<uint32_t>(gSim.writeCount));
  assertWrite(0, cmd::REG_OPMODE, cmd::OPMODE_RESET);
}

// ============================================================================
// Command / General Purpose Registers
// ============================================================================

void test_clear_command() {
  Device dev;
  beginOk(dev);
  TEST_ASSERT_TRUE(dev.clearCommand().ok());
  TEST_ASSERT_EQUAL_UINT32(2u, static_cast<uint32_t>(gSim.writeCount));
  assertWrite(0, cmd::REG_COMMAND, cmd::CMD_NOP);
  assertWrite(1, cmd::REG_COMMAND, cmd::CMD_CLRGPR);
  TEST_ASSERT_EQUAL_UINT32(1u, static_cast<uint32_t>(gSim.delayCount));
  TEST_ASSERT_EQUAL_UINT32(cmd::COMMAND_SETTLE_MS, gSim.delays[0]);
}

void test_read_general_purpose() {
  Device dev;
  beginOk(dev);
  for (uint8_t i = 0; i < cmd::GPR_READ_LEN; i++) {
    gSim.regs[cmd::REG_GPR_READ + i] = static_cast<uint8_t>(0x10 + i);
  }

  GeneralPurposeRegisters gpr;
  TEST_ASSERT_TRUE(dev.readGeneralPurpose(gpr).ok());
  for (uint8_t i = 0; i < cmd::GPR_READ_LEN; i++) {
    TEST_ASSERT_EQUAL_HEX8(0x10 + i, gpr.bytes[i]);
  }
}

void test_firmware_version_restores_mode() {
  Device dev;
  beginOk(dev);
  gSim.regs[cmd::REG_GPR_READ + cmd::GPR_APPVER_MAJOR] = 1;
  gSim.regs[cmd::REG_GPR_READ + cmd::GPR_APPVER_MINOR] = 4;
  gSim.regs[cmd::REG_GPR_READ + cmd::GPR_APPVER_PATCH] = 2;

  FirmwareVersion fw;
  TEST_ASSERT_TRUE(dev.readFirmwareVersion(fw).ok());
  TEST_ASSERT_EQUAL_UINT8(1, fw.major);
  TEST_ASSERT_EQUAL_UINT8(4, fw.minor);
  TEST_ASSERT_EQUAL_UINT8(2, fw.patch);

  TEST_ASSERT_EQUAL_UINT32(5u, static_cast<uint32_t>(gSim.writeCount));
  assertWrite(0, cmd::REG_OPMODE, cmd::OPMODE_IDLE);
  assertWrite(1, cmd::REG_COMMAND, cmd::CMD_NOP);
  assertWrite(2, cmd::REG_COMMAND, cmd::CMD_CLRGPR);
  assertWrite(3, cmd::REG_COMMAND, cmd::CMD_GET_APPVER);
  assertWrite(4, cmd::REG_OPMODE, cmd::OPMODE_STANDARD);
  TEST_ASSERT_EQUAL_HEX8(cmd::OPMODE_STANDARD, gSim.regs[cmd::REG_OPMODE]);
}

void test_firmware_version_restores_mode_on_failure() {
  Device dev;
  beginOk(dev);
  gSim.failReadReg = cmd::REG_GPR_READ;

  FirmwareVersion fw;
  fw.major = 9;
  Status st = dev.readFirmwareVersion(fw);
  TEST_ASSERT_EQUAL(Err::I2C_NACK_ADDR, st.code);
  TEST_ASSERT_EQUAL_UINT8(9, fw.major);

  TEST_ASSERT_TRUE(gSim.writeCount >= 1);
  const sim::WriteRecord& last = gSim.writes[gSim.writeCount - 1];
  TEST_ASSERT_EQUAL_HEX8(cmd::REG_OPMODE, last.reg);
  TEST_ASSERT_EQUAL_HEX8(cmd::OPMODE_STANDARD, last.data[0]);
  TEST_ASSERT_EQUAL_HEX8(cmd::OPMODE_STANDARD, gSim.regs[cmd::REG_OPMODE]);
}

void test_firmware_version_from_sleep() {
  Device dev;
  beginOk(dev);
  TEST_ASSERT_TRUE(dev.setMode(Mode::SLEEP).ok());

  FirmwareVersion fw;
  TEST_ASSERT_TRUE(dev.readFirmwareVersion(fw).ok());
  TEST_ASSERT_EQUAL_HEX8(cmd::OPMODE_SLEEP, gSim.regs[cmd::REG_OPMODE]);
}

// ============================================================================
// Compensation
// ============================================================================

void test_compensation_write() {
  Device dev;
  beginOk(dev);

  TEST_ASSERT_TRUE(dev.setTemperatureCompensation(25.5f).ok());
  TEST_ASSERT_TRUE(dev.setHumidityCompensation(50.0f).ok());
  TEST_ASSERT_EQUAL_UINT32(2u, static_cast<uint32_t>(gSim.writeCount));
  TEST_ASSERT_EQUAL_HEX8(cmd::REG_TEMP_IN, gSim.writes[0].reg);
  TEST_ASSERT_EQUAL_HEX8(0xAA, gSim.writes[0].data[0]);
  TEST_ASSERT_EQUAL_HEX8(0x4A, gSim.writes[0].data[1]);
  TEST_ASSERT_EQUAL_HEX8(cmd::REG_RH_IN, gSim.writes[1].reg);
  TEST_ASSERT_EQUAL_HEX8(0x00, gSim.writes[1].data[0]);
  TEST_ASSERT_EQUAL_HEX8(0x64, gSim.writes[1].data[1]);
}

void test_compensation_read_back() {
  Device dev;
  beginOk(dev);
  gSim.regs[cmd::REG_DATA_T] = 0x4A;
  gSim.regs[cmd::REG_DATA_T + 1] = 0xAA;
  gSim.regs[cmd::REG_DATA_RH] = 0x64;
  gSim.regs[cmd::REG_DATA_RH + 1] = 0x00;

  float t = 0.0f;
  float rh = 0.0f;
  TEST_ASSERT_TRUE(dev.getTemperatureCompensation(t).ok());
  TEST_ASSERT_TRUE(dev.getHumidityCompensation(rh).ok());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 25.5f, t);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 50.0f, rh);
}

void test_compensation_rejects_unencodable() {
  Device dev;
  beginOk(dev);

  TEST_ASSERT_EQUAL(Err::INVALID_PARAM,
                    dev.setTemperatureCompensation(std::numeric_limits<float>::quiet_NaN()).code);
  TEST_ASSERT_EQUAL(Err::INVALID_PARAM, dev.setTemperatureCompensation(-300.0f).code);
  TEST_ASSERT_EQUAL(Err::INVALID_PARAM, dev.setHumidityCompensation(-1.0f).code);
  TEST_ASSERT_EQUAL(Err::INVALID_PARAM, dev.setHumidityCompensation(500.0f).code);
  TEST_ASSERT_EQUAL_UINT32(0u, static_cast<uint32_t>(gSim.writeCount));
  TEST_ASSERT_EQUAL(DriverState::READY, dev.state());
}

// ============================================================================
// Measurement API
// ============================================================================

void test_read_data_registers() {
  Device dev;
  beginOk(dev);
  gSim.regs[cmd::REG_DATA_AQI] = 3;
  gSim.regs[cmd::REG_DATA_TVOC] = 0x2C;      // 300 ppb
  gSim.regs[cmd::REG_DATA_TVOC + 1] = 0x01;
  gSim.regs[cmd::REG_DATA_ECO2] = 0x20;      // 800 ppm
  gSim.regs[cmd::REG_DATA_ECO2 + 1] = 0x03;

  uint8_t aqi = 0;
  uint16_t tvoc = 0;
  uint16_t eco2 = 0;
  TEST_ASSERT_TRUE(dev.readAqi(aqi).ok());
  TEST_ASSERT_TRUE(dev.readTvoc(tvoc).ok());
  TEST_ASSERT_TRUE(dev.readEco2(eco2).ok());
  TEST_ASSERT_EQUAL_UINT8(3, aqi);
  TEST_ASSERT_EQUAL_UINT16(300, tvoc);
  TEST_ASSERT_EQUAL_UINT16(800, eco2);
}

void test_read_status() {
  Device dev;
  beginOk(dev);
  gSim.regs[cmd::REG_DEVICE_STATUS] = 0x86;

  StatusSnapshot s;
  TEST_ASSERT_TRUE(dev.readStatus(s).ok());
  TEST_ASSERT_EQUAL_HEX8(0x86, s.raw);
  TEST_ASSERT_TRUE(s.operatingMode);
  TEST_ASSERT_FALSE(s.error);
  TEST_ASSERT_EQUAL(Validity::WARMUP, s.validity);
  TEST_ASSERT_TRUE(s.newData);
  TEST_ASSERT_FALSE(s.newGpr);
}

void test_read_measurement() {
  Device dev;
  beginOk(dev);
  gSim.regs[cmd::REG_DEVICE_STATUS] = 0x82;
  gSim.regs[cmd::REG_DATA_AQI] = 1;
  gSim.regs[cmd::REG_DATA_TVOC] = 0x0A;
  gSim.regs[cmd::REG_DATA_ECO2] = 0x90;      // 400 ppm
  gSim.regs[cmd::REG_DATA_ECO2 + 1] = 0x01;

  Measurement m;
  TEST_ASSERT_TRUE(dev.readMeasurement(m).ok());
  TEST_ASSERT_EQUAL(Validity::NORMAL, m.status.validity);
  TEST_ASSERT_TRUE(m.status.newData);
  TEST_ASSERT_EQUAL_UINT8(1, m.aqi);
  TEST_ASSERT_EQUAL_UINT16(10, m.tvocPpb);
  TEST_ASSERT_EQUAL_UINT16(400, m.eco2Ppm);
}

void test_read_measurement_partial_failure_leaves_output() {
  Device dev;
  beginOk(dev);
  gSim.regs[cmd::REG_DATA_AQI] = 4;
  gSim.failReadReg = cmd::REG_DATA_ECO2;

  Measurement m;
  m.aqi = 0xEE;
  Status st = dev.readMeasurement(m);
  TEST_ASSERT_EQUAL(Err::I2C_NACK_ADDR, st.code);
  TEST_ASSERT_EQUAL_UINT8(0xEE, m.aqi);
}

// ============================================================================
// Health Tracking / Diagnostics
// ============================================================================

void test_health_degraded_offline_recover() {
  Device dev;
  beginOk(dev);
  TEST_ASSERT_EQUAL_UINT32(0u, dev.totalFailures());

  gSim.failReadReg = cmd::REG_DATA_AQI;
  uint8_t aqi = 0;
  TEST_ASSERT_FALSE(dev.readAqi(aqi).ok());
  TEST_ASSERT_EQUAL(DriverState::DEGRADED, dev.state());
  TEST_ASSERT_TRUE(dev.isOnline());
  TEST_ASSERT_EQUAL_UINT8(1, dev.consecutiveFailures());
  TEST_ASSERT_EQUAL(Err::I2C_NACK_ADDR, dev.lastError().code);

  for (int i = 0; i < 4; i++) {
    TEST_ASSERT_FALSE(dev.readAqi(aqi).ok());
  }
  TEST_ASSERT_EQUAL(DriverState::OFFLINE, dev.state());
  TEST_ASSERT_FALSE(dev.isOnline());
  TEST_ASSERT_EQUAL_UINT32(5u, dev.totalFailures());

  gSim.failReadReg = -1;
  TEST_ASSERT_TRUE(dev.recover().ok());
  TEST_ASSERT_EQUAL(DriverState::READY, dev.state());
  TEST_ASSERT_EQUAL_UINT8(0, dev.consecutiveFailures());
  TEST_ASSERT_TRUE(dev.totalSuccess() >= 1u);
}

void test_health_timestamps_use_clock() {
  Device dev;
  beginOk(dev);
  gSim.nowMs = 1234;

  uint8_t aqi = 0;
  TEST_ASSERT_TRUE(dev.readAqi(aqi).ok());
  TEST_ASSERT_EQUAL_UINT32(1234u, dev.lastOkMs());

  gSim.nowMs = 2000;
  gSim.failReadReg = cmd::REG_DATA_AQI;
  TEST_ASSERT_FALSE(dev.readAqi(aqi).ok());
  TEST_ASSERT_EQUAL_UINT32(2000u, dev.lastErrorMs());
}

void test_probe() {
  Device dev;
  beginOk(dev);
  TEST_ASSERT_TRUE(dev.probe().ok());

  gSim.failReadReg = cmd::REG_PART_ID;
  Status st = dev.probe();
  TEST_ASSERT_EQUAL(Err::DEVICE_NOT_FOUND, st.code);
  // probe() is not health tracked
  TEST_ASSERT_EQUAL(DriverState::READY, dev.state());
  TEST_ASSERT_EQUAL_UINT32(0u, dev.totalFailures());

  gSim.failReadReg = -1;
  gSim.regs[cmd::REG_PART_ID] = 0x61;
  TEST_ASSERT_EQUAL(Err::PART_ID_MISMATCH, dev.probe().code);
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
  (void)argc;
  (void)argv;
  UNITY_BEGIN();
  RUN_TEST(test_begin_sequence);
  RUN_TEST(test_begin_without_default_compensation);
  RUN_TEST(test_begin_part_id_mismatch);
  RUN_TEST(test_begin_bus_error_propagates);
  RUN_TEST(test_begin_can_be_retried);
  RUN_TEST(test_begin_invalid_config);
  RUN_TEST(test_not_initialized);
  RUN_TEST(test_end_returns_to_uninit);
  RUN_TEST(test_check_part_id);
  RUN_TEST(test_mode_roundtrip);
  RUN_TEST(test_invalid_mode_rejected_without_io);
  RUN_TEST(test_get_mode_passes_undefined_value);
  RUN_TEST(test_reset_writes_reset_mode);
  RUN_TEST(test_clear_command);
  RUN_TEST(test_read_general_purpose);
  RUN_TEST(test_firmware_version_restores_mode);
  RUN_TEST(test_firmware_version_restores_mode_on_failure);
  RUN_TEST(test_firmware_version_from_sleep);
  RUN_TEST(test_compensation_write);
  RUN_TEST(test_compensation_read_back);
  RUN_TEST(test_compensation_rejects_unencodable);
  RUN_TEST(test_read_data_registers);
  RUN_TEST(test_read_status);
  RUN_TEST(test_read_measurement);
  RUN_TEST(test_read_measurement_partial_failure_leaves_output);
  RUN_TEST(test_health_degraded_offline_recover);
  RUN_TEST(test_health_timestamps_use_clock);
  RUN_TEST(test_probe);
  return UNITY_END();
}
