/// @file CommandTable.h
/// @brief Register addresses, command bytes and bit definitions for ENS160
#pragma once

#include <cstdint>
#include <cstddef>

namespace ENS160 {
namespace cmd {

// ============================================================================
// I2C Addresses (7-bit)
// ============================================================================

static constexpr uint8_t I2C_ADDR_LOW = 0x52;   // ADDR=GND
static constexpr uint8_t I2C_ADDR_HIGH = 0x53;  // ADDR=VDD (default)

// ============================================================================
// Device Identification
// ============================================================================

static constexpr uint8_t REG_PART_ID = 0x00;    // 2 bytes, little-endian
static constexpr uint8_t PART_ID_LEN = 2;
static constexpr uint16_t PART_ID_ENS160 = 0x0160;

// ============================================================================
// Control Registers
// ============================================================================

static constexpr uint8_t REG_OPMODE = 0x10;     // 1 byte, R/W
static constexpr uint8_t REG_COMMAND = 0x12;    // 1 byte, W (valid in IDLE only)
static constexpr uint8_t REG_TEMP_IN = 0x13;    // 2 bytes, W, little-endian
static constexpr uint8_t REG_RH_IN = 0x15;      // 2 bytes, W, little-endian
static constexpr uint8_t COMP_IN_LEN = 2;

// ============================================================================
// Data Registers
// ============================================================================

static constexpr uint8_t REG_DEVICE_STATUS = 0x20;  // 1 byte
static constexpr uint8_t REG_DATA_AQI = 0x21;       // 1 byte
static constexpr uint8_t REG_DATA_TVOC = 0x22;      // 2 bytes, little-endian
static constexpr uint8_t REG_DATA_ECO2 = 0x24;      // 2 bytes, little-endian
static constexpr uint8_t REG_DATA_T = 0x30;         // 2 bytes, read back big-endian
static constexpr uint8_t REG_DATA_RH = 0x32;        // 2 bytes, read back big-endian
static constexpr uint8_t DATA_WORD_LEN = 2;

// ============================================================================
// General Purpose Read Registers
// ============================================================================

static constexpr uint8_t REG_GPR_READ = 0x48;
static constexpr uint8_t GPR_READ_LEN = 8;

// GET_APPVER result offsets inside the GPR bank
static constexpr uint8_t GPR_APPVER_MAJOR = 4;
static constexpr uint8_t GPR_APPVER_MINOR = 5;
static constexpr uint8_t GPR_APPVER_PATCH = 6;

// ============================================================================
// Operating Modes (OPMODE values)
// ============================================================================

static constexpr uint8_t OPMODE_SLEEP = 0x00;
static constexpr uint8_t OPMODE_IDLE = 0x01;
static constexpr uint8_t OPMODE_STANDARD = 0x02;
static constexpr uint8_t OPMODE_RESET = 0xF0;

// ============================================================================
// Commands (COMMAND values)
// ============================================================================

static constexpr uint8_t CMD_NOP = 0x00;
static constexpr uint8_t CMD_GET_APPVER = 0x0E;
static constexpr uint8_t CMD_CLRGPR = 0xCC;

// ============================================================================
// DEVICE_STATUS Bit Masks / Positions
// ============================================================================

static constexpr uint8_t MASK_STATUS_STATAS = 0x80;    // Operating mode running
static constexpr uint8_t MASK_STATUS_STATER = 0x40;    // Error detected
static constexpr uint8_t MASK_STATUS_VALIDITY = 0x0C;  // Validity flag (2 bits)
static constexpr uint8_t MASK_STATUS_NEWDAT = 0x02;    // New data in data registers
static constexpr uint8_t MASK_STATUS_NEWGPR = 0x01;    // New data in GPR_READ

static constexpr uint8_t BIT_STATUS_VALIDITY = 2;

// ============================================================================
// Compensation Fixed-Point Scaling
// ============================================================================

static constexpr double KELVIN_OFFSET = 273.15;
static constexpr double TEMP_SCALE = 64.0;      // Kelvin * 64
static constexpr double RH_SCALE = 512.0;       // %RH * 512

// ============================================================================
// Timing (device requirements, ms)
// ============================================================================

static constexpr uint32_t STARTUP_DELAY_MS = 20;   // Power rail settle before first access
static constexpr uint32_t MODE_SETTLE_MS = 10;     // After every OPMODE write
static constexpr uint32_t COMMAND_SETTLE_MS = 10;  // After CLRGPR and before GET_APPVER

} // namespace cmd
} // namespace ENS160
