/// @file main.cpp
/// @brief Basic bringup example for ENS160
/// @note This is an EXAMPLE, not part of the library

#include <Arduino.h>
#include <cstdlib>
#include <limits>
#include "common/Log.h"
#include "common/BoardConfig.h"
#include "common/I2cTransport.h"

#include "ENS160/ENS160.h"

// ============================================================================
// Globals
// ============================================================================

struct StressStats {
  bool active = false;
  uint32_t startMs = 0;
  int target = 0;
  int attempts = 0;
  int success = 0;
  uint32_t errors = 0;
  uint16_t minEco2 = 0;
  uint16_t maxEco2 = 0;
  uint16_t minTvoc = 0;
  uint16_t maxTvoc = 0;
  double sumEco2 = 0.0;
  double sumTvoc = 0.0;
  ENS160::Status lastError = ENS160::Status::Ok();
};

ENS160::ENS160 device;
ENS160::Config gConfig;
bool verboseMode = false;
bool watchMode = false;
uint32_t lastPollMs = 0;
StressStats stressStats;

// ============================================================================
// Helper Functions
// ============================================================================

const char* errToStr(ENS160::Err err) {
  using namespace ENS160;
  switch (err) {
    case Err::OK: return "OK";
    case Err::NOT_INITIALIZED: return "NOT_INITIALIZED";
    case Err::INVALID_CONFIG: return "INVALID_CONFIG";
    case Err::I2C_ERROR: return "I2C_ERROR";
    case Err::I2C_NACK_ADDR: return "I2C_NACK_ADDR";
    case Err::I2C_NACK_DATA: return "I2C_NACK_DATA";
    case Err::I2C_TIMEOUT: return "I2C_TIMEOUT";
    case Err::I2C_BUS: return "I2C_BUS";
    case Err::INVALID_PARAM: return "INVALID_PARAM";
    case Err::INVALID_MODE: return "INVALID_MODE";
    case Err::DEVICE_NOT_FOUND: return "DEVICE_NOT_FOUND";
    case Err::PART_ID_MISMATCH: return "PART_ID_MISMATCH";
    default: return "UNKNOWN";
  }
}

const char* stateToStr(ENS160::DriverState st) {
  using namespace ENS160;
  switch (st) {
    case DriverState::UNINIT: return "UNINIT";
    case DriverState::READY: return "READY";
    case DriverState::DEGRADED: return "DEGRADED";
    case DriverState::OFFLINE: return "OFFLINE";
    default: return "UNKNOWN";
  }
}

const char* modeToStr(ENS160::Mode mode) {
  using namespace ENS160;
  switch (mode) {
    case Mode::SLEEP: return "SLEEP";
    case Mode::IDLE: return "IDLE";
    case Mode::STANDARD: return "STANDARD";
    case Mode::RESET: return "RESET";
    default: return "UNKNOWN";
  }
}

const char* validityToStr(ENS160::Validity v) {
  using namespace ENS160;
  switch (v) {
    case Validity::NORMAL: return "normal";
    case Validity::WARMUP: return "warmup";
    case Validity::STARTUP: return "startup";
    case Validity::INVALID: return "invalid";
    default: return "unknown";
  }
}

void printStatus(const ENS160::Status& st) {
  Serial.printf("  Status: %s (code=%u, detail=%ld)\n",
                errToStr(st.code),
                static_cast<unsigned>(st.code),
                static_cast<long>(st.detail));
  if (st.msg && st.msg[0]) {
    Serial.printf("  Message: %s\n", st.msg);
  }
}

void printDriverHealth() {
  Serial.println("=== Driver State ===");
  Serial.printf("  State: %s\n", stateToStr(device.state()));
  Serial.printf("  Online: %s\n", device.isOnline() ? "YES" : "NO");
  Serial.printf("  Consecutive failures: %u\n", device.consecutiveFailures());
  Serial.printf("  Total failures: %lu\n", static_cast<unsigned long>(device.totalFailures()));
  Serial.printf("  Total success: %lu\n", static_cast<unsigned long>(device.totalSuccess()));
  Serial.printf("  Last OK at: %lu ms\n", static_cast<unsigned long>(device.lastOkMs()));
  Serial.printf("  Last error at: %lu ms\n", static_cast<unsigned long>(device.lastErrorMs()));
  if (device.lastError().code != ENS160::Err::OK) {
    Serial.printf("  Last error: %s\n", errToStr(device.lastError().code));
  }
}

void printSnapshot(const ENS160::StatusSnapshot& s) {
  Serial.printf("Status: 0x%02X (opmode=%d error=%d validity=%s newdat=%d newgpr=%d)\n",
                s.raw,
                s.operatingMode ? 1 : 0,
                s.error ? 1 : 0,
                validityToStr(s.validity),
                s.newData ? 1 : 0,
                s.newGpr ? 1 : 0);
}

void printMeasurement(const ENS160::Measurement& m) {
  Serial.printf("AQI: %u, TVOC: %u ppb, eCO2: %u ppm, validity: %s\n",
                static_cast<unsigned>(m.aqi),
                static_cast<unsigned>(m.tvocPpb),
                static_cast<unsigned>(m.eco2Ppm),
                validityToStr(m.status.validity));
}

void printCompensation() {
  float tempC = 0.0f;
  float humidityPct = 0.0f;
  ENS160::Status st = device.getTemperatureCompensation(tempC);
  if (!st.ok()) {
    printStatus(st);
    return;
  }
  st = device.getHumidityCompensation(humidityPct);
  if (!st.ok()) {
    printStatus(st);
    return;
  }
  Serial.printf("Compensation in use: T=%.1f C, RH=%.1f %%\n", tempC, humidityPct);
}

void printConfig() {
  Serial.println("=== Config ===");
  Serial.printf("  Address: 0x%02X\n", gConfig.i2cAddress);
  Serial.printf("  I2C timeout: %lu ms\n", static_cast<unsigned long>(gConfig.i2cTimeoutMs));
  Serial.printf("  Default compensation: %s (T=%.1f C, RH=%.1f %%)\n",
                gConfig.applyDefaultCompensation ? "ON" : "OFF",
                gConfig.defaultTemperatureC, gConfig.defaultHumidityPct);
  Serial.printf("  Offline threshold: %u\n", gConfig.offlineThreshold);
  Serial.printf("  Verbose: %s\n", verboseMode ? "ON" : "OFF");
}

bool parseMode(const String& token, ENS160::Mode& out) {
  String t = token;
  t.toLowerCase();
  if (t == "sleep") {
    out = ENS160::Mode::SLEEP;
    return true;
  }
  if (t == "idle") {
    out = ENS160::Mode::IDLE;
    return true;
  }
  if (t == "standard" || t == "std") {
    out = ENS160::Mode::STANDARD;
    return true;
  }
  return false;
}

bool parseFloat(const String& token, float& out) {
  const char* str = token.c_str();
  char* end = nullptr;
  const float value = std::strtof(str, &end);
  if (end == str || *end != '\0') {
    return false;
  }
  out = value;
  return true;
}

void resetStressStats(int target) {
  stressStats = StressStats{};
  stressStats.active = true;
  stressStats.startMs = millis();
  stressStats.target = target;
  stressStats.minEco2 = std::numeric_limits<uint16_t>::max();
  stressStats.minTvoc = std::numeric_limits<uint16_t>::max();
}

void updateStressStats(const ENS160::Measurement& m) {
  if (m.eco2Ppm < stressStats.minEco2) {
    stressStats.minEco2 = m.eco2Ppm;
  }
  if (m.eco2Ppm > stressStats.maxEco2) {
    stressStats.maxEco2 = m.eco2Ppm;
  }
  if (m.tvocPpb < stressStats.minTvoc) {
    stressStats.minTvoc = m.tvocPpb;
  }
  if (m.tvocPpb > stressStats.maxTvoc) {
    stressStats.maxTvoc = m.tvocPpb;
  }
  stressStats.sumEco2 += m.eco2Ppm;
  stressStats.sumTvoc += m.tvocPpb;
  stressStats.success++;
}

void runStress(int count) {
  resetStressStats(count);
  LOGI("Starting stress test: %d reads", count);

  for (int i = 0; i < count; i++) {
    ENS160::Measurement m;
    const ENS160::Status st = device.readMeasurement(m);
    stressStats.attempts++;
    if (st.ok()) {
      updateStressStats(m);
    } else {
      stressStats.errors++;
      stressStats.lastError = st;
    }
  }

  stressStats.active = false;
  const uint32_t durationMs = millis() - stressStats.startMs;

  Serial.println("=== Stress Summary ===");
  Serial.printf("  Target: %d\n", stressStats.target);
  Serial.printf("  Attempts: %d\n", stressStats.attempts);
  Serial.printf("  Success: %d\n", stressStats.success);
  Serial.printf("  Errors: %lu\n", static_cast<unsigned long>(stressStats.errors));
  Serial.printf("  Duration: %lu ms\n", static_cast<unsigned long>(durationMs));
  if (stressStats.success > 0) {
    Serial.printf("  eCO2 ppm: min=%u avg=%.1f max=%u\n",
                  static_cast<unsigned>(stressStats.minEco2),
                  stressStats.sumEco2 / stressStats.success,
                  static_cast<unsigned>(stressStats.maxEco2));
    Serial.printf("  TVOC ppb: min=%u avg=%.1f max=%u\n",
                  static_cast<unsigned>(stressStats.minTvoc),
                  stressStats.sumTvoc / stressStats.success,
                  static_cast<unsigned>(stressStats.maxTvoc));
  } else {
    Serial.println("  No valid samples");
  }
  if (!stressStats.lastError.ok()) {
    Serial.printf("  Last error: %s\n", errToStr(stressStats.lastError.code));
  }
}

void printHelp() {
  Serial.println("=== Commands ===");
  Serial.println("  help                     - Show this help");
  Serial.println("  read                     - Read status, AQI, TVOC, eCO2");
  Serial.println("  aqi | tvoc | eco2        - Read a single data register");
  Serial.println("  status                   - Read and decode DEVICE_STATUS");
  Serial.println("  watch [0|1]              - Print a reading every second");
  Serial.println("  mode [sleep|idle|standard] - Set or show operating mode");
  Serial.println("  reset                    - Soft reset (OPMODE=RESET)");
  Serial.println("  check                    - Verify PART_ID");
  Serial.println("  fw                       - Read firmware version");
  Serial.println("  gpr                      - Dump GPR_READ bank");
  Serial.println("  clear                    - NOP + CLRGPR (device must be IDLE)");
  Serial.println("  temp <C>                 - Set temperature compensation");
  Serial.println("  rh <pct>                 - Set humidity compensation");
  Serial.println("  comp                     - Show compensation in use");
  Serial.println("  cfg                      - Show current config");
  Serial.println("  drv                      - Show driver state and health");
  Serial.println("  begin                    - Re-initialize device");
  Serial.println("  end                      - End driver session");
  Serial.println("  probe                    - Probe device (no health tracking)");
  Serial.println("  recover                  - Manual recovery attempt");
  Serial.println("  verbose [0|1]            - Enable/disable verbose output");
  Serial.println("  stress [N]               - Run N back-to-back reads");
}

// ============================================================================
// Command Processing
// ============================================================================

void processCommand(const String& cmdLine) {
  String cmd = cmdLine;
  cmd.trim();
  if (cmd.length() == 0) {
    return;
  }

  if (cmd == "help" || cmd == "?") {
    printHelp();
    return;
  }

  if (cmd == "read") {
    ENS160::Measurement m;
    const ENS160::Status st = device.readMeasurement(m);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    printMeasurement(m);
    if (verboseMode) {
      printSnapshot(m.status);
    }
    return;
  }

  if (cmd == "aqi") {
    uint8_t aqi = 0;
    const ENS160::Status st = device.readAqi(aqi);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("AQI (1-5): %u\n", static_cast<unsigned>(aqi));
    return;
  }

  if (cmd == "tvoc") {
    uint16_t ppb = 0;
    const ENS160::Status st = device.readTvoc(ppb);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("TVOC: %u ppb\n", static_cast<unsigned>(ppb));
    return;
  }

  if (cmd == "eco2") {
    uint16_t ppm = 0;
    const ENS160::Status st = device.readEco2(ppm);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("eCO2: %u ppm\n", static_cast<unsigned>(ppm));
    return;
  }

  if (cmd == "status") {
    ENS160::StatusSnapshot snap;
    const ENS160::Status st = device.readStatus(snap);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    printSnapshot(snap);
    return;
  }

  if (cmd == "watch") {
    Serial.printf("  Watch: %s\n", watchMode ? "ON" : "OFF");
    return;
  }

  if (cmd.startsWith("watch ")) {
    watchMode = cmd.substring(6).toInt() != 0;
    lastPollMs = millis();
    LOGI("Watch mode: %s", watchMode ? "ON" : "OFF");
    return;
  }

  if (cmd == "mode") {
    ENS160::Mode mode;
    const ENS160::Status st = device.getMode(mode);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.printf("Mode: %s (0x%02X)\n", modeToStr(mode), static_cast<unsigned>(mode));
    return;
  }

  if (cmd.startsWith("mode ")) {
    String arg = cmd.substring(5);
    arg.trim();
    ENS160::Mode mode;
    if (!parseMode(arg, mode)) {
      LOGW("Invalid mode: %s", arg.c_str());
      return;
    }
    printStatus(device.setMode(mode));
    return;
  }

  if (cmd == "reset") {
    LOGI("Soft reset; run 'begin' to restore STANDARD mode");
    printStatus(device.reset());
    return;
  }

  if (cmd == "check") {
    printStatus(device.check());
    return;
  }

  if (cmd == "fw") {
    ENS160::FirmwareVersion fw;
    const ENS160::Status st = device.readFirmwareVersion(fw);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    char text[16] = {};
    ENS160::ENS160::formatFirmwareVersion(fw, text, sizeof(text));
    Serial.printf("Firmware: %s\n", text);
    return;
  }

  if (cmd == "gpr") {
    ENS160::GeneralPurposeRegisters gpr;
    const ENS160::Status st = device.readGeneralPurpose(gpr);
    if (!st.ok()) {
      printStatus(st);
      return;
    }
    Serial.print("GPR:");
    for (size_t i = 0; i < sizeof(gpr.bytes); i++) {
      Serial.printf(" %02X", gpr.bytes[i]);
    }
    Serial.println();
    return;
  }

  if (cmd == "clear") {
    printStatus(device.clearCommand());
    return;
  }

  if (cmd.startsWith("temp ")) {
    float tempC = 0.0f;
    if (!parseFloat(cmd.substring(5), tempC)) {
      LOGW("Usage: temp <C>");
      return;
    }
    printStatus(device.setTemperatureCompensation(tempC));
    return;
  }

  if (cmd.startsWith("rh ")) {
    float humidityPct = 0.0f;
    if (!parseFloat(cmd.substring(3), humidityPct)) {
      LOGW("Usage: rh <pct>");
      return;
    }
    printStatus(device.setHumidityCompensation(humidityPct));
    return;
  }

  if (cmd == "comp") {
    printCompensation();
    return;
  }

  if (cmd == "cfg") {
    printConfig();
    return;
  }

  if (cmd == "begin") {
    watchMode = false;
    LOGI("Re-initializing...");
    const ENS160::Status st = device.begin(gConfig);
    printStatus(st);
    return;
  }

  if (cmd == "end") {
    watchMode = false;
    device.end();
    LOGI("Driver ended");
    return;
  }

  if (cmd == "drv") {
    printDriverHealth();
    printConfig();
    return;
  }

  if (cmd == "probe") {
    LOGI("Probing device (no health tracking)...");
    printStatus(device.probe());
    return;
  }

  if (cmd == "recover") {
    LOGI("Attempting recovery...");
    printStatus(device.recover());
    printDriverHealth();
    return;
  }

  if (cmd == "verbose") {
    Serial.printf("  Verbose: %s\n", verboseMode ? "ON" : "OFF");
    return;
  }

  if (cmd.startsWith("verbose ")) {
    verboseMode = cmd.substring(8).toInt() != 0;
    LOGI("Verbose mode: %s", verboseMode ? "ON" : "OFF");
    return;
  }

  if (cmd.startsWith("stress")) {
    int count = 10;
    if (cmd.length() > 6) {
      count = cmd.substring(6).toInt();
    }
    if (count <= 0) {
      LOGW("Invalid stress count");
      return;
    }
    runStress(count);
    return;
  }

  LOGW("Unknown command: %s", cmd.c_str());
}

// ============================================================================
// Setup and Loop
// ============================================================================

void setup() {
  log_begin(115200);

  LOGI("=== ENS160 Bringup Example (driver %s) ===", ENS160::VERSION);

  if (!board::initI2c()) {
    LOGE("Failed to initialize I2C");
    return;
  }
  LOGI("I2C initialized (SDA=%d, SCL=%d)", board::I2C_SDA, board::I2C_SCL);

  gConfig.i2cWrite = transport::wireWrite;
  gConfig.i2cWriteRead = transport::wireWriteRead;
  gConfig.delayMs = transport::arduinoDelayMs;
  gConfig.nowMs = transport::arduinoNowMs;
  gConfig.i2cAddress = board::ENS160_ADDR;
  gConfig.i2cTimeoutMs = board::I2C_TIMEOUT_MS;
  gConfig.offlineThreshold = 5;

  const ENS160::Status st = device.begin(gConfig);
  if (!st.ok()) {
    LOGE("Failed to initialize device");
    printStatus(st);
    return;
  }

  LOGI("Device initialized successfully");
  ENS160::FirmwareVersion fw;
  if (device.readFirmwareVersion(fw).ok()) {
    LOGI("Firmware %u.%u.%u", fw.major, fw.minor, fw.patch);
  }
  printDriverHealth();
  printHelp();
  Serial.print("> ");
}

void loop() {
  if (watchMode && device.isOnline() &&
      static_cast<uint32_t>(millis() - lastPollMs) >= board::POLL_INTERVAL_MS) {
    lastPollMs = millis();
    ENS160::Measurement m;
    const ENS160::Status st = device.readMeasurement(m);
    if (st.ok()) {
      printMeasurement(m);
    } else {
      LOGW("Failed to get sensor data: %s", errToStr(st.code));
    }
  }

  static String inputBuffer;
  while (Serial.available()) {
    const char c = static_cast<char>(Serial.read());
    if (c == '\n' || c == '\r') {
      if (inputBuffer.length() > 0) {
        processCommand(inputBuffer);
        inputBuffer = "";
        Serial.print("> ");
      }
    } else {
      inputBuffer += c;
    }
  }
}
