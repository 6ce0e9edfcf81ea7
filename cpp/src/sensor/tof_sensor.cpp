// src/sensor/tof_sensor.cpp (VL53L1X over lgpio I2C)

#include "devices.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <thread>
#include <lgpio.h>

// ----------- VL53L1X 레지스터 ----------- //
constexpr uint16_t REG_VHV_CONFIG_TIMEOUT_LOOP  = 0x0008;
constexpr uint16_t REG_VHV_CONFIG_INIT          = 0x000B;
constexpr uint16_t REG_DEFAULT_CONFIG_START     = 0x002D;
constexpr uint16_t REG_GPIO_HV_MUX_CTRL         = 0x0030;
constexpr uint16_t REG_GPIO_TIO_HV_STATUS       = 0x0031;
constexpr uint16_t REG_PHASECAL_TIMEOUT_MACROP  = 0x004B;
constexpr uint16_t REG_RANGE_TIMEOUT_MACROP_A   = 0x005E;
constexpr uint16_t REG_RANGE_VCSEL_PERIOD_A     = 0x0060;
constexpr uint16_t REG_RANGE_TIMEOUT_MACROP_B   = 0x0061;
constexpr uint16_t REG_RANGE_VCSEL_PERIOD_B     = 0x0063;
constexpr uint16_t REG_RANGE_VALID_PHASE_HIGH   = 0x0069;
constexpr uint16_t REG_INTERMEASUREMENT_PERIOD  = 0x006C;
constexpr uint16_t REG_SD_CONFIG_WOI_SD0        = 0x0078;
constexpr uint16_t REG_SD_CONFIG_INITIAL_PHASE  = 0x007A;
constexpr uint16_t REG_INTERRUPT_CLEAR          = 0x0086;
constexpr uint16_t REG_MODE_START               = 0x0087;
constexpr uint16_t REG_RANGE_STATUS             = 0x0089;
constexpr uint16_t REG_RANGE_MM                 = 0x0096;
constexpr uint16_t REG_OSC_CALIBRATE_VAL        = 0x00DE;
constexpr uint16_t REG_FIRMWARE_SYSTEM_STATUS   = 0x00E5;
constexpr uint16_t REG_MODEL_ID                 = 0x010F;

constexpr uint16_t MODEL_ID                = 0xEACC;
constexpr uint8_t  MODE_START_CONTINUOUS   = 0x40;
constexpr uint8_t  MODE_STOP               = 0x00;
constexpr uint8_t  RAW_STATUS_VALID        = 9;     // 장치 원시 코드 9 == 정상 측정

constexpr auto BOOT_TIMEOUT        = std::chrono::milliseconds(1000);
constexpr auto FIRST_RANGE_TIMEOUT = std::chrono::milliseconds(1000);
constexpr auto POLL_STEP           = std::chrono::milliseconds(2);

// timing budget 50ms 기준 거리 모드별 값
constexpr uint32_t TIMING_BUDGET_MS = 50;

struct DistanceModeRegs {
    uint8_t  phasecal_timeout;
    uint8_t  vcsel_period_a;
    uint8_t  vcsel_period_b;
    uint8_t  valid_phase_high;
    uint16_t woi_sd0;
    uint16_t initial_phase_sd0;
    uint16_t timeout_macrop_a;
    uint16_t timeout_macrop_b;
};

constexpr DistanceModeRegs SHORT_MODE = {0x14, 0x07, 0x05, 0x38, 0x0705, 0x0606, 0x01AE, 0x01E8};
constexpr DistanceModeRegs LONG_MODE  = {0x0A, 0x0F, 0x0D, 0xB8, 0x0F0D, 0x0E0E, 0x00AD, 0x00C6};

// 0x2D ~ 0x87 기본 설정 블록 (ST ULD 기본값)
// 0x30: active high 인터럽트, 0x46: new sample ready 인터럽트, 0x87: 정지 상태로 시작
static const uint8_t DEFAULT_CONFIG[] = {
    0x00, 0x00, 0x00, 0x01, 0x02, 0x00, 0x02, 0x08,   // 0x2D
    0x00, 0x08, 0x10, 0x01, 0x01, 0x00, 0x00, 0x00,   // 0x35
    0x00, 0xFF, 0x00, 0x0F, 0x00, 0x00, 0x00, 0x00,   // 0x3D
    0x00, 0x20, 0x0B, 0x00, 0x00, 0x02, 0x0A, 0x21,   // 0x45
    0x00, 0x00, 0x05, 0x00, 0x00, 0x00, 0x00, 0xC8,   // 0x4D
    0x00, 0x00, 0x38, 0xFF, 0x01, 0x00, 0x08, 0x00,   // 0x55
    0x00, 0x01, 0xCC, 0x0F, 0x01, 0xF1, 0x0D, 0x01,   // 0x5D
    0x68, 0x00, 0x80, 0x08, 0xB8, 0x00, 0x00, 0x00,   // 0x65
    0x00, 0x0F, 0x89, 0x00, 0x00, 0x00, 0x00, 0x00,   // 0x6D
    0x00, 0x00, 0x01, 0x0F, 0x0D, 0x0E, 0x0E, 0x00,   // 0x75
    0x00, 0x02, 0xC7, 0xFF, 0x9B, 0x00, 0x00, 0x00,   // 0x7D
    0x01, 0x00, 0x00                                  // 0x85
};
static_assert(sizeof(DEFAULT_CONFIG) == REG_MODE_START - REG_DEFAULT_CONFIG_START + 1,
              "default config must cover 0x2D..0x87");

Vl53l1xSensor::Vl53l1xSensor(const SensorConfig& cfg) : cfg_(cfg) {}

Vl53l1xSensor::~Vl53l1xSensor() {
    close();
}

// ----------- I2C ----------- //

bool Vl53l1xSensor::write_regs(uint16_t reg, const uint8_t* data, int count) {
    char buf[2 + sizeof(DEFAULT_CONFIG)];
    if (count < 0 || count > static_cast<int>(sizeof(DEFAULT_CONFIG))) return false;
    buf[0] = static_cast<char>(reg >> 8);
    buf[1] = static_cast<char>(reg & 0xFF);
    std::copy(data, data + count, reinterpret_cast<uint8_t*>(buf) + 2);
    return lgI2cWriteDevice(handle_, buf, count + 2) == 0;
}

bool Vl53l1xSensor::write_reg8(uint16_t reg, uint8_t value) {
    return write_regs(reg, &value, 1);
}

bool Vl53l1xSensor::write_reg16(uint16_t reg, uint16_t value) {
    uint8_t b[2] = { static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value & 0xFF) };
    return write_regs(reg, b, 2);
}

bool Vl53l1xSensor::write_reg32(uint16_t reg, uint32_t value) {
    uint8_t b[4] = { static_cast<uint8_t>(value >> 24), static_cast<uint8_t>(value >> 16),
                     static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value & 0xFF) };
    return write_regs(reg, b, 4);
}

bool Vl53l1xSensor::read_regs(uint16_t reg, uint8_t* out, int count) {
    char addr[2] = { static_cast<char>(reg >> 8), static_cast<char>(reg & 0xFF) };
    if (lgI2cWriteDevice(handle_, addr, 2) != 0) return false;
    return lgI2cReadDevice(handle_, reinterpret_cast<char*>(out), count) == count;
}

// ----------- 초기화 단계 ----------- //

// 펌웨어 부팅 완료 (FIRMWARE__SYSTEM_STATUS bit0) 까지 대기
bool Vl53l1xSensor::wait_booted() {
    const auto deadline = SteadyClock::now() + BOOT_TIMEOUT;
    while (SteadyClock::now() < deadline) {
        uint8_t state = 0;
        if (read_regs(REG_FIRMWARE_SYSTEM_STATUS, &state, 1) && (state & 0x01)) return true;
        std::this_thread::sleep_for(POLL_STEP);
    }
    return false;
}

bool Vl53l1xSensor::data_ready(bool& ready) {
    uint8_t status = 0;
    if (!read_regs(REG_GPIO_TIO_HV_STATUS, &status, 1)) return false;
    ready = (status & 0x01) == ready_polarity_;
    return true;
}

bool Vl53l1xSensor::wait_data_ready() {
    const auto deadline = SteadyClock::now() + FIRST_RANGE_TIMEOUT;
    while (SteadyClock::now() < deadline) {
        bool ready = false;
        if (!data_ready(ready)) return false;
        if (ready) return true;
        std::this_thread::sleep_for(POLL_STEP);
    }
    return false;
}

// short: 약 1.3m 까지, 주변광에 강함 / long: 약 4m 까지
bool Vl53l1xSensor::configure_distance_mode() {
    const DistanceModeRegs& m = cfg_.distance_mode == DistanceMode::Short ? SHORT_MODE : LONG_MODE;
    if (!write_reg8(REG_PHASECAL_TIMEOUT_MACROP, m.phasecal_timeout) ||
        !write_reg8(REG_RANGE_VCSEL_PERIOD_A, m.vcsel_period_a) ||
        !write_reg8(REG_RANGE_VCSEL_PERIOD_B, m.vcsel_period_b) ||
        !write_reg8(REG_RANGE_VALID_PHASE_HIGH, m.valid_phase_high) ||
        !write_reg16(REG_SD_CONFIG_WOI_SD0, m.woi_sd0) ||
        !write_reg16(REG_SD_CONFIG_INITIAL_PHASE, m.initial_phase_sd0) ||
        !write_reg16(REG_RANGE_TIMEOUT_MACROP_A, m.timeout_macrop_a) ||
        !write_reg16(REG_RANGE_TIMEOUT_MACROP_B, m.timeout_macrop_b))
        return false;

    // 측정 주기 = 샘플링 주기 (timing budget 보다 짧을 수 없음)
    uint8_t osc[2] = {0, 0};
    if (!read_regs(REG_OSC_CALIBRATE_VAL, osc, 2)) return false;
    const uint32_t clock_pll = ((osc[0] << 8) | osc[1]) & 0x3FF;
    const uint32_t period_ms = std::max<uint32_t>(
        TIMING_BUDGET_MS, static_cast<uint32_t>(1000.0 / cfg_.frequency_hz));
    return write_reg32(REG_INTERMEASUREMENT_PERIOD,
                       static_cast<uint32_t>(clock_pll * period_ms * 1.075));
}

void Vl53l1xSensor::fail(const char* what) {
    Log(LogLevel::Error, "ToFSensor") << "Failed to initialize ToF sensor: " << what;
    if (handle_ >= 0) {
        lgI2cClose(handle_);
        handle_ = -1;
    }
    enabled_ = false;
}

bool Vl53l1xSensor::initialize() {
    if (!cfg_.enabled) {
        Log(LogLevel::Warn, "ToFSensor") << "ToF sensor disabled";
        return false;
    }

    handle_ = lgI2cOpen(cfg_.i2c_bus, cfg_.i2c_address, 0);
    if (handle_ < 0) {
        Log(LogLevel::Error, "ToFSensor") << "Failed to initialize ToF sensor: "
                                          << lguErrorText(handle_);
        handle_ = -1;
        return false;
    }

    uint8_t id[2] = {0, 0};
    if (!read_regs(REG_MODEL_ID, id, 2) || ((id[0] << 8) | id[1]) != MODEL_ID) {
        Log(LogLevel::Error, "ToFSensor") << "Unexpected model id 0x"
                                          << std::hex << ((id[0] << 8) | id[1]) << std::dec;
        fail("not a VL53L1X");
        return false;
    }

    if (!wait_booted()) {
        fail("firmware did not boot");
        return false;
    }

    // 전원이 꺼지면 설정이 사라지므로 매번 기본 블록을 다시 쓴다
    if (!write_regs(REG_DEFAULT_CONFIG_START, DEFAULT_CONFIG, sizeof(DEFAULT_CONFIG))) {
        fail("default configuration upload failed");
        return false;
    }

    // 인터럽트 극성에 따라 data ready 비트 의미가 바뀐다
    uint8_t mux = 0;
    if (!read_regs(REG_GPIO_HV_MUX_CTRL, &mux, 1)) {
        fail("cannot read interrupt polarity");
        return false;
    }
    ready_polarity_ = ((mux & 0x10) >> 4) ? 0 : 1;

    // 첫 측정 한 번으로 VHV 보정, 이후 이전 온도 값에서 시작
    if (!write_reg8(REG_MODE_START, MODE_START_CONTINUOUS) || !wait_data_ready() ||
        !write_reg8(REG_INTERRUPT_CLEAR, 0x01) || !write_reg8(REG_MODE_START, MODE_STOP) ||
        !write_reg8(REG_VHV_CONFIG_TIMEOUT_LOOP, 0x09) || !write_reg8(REG_VHV_CONFIG_INIT, 0x00)) {
        fail("VHV calibration ranging failed");
        return false;
    }

    if (!configure_distance_mode()) {
        fail("distance mode setup failed");
        return false;
    }

    if (!write_reg8(REG_INTERRUPT_CLEAR, 0x01) || !write_reg8(REG_MODE_START, MODE_START_CONTINUOUS)) {
        fail("cannot start ranging");
        return false;
    }

    enabled_ = true;
    io_errors_.reset();
    Log(LogLevel::Info, "ToFSensor") << "ToF sensor initialized on I2C bus " << cfg_.i2c_bus
                                     << " (address 0x" << std::hex << cfg_.i2c_address << std::dec
                                     << ", " << (cfg_.distance_mode == DistanceMode::Short ? "short" : "long")
                                     << " distance mode)";
    return true;
}

// ----------- 측정 ----------- //

std::optional<DistanceSample> Vl53l1xSensor::poll(TimePoint now) {
    if (!enabled_) return std::nullopt;

    DistanceSample sample{now, std::nullopt};

    bool ready = false;
    uint8_t range_status = 0;
    uint8_t mm[2] = {0, 0};
    bool io_ok = data_ready(ready);
    if (io_ok && !ready) return std::nullopt;   // 아직 측정 중
    if (io_ok)
        io_ok = read_regs(REG_RANGE_STATUS, &range_status, 1) && read_regs(REG_RANGE_MM, mm, 2) &&
                write_reg8(REG_INTERRUPT_CLEAR, 0x01);

    // 연속 실패는 처음과 복구 시점에만 기록
    if (!io_ok) {
        io_errors_.failed();
        return sample;
    }
    io_errors_.succeeded();

    if ((range_status & 0x1F) == RAW_STATUS_VALID)
        sample.distance_mm = static_cast<uint32_t>((mm[0] << 8) | mm[1]);
    else
        Log(LogLevel::Debug, "ToFSensor") << "Invalid range status " << int(range_status & 0x1F);
    return sample;
}

void Vl53l1xSensor::close() {
    if (handle_ < 0) return;
    if (enabled_ && !write_reg8(REG_MODE_START, MODE_STOP))
        Log(LogLevel::Error, "ToFSensor") << "Error closing ToF sensor: stop ranging failed";
    lgI2cClose(handle_);
    handle_ = -1;
    enabled_ = false;
}
