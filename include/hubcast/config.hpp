#pragma once
#include <string>
#include "common.hpp"
#include "log_sink.hpp"
#include "monitor.hpp"
#include "pipeline.hpp"
#include "radio.hpp"
#include "radio_adapter.hpp"
#include "registry.hpp"

namespace hubcast {

// 서비스 전체 설정. 기본값은 config/app_config.h 매크로.
struct ServiceConfig {
	RadioDevice device = RadioDevice::Hci;
	RadioConfig radio;
	bool reset_on_startup = false;

	MonitorConfig monitor;
	RegistryTiming registry;
	Millis liveness_window{ 5000 };

	PipelineConfig pipeline;
	LogConfig log;
};

ServiceConfig default_config();

/** @brief JSON 텍스트 적용. 모르는 키는 무시, 타입/값 오류면 로그 후 false (cfg는 일부만 바뀔 수 있음) */
bool apply_config_json(const std::string& text, ServiceConfig& cfg);
/** @brief 파일을 읽어 apply_config_json */
bool load_config(const std::string& path, ServiceConfig& cfg);

/**
* @brief 환경 변수 덮어쓰기
* HUBCAST_LOG_LEVEL, HUBCAST_LOG_FORMAT, HUBCAST_LOG_FILE, HUBCAST_HCI_DEVICE, HUBCAST_RESET_ON_STARTUP
*/
void apply_env_overrides(ServiceConfig& cfg);

} // namespace hubcast
