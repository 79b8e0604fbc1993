#pragma once
#include <atomic>
#include <future>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "monitor.hpp"
#include "pipeline.hpp"
#include "radio.hpp"
#include "registry.hpp"

namespace hubcast {

struct HealthReport {
	bool bluetooth_available = false;
	size_t connected_trains = 0;
	size_t connected_switches = 0;
	bool scanning = false;
	uint64_t monitor_restarts = 0;
	std::string status; ///< "healthy" / "unhealthy"
};

/**
* 허브 서비스: 무선/레지스트리/모니터/파이프라인을 하나씩 소유하고
* start/stop에 수명을 묶는다. 외부 API(HTTP 등)는 이 객체만 호출한다.
*/
class HubService {
public:
	/** @param adapter nullptr이면 cfg.device로 생성. 넘기면 소유권 이전 */
	explicit HubService(const ServiceConfig& cfg, RadioAdapter* adapter = nullptr);
	~HubService();

	HubService(const HubService&) = delete;
	HubService& operator=(const HubService&) = delete;

	/**
	* @brief 어댑터가 없으면 NoDevice. 설정 시 어댑터 리셋 후 모니터/파이프라인 시작.
	* 파이프라인 스레드를 못 만들면 그 에러를 반환한다. stop 이후 다시 호출 가능.
	*/
	HubErr start();
	/** @brief 파이프라인 → 모니터 순서로 정지, 광고 끔. 이후 명령은 Stopped */
	void stop();
	bool started() const { return started_.load(); }

	HubErr enqueue_power(int channel, int power);
	HubErr enqueue_self_drive(int channel, bool enabled);
	/** @brief 확인(또는 재시도 소진)까지 대기 */
	HubErr enqueue_switch(int channel, Port port, SwitchPosition position);
	std::future<HubErr> submit_switch(int channel, Port port, SwitchPosition position);

	HubErr register_hub(int channel, HubKind kind, const std::string& name);
	HubErr reset_adapter();

	std::vector<HubRecord> connected_trains() const;
	std::vector<HubRecord> connected_switches() const;

	/** @brief {"<ch>": {status, speed, direction, name, selfDrive, ...}} */
	nlohmann::json list_connected_trains() const;
	/** @brief {"<ch>": {switch_positions, switch_states, reliability, ...}} */
	nlohmann::json list_connected_switches() const;

	HealthReport health();
	nlohmann::json health_json();

	const ServiceConfig& config() const { return cfg_; }
	DeviceRegistry& registry() { return reg_; }
	RadioAccess& radio() { return radio_; }
	MonitorLoop& monitor() { return monitor_; }

private:
	ServiceConfig cfg_;
	RadioAccess radio_;
	DeviceRegistry reg_;
	MonitorLoop monitor_;
	TrainPipeline trains_;
	SwitchPipeline switches_;
	std::atomic_bool started_{ false };
};

nlohmann::json train_json(const HubRecord& r, TimePoint now, bool active);
nlohmann::json switch_json(const HubRecord& r, TimePoint now);

} // namespace hubcast
