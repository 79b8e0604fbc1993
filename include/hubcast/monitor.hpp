#pragma once
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "common.hpp"
#include "hub_types.hpp"
#include "protocol.hpp"
#include "radio.hpp"
#include "registry.hpp"

namespace hubcast {

struct MonitorConfig {
	uint16_t manufacturer_id = kLegoManufacturerId;
	std::string train_marker = "Train";
	std::string switch_marker = "Technic Hub";
	Millis restart_delay{ 1000 };
};

struct MonitorStats {
	uint64_t advertisements = 0; ///< LEGO 제조사 데이터가 있는 광고
	uint64_t decoded = 0;
	uint64_t decode_errors = 0;
	uint64_t restarts = 0;
	uint64_t scan_failures = 0;
};

/**
* 스캔 감시 루프.
* 스캔을 시작하고 광고를 디코드해 레지스트리에 넣는다.
* 스캔 세션이 실패하면 정지 → restart_delay 대기 → 재시작 (횟수 제한 없음).
*/
class MonitorLoop {
public:
	MonitorLoop(RadioAccess& radio, DeviceRegistry& registry, const MonitorConfig& cfg);
	~MonitorLoop();

	MonitorLoop(const MonitorLoop&) = delete;
	MonitorLoop& operator=(const MonitorLoop&) = delete;

	void start();
	void stop();

	/** @brief 광고 한 건 처리 (수신 스레드에서 호출됨) */
	void handle_advertisement(const BleAdv& adv);

	bool running() const { return running_.load(); }
	bool scanning() const { return radio_.scanning(); }
	MonitorStats stats() const;

	/** @brief 이름 마커로 종류 판별. 둘 다 아니면 nullopt */
	std::optional<HubKind> classify(const std::string& name) const;

private:
	void run();
	void on_scan_error(HubErr err);

	RadioAccess& radio_;
	DeviceRegistry& reg_;
	MonitorConfig cfg_;

	std::thread th_;
	std::atomic_bool running_{ false };

	std::mutex m_;
	std::condition_variable cv_;
	bool stop_ = false;
	bool failed_ = false;

	mutable std::mutex stats_m_;
	MonitorStats stats_;
	std::map<std::string, std::string> names_; ///< MAC → 마지막으로 본 이름 (stats_m_)
};

} // namespace hubcast
