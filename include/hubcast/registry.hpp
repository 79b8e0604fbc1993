#pragma once
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common.hpp"
#include "hub_err.hpp"
#include "hub_types.hpp"

namespace hubcast {

// 허브 한 대의 마지막 상태. 삭제되지 않고 liveness 창 밖으로 나가면 목록에서만 빠진다.
struct HubRecord {
	int channel = 0;
	HubKind kind = HubKind::Train;
	std::string name;
	std::string mac;          ///< 마지막 광고 주소
	int8_t rssi = 0;
	bool seen = false;        ///< 상태 광고를 한 번이라도 받았는지
	TimePoint last_seen{};

	std::optional<TrainStatus> train; ///< kind == Train 일 때 마지막 디코드 결과
	std::optional<SwitchStatus> sw;   ///< kind == Switch 일 때

	bool self_drive = false;  ///< 명령으로만 바뀜
	TimePoint active_until{};  ///< 명령 후 active 만료 시각
	std::map<std::string, ReliabilityCounter> reliability; ///< "MOTOR", "SWITCH_A".. 별
};

struct RegistryTiming {
	Millis active_hold{ 5000 };
	Millis active_update{ 100 };
	Millis idle_update{ 500 };
};

/**
* 채널별 허브 레지스트리.
* 모니터(수신 스레드), 파이프라인 드레인 스레드, 조회 호출자가 동시에 접근하므로
* 모든 연산은 내부 뮤텍스로 보호되고 조회는 복사본을 돌려준다.
* 상태가 기록될 때마다 cv를 깨워 검증 대기를 풀어준다.
*/
class DeviceRegistry {
public:
	explicit DeviceRegistry(const RegistryTiming& timing = RegistryTiming{});

	/** @brief 없으면 만들고 현재 레코드를 out에 복사. 채널 범위 밖이면 InvalidCommand */
	HubErr get_or_create(int channel, HubKind kind, const std::string& name, HubRecord* out = nullptr);
	/** @brief 명시적 등록. 이미 있으면 kind/name 갱신 */
	HubErr register_hub(int channel, HubKind kind, const std::string& name);

	/** @brief 디코드된 상태 기록 (처음 보는 채널이면 자동 등록) */
	HubErr record_status(const StatusFrame& frame, const std::string& name,
		const std::string& mac, int8_t rssi, TimePoint now);

	std::optional<HubRecord> find(int channel) const;
	bool contains(int channel) const;
	bool contains(int channel, HubKind kind) const;

	/** @brief now - last_seen < window (같으면 live 아님) */
	bool is_live(int channel, Millis window, TimePoint now) const;

	void mark_active(int channel, TimePoint now);
	bool is_active(int channel, TimePoint now) const;
	/** @brief active면 active_update, 아니면 idle_update */
	Millis expected_update_interval(int channel, TimePoint now) const;

	void set_self_drive(int channel, bool enabled);

	void record_attempt(int channel, const std::string& key);
	void record_success(int channel, const std::string& key);
	ReliabilityCounter reliability(int channel, const std::string& key) const;

	/**
	* @brief 전환기 포트가 원하는 위치를 보고할 때까지 대기.
	* 상태 기록 시 깨어나며 poll은 최대 대기 간격. timeout이 지나면 false.
	*/
	bool wait_for_switch_position(int channel, Port port, SwitchPosition position,
		Millis timeout, Millis poll) const;

	/** @brief kind가 같고 window 안에서 보인 허브들 (채널 오름차순) */
	std::vector<HubRecord> snapshot(HubKind kind, Millis window, TimePoint now) const;

	size_t size() const;

private:
	HubRecord& create_locked(int channel, HubKind kind, const std::string& name);
	bool switch_at_locked(int channel, Port port, SwitchPosition position) const;

	RegistryTiming timing_;
	mutable std::mutex m_;
	mutable std::condition_variable cv_;
	std::map<int, HubRecord> hubs_;
};

} // namespace hubcast
