#pragma once
#include <functional>
#include <vector>
#include "radio_adapter.hpp"

/*
 * 디버그 어댑터 제어 API.
 * 실제 무선 없이 광고 주입/송신 기록/실패 강제를 할 수 있다.
 * create_debug_adapter()로 만든 어댑터에만 사용.
 */
namespace hubcast {

struct DebugRadioStats {
	size_t probes = 0;
	size_t scan_enables = 0;
	size_t scan_disables = 0;
	size_t adv_param_sets = 0;
	size_t adv_enables = 0;
	size_t adv_disables = 0;
	size_t power_cycles = 0;
	uint16_t last_interval_units = 0;
	std::vector<bytes> payloads; ///< adv_set_data 순서대로
	bool scanning = false;
	bool advertising = false;
};

// 광고가 켜질 때마다 현재 페이로드로 호출됨 (observe 하는 허브 펌웨어 흉내)
using DebugPeerFn = std::function<void(const bytes& payload)>;

/** @brief 스캔 중이면 수신 콜백으로 전달. 스캔 중이 아니면 false */
bool debug_inject_advertisement(RadioAdapter* a, const BleAdv& adv);
/** @brief 진행 중인 스캔 세션에 에러를 발생시킨다 (세션은 종료됨) */
bool debug_fail_scan(RadioAdapter* a, HubErr err = HubErr::ScanFailure);
/** @brief 다음 n번의 scan_enable을 실패시킨다 */
void debug_fail_scan_enable(RadioAdapter* a, int count);
/** @brief 광고 명령(set_params/set_data/enable) 실패 on/off */
void debug_fail_transmit(RadioAdapter* a, bool fail);
void debug_set_available(RadioAdapter* a, bool available);
void debug_set_peer(RadioAdapter* a, DebugPeerFn fn);
DebugRadioStats debug_stats(RadioAdapter* a);

} // namespace hubcast
