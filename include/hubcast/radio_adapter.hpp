#pragma once
#include <cstddef>
#include <cstdint>
#include "common.hpp"
#include "hub_err.hpp"

namespace hubcast {

// 전방선언
struct RadioAdapter;

enum class RadioDevice : uint8_t {
	None = 0,
	Hci,   ///< BlueZ HCI raw 소켓 + D-Bus(전원 리셋)
	Debug  ///< 메모리 루프백 (테스트/하드웨어 없는 실행)
};

// 어댑터 → 프론트 콜백 (수신 스레드에서 호출)
using adapter_adv_cb_t = void (*)(const BleAdv* adv, void* user);
using adapter_err_cb_t = void (*)(HubErr err, void* user);

// LE 스캔 파라미터 (0.625ms 단위)
struct ScanParams {
	uint16_t interval = 0x0010;
	uint16_t window = 0x0010;
	bool filter_dup = false; ///< 같은 허브의 반복 상태 광고를 받아야 하므로 기본 off
};

// 가상 테이블: 프론트(RadioAccess)가 직렬화한 뒤 호출한다
struct RadioVTable {
	HubErr(*probe)(RadioAdapter* self);

	HubErr(*scan_enable)(RadioAdapter* self, const ScanParams* params,
		adapter_adv_cb_t on_adv, void* on_adv_user,
		adapter_err_cb_t on_err, void* on_err_user);
	void   (*scan_disable)(RadioAdapter* self);

	HubErr(*adv_set_params)(RadioAdapter* self, uint16_t interval_units);
	HubErr(*adv_set_data)(RadioAdapter* self, const uint8_t* data, size_t len);
	HubErr(*adv_enable)(RadioAdapter* self, bool on);

	HubErr(*power_cycle)(RadioAdapter* self, uint32_t step_ms);

	void (*destroy)(RadioAdapter* self);
};

// 어댑터 본체
struct RadioAdapter {
	const RadioVTable* v;
	void* priv;
};

// 팩토리
RadioAdapter* create_radio_adapter(RadioDevice device, int hci_index = 0);
RadioAdapter* create_hci_adapter(int hci_index);
RadioAdapter* create_debug_adapter();

} // namespace hubcast
