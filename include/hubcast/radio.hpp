#pragma once
#include <atomic>
#include <functional>
#include <mutex>
#include "common.hpp"
#include "hub_err.hpp"
#include "radio_adapter.hpp"

namespace hubcast {

struct RadioConfig {
	int hci_index = 0;
	bool keep_advertising = true; ///< 버스트 끝에 광고를 켠 채로 둔다
	Millis scan_settle{ 1000 };   ///< 스캔 재시작 전 대기
	Millis reset_step{ 500 };     ///< power off → on 간격
	ScanParams scan{};
};

// 명령 클래스별 송신 타이밍
struct TxProfile {
	Millis interval{ 100 }; ///< 광고 간격
	int repeats = 2;        ///< set_data → enable → dwell → disable 사이클 수
	Millis step{ 100 };     ///< 각 HCI 명령 사이 대기
	Millis dwell{ 200 };    ///< 광고 유지 시간
};

using ScanErrorCallback = std::function<void(HubErr)>;

/**
* 무선 접근 프론트.
* - 스캔 시작/정지, 광고 버스트, 어댑터 리셋은 radio_m_ 하나로 직렬화 (서로 끼어들지 않음)
* - 스캔 세션은 하나. 이미 스캔 중이면 정지 → settle 후 재시작
* - 어댑터 수명은 이 객체가 소유
*/
class RadioAccess {
public:
	RadioAccess(RadioAdapter* adapter, const RadioConfig& cfg);
	~RadioAccess();

	RadioAccess(const RadioAccess&) = delete;
	RadioAccess& operator=(const RadioAccess&) = delete;

	/** @brief 스캔 시작. 콜백은 수신 스레드에서 호출된다 */
	HubErr start_scan(AdvCallback on_adv, ScanErrorCallback on_err);
	void stop_scan();

	/**
	* @brief 스캔 중지 → 어댑터 전원 리셋.
	* 리셋 전에 스캔 중이었다면 에러 콜백(ScanFailure)을 호출해 소유자가 재시작하게 한다.
	*/
	HubErr reset_adapter();

	/** @brief payload 하나를 profile대로 광고. 실패 시 TransmitFailure */
	HubErr transmit(const bytes& payload, const TxProfile& profile);
	void stop_advertising();

	bool scanning() const { return scanning_.load(); }
	bool available();
	RadioAdapter* adapter() const { return adapter_; }

	static uint16_t interval_units(Millis interval); ///< ms → 0.625ms 단위 (0x20..0x4000)

private:
	static void on_adv_thunk(const BleAdv* adv, void* user);
	static void on_err_thunk(HubErr err, void* user);
	void stop_scan_locked();

	RadioAdapter* adapter_;
	RadioConfig cfg_;

	std::mutex radio_m_; ///< 어댑터 명령 시퀀스 직렬화
	std::mutex cb_m_;    ///< 콜백 교체 vs 호출 (수신 스레드 join과 분리)
	AdvCallback adv_cb_;
	ScanErrorCallback err_cb_;
	std::atomic_bool scanning_{ false };
};

} // namespace hubcast
