#pragma once
#include <cstdint>

namespace hubcast {

// 모든 공개 API의 결과 코드. 재시도 가능한 실패는 파이프라인/모니터 내부에서 흡수되고
// 재시도가 모두 끝난 결과만 호출자에게 올라간다.
enum class HubErr : uint8_t {
	Ok = 0,
	InvalidCommand,      ///< 프로토콜 범위 밖 값 (송신 전 거부)
	UnknownDevice,       ///< 등록되지 않은 채널
	TransmitFailure,     ///< 무선/HCI 레벨 실패
	VerificationTimeout, ///< 전환기 위치 확인 실패
	ScanFailure,         ///< 스캔 세션 실패 (모니터가 재시작)
	NoDevice,            ///< 어댑터 없음
	Io,                  ///< 백엔드 시스템 콜 실패
	Stopped              ///< 파이프라인이 돌고 있지 않아 처리되지 못함 (시작 전/종료 후)
};

inline const char* hub_err_str(HubErr e) {
	switch (e) {
	case HubErr::Ok:                  return "ok";
	case HubErr::InvalidCommand:      return "invalid_command";
	case HubErr::UnknownDevice:       return "unknown_device";
	case HubErr::TransmitFailure:     return "transmit_failure";
	case HubErr::VerificationTimeout: return "verification_timeout";
	case HubErr::ScanFailure:         return "scan_failure";
	case HubErr::NoDevice:            return "no_device";
	case HubErr::Io:                  return "io";
	case HubErr::Stopped:             return "stopped";
	}
	return "unknown";
}

} // namespace hubcast
