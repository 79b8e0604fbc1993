#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <functional>

namespace hubcast {

// 바이트 배열 별칭
using bytes = std::vector<uint8_t>;

// 단조 시간 (lastSeen, active 만료 등)
using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;
using Millis = std::chrono::milliseconds;

// 허브 채널 범위: 광고 broadcast/observe 채널 겸 허브 ID
constexpr int kMinChannel = 1;
constexpr int kMaxChannel = 30;

inline bool valid_channel(int ch) { return ch >= kMinChannel && ch <= kMaxChannel; }

// HCI LE Advertising Report 한 건
struct BleAdv {
	std::string mac; ///< "AA:BB:CC:DD:EE:FF"
	int8_t rssi = 0; ///< 수신 RSSI(dBm)
	bytes raw; ///< AD(Advertising Data) 원본
	std::optional<std::string> name; ///< 로컬 이름(있다면)
};

using AdvCallback = std::function<void(const BleAdv&)>;

// 헥스 문자열 유틸 (디버그 로그용)
inline std::string hex(const bytes& v) {
	static const char* k = "0123456789ABCDEF";
	std::string s; s.reserve(v.size() * 2);
	for (auto b : v) { s.push_back(k[b >> 4]); s.push_back(k[b & 0xF]); }
	return s;
}

} // namespace hubcast
