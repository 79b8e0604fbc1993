#pragma once
#include <array>
#include <cstdint>
#include <string>
#include "common.hpp"

namespace hubcast {

enum class HubKind : uint8_t { Train = 0, Switch = 1 };

enum class Port : uint8_t { A = 0, B = 1, C = 2, D = 3 };
constexpr std::array<Port, 4> kAllPorts{ Port::A, Port::B, Port::C, Port::D };

enum class SwitchPosition : uint8_t { Straight = 0, Diverging = 1 };

enum class Direction : uint8_t { Forward = 0, Backward = 1 };

inline int port_index(Port p) { return static_cast<int>(p); }
inline char port_letter(Port p) { return static_cast<char>('A' + port_index(p)); }
// 허브 펌웨어 규약: 포트 P 비트 = 1 << (3 - index(P))  (A=0b1000 ... D=0b0001)
inline uint8_t port_bit(Port p) { return static_cast<uint8_t>(1u << (3 - port_index(p))); }

bool parse_port(char c, Port& out);                         ///< 'A'..'D' (대소문자 무관)
bool parse_position(const std::string& s, SwitchPosition& out); ///< STRAIGHT / DIVERGING / 0 / 1
const char* position_str(SwitchPosition p);
const char* kind_str(HubKind k);
std::string switch_key(Port p);                             ///< "SWITCH_A"

// 열차 상태 (광고 1건에서 디코드)
struct TrainStatus {
	bool running = false;
	int8_t speed = 0;        ///< -100..100 (%)
	bool self_drive = false; ///< 광고로는 알 수 없음, 로컬 추적값
	TimePoint timestamp{};

	Direction direction() const { return speed >= 0 ? Direction::Forward : Direction::Backward; }
};

// 선로전환기 상태: 상태 바이트/포트 연결 바이트 각각 4비트
struct SwitchStatus {
	uint8_t raw_status = 0;
	uint8_t raw_ports = 0;
	std::array<SwitchPosition, 4> positions{};
	std::array<bool, 4> connected{};
	TimePoint timestamp{};

	SwitchPosition position(Port p) const { return positions[port_index(p)]; }
	bool port_connected(Port p) const { return connected[port_index(p)]; }
};

// 디코드된 상태 광고 한 건
struct StatusFrame {
	HubKind kind = HubKind::Train;
	uint8_t broadcast_channel = 0; ///< 허브가 송신하는 상태 채널
	uint8_t channel = 0;           ///< 허브 ID (= 명령 observe 채널)
	TrainStatus train;
	SwitchStatus sw;
};

enum class CommandType : uint8_t { SetPower = 0, SetSelfDrive = 1, SetSwitch = 2 };

// 큐에 들어간 이후 변경되지 않는 명령
struct Command {
	CommandType type = CommandType::SetPower;
	int channel = 0;
	int power = 0;
	bool enabled = false;
	Port port = Port::A;
	SwitchPosition position = SwitchPosition::Straight;

	static Command set_power(int channel, int power);
	static Command set_self_drive(int channel, bool enabled);
	static Command set_switch(int channel, Port port, SwitchPosition position);

	bool operator==(const Command& o) const;
	bool operator!=(const Command& o) const { return !(*this == o); }
	std::string describe() const;
};

// (기기, 대상) 단위 신뢰도 카운터. 성공률은 저장하지 않고 계산한다.
struct ReliabilityCounter {
	uint32_t attempts = 0;
	uint32_t successes = 0;

	double success_rate() const {
		return attempts == 0 ? 0.0 : static_cast<double>(successes) / attempts * 100.0;
	}
};

} // namespace hubcast
