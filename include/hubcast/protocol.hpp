#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "common.hpp"
#include "hub_err.hpp"
#include "hub_types.hpp"

/**
* LEGO Powered-Up 광고 프로토콜 (Pybricks broadcast/observe 호환)
*
* 명령 프레임 (AD 구조 1개, 전체 광고 데이터):
*   [len][0xFF][mfg lo][mfg hi][channel][0x00][type][payload...]
*   - type 0x61 (INT8)  : 열차 출력 -100..100, 101 = self-drive ON, 102 = self-drive OFF
*   - type 0x62 (INT16) : 선로전환기 switchNumber*1000 + position (LE), A..D = 1..4
*
* 상태 프레임 (제조사 데이터, company id 이후):
*   [broadcast ch][..][hub ch] ... [status][value]   (최소 5바이트)
*   - 열차     : value = signed power, running = status > 0
*   - 전환기   : status/value 모두 포트별 4비트 (A=0b1000 ... D=0b0001)
*/
namespace hubcast {

constexpr uint16_t kLegoManufacturerId = 0x0397;

constexpr uint8_t kAdTypeShortName = 0x08;
constexpr uint8_t kAdTypeCompleteName = 0x09;
constexpr uint8_t kAdTypeManufacturer = 0xFF;

constexpr uint8_t kValueInt8 = 0x61;
constexpr uint8_t kValueInt16 = 0x62;
constexpr uint8_t kReserved = 0x00;

constexpr int kPowerMin = -100;
constexpr int kPowerMax = 100;
// 출력 필드를 재활용하는 self-drive 센티널 (펌웨어 규약, 변경 금지)
constexpr int8_t kSelfDriveOn = 101;
constexpr int8_t kSelfDriveOff = 102;

constexpr int kSwitchCommandScale = 1000;

constexpr size_t kCommandHeaderLen = 7;   ///< len..type
constexpr size_t kMinStatusDataLen = 5;   ///< company id 제외

inline int clamp_power(int power) {
	return power < kPowerMin ? kPowerMin : (power > kPowerMax ? kPowerMax : power);
}

// === Pack(송신) ===
namespace PACK {
	/** @brief 열차 출력 명령. power 범위 밖이면 InvalidCommand (클램프는 호출자 책임) */
	HubErr train_power(int channel, int power, bytes& out, uint16_t mfg_id = kLegoManufacturerId);
	HubErr self_drive(int channel, bool enabled, bytes& out, uint16_t mfg_id = kLegoManufacturerId);
	HubErr switch_command(int channel, Port port, SwitchPosition position, bytes& out,
		uint16_t mfg_id = kLegoManufacturerId);
	/** @brief Command 종류에 따라 위 세 함수 중 하나로 위임 */
	HubErr command(const Command& cmd, bytes& out, uint16_t mfg_id = kLegoManufacturerId);

	/**
	* @brief 허브 펌웨어가 내보내는 상태 광고(AD 전체)를 만든다. 디버그 백엔드/테스트용.
	* @param name 비어있으면 로컬 이름 AD를 생략
	*/
	bytes status_advertisement(uint8_t broadcast_channel, uint8_t hub_channel, const std::string& name,
		uint8_t status, uint8_t value, uint16_t mfg_id = kLegoManufacturerId);
}

// === Unpack(수신) ===
namespace UNPACK {
	/** @brief 명령 프레임 → Command. 형식/범위 오류면 nullopt */
	std::optional<Command> command(const bytes& payload, uint16_t mfg_id = kLegoManufacturerId);

	/** @brief AD 구조를 따라가며 company id가 일치하는 제조사 데이터(company id 이후)를 찾는다 */
	std::optional<bytes> manufacturer_data(const uint8_t* ad, size_t len, uint16_t mfg_id = kLegoManufacturerId);
	/** @brief 0x09 Complete / 0x08 Shortened Local Name */
	std::optional<std::string> local_name(const uint8_t* ad, size_t len);

	std::optional<StatusFrame> train_status(const bytes& mfg_data);
	std::optional<StatusFrame> switch_status(const bytes& mfg_data);
	std::optional<StatusFrame> status(HubKind kind, const bytes& mfg_data);
}

} // namespace hubcast
