#pragma once
#include <string>
#include "hub_err.hpp"
#include "hub_types.hpp"

namespace hubcast {

enum class ConsoleOp : uint8_t {
	None = 0,
	Switch,    ///< <ch><port><s|d>   예: 1as, 2dd
	Power,     ///< <ch>tf[p] / <ch>tb[p] / <ch>ts
	SelfDrive, ///< <ch>sd1 / <ch>sd0
	List,      ///< l
	Health,    ///< h
	Reset,     ///< r
	Quit,      ///< q
	Help       ///< ?
};

struct ConsoleCmd {
	ConsoleOp op = ConsoleOp::None;
	int channel = 0;
	Port port = Port::A;
	SwitchPosition position = SwitchPosition::Straight;
	int power = 0;
	bool enabled = false;
};

constexpr int kConsoleDefaultPower = 40;

/** @brief 콘솔 한 줄 파싱. 빈 줄이면 op=None + Ok, 형식 오류면 InvalidCommand */
HubErr parse_console(const std::string& line, ConsoleCmd& out);

const char* console_help();

} // namespace hubcast
