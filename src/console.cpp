#include "hubcast/console.hpp"
#include "hubcast/common.hpp"

#include <cctype>

namespace hubcast {

static std::string trim_lower(const std::string& s) {
	size_t b = 0, e = s.size();
	while (b < e && std::isspace((unsigned char)s[b])) b++;
	while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
	std::string out = s.substr(b, e - b);
	for (auto& c : out) c = (char)std::tolower((unsigned char)c);
	return out;
}

static bool all_digits(const std::string& s) {
	if (s.empty()) return false;
	for (char c : s) if (!std::isdigit((unsigned char)c)) return false;
	return true;
}

HubErr parse_console(const std::string& line, ConsoleCmd& out) {
	out = ConsoleCmd{};
	const std::string s = trim_lower(line);
	if (s.empty()) return HubErr::Ok;

	if (s.size() == 1) {
		switch (s[0]) {
		case 'l': out.op = ConsoleOp::List; return HubErr::Ok;
		case 'h': out.op = ConsoleOp::Health; return HubErr::Ok;
		case 'r': out.op = ConsoleOp::Reset; return HubErr::Ok;
		case 'q': out.op = ConsoleOp::Quit; return HubErr::Ok;
		case '?': out.op = ConsoleOp::Help; return HubErr::Ok;
		default: break;
		}
	}

	// 채널 번호
	size_t i = 0;
	while (i < s.size() && std::isdigit((unsigned char)s[i])) i++;
	if (i == 0 || i > 2 || i == s.size()) return HubErr::InvalidCommand;
	out.channel = std::stoi(s.substr(0, i));
	if (!valid_channel(out.channel)) return HubErr::InvalidCommand;
	const std::string rest = s.substr(i);

	// 전환기: <port><s|d>
	Port port;
	if (rest.size() == 2 && parse_port(rest[0], port) && (rest[1] == 's' || rest[1] == 'd')) {
		out.op = ConsoleOp::Switch;
		out.port = port;
		out.position = rest[1] == 'd' ? SwitchPosition::Diverging : SwitchPosition::Straight;
		return HubErr::Ok;
	}

	// 열차
	if (rest == "ts") {
		out.op = ConsoleOp::Power;
		out.power = 0;
		return HubErr::Ok;
	}
	if (rest.size() >= 2 && rest[0] == 't' && (rest[1] == 'f' || rest[1] == 'b')) {
		int p = kConsoleDefaultPower;
		const std::string num = rest.substr(2);
		if (!num.empty()) {
			if (!all_digits(num) || num.size() > 3) return HubErr::InvalidCommand;
			p = std::stoi(num);
		}
		if (p > 100) return HubErr::InvalidCommand;
		out.op = ConsoleOp::Power;
		out.power = rest[1] == 'b' ? -p : p;
		return HubErr::Ok;
	}
	if (rest == "sd1" || rest == "sd0") {
		out.op = ConsoleOp::SelfDrive;
		out.enabled = rest[2] == '1';
		return HubErr::Ok;
	}
	return HubErr::InvalidCommand;
}

const char* console_help() {
	return
		"  <ch>as|ad .. <ch>ds|dd  switch port A-D straight/diverging\n"
		"  <ch>tf[p] / <ch>tb[p]   train forward/backward (default 40)\n"
		"  <ch>ts                  stop train\n"
		"  <ch>sd1 / <ch>sd0       self-drive on/off\n"
		"  l  list hubs   h  health   r  reset adapter   q  quit\n";
}

} // namespace hubcast
