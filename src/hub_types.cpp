#include "hubcast/hub_types.hpp"
#include <cctype>

namespace hubcast {

bool parse_port(char c, Port& out) {
	const char u = (char)std::toupper((unsigned char)c);
	if (u < 'A' || u > 'D') return false;
	out = static_cast<Port>(u - 'A');
	return true;
}

bool parse_position(const std::string& s, SwitchPosition& out) {
	std::string up = s;
	for (auto& c : up) c = (char)std::toupper((unsigned char)c);
	if (up == "STRAIGHT" || up == "0") { out = SwitchPosition::Straight; return true; }
	if (up == "DIVERGING" || up == "1") { out = SwitchPosition::Diverging; return true; }
	return false;
}

const char* position_str(SwitchPosition p) {
	return p == SwitchPosition::Diverging ? "DIVERGING" : "STRAIGHT";
}

const char* kind_str(HubKind k) {
	return k == HubKind::Switch ? "switch" : "train";
}

std::string switch_key(Port p) {
	return std::string("SWITCH_") + port_letter(p);
}

Command Command::set_power(int channel, int power) {
	Command c; c.type = CommandType::SetPower; c.channel = channel; c.power = power; return c;
}

Command Command::set_self_drive(int channel, bool enabled) {
	Command c; c.type = CommandType::SetSelfDrive; c.channel = channel; c.enabled = enabled; return c;
}

Command Command::set_switch(int channel, Port port, SwitchPosition position) {
	Command c; c.type = CommandType::SetSwitch; c.channel = channel; c.port = port; c.position = position; return c;
}

bool Command::operator==(const Command& o) const {
	if (type != o.type || channel != o.channel) return false;
	switch (type) {
	case CommandType::SetPower:     return power == o.power;
	case CommandType::SetSelfDrive: return enabled == o.enabled;
	case CommandType::SetSwitch:    return port == o.port && position == o.position;
	}
	return false;
}

std::string Command::describe() const {
	const std::string ch = "ch=" + std::to_string(channel);
	switch (type) {
	case CommandType::SetPower:     return "SetPower " + ch + " power=" + std::to_string(power);
	case CommandType::SetSelfDrive: return "SetSelfDrive " + ch + (enabled ? " on" : " off");
	case CommandType::SetSwitch:
		return "SetSwitch " + ch + " " + switch_key(port) + "=" + position_str(position);
	}
	return ch;
}

} // namespace hubcast
