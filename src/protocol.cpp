#include "hubcast/protocol.hpp"

namespace hubcast {

namespace {

void put_header(bytes& out, int channel, uint8_t type, uint16_t mfg_id) {
	out.clear();
	out.push_back(0x00); // 길이는 마지막에 채움
	out.push_back(kAdTypeManufacturer);
	out.push_back((uint8_t)(mfg_id & 0xFF));
	out.push_back((uint8_t)(mfg_id >> 8));
	out.push_back((uint8_t)channel);
	out.push_back(kReserved);
	out.push_back(type);
}

void seal(bytes& out) { out[0] = (uint8_t)(out.size() - 1); }

HubErr int8_frame(int channel, int8_t value, bytes& out, uint16_t mfg_id) {
	if (!valid_channel(channel)) return HubErr::InvalidCommand;
	put_header(out, channel, kValueInt8, mfg_id);
	out.push_back((uint8_t)value);
	seal(out);
	return HubErr::Ok;
}

// 전환기 상태/포트 바이트 → 포트별 값
void unpack_port_bits(uint8_t status, uint8_t ports, SwitchStatus& sw) {
	sw.raw_status = status;
	sw.raw_ports = ports;
	for (Port p : kAllPorts) {
		const int i = port_index(p);
		sw.positions[i] = (status & port_bit(p)) ? SwitchPosition::Diverging : SwitchPosition::Straight;
		sw.connected[i] = (ports & port_bit(p)) != 0;
	}
}

bool status_header(const bytes& d, StatusFrame& f) {
	if (d.size() < kMinStatusDataLen) return false;
	if (!valid_channel(d[2])) return false;
	f.broadcast_channel = d[0];
	f.channel = d[2];
	return true;
}

} // namespace

// ===================== PACK =====================

HubErr PACK::train_power(int channel, int power, bytes& out, uint16_t mfg_id) {
	if (power < kPowerMin || power > kPowerMax) return HubErr::InvalidCommand;
	return int8_frame(channel, (int8_t)power, out, mfg_id);
}

HubErr PACK::self_drive(int channel, bool enabled, bytes& out, uint16_t mfg_id) {
	return int8_frame(channel, enabled ? kSelfDriveOn : kSelfDriveOff, out, mfg_id);
}

HubErr PACK::switch_command(int channel, Port port, SwitchPosition position, bytes& out, uint16_t mfg_id) {
	if (!valid_channel(channel)) return HubErr::InvalidCommand;
	if (port_index(port) < 0 || port_index(port) > 3) return HubErr::InvalidCommand;
	const int pos = static_cast<int>(position);
	if (pos != 0 && pos != 1) return HubErr::InvalidCommand;

	const int16_t value = (int16_t)((port_index(port) + 1) * kSwitchCommandScale + pos);
	put_header(out, channel, kValueInt16, mfg_id);
	out.push_back((uint8_t)(value & 0xFF));
	out.push_back((uint8_t)((uint16_t)value >> 8));
	seal(out);
	return HubErr::Ok;
}

HubErr PACK::command(const Command& cmd, bytes& out, uint16_t mfg_id) {
	switch (cmd.type) {
	case CommandType::SetPower:     return train_power(cmd.channel, cmd.power, out, mfg_id);
	case CommandType::SetSelfDrive: return self_drive(cmd.channel, cmd.enabled, out, mfg_id);
	case CommandType::SetSwitch:    return switch_command(cmd.channel, cmd.port, cmd.position, out, mfg_id);
	}
	return HubErr::InvalidCommand;
}

bytes PACK::status_advertisement(uint8_t broadcast_channel, uint8_t hub_channel, const std::string& name,
	uint8_t status, uint8_t value, uint16_t mfg_id) {
	bytes ad;
	// Flags: LE General Discoverable, BR/EDR not supported
	ad.push_back(0x02); ad.push_back(0x01); ad.push_back(0x06);

	if (!name.empty()) {
		ad.push_back((uint8_t)(name.size() + 1));
		ad.push_back(kAdTypeCompleteName);
		ad.insert(ad.end(), name.begin(), name.end());
	}

	const bytes mfg{ broadcast_channel, kReserved, hub_channel, status, value };
	ad.push_back((uint8_t)(mfg.size() + 3));
	ad.push_back(kAdTypeManufacturer);
	ad.push_back((uint8_t)(mfg_id & 0xFF));
	ad.push_back((uint8_t)(mfg_id >> 8));
	ad.insert(ad.end(), mfg.begin(), mfg.end());
	return ad;
}

// ===================== UNPACK =====================

std::optional<Command> UNPACK::command(const bytes& p, uint16_t mfg_id) {
	if (p.size() < kCommandHeaderLen + 1) return std::nullopt;
	if ((size_t)p[0] + 1 != p.size()) return std::nullopt;
	if (p[1] != kAdTypeManufacturer) return std::nullopt;
	if ((uint16_t)(p[2] | (p[3] << 8)) != mfg_id) return std::nullopt;
	const int channel = p[4];
	if (!valid_channel(channel) || p[5] != kReserved) return std::nullopt;

	if (p[6] == kValueInt8) {
		if (p.size() != kCommandHeaderLen + 1) return std::nullopt;
		const int8_t v = (int8_t)p[7];
		if (v == kSelfDriveOn) return Command::set_self_drive(channel, true);
		if (v == kSelfDriveOff) return Command::set_self_drive(channel, false);
		if (v < kPowerMin || v > kPowerMax) return std::nullopt;
		return Command::set_power(channel, v);
	}
	if (p[6] == kValueInt16) {
		if (p.size() != kCommandHeaderLen + 2) return std::nullopt;
		const int16_t v = (int16_t)(uint16_t)(p[7] | (p[8] << 8));
		const int num = v / kSwitchCommandScale;
		const int pos = v % kSwitchCommandScale;
		if (num < 1 || num > 4 || (pos != 0 && pos != 1)) return std::nullopt;
		return Command::set_switch(channel, static_cast<Port>(num - 1), static_cast<SwitchPosition>(pos));
	}
	return std::nullopt;
}

std::optional<bytes> UNPACK::manufacturer_data(const uint8_t* ad, size_t len, uint16_t mfg_id) {
	size_t idx = 0;
	while (idx + 2 <= len) {
		const uint8_t field_len = ad[idx];
		if (field_len == 0) break;
		if (idx + 1 + field_len > len) break;
		const uint8_t type = ad[idx + 1];
		const uint8_t* val = &ad[idx + 2];
		const size_t vlen = field_len - 1;

		if (type == kAdTypeManufacturer && vlen >= 2 && (uint16_t)(val[0] | (val[1] << 8)) == mfg_id) {
			return bytes(val + 2, val + vlen);
		}
		idx += (1 + field_len);
	}
	return std::nullopt;
}

std::optional<std::string> UNPACK::local_name(const uint8_t* ad, size_t len) {
	size_t idx = 0;
	while (idx + 2 <= len) {
		const uint8_t field_len = ad[idx];
		if (field_len == 0) break;
		if (idx + 1 + field_len > len) break;
		const uint8_t type = ad[idx + 1];
		if (type == kAdTypeCompleteName || type == kAdTypeShortName) {
			return std::string(reinterpret_cast<const char*>(&ad[idx + 2]), field_len - 1);
		}
		idx += (1 + field_len);
	}
	return std::nullopt;
}

std::optional<StatusFrame> UNPACK::train_status(const bytes& d) {
	StatusFrame f;
	if (!status_header(d, f)) return std::nullopt;
	const int8_t power = (int8_t)d[d.size() - 1];
	if (power < kPowerMin || power > kPowerMax) return std::nullopt;
	f.kind = HubKind::Train;
	f.train.running = d[d.size() - 2] > 0;
	f.train.speed = power;
	return f;
}

std::optional<StatusFrame> UNPACK::switch_status(const bytes& d) {
	StatusFrame f;
	if (!status_header(d, f)) return std::nullopt;
	f.kind = HubKind::Switch;
	unpack_port_bits(d[d.size() - 2] & 0x0F, d[d.size() - 1] & 0x0F, f.sw);
	return f;
}

std::optional<StatusFrame> UNPACK::status(HubKind kind, const bytes& d) {
	return kind == HubKind::Switch ? switch_status(d) : train_status(d);
}

} // namespace hubcast
