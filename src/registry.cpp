#include "hubcast/registry.hpp"
#include "hubcast/log_sink.hpp"

#include <algorithm>

namespace hubcast {

DeviceRegistry::DeviceRegistry(const RegistryTiming& timing) : timing_(timing) {}

HubRecord& DeviceRegistry::create_locked(int channel, HubKind kind, const std::string& name) {
	auto it = hubs_.find(channel);
	if (it != hubs_.end()) return it->second;

	HubRecord r;
	r.channel = channel;
	r.kind = kind;
	r.name = name;
	log_info("REG", std::string("registered ") + kind_str(kind) + " ch=" + std::to_string(channel)
		+ (name.empty() ? "" : " name=" + name));
	return hubs_.emplace(channel, std::move(r)).first->second;
}

HubErr DeviceRegistry::get_or_create(int channel, HubKind kind, const std::string& name, HubRecord* out) {
	if (!valid_channel(channel)) return HubErr::InvalidCommand;
	std::lock_guard<std::mutex> lk(m_);
	HubRecord& r = create_locked(channel, kind, name);
	if (out) *out = r;
	return HubErr::Ok;
}

HubErr DeviceRegistry::register_hub(int channel, HubKind kind, const std::string& name) {
	if (!valid_channel(channel)) return HubErr::InvalidCommand;
	std::lock_guard<std::mutex> lk(m_);
	HubRecord& r = create_locked(channel, kind, name);
	r.kind = kind;
	if (!name.empty()) r.name = name;
	return HubErr::Ok;
}

HubErr DeviceRegistry::record_status(const StatusFrame& frame, const std::string& name,
	const std::string& mac, int8_t rssi, TimePoint now) {
	const int ch = frame.channel;
	if (!valid_channel(ch)) return HubErr::InvalidCommand;
	{
		std::lock_guard<std::mutex> lk(m_);
		HubRecord& r = create_locked(ch, frame.kind, name);
		if (r.kind != frame.kind) {
			log_warn("REG", "ch=" + std::to_string(ch) + " changed kind to " + kind_str(frame.kind));
			r.kind = frame.kind;
		}
		if (!name.empty()) r.name = name;
		if (!mac.empty()) r.mac = mac;
		r.rssi = rssi;
		r.seen = true;
		r.last_seen = now;

		// 마지막 상태는 항상 통째로 교체
		if (frame.kind == HubKind::Train) {
			TrainStatus t = frame.train;
			t.self_drive = r.self_drive;
			t.timestamp = now;
			r.train = t;
			r.sw.reset();
		}
		else {
			SwitchStatus s = frame.sw;
			s.timestamp = now;
			r.sw = s;
			r.train.reset();
		}
	}
	cv_.notify_all();
	return HubErr::Ok;
}

std::optional<HubRecord> DeviceRegistry::find(int channel) const {
	std::lock_guard<std::mutex> lk(m_);
	auto it = hubs_.find(channel);
	if (it == hubs_.end()) return std::nullopt;
	return it->second;
}

bool DeviceRegistry::contains(int channel) const {
	std::lock_guard<std::mutex> lk(m_);
	return hubs_.count(channel) != 0;
}

bool DeviceRegistry::contains(int channel, HubKind kind) const {
	std::lock_guard<std::mutex> lk(m_);
	auto it = hubs_.find(channel);
	return it != hubs_.end() && it->second.kind == kind;
}

bool DeviceRegistry::is_live(int channel, Millis window, TimePoint now) const {
	std::lock_guard<std::mutex> lk(m_);
	auto it = hubs_.find(channel);
	if (it == hubs_.end() || !it->second.seen) return false;
	return now - it->second.last_seen < window;
}

void DeviceRegistry::mark_active(int channel, TimePoint now) {
	std::lock_guard<std::mutex> lk(m_);
	auto it = hubs_.find(channel);
	if (it == hubs_.end()) return;
	it->second.active_until = now + timing_.active_hold;
}

bool DeviceRegistry::is_active(int channel, TimePoint now) const {
	std::lock_guard<std::mutex> lk(m_);
	auto it = hubs_.find(channel);
	return it != hubs_.end() && now < it->second.active_until;
}

Millis DeviceRegistry::expected_update_interval(int channel, TimePoint now) const {
	return is_active(channel, now) ? timing_.active_update : timing_.idle_update;
}

void DeviceRegistry::set_self_drive(int channel, bool enabled) {
	std::lock_guard<std::mutex> lk(m_);
	auto it = hubs_.find(channel);
	if (it == hubs_.end()) return;
	it->second.self_drive = enabled;
	if (it->second.train) it->second.train->self_drive = enabled;
}

void DeviceRegistry::record_attempt(int channel, const std::string& key) {
	std::lock_guard<std::mutex> lk(m_);
	auto it = hubs_.find(channel);
	if (it == hubs_.end()) return;
	it->second.reliability[key].attempts++;
}

void DeviceRegistry::record_success(int channel, const std::string& key) {
	std::lock_guard<std::mutex> lk(m_);
	auto it = hubs_.find(channel);
	if (it == hubs_.end()) return;
	it->second.reliability[key].successes++;
}

ReliabilityCounter DeviceRegistry::reliability(int channel, const std::string& key) const {
	std::lock_guard<std::mutex> lk(m_);
	auto it = hubs_.find(channel);
	if (it == hubs_.end()) return {};
	auto rit = it->second.reliability.find(key);
	return rit == it->second.reliability.end() ? ReliabilityCounter{} : rit->second;
}

bool DeviceRegistry::switch_at_locked(int channel, Port port, SwitchPosition position) const {
	auto it = hubs_.find(channel);
	if (it == hubs_.end() || !it->second.sw) return false;
	return it->second.sw->position(port) == position;
}

bool DeviceRegistry::wait_for_switch_position(int channel, Port port, SwitchPosition position,
	Millis timeout, Millis poll) const {
	const TimePoint deadline = Clock::now() + timeout;
	if (poll <= Millis(0)) poll = Millis(1); // 대기 조각은 최소 1ms
	std::unique_lock<std::mutex> lk(m_);
	while (!switch_at_locked(channel, port, position)) {
		const TimePoint now = Clock::now();
		if (now >= deadline) return false;
		auto slice = std::min<Clock::duration>(poll, deadline - now);
		cv_.wait_for(lk, slice);
	}
	return true;
}

std::vector<HubRecord> DeviceRegistry::snapshot(HubKind kind, Millis window, TimePoint now) const {
	std::vector<HubRecord> out;
	std::lock_guard<std::mutex> lk(m_);
	for (const auto& kv : hubs_) {
		const HubRecord& r = kv.second;
		if (r.kind != kind || !r.seen) continue;
		if (now - r.last_seen >= window) continue;
		out.push_back(r);
	}
	return out;
}

size_t DeviceRegistry::size() const {
	std::lock_guard<std::mutex> lk(m_);
	return hubs_.size();
}

} // namespace hubcast
