#include "hubcast/service.hpp"
#include "hubcast/log_sink.hpp"

#include <cmath>

namespace hubcast {

using json = nlohmann::json;

static double seconds_ago(TimePoint then, TimePoint now, double scale = 100.0) {
	double s = std::chrono::duration<double>(now - then).count();
	if (s < 0) s = 0;
	return std::round(s * scale) / scale;
}

json train_json(const HubRecord& r, TimePoint now, bool active) {
	const TrainStatus t = r.train ? *r.train : TrainStatus{};
	json j;
	j["status"] = t.running ? "running" : "stopped";
	j["speed"] = (int)t.speed;
	j["direction"] = t.direction() == Direction::Forward ? "forward" : "backward";
	j["name"] = r.name.empty() ? "Train " + std::to_string(r.channel) : r.name;
	j["selfDrive"] = r.self_drive;
	j["last_update_seconds_ago"] = seconds_ago(r.last_seen, now);
	j["rssi"] = (int)r.rssi;
	j["channel"] = r.channel;
	j["active"] = active;
	return j;
}

json switch_json(const HubRecord& r, TimePoint now) {
	const SwitchStatus s = r.sw ? *r.sw : SwitchStatus{};
	json positions = json::object();
	json states = json::object();
	json reliability = json::object();
	for (Port p : kAllPorts) {
		const std::string key = switch_key(p);
		positions[key] = static_cast<int>(s.position(p));
		states[key] = s.port_connected(p) ? 1 : 0;
		auto it = r.reliability.find(key);
		if (it == r.reliability.end()) continue;
		reliability[key] = {
			{ "success_rate", std::round(it->second.success_rate() * 10.0) / 10.0 },
			{ "attempts", it->second.attempts },
			{ "successes", it->second.successes }
		};
	}

	json j;
	j["switch_positions"] = positions;
	j["switch_states"] = states;
	j["last_update_seconds_ago"] = seconds_ago(r.last_seen, now);
	j["name"] = r.name;
	j["status"] = (int)s.raw_status;
	j["connected"] = true;
	j["rssi"] = (int)r.rssi;
	j["reliability"] = reliability;
	return j;
}

static RadioAdapter* make_adapter(const ServiceConfig& cfg, RadioAdapter* given) {
	if (given) return given;
	RadioAdapter* a = create_radio_adapter(cfg.device, cfg.radio.hci_index);
	if (!a) log_error("SVC", "radio adapter could not be created");
	return a;
}

HubService::HubService(const ServiceConfig& cfg, RadioAdapter* adapter)
	: cfg_(cfg),
	radio_(make_adapter(cfg, adapter), cfg.radio),
	reg_(cfg.registry),
	monitor_(radio_, reg_, cfg.monitor),
	trains_(radio_, reg_, cfg.pipeline),
	switches_(radio_, reg_, cfg.pipeline) {}

HubService::~HubService() { stop(); }

HubErr HubService::start() {
	if (started_.load()) return HubErr::Ok;
	if (!radio_.adapter()) return HubErr::NoDevice;

	if (!radio_.available()) log_warn("SVC", "bluetooth adapter not available yet, monitor will keep retrying");

	if (cfg_.reset_on_startup) {
		HubErr re = radio_.reset_adapter();
		if (re != HubErr::Ok) log_warn("SVC", std::string("startup reset failed: ") + hub_err_str(re));
	}

	HubErr e = trains_.start();
	if (e == HubErr::Ok) e = switches_.start();
	if (e != HubErr::Ok) {
		trains_.stop();
		switches_.stop();
		log_error("SVC", std::string("pipelines could not start: ") + hub_err_str(e));
		return e;
	}
	monitor_.start();
	started_.store(true);
	log_info("SVC", "service started");
	return HubErr::Ok;
}

void HubService::stop() {
	if (!started_.exchange(false)) return;
	trains_.stop();
	switches_.stop();
	monitor_.stop();
	radio_.stop_advertising();
	log_info("SVC", "service stopped");
}

HubErr HubService::enqueue_power(int channel, int power) {
	if (!started_.load()) return HubErr::Stopped;
	return trains_.enqueue_power(channel, power);
}

HubErr HubService::enqueue_self_drive(int channel, bool enabled) {
	if (!started_.load()) return HubErr::Stopped;
	return trains_.enqueue_self_drive(channel, enabled);
}

HubErr HubService::enqueue_switch(int channel, Port port, SwitchPosition position) {
	return switches_.enqueue_switch(channel, port, position);
}

std::future<HubErr> HubService::submit_switch(int channel, Port port, SwitchPosition position) {
	return switches_.submit_switch(channel, port, position);
}

HubErr HubService::register_hub(int channel, HubKind kind, const std::string& name) {
	return reg_.register_hub(channel, kind, name);
}

HubErr HubService::reset_adapter() {
	return radio_.reset_adapter();
}

std::vector<HubRecord> HubService::connected_trains() const {
	return reg_.snapshot(HubKind::Train, cfg_.liveness_window, Clock::now());
}

std::vector<HubRecord> HubService::connected_switches() const {
	return reg_.snapshot(HubKind::Switch, cfg_.liveness_window, Clock::now());
}

json HubService::list_connected_trains() const {
	const TimePoint now = Clock::now();
	json out = json::object();
	for (const auto& r : reg_.snapshot(HubKind::Train, cfg_.liveness_window, now))
		out[std::to_string(r.channel)] = train_json(r, now, now < r.active_until);
	return out;
}

json HubService::list_connected_switches() const {
	const TimePoint now = Clock::now();
	json out = json::object();
	for (const auto& r : reg_.snapshot(HubKind::Switch, cfg_.liveness_window, now))
		out[std::to_string(r.channel)] = switch_json(r, now);
	return out;
}

HealthReport HubService::health() {
	HealthReport h;
	h.bluetooth_available = radio_.available();
	h.connected_trains = connected_trains().size();
	h.connected_switches = connected_switches().size();
	h.scanning = monitor_.scanning();
	h.monitor_restarts = monitor_.stats().restarts;
	h.status = h.bluetooth_available ? "healthy" : "unhealthy";
	return h;
}

json HubService::health_json() {
	const HealthReport h = health();
	return {
		{ "status", h.status },
		{ "bluetooth_available", h.bluetooth_available },
		{ "connected_trains", h.connected_trains },
		{ "connected_switches", h.connected_switches },
		{ "scanning", h.scanning },
		{ "monitor_restarts", h.monitor_restarts }
	};
}

} // namespace hubcast
