#include "hubcast/config.hpp"
#include "app_config.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace hubcast {

using json = nlohmann::json;

ServiceConfig default_config() {
	ServiceConfig c;
	c.device = RadioDevice::Hci;
	c.radio.hci_index = HUBCAST_HCI_DEVICE;
	c.radio.keep_advertising = HUBCAST_TX_KEEP_ADVERTISING != 0;
	c.radio.scan_settle = Millis(HUBCAST_SCAN_SETTLE_MS);
	c.radio.reset_step = Millis(HUBCAST_RESET_STEP_MS);
	c.reset_on_startup = HUBCAST_RESET_ON_STARTUP != 0;

	c.monitor.manufacturer_id = HUBCAST_MANUFACTURER_ID;
	c.monitor.train_marker = HUBCAST_TRAIN_NAME_MARKER;
	c.monitor.switch_marker = HUBCAST_SWITCH_NAME_MARKER;
	c.monitor.restart_delay = Millis(HUBCAST_MONITOR_RESTART_MS);

	c.registry.active_hold = Millis(HUBCAST_ACTIVE_HOLD_MS);
	c.registry.active_update = Millis(HUBCAST_ACTIVE_UPDATE_MS);
	c.registry.idle_update = Millis(HUBCAST_IDLE_UPDATE_MS);
	c.liveness_window = Millis(HUBCAST_LIVENESS_WINDOW_MS);

	PipelineConfig& p = c.pipeline;
	p.queue_capacity = HUBCAST_QUEUE_CAPACITY;
	p.manufacturer_id = HUBCAST_MANUFACTURER_ID;
	p.train_batch = HUBCAST_TRAIN_BATCH;
	p.train_batch_gap = Millis(HUBCAST_TRAIN_BATCH_GAP_MS);
	p.train_tx = TxProfile{ Millis(HUBCAST_TRAIN_ADV_INTERVAL_MS), HUBCAST_TRAIN_TX_REPEATS,
		Millis(HUBCAST_TRAIN_TX_STEP_MS), Millis(HUBCAST_TRAIN_TX_DWELL_MS) };
	p.switch_gap = Millis(HUBCAST_SWITCH_GAP_MS);
	p.max_retries = HUBCAST_MAX_RETRIES;
	p.retry_base = Millis(HUBCAST_RETRY_BASE_MS);
	p.verify_timeout = Millis(HUBCAST_VERIFY_TIMEOUT_MS);
	p.verify_poll = Millis(HUBCAST_VERIFY_POLL_MS);
	p.switch_tx = TxProfile{ Millis(HUBCAST_SWITCH_ADV_INTERVAL_MS), HUBCAST_SWITCH_TX_REPEATS,
		Millis(HUBCAST_SWITCH_TX_STEP_MS), Millis(HUBCAST_SWITCH_TX_DWELL_MS) };

	parse_log_level(HUBCAST_LOG_LEVEL, c.log.level);
	parse_log_format(HUBCAST_LOG_FORMAT, c.log.format);
	return c;
}

namespace {

template<typename T>
void take(const json& obj, const char* key, T& out) {
	auto it = obj.find(key);
	if (it != obj.end()) out = it->template get<T>();
}

// get<uint16_t>() 같은 좁은 변환은 조용히 잘리므로 int64로 읽고 범위를 본다
template<typename T>
void take_int(const json& obj, const char* key, T& out, int64_t lo, int64_t hi) {
	auto it = obj.find(key);
	if (it == obj.end()) return;
	const int64_t v = it->get<int64_t>();
	if (v < lo || v > hi)
		throw std::invalid_argument(std::string(key) + " out of range [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
	out = static_cast<T>(v);
}

// 시간 값(ms). min_ms 미만이면 거부
void take_ms(const json& obj, const char* key, Millis& out, int64_t min_ms = 0) {
	auto it = obj.find(key);
	if (it == obj.end()) return;
	const int64_t v = it->get<int64_t>();
	if (v < min_ms)
		throw std::invalid_argument(std::string(key) + " must be >= " + std::to_string(min_ms));
	out = Millis(v);
}

const json* section(const json& root, const char* key) {
	auto it = root.find(key);
	if (it == root.end()) return nullptr;
	if (!it->is_object()) throw std::invalid_argument(std::string("section '") + key + "' must be an object");
	return &*it;
}

void take_tx(const json& obj, const char* key, TxProfile& tx) {
	const json* s = section(obj, key);
	if (!s) return;
	take_ms(*s, "interval_ms", tx.interval, 1);
	take_int(*s, "repeats", tx.repeats, 1, 100);
	take_ms(*s, "step_ms", tx.step);
	take_ms(*s, "dwell_ms", tx.dwell);
}

} // namespace

bool apply_config_json(const std::string& text, ServiceConfig& cfg) {
	json root = json::parse(text, nullptr, false);
	if (root.is_discarded() || !root.is_object()) {
		log_error("CFG", "config is not a JSON object");
		return false;
	}

	// 전부 통과해야 반영 (중간 실패 시 cfg는 그대로)
	ServiceConfig next = cfg;

	try {
		if (const json* s = section(root, "radio")) {
			if (s->contains("device")) {
				const std::string d = s->at("device").get<std::string>();
				if (d == "hci") next.device = RadioDevice::Hci;
				else if (d == "debug") next.device = RadioDevice::Debug;
				else throw std::invalid_argument("radio.device must be 'hci' or 'debug'");
			}
			take_int(*s, "hci_index", next.radio.hci_index, 0, 255);
			take(*s, "keep_advertising", next.radio.keep_advertising);
			take_ms(*s, "scan_settle_ms", next.radio.scan_settle);
			take_ms(*s, "reset_step_ms", next.radio.reset_step);
			take(*s, "reset_on_startup", next.reset_on_startup);
		}
		if (const json* s = section(root, "protocol")) {
			uint16_t id = next.monitor.manufacturer_id;
			take_int(*s, "manufacturer_id", id, 0, 0xFFFF);
			next.monitor.manufacturer_id = id;
			next.pipeline.manufacturer_id = id;
			take(*s, "train_name_marker", next.monitor.train_marker);
			take(*s, "switch_name_marker", next.monitor.switch_marker);
		}
		if (const json* s = section(root, "monitor")) {
			take_ms(*s, "restart_delay_ms", next.monitor.restart_delay);
			take_ms(*s, "liveness_window_ms", next.liveness_window, 1);
			take_ms(*s, "active_hold_ms", next.registry.active_hold);
			take_ms(*s, "active_update_ms", next.registry.active_update);
			take_ms(*s, "idle_update_ms", next.registry.idle_update);
		}
		if (const json* s = section(root, "pipeline")) {
			PipelineConfig& p = next.pipeline;
			take_int(*s, "queue_capacity", p.queue_capacity, 1, 100000);
			take_int(*s, "train_batch", p.train_batch, 1, 1000);
			take_ms(*s, "train_batch_gap_ms", p.train_batch_gap);
			take_ms(*s, "switch_gap_ms", p.switch_gap);
			take_int(*s, "max_retries", p.max_retries, 1, 100);
			take_ms(*s, "retry_base_ms", p.retry_base);
			take_ms(*s, "verify_timeout_ms", p.verify_timeout, 1);
			take_ms(*s, "verify_poll_ms", p.verify_poll, 1);
			take_tx(*s, "train_tx", p.train_tx);
			take_tx(*s, "switch_tx", p.switch_tx);
		}
		if (const json* s = section(root, "log")) {
			if (s->contains("level") && !parse_log_level(s->at("level").get<std::string>(), next.log.level))
				throw std::invalid_argument("log.level must be debug|info|warn|error");
			if (s->contains("format") && !parse_log_format(s->at("format").get<std::string>(), next.log.format))
				throw std::invalid_argument("log.format must be text|json");
			take(*s, "file", next.log.file);
		}
	}
	catch (const json::exception& e) {
		log_error("CFG", std::string("bad config value: ") + e.what());
		return false;
	}
	catch (const std::invalid_argument& e) {
		log_error("CFG", e.what());
		return false;
	}
	cfg = next;
	return true;
}

bool load_config(const std::string& path, ServiceConfig& cfg) {
	std::ifstream f(path);
	if (!f.is_open()) {
		log_error("CFG", "cannot open " + path);
		return false;
	}
	std::stringstream ss;
	ss << f.rdbuf();
	if (!apply_config_json(ss.str(), cfg)) return false;
	log_info("CFG", "loaded " + path);
	return true;
}

void apply_env_overrides(ServiceConfig& cfg) {
	if (const char* v = std::getenv("HUBCAST_LOG_LEVEL")) {
		if (!parse_log_level(v, cfg.log.level)) log_warn("CFG", std::string("ignoring HUBCAST_LOG_LEVEL=") + v);
	}
	if (const char* v = std::getenv("HUBCAST_LOG_FORMAT")) {
		if (!parse_log_format(v, cfg.log.format)) log_warn("CFG", std::string("ignoring HUBCAST_LOG_FORMAT=") + v);
	}
	if (const char* v = std::getenv("HUBCAST_LOG_FILE")) cfg.log.file = v;
	if (const char* v = std::getenv("HUBCAST_HCI_DEVICE")) {
		// "hci1" 또는 "1"
		std::string s = v;
		if (s.rfind("hci", 0) == 0) s = s.substr(3);
		char* end = nullptr;
		long idx = std::strtol(s.c_str(), &end, 10);
		if (!s.empty() && end && *end == '\0' && idx >= 0) cfg.radio.hci_index = (int)idx;
		else log_warn("CFG", std::string("ignoring HUBCAST_HCI_DEVICE=") + v);
	}
	if (const char* v = std::getenv("HUBCAST_RESET_ON_STARTUP")) {
		const std::string s = v;
		cfg.reset_on_startup = (s == "1" || s == "true" || s == "yes" || s == "on");
	}
}

} // namespace hubcast
