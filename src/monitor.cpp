#include "hubcast/monitor.hpp"
#include "hubcast/log_sink.hpp"

namespace hubcast {

MonitorLoop::MonitorLoop(RadioAccess& radio, DeviceRegistry& registry, const MonitorConfig& cfg)
	: radio_(radio), reg_(registry), cfg_(cfg) {}

MonitorLoop::~MonitorLoop() { stop(); }

void MonitorLoop::start() {
	if (th_.joinable()) return;
	{
		std::lock_guard<std::mutex> lk(m_);
		stop_ = false;
		failed_ = false;
	}
	running_.store(true);
	th_ = std::thread(&MonitorLoop::run, this);
}

void MonitorLoop::stop() {
	{
		std::lock_guard<std::mutex> lk(m_);
		stop_ = true;
	}
	cv_.notify_all();
	if (th_.joinable()) th_.join();
	running_.store(false);
}

MonitorStats MonitorLoop::stats() const {
	std::lock_guard<std::mutex> lk(stats_m_);
	return stats_;
}

std::optional<HubKind> MonitorLoop::classify(const std::string& name) const {
	if (name.empty()) return std::nullopt;
	if (!cfg_.train_marker.empty() && name.find(cfg_.train_marker) != std::string::npos) return HubKind::Train;
	if (!cfg_.switch_marker.empty() && name.find(cfg_.switch_marker) != std::string::npos) return HubKind::Switch;
	return std::nullopt;
}

void MonitorLoop::on_scan_error(HubErr err) {
	{
		std::lock_guard<std::mutex> lk(stats_m_);
		stats_.scan_failures++;
	}
	{
		std::lock_guard<std::mutex> lk(m_);
		failed_ = true;
	}
	cv_.notify_all();
	log_debug("MON", std::string("scan error reported: ") + hub_err_str(err));
}

void MonitorLoop::handle_advertisement(const BleAdv& adv) {
	auto mfg = UNPACK::manufacturer_data(adv.raw.data(), adv.raw.size(), cfg_.manufacturer_id);
	if (!mfg) return;

	// 이름 해석: 광고 → 같은 MAC에서 마지막으로 본 이름
	std::string name;
	{
		std::lock_guard<std::mutex> lk(stats_m_);
		stats_.advertisements++;
		if (adv.name && !adv.name->empty()) {
			name = *adv.name;
			if (!adv.mac.empty()) names_[adv.mac] = name;
		}
		else if (!adv.mac.empty()) {
			auto it = names_.find(adv.mac);
			if (it != names_.end()) name = it->second;
		}
	}

	std::optional<HubKind> kind = classify(name);
	if (!kind && mfg->size() >= kMinStatusDataLen) {
		// 이름이 없으면 등록된 허브의 종류를 따른다
		auto rec = reg_.find((*mfg)[2]);
		if (rec) {
			kind = rec->kind;
			if (name.empty()) name = rec->name;
		}
	}
	if (!kind) return;

	auto frame = UNPACK::status(*kind, *mfg);
	if (!frame || !valid_channel(frame->channel)) {
		std::lock_guard<std::mutex> lk(stats_m_);
		stats_.decode_errors++;
		log_debug("MON", "undecodable " + std::string(kind_str(*kind)) + " status from " + adv.mac + ": " + hex(*mfg));
		return;
	}

	const TimePoint now = Clock::now();
	reg_.get_or_create(frame->channel, frame->kind, name);
	if (reg_.record_status(*frame, name, adv.mac, adv.rssi, now) != HubErr::Ok) return;

	std::lock_guard<std::mutex> lk(stats_m_);
	stats_.decoded++;
}

void MonitorLoop::run() {
	log_info("MON", "monitor started");
	bool first = true;

	for (;;) {
		{
			std::lock_guard<std::mutex> lk(m_);
			if (stop_) break;
			failed_ = false;
		}

		if (!first) {
			std::lock_guard<std::mutex> lk(stats_m_);
			stats_.restarts++;
		}
		first = false;

		HubErr e = radio_.start_scan(
			[this](const BleAdv& adv) { handle_advertisement(adv); },
			[this](HubErr err) { on_scan_error(err); });

		if (e == HubErr::Ok) {
			// 실패 또는 정지까지 대기
			std::unique_lock<std::mutex> lk(m_);
			cv_.wait(lk, [&] { return stop_ || failed_; });
			if (stop_) break;
			lk.unlock();
			log_warn("MON", "scan failed, restarting in " + std::to_string(cfg_.restart_delay.count()) + "ms");
		}
		else {
			log_warn("MON", std::string("scan start failed: ") + hub_err_str(e));
		}

		radio_.stop_scan();

		std::unique_lock<std::mutex> lk(m_);
		if (cv_.wait_for(lk, cfg_.restart_delay, [&] { return stop_; })) break;
	}

	radio_.stop_scan();
	running_.store(false);
	log_info("MON", "monitor stopped");
}

} // namespace hubcast
