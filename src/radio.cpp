#include "hubcast/radio.hpp"
#include "hubcast/log_sink.hpp"

#include <thread>

namespace hubcast {

RadioAccess::RadioAccess(RadioAdapter* adapter, const RadioConfig& cfg)
	: adapter_(adapter), cfg_(cfg) {}

RadioAccess::~RadioAccess() {
	stop_scan();
	if (adapter_) {
		stop_advertising();
		adapter_->v->destroy(adapter_);
		adapter_ = nullptr;
	}
}

uint16_t RadioAccess::interval_units(Millis interval) {
	long long units = interval.count() * 8 / 5; // 1 unit = 0.625ms
	if (units < 0x0020) units = 0x0020;
	if (units > 0x4000) units = 0x4000;
	return static_cast<uint16_t>(units);
}

bool RadioAccess::available() {
	return adapter_ && adapter_->v->probe(adapter_) == HubErr::Ok;
}

// 어댑터 → 프론트 (수신 스레드)
void RadioAccess::on_adv_thunk(const BleAdv* adv, void* user) {
	auto* self = static_cast<RadioAccess*>(user);
	std::lock_guard<std::mutex> lk(self->cb_m_);
	if (self->adv_cb_ && adv) self->adv_cb_(*adv);
}

void RadioAccess::on_err_thunk(HubErr err, void* user) {
	auto* self = static_cast<RadioAccess*>(user);
	self->scanning_.store(false);
	ScanErrorCallback cb;
	{
		std::lock_guard<std::mutex> lk(self->cb_m_);
		cb = self->err_cb_;
	}
	log_warn("RADIO", std::string("scan session failed: ") + hub_err_str(err));
	if (cb) cb(err);
}

HubErr RadioAccess::start_scan(AdvCallback on_adv, ScanErrorCallback on_err) {
	if (!adapter_) return HubErr::NoDevice;
	std::lock_guard<std::mutex> lk(radio_m_);

	if (scanning_.load()) {
		log_info("RADIO", "scan already running, restarting");
		stop_scan_locked();
		std::this_thread::sleep_for(cfg_.scan_settle);
	}

	{
		std::lock_guard<std::mutex> cl(cb_m_);
		adv_cb_ = std::move(on_adv);
		err_cb_ = std::move(on_err);
	}

	// 실패한 세션 잔여물 정리 (어댑터는 중복 disable을 허용)
	adapter_->v->scan_disable(adapter_);

	HubErr e = adapter_->v->scan_enable(adapter_, &cfg_.scan, on_adv_thunk, this, on_err_thunk, this);
	if (e != HubErr::Ok) {
		log_error("RADIO", std::string("scan_enable failed: ") + hub_err_str(e));
		std::lock_guard<std::mutex> cl(cb_m_);
		adv_cb_ = nullptr;
		err_cb_ = nullptr;
		return e == HubErr::NoDevice ? e : HubErr::ScanFailure;
	}
	scanning_.store(true);
	log_info("RADIO", "scan started");
	return HubErr::Ok;
}

void RadioAccess::stop_scan_locked() {
	// 수신 스레드가 cb_m_을 잡을 수 있으므로 disable(join)은 cb_m_ 밖에서
	adapter_->v->scan_disable(adapter_);
	{
		std::lock_guard<std::mutex> cl(cb_m_);
		adv_cb_ = nullptr;
		err_cb_ = nullptr;
	}
	if (scanning_.exchange(false)) log_info("RADIO", "scan stopped");
}

void RadioAccess::stop_scan() {
	if (!adapter_) return;
	std::lock_guard<std::mutex> lk(radio_m_);
	stop_scan_locked();
}

HubErr RadioAccess::reset_adapter() {
	if (!adapter_) return HubErr::NoDevice;

	ScanErrorCallback owner;
	HubErr e;
	{
		// 스캔 정지와 전원 리셋 사이에 다른 시퀀스가 끼어들지 않게 한 번에 잡는다
		std::lock_guard<std::mutex> lk(radio_m_);
		if (scanning_.load()) {
			std::lock_guard<std::mutex> cl(cb_m_);
			owner = err_cb_;
		}
		stop_scan_locked();

		log_warn("RADIO", "resetting adapter");
		e = adapter_->v->power_cycle(adapter_, static_cast<uint32_t>(cfg_.reset_step.count()));
	}
	if (e != HubErr::Ok) log_error("RADIO", std::string("adapter reset failed: ") + hub_err_str(e));
	else log_info("RADIO", "adapter reset done");

	// 소유자 콜백은 락 밖에서 (재시작이 start_scan으로 다시 들어옴)
	if (owner) owner(HubErr::ScanFailure);
	return e;
}

HubErr RadioAccess::transmit(const bytes& payload, const TxProfile& profile) {
	if (!adapter_) return HubErr::NoDevice;
	if (payload.empty()) return HubErr::InvalidCommand;

	std::lock_guard<std::mutex> lk(radio_m_);
	const RadioVTable* v = adapter_->v;

	// 이전 광고가 켜져 있으면 파라미터 변경이 거부되므로 먼저 끈다 (이미 꺼져 있으면 에러 무시)
	v->adv_enable(adapter_, false);
	std::this_thread::sleep_for(profile.step);

	HubErr e = v->adv_set_params(adapter_, interval_units(profile.interval));
	if (e != HubErr::Ok) {
		log_error("RADIO", std::string("adv_set_params failed: ") + hub_err_str(e));
		return HubErr::TransmitFailure;
	}
	std::this_thread::sleep_for(profile.step);

	const int repeats = profile.repeats < 1 ? 1 : profile.repeats;
	for (int i = 0; i < repeats; ++i) {
		e = v->adv_set_data(adapter_, payload.data(), payload.size());
		if (e != HubErr::Ok) {
			log_error("RADIO", std::string("adv_set_data failed: ") + hub_err_str(e));
			return HubErr::TransmitFailure;
		}
		std::this_thread::sleep_for(profile.step);

		e = v->adv_enable(adapter_, true);
		if (e != HubErr::Ok) {
			log_error("RADIO", std::string("adv_enable failed: ") + hub_err_str(e));
			return HubErr::TransmitFailure;
		}
		std::this_thread::sleep_for(profile.dwell);

		const bool last = (i == repeats - 1);
		if (last && cfg_.keep_advertising) break;
		e = v->adv_enable(adapter_, false);
		if (e != HubErr::Ok) {
			log_error("RADIO", std::string("adv_disable failed: ") + hub_err_str(e));
			return HubErr::TransmitFailure;
		}
		if (!last) std::this_thread::sleep_for(profile.step);
	}

	log_debug("RADIO", "tx " + hex(payload));
	return HubErr::Ok;
}

void RadioAccess::stop_advertising() {
	if (!adapter_) return;
	std::lock_guard<std::mutex> lk(radio_m_);
	if (adapter_->v->adv_enable(adapter_, false) != HubErr::Ok) {
		log_debug("RADIO", "advertising already off");
	}
}

} // namespace hubcast
