#include "hubcast/radio_debug.hpp"
#include <mutex>
#include <new>

namespace hubcast {

// 어댑터 내부 상태: 메모리 기록 + 콜백 보관
struct DebugAdapterPriv {
	std::mutex m;
	DebugRadioStats st;
	bytes current;

	adapter_adv_cb_t on_adv = nullptr; void* on_adv_user = nullptr;
	adapter_err_cb_t on_err = nullptr; void* on_err_user = nullptr;

	int fail_scan_enable = 0;
	bool fail_tx = false;
	bool available = true;
	DebugPeerFn peer;
};

static DebugAdapterPriv* priv_of(RadioAdapter* a) {
	return a ? static_cast<DebugAdapterPriv*>(a->priv) : nullptr;
}

static HubErr dbg_probe(RadioAdapter* self) {
	auto* p = priv_of(self);
	if (!p) return HubErr::NoDevice;
	std::lock_guard<std::mutex> lk(p->m);
	p->st.probes++;
	return p->available ? HubErr::Ok : HubErr::NoDevice;
}

static HubErr dbg_scan_enable(RadioAdapter* self, const ScanParams* /*params*/,
	adapter_adv_cb_t on_adv, void* on_adv_user,
	adapter_err_cb_t on_err, void* on_err_user) {
	auto* p = priv_of(self);
	if (!p) return HubErr::NoDevice;
	std::lock_guard<std::mutex> lk(p->m);
	if (!p->available) return HubErr::NoDevice;
	if (p->fail_scan_enable > 0) { p->fail_scan_enable--; return HubErr::ScanFailure; }
	p->on_adv = on_adv; p->on_adv_user = on_adv_user;
	p->on_err = on_err; p->on_err_user = on_err_user;
	p->st.scan_enables++;
	p->st.scanning = true;
	return HubErr::Ok;
}

static void dbg_scan_disable(RadioAdapter* self) {
	auto* p = priv_of(self);
	if (!p) return;
	std::lock_guard<std::mutex> lk(p->m);
	p->on_adv = nullptr; p->on_adv_user = nullptr;
	p->on_err = nullptr; p->on_err_user = nullptr;
	p->st.scan_disables++;
	p->st.scanning = false;
}

static HubErr dbg_adv_set_params(RadioAdapter* self, uint16_t interval_units) {
	auto* p = priv_of(self);
	if (!p) return HubErr::NoDevice;
	std::lock_guard<std::mutex> lk(p->m);
	if (p->fail_tx) return HubErr::Io;
	p->st.adv_param_sets++;
	p->st.last_interval_units = interval_units;
	return HubErr::Ok;
}

static HubErr dbg_adv_set_data(RadioAdapter* self, const uint8_t* data, size_t len) {
	auto* p = priv_of(self);
	if (!p || !data) return HubErr::Io;
	std::lock_guard<std::mutex> lk(p->m);
	if (p->fail_tx) return HubErr::Io;
	p->current.assign(data, data + len);
	p->st.payloads.push_back(p->current);
	return HubErr::Ok;
}

static HubErr dbg_adv_enable(RadioAdapter* self, bool on) {
	auto* p = priv_of(self);
	if (!p) return HubErr::NoDevice;
	DebugPeerFn peer;
	bytes payload;
	{
		std::lock_guard<std::mutex> lk(p->m);
		if (p->fail_tx) return HubErr::Io;
		if (on) p->st.adv_enables++; else p->st.adv_disables++;
		p->st.advertising = on;
		if (on && p->peer) { peer = p->peer; payload = p->current; }
	}
	// 피어 콜백은 락 밖에서 (광고 주입이 다시 이 어댑터를 잠글 수 있음)
	if (peer) peer(payload);
	return HubErr::Ok;
}

static HubErr dbg_power_cycle(RadioAdapter* self, uint32_t /*step_ms*/) {
	auto* p = priv_of(self);
	if (!p) return HubErr::NoDevice;
	std::lock_guard<std::mutex> lk(p->m);
	if (!p->available) return HubErr::NoDevice;
	p->st.power_cycles++;
	p->st.advertising = false;
	return HubErr::Ok;
}

static void dbg_destroy(RadioAdapter* self) {
	if (!self) return;
	delete priv_of(self);
	self->priv = nullptr;
	delete self;
}

static const RadioVTable g_vtbl = {
	dbg_probe,
	dbg_scan_enable,
	dbg_scan_disable,
	dbg_adv_set_params,
	dbg_adv_set_data,
	dbg_adv_enable,
	dbg_power_cycle,
	dbg_destroy
};

RadioAdapter* create_debug_adapter() {
	auto* a = new (std::nothrow) RadioAdapter();
	if (!a) return nullptr;
	a->v = &g_vtbl;
	a->priv = new (std::nothrow) DebugAdapterPriv();
	if (!a->priv) { delete a; return nullptr; }
	return a;
}

// ===== 제어 API =====

bool debug_inject_advertisement(RadioAdapter* a, const BleAdv& adv) {
	auto* p = priv_of(a);
	if (!p) return false;
	adapter_adv_cb_t cb = nullptr; void* user = nullptr;
	{
		std::lock_guard<std::mutex> lk(p->m);
		if (!p->st.scanning) return false;
		cb = p->on_adv; user = p->on_adv_user;
	}
	if (cb) cb(&adv, user);
	return cb != nullptr;
}

bool debug_fail_scan(RadioAdapter* a, HubErr err) {
	auto* p = priv_of(a);
	if (!p) return false;
	adapter_err_cb_t cb = nullptr; void* user = nullptr;
	{
		std::lock_guard<std::mutex> lk(p->m);
		if (!p->st.scanning) return false;
		cb = p->on_err; user = p->on_err_user;
		// 실제 수신 스레드처럼 세션은 죽고 disable 전까지 광고는 전달되지 않음
		p->on_adv = nullptr; p->on_adv_user = nullptr;
	}
	if (cb) cb(err, user);
	return true;
}

void debug_fail_scan_enable(RadioAdapter* a, int count) {
	auto* p = priv_of(a);
	if (!p) return;
	std::lock_guard<std::mutex> lk(p->m);
	p->fail_scan_enable = count;
}

void debug_fail_transmit(RadioAdapter* a, bool fail) {
	auto* p = priv_of(a);
	if (!p) return;
	std::lock_guard<std::mutex> lk(p->m);
	p->fail_tx = fail;
}

void debug_set_available(RadioAdapter* a, bool available) {
	auto* p = priv_of(a);
	if (!p) return;
	std::lock_guard<std::mutex> lk(p->m);
	p->available = available;
}

void debug_set_peer(RadioAdapter* a, DebugPeerFn fn) {
	auto* p = priv_of(a);
	if (!p) return;
	std::lock_guard<std::mutex> lk(p->m);
	p->peer = std::move(fn);
}

DebugRadioStats debug_stats(RadioAdapter* a) {
	auto* p = priv_of(a);
	if (!p) return {};
	std::lock_guard<std::mutex> lk(p->m);
	return p->st;
}

} // namespace hubcast
