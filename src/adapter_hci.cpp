#include "hubcast/radio_adapter.hpp"
#include "hubcast/log_sink.hpp"
#include "hubcast/protocol.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <new>
#include <string>
#include <thread>

#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>

extern "C" {
#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>
}

#include <gio/gio.h>
#include <glib.h>

/*
 * BlueZ HCI raw 소켓 어댑터.
 * - 스캔: 전용 소켓 + 수신 스레드 (EVT_LE_ADVERTISING_REPORT)
 * - 광고: 별도 명령 소켓에서 hci_send_req (상태 응답 확인)
 * - 전원 리셋: bluetoothd D-Bus(org.bluez.Adapter1.Powered) off → on
 */
namespace hubcast {

namespace {

constexpr int kHciTimeoutMs = 1000;
constexpr int kRxPollMs = 100;

struct HciPriv {
	int dev_id = -1;
	int cmd_dd = -1;   ///< 광고 명령용
	int scan_dd = -1;  ///< 스캔 수신용
	std::thread rx_thread;
	std::atomic_bool stop{ false };

	adapter_adv_cb_t on_adv = nullptr; void* on_adv_user = nullptr;
	adapter_err_cb_t on_err = nullptr; void* on_err_user = nullptr;
};

HciPriv* priv_of(RadioAdapter* a) { return a ? static_cast<HciPriv*>(a->priv) : nullptr; }

std::string mac_to_string(const bdaddr_t& a) {
	char addr[18]{};
	ba2str(&a, addr);
	return std::string(addr);
}

int cmd_socket(HciPriv* p) {
	if (p->cmd_dd < 0) p->cmd_dd = hci_open_dev(p->dev_id);
	return p->cmd_dd;
}

void close_cmd_socket(HciPriv* p) {
	if (p->cmd_dd >= 0) { hci_close_dev(p->cmd_dd); p->cmd_dd = -1; }
}

HubErr send_le_cmd(HciPriv* p, uint16_t ocf, void* cp, int clen) {
	int dd = cmd_socket(p);
	if (dd < 0) return HubErr::NoDevice;
	uint8_t status = 0;
	struct hci_request rq {};
	rq.ogf = OGF_LE_CTL;
	rq.ocf = ocf;
	rq.cparam = cp;
	rq.clen = clen;
	rq.rparam = &status;
	rq.rlen = 1;
	if (hci_send_req(dd, &rq, kHciTimeoutMs) < 0) {
		// 소켓이 죽었을 수 있으므로 다음 명령에서 다시 연다
		close_cmd_socket(p);
		return HubErr::Io;
	}
	return status == 0 ? HubErr::Ok : HubErr::Io;
}

// 수신 루프 (별도 스레드)
void rx_loop(HciPriv* p) {
	struct hci_filter nf {};
	hci_filter_clear(&nf);
	hci_filter_set_ptype(HCI_EVENT_PKT, &nf);
	hci_filter_set_event(EVT_LE_META_EVENT, &nf);
	if (setsockopt(p->scan_dd, SOL_HCI, HCI_FILTER, &nf, sizeof(nf)) < 0) {
		log_warn("HCI", std::string("setsockopt HCI_FILTER failed: ") + std::strerror(errno));
	}

	while (!p->stop.load()) {
		pollfd pfd{ p->scan_dd, POLLIN, 0 };
		int r = ::poll(&pfd, 1, kRxPollMs);
		if (r == 0) continue;
		if (r < 0) {
			if (errno == EINTR) continue;
			break;
		}
		if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) break;

		uint8_t buf[HCI_MAX_EVENT_SIZE];
		ssize_t n = ::read(p->scan_dd, buf, sizeof(buf));
		if (n < 0) {
			if (errno == EAGAIN || errno == EINTR) continue;
			break;
		}
		if (n < (ssize_t)(1 + HCI_EVENT_HDR_SIZE + 2)) continue;

		auto* meta = (evt_le_meta_event*)(buf + (1 + HCI_EVENT_HDR_SIZE));
		if (meta->subevent != EVT_LE_ADVERTISING_REPORT) continue;

		const uint8_t* end = buf + n;
		const uint8_t num_reports = meta->data[0];
		const uint8_t* ptr = meta->data + 1;
		for (uint8_t i = 0; i < num_reports; ++i) {
			if (ptr + LE_ADVERTISING_INFO_SIZE > end) break;
			auto* info = (const le_advertising_info*)ptr;
			if (ptr + LE_ADVERTISING_INFO_SIZE + info->length + 1 > end) break;

			BleAdv adv{};
			adv.mac = mac_to_string(info->bdaddr);
			adv.raw.assign(info->data, info->data + info->length);
			adv.rssi = (int8_t)info->data[info->length];
			adv.name = UNPACK::local_name(info->data, info->length);
			if (p->on_adv) p->on_adv(&adv, p->on_adv_user);

			ptr += LE_ADVERTISING_INFO_SIZE + info->length + 1; // + RSSI
		}
	}

	if (!p->stop.load()) {
		log_error("HCI", std::string("scan socket failed: ") + std::strerror(errno));
		if (p->on_err) p->on_err(HubErr::ScanFailure, p->on_err_user);
	}
}

// ===== D-Bus: 어댑터 찾기 / 프로퍼티 설정 =====
std::string get_adapter_path(GDBusConnection* conn, int dev_id) {
	GError* err = nullptr;
	GVariant* ret = g_dbus_connection_call_sync(
		conn, "org.bluez", "/",
		"org.freedesktop.DBus.ObjectManager", "GetManagedObjects",
		nullptr, nullptr, G_DBUS_CALL_FLAGS_NONE, -1, nullptr, &err);
	if (!ret) {
		if (err) { log_error("HCI", std::string("GetManagedObjects: ") + err->message); g_error_free(err); }
		return {};
	}

	const std::string wanted = "/org/bluez/hci" + std::to_string(dev_id);
	std::string first;
	bool found = false;

	GVariant* dict = g_variant_get_child_value(ret, 0);
	GVariantIter* i = nullptr; g_variant_get(dict, "a{oa{sa{sv}}}", &i);
	const gchar* objpath = nullptr; GVariant* ifaces = nullptr;
	while (g_variant_iter_loop(i, "{&o@a{sa{sv}}}", &objpath, &ifaces)) {
		GVariantIter* ii = nullptr; const gchar* ifname = nullptr; GVariant* props = nullptr;
		g_variant_get(ifaces, "a{sa{sv}}", &ii);
		while (g_variant_iter_loop(ii, "{&s@a{sv}}", &ifname, &props)) {
			if (g_strcmp0(ifname, "org.bluez.Adapter1") != 0) continue;
			if (first.empty()) first = objpath;
			if (wanted == objpath) found = true;
		}
		if (ii) g_variant_iter_free(ii);
	}
	if (i) g_variant_iter_free(i);
	g_variant_unref(dict);
	g_variant_unref(ret);
	return found ? wanted : first;
}

bool call_set(GDBusConnection* conn, const std::string& objpath,
	const char* iface, const char* prop, GVariant* value) {
	GError* err = nullptr;
	GVariant* r = g_dbus_connection_call_sync(
		conn, "org.bluez", objpath.c_str(),
		"org.freedesktop.DBus.Properties", "Set",
		g_variant_new("(ssv)", iface, prop, value),
		nullptr, G_DBUS_CALL_FLAGS_NONE, 5000, nullptr, &err);
	if (!r) {
		if (err) { log_error("HCI", std::string("Set ") + prop + ": " + err->message); g_error_free(err); }
		return false;
	}
	g_variant_unref(r);
	return true;
}

} // namespace

static HubErr hci_probe(RadioAdapter* self) {
	auto* p = priv_of(self);
	if (!p) return HubErr::NoDevice;
	struct hci_dev_info di {};
	if (hci_devinfo(p->dev_id, &di) < 0) return HubErr::NoDevice;
	return hci_test_bit(HCI_UP, &di.flags) ? HubErr::Ok : HubErr::NoDevice;
}

static HubErr hci_scan_enable(RadioAdapter* self, const ScanParams* params,
	adapter_adv_cb_t on_adv, void* on_adv_user,
	adapter_err_cb_t on_err, void* on_err_user) {
	auto* p = priv_of(self);
	if (!p || !params) return HubErr::NoDevice;
	if (p->scan_dd >= 0) return HubErr::ScanFailure; // 프론트가 먼저 disable 해야 함

	int dd = hci_open_dev(p->dev_id);
	if (dd < 0) return HubErr::NoDevice;

	// 이전 세션이 남긴 스캔 상태는 무시 (disable 실패 허용)
	hci_le_set_scan_enable(dd, 0x00, 0x00, kHciTimeoutMs);

	if (hci_le_set_scan_parameters(dd, 0x00 /* passive */,
		htobs(params->interval), htobs(params->window),
		LE_PUBLIC_ADDRESS, 0x00 /* accept all */, kHciTimeoutMs) < 0) {
		log_error("HCI", std::string("set_scan_parameters: ") + std::strerror(errno));
		hci_close_dev(dd);
		return HubErr::ScanFailure;
	}
	if (hci_le_set_scan_enable(dd, 0x01, params->filter_dup ? 0x01 : 0x00, kHciTimeoutMs) < 0) {
		log_error("HCI", std::string("set_scan_enable: ") + std::strerror(errno));
		hci_close_dev(dd);
		return HubErr::ScanFailure;
	}

	p->scan_dd = dd;
	p->on_adv = on_adv; p->on_adv_user = on_adv_user;
	p->on_err = on_err; p->on_err_user = on_err_user;
	p->stop.store(false);
	p->rx_thread = std::thread(rx_loop, p);
	return HubErr::Ok;
}

static void hci_scan_disable(RadioAdapter* self) {
	auto* p = priv_of(self);
	if (!p) return;
	p->stop.store(true);
	if (p->rx_thread.joinable()) p->rx_thread.join();
	if (p->scan_dd >= 0) {
		if (hci_le_set_scan_enable(p->scan_dd, 0x00, 0x00, kHciTimeoutMs) < 0) {
			log_debug("HCI", "scan disable rejected (already off?)");
		}
		hci_close_dev(p->scan_dd);
		p->scan_dd = -1;
	}
	p->on_adv = nullptr; p->on_adv_user = nullptr;
	p->on_err = nullptr; p->on_err_user = nullptr;
}

static HubErr hci_adv_set_params(RadioAdapter* self, uint16_t interval_units) {
	auto* p = priv_of(self);
	if (!p) return HubErr::NoDevice;
	le_set_advertising_parameters_cp cp{};
	cp.min_interval = htobs(interval_units);
	cp.max_interval = htobs(interval_units);
	cp.advtype = 0x03;          // ADV_NONCONN_IND
	cp.own_bdaddr_type = 0x00;  // public
	cp.direct_bdaddr_type = 0x00;
	cp.chan_map = 0x07;         // 37/38/39
	cp.filter = 0x00;
	return send_le_cmd(p, OCF_LE_SET_ADVERTISING_PARAMETERS, &cp, LE_SET_ADVERTISING_PARAMETERS_CP_SIZE);
}

static HubErr hci_adv_set_data(RadioAdapter* self, const uint8_t* data, size_t len) {
	auto* p = priv_of(self);
	if (!p || !data) return HubErr::NoDevice;
	le_set_advertising_data_cp cp{};
	if (len > sizeof(cp.data)) return HubErr::Io;
	cp.length = (uint8_t)len;
	std::memcpy(cp.data, data, len);
	return send_le_cmd(p, OCF_LE_SET_ADVERTISING_DATA, &cp, LE_SET_ADVERTISING_DATA_CP_SIZE);
}

static HubErr hci_adv_enable(RadioAdapter* self, bool on) {
	auto* p = priv_of(self);
	if (!p) return HubErr::NoDevice;
	le_set_advertise_enable_cp cp{};
	cp.enable = on ? 0x01 : 0x00;
	return send_le_cmd(p, OCF_LE_SET_ADVERTISE_ENABLE, &cp, LE_SET_ADVERTISE_ENABLE_CP_SIZE);
}

static HubErr hci_power_cycle(RadioAdapter* self, uint32_t step_ms) {
	auto* p = priv_of(self);
	if (!p) return HubErr::NoDevice;

	// 전원이 내려가면 명령 소켓도 무효
	close_cmd_socket(p);

	GError* err = nullptr;
	GDBusConnection* conn = g_bus_get_sync(G_BUS_TYPE_SYSTEM, nullptr, &err);
	if (!conn) {
		if (err) { log_error("HCI", std::string("system bus: ") + err->message); g_error_free(err); }
		return HubErr::Io;
	}

	HubErr rc = HubErr::Ok;
	const std::string path = get_adapter_path(conn, p->dev_id);
	if (path.empty()) {
		log_error("HCI", "no org.bluez.Adapter1 found");
		rc = HubErr::NoDevice;
	}
	else {
		log_info("HCI", "power cycling " + path);
		if (!call_set(conn, path, "org.bluez.Adapter1", "Powered", g_variant_new_boolean(FALSE))) {
			log_warn("HCI", "power off failed, trying power on anyway");
		}
		g_usleep((gulong)step_ms * 1000);
		if (!call_set(conn, path, "org.bluez.Adapter1", "Powered", g_variant_new_boolean(TRUE))) rc = HubErr::Io;
		g_usleep((gulong)step_ms * 1000);
	}
	g_object_unref(conn);
	return rc;
}

static void hci_destroy(RadioAdapter* self) {
	if (!self) return;
	auto* p = priv_of(self);
	if (p) {
		hci_scan_disable(self);
		close_cmd_socket(p);
		delete p;
	}
	self->priv = nullptr;
	delete self;
}

static const RadioVTable g_vtbl = {
	hci_probe,
	hci_scan_enable,
	hci_scan_disable,
	hci_adv_set_params,
	hci_adv_set_data,
	hci_adv_enable,
	hci_power_cycle,
	hci_destroy
};

RadioAdapter* create_hci_adapter(int hci_index) {
	auto* a = new (std::nothrow) RadioAdapter();
	if (!a) return nullptr;
	auto* p = new (std::nothrow) HciPriv();
	if (!p) { delete a; return nullptr; }
	p->dev_id = hci_index;
	a->v = &g_vtbl;
	a->priv = p;
	return a;
}

} // namespace hubcast
