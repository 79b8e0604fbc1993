// LEGO 허브 광고 스캐너 (BlueZ HCI). 결과를 표준출력으로 로그
// 빌드 전제: libbluetooth-dev / bluez, 실제 어댑터 필요 (자동 테스트 아님)
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "hubcast/config.hpp"
#include "hubcast/log_sink.hpp"
#include "hubcast/protocol.hpp"
#include "hubcast/radio.hpp"

using namespace hubcast;

static std::atomic_bool g_stop{ false };
static void on_sigint(int) { g_stop.store(true); }

static void print_adv(const BleAdv& adv, const MonitorConfig& mc) {
	auto mfg = UNPACK::manufacturer_data(adv.raw.data(), adv.raw.size(), mc.manufacturer_id);
	if (!mfg) return;

	const std::string name = adv.name ? *adv.name : "";
	std::cout << "[BLE] mac=" << adv.mac << " rssi=" << (int)adv.rssi
		<< (name.empty() ? "" : (" name=\"" + name + "\""))
		<< " mfg=" << hex(*mfg);

	HubKind kind = HubKind::Train;
	if (!name.empty() && name.find(mc.switch_marker) != std::string::npos) kind = HubKind::Switch;
	else if (name.empty() || name.find(mc.train_marker) == std::string::npos) {
		std::cout << std::endl;
		return;
	}

	auto f = UNPACK::status(kind, *mfg);
	if (!f) { std::cout << " (undecodable)" << std::endl; return; }

	std::cout << " ch=" << (int)f->channel;
	if (kind == HubKind::Train) {
		std::cout << " train " << (f->train.running ? "running" : "stopped") << " speed=" << (int)f->train.speed;
	}
	else {
		std::cout << " switch";
		for (Port p : kAllPorts) {
			std::cout << " " << port_letter(p) << "=" << position_str(f->sw.position(p))
				<< (f->sw.port_connected(p) ? "" : "(nc)");
		}
	}
	std::cout << std::endl;
}

int main(int argc, char** argv) {
	std::signal(SIGINT, on_sigint);
	std::signal(SIGTERM, on_sigint);

	int seconds = (argc > 1 ? std::stoi(argv[1]) : 5); // 기본 5초 스캔

	ServiceConfig cfg = default_config();
	apply_env_overrides(cfg);
	log_init(cfg.log);

	RadioAccess radio(create_radio_adapter(RadioDevice::Hci, cfg.radio.hci_index), cfg.radio);
	if (!radio.available()) { std::cerr << "[ERR] no HCI device (hci" << cfg.radio.hci_index << ")\n"; return 1; }

	std::atomic_bool failed{ false };
	HubErr e = radio.start_scan(
		[&](const BleAdv& adv) { print_adv(adv, cfg.monitor); },
		[&](HubErr) { failed.store(true); });
	if (e != HubErr::Ok) { std::cerr << "[ERR] start_scan: " << hub_err_str(e) << "\n"; return 1; }

	std::cout << "[RUN] BLE scanning for " << seconds << "s ..." << std::endl;

	auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
	while (!g_stop.load() && !failed.load() && std::chrono::steady_clock::now() < deadline) {
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
	}

	radio.stop_scan();
	if (failed.load()) { std::cerr << "[ERR] scan session failed\n"; return 1; }
	std::cout << "[DONE] BLE scan finished" << std::endl;
	return 0;
}
