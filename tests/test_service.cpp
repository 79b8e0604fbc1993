// 허브 서비스: 수명, 목록(JSON), health, 전체 경로 (디버그 무선)
#include "test_common.hpp"
#include "hubcast/service.hpp"

using namespace hubcast;

static void test_no_adapter() {
	ServiceConfig cfg = fast_config();
	cfg.device = RadioDevice::None;
	HubService svc(cfg);
	check(svc.start() == HubErr::NoDevice, "svc.start() == HubErr::NoDevice", __LINE__);
	check(!svc.started(), "!svc.started()", __LINE__);
	check(svc.reset_adapter() == HubErr::NoDevice, "svc.reset_adapter() == HubErr::NoDevice", __LINE__);
	check(svc.health().status == "unhealthy", "svc.health().status == \"unhealthy\"", __LINE__);
}

static void test_train_listing() {
	ServiceConfig cfg = fast_config();
	cfg.liveness_window = Millis(200);
	HubService svc(cfg);
	check(svc.start() == HubErr::Ok, "svc.start() == HubErr::Ok", __LINE__);
	RadioAdapter* a = svc.radio().adapter();
	check(wait_until([&] { return svc.monitor().scanning(); }), "wait_until([&] { return svc.monitor().scanning(); })", __LINE__);

	check(debug_inject_advertisement(a, make_adv("90:84:2B:00:00:21", "Train 21", 21, 1, 40, -52)), "debug_inject_advertisement(a, make_adv(\"90:84:2B:00:00:21\", \"Train 21\", 21, 1, 40, -52))", __LINE__);
	check(svc.connected_trains().size() == 1, "svc.connected_trains().size() == 1", __LINE__);

	check(svc.enqueue_power(21, -30) == HubErr::Ok, "svc.enqueue_power(21, -30) == HubErr::Ok", __LINE__);
	check(svc.enqueue_self_drive(21, true) == HubErr::Ok, "svc.enqueue_self_drive(21, true) == HubErr::Ok", __LINE__);
	check(svc.enqueue_power(22, 10) == HubErr::UnknownDevice, "svc.enqueue_power(22, 10) == HubErr::UnknownDevice", __LINE__);

	nlohmann::json trains = svc.list_connected_trains();
	check(trains.contains("21"), "trains.contains(\"21\")", __LINE__);
	if (trains.contains("21")) {
		const auto& t = trains["21"];
		check(t["status"] == "running", "t[\"status\"] == \"running\"", __LINE__);
		check(t["speed"] == 40, "t[\"speed\"] == 40", __LINE__);
		check(t["direction"] == "forward", "t[\"direction\"] == \"forward\"", __LINE__);
		check(t["name"] == "Train 21", "t[\"name\"] == \"Train 21\"", __LINE__);
		check(t["selfDrive"] == true, "t[\"selfDrive\"] == true", __LINE__);
		check(t["rssi"] == -52, "t[\"rssi\"] == -52", __LINE__);
		check(t["channel"] == 21, "t[\"channel\"] == 21", __LINE__);
		check(t["active"] == true, "t[\"active\"] == true", __LINE__);
		check(t["last_update_seconds_ago"].get<double>() < 0.2, "t[\"last_update_seconds_ago\"].get<double>() < 0.2", __LINE__);
	}

	// 명령이 실제로 광고됐는지
	bytes want;
	PACK::train_power(21, -30, want);
	check(wait_until([&] {
		for (const auto& p : debug_stats(a).payloads) if (p == want) return true;
		return false;
	}), "wait_until([&] { for (const auto& p : debug_stats(a).payloads) if (p == want) return true; return false; })", __LINE__);

	// 조용해지면 목록에서 빠짐 (레코드는 남음)
	sleep_ms(300);
	check(svc.list_connected_trains().empty(), "svc.list_connected_trains().empty()", __LINE__);
	check(svc.registry().contains(21), "svc.registry().contains(21)", __LINE__);

	svc.stop();
	check(!debug_stats(a).advertising, "!debug_stats(a).advertising", __LINE__);
	check(!debug_stats(a).scanning, "!debug_stats(a).scanning", __LINE__);
}

static void test_switch_listing() {
	HubService svc(fast_config());
	check(svc.start() == HubErr::Ok, "svc.start() == HubErr::Ok", __LINE__);
	RadioAdapter* a = svc.radio().adapter();
	check(wait_until([&] { return svc.monitor().scanning(); }), "wait_until([&] { return svc.monitor().scanning(); })", __LINE__);

	SimSwitchHub hub(a, 1, "Technic Hub");
	hub.attach();
	hub.announce();
	check(wait_until([&] { return svc.connected_switches().size() == 1; }), "wait_until([&] { return svc.connected_switches().size() == 1; })", __LINE__);

	check(svc.enqueue_switch(1, Port::A, SwitchPosition::Diverging) == HubErr::Ok, "svc.enqueue_switch(1, Port::A, SwitchPosition::Diverging) == HubErr::Ok", __LINE__);
	check(svc.submit_switch(1, Port::C, SwitchPosition::Diverging).get() == HubErr::Ok, "svc.submit_switch(1, Port::C, SwitchPosition::Diverging).get() == HubErr::Ok", __LINE__);
	check(svc.enqueue_switch(3, Port::A, SwitchPosition::Diverging) == HubErr::UnknownDevice, "svc.enqueue_switch(3, Port::A, SwitchPosition::Diverging) == HubErr::UnknownDevice", __LINE__);

	nlohmann::json sw = svc.list_connected_switches();
	check(sw.contains("1"), "sw.contains(\"1\")", __LINE__);
	if (sw.contains("1")) {
		const auto& s = sw["1"];
		check(s["switch_positions"]["SWITCH_A"] == 1, "s[\"switch_positions\"][\"SWITCH_A\"] == 1", __LINE__);
		check(s["switch_positions"]["SWITCH_B"] == 0, "s[\"switch_positions\"][\"SWITCH_B\"] == 0", __LINE__);
		check(s["switch_positions"]["SWITCH_C"] == 1, "s[\"switch_positions\"][\"SWITCH_C\"] == 1", __LINE__);
		check(s["switch_states"]["SWITCH_D"] == 1, "s[\"switch_states\"][\"SWITCH_D\"] == 1", __LINE__);
		check(s["status"] == 0x0A, "s[\"status\"] == 0x0A", __LINE__);
		check(s["connected"] == true, "s[\"connected\"] == true", __LINE__);
		check(s["name"] == "Technic Hub", "s[\"name\"] == \"Technic Hub\"", __LINE__);
		check(s["reliability"]["SWITCH_A"]["attempts"] == 1, "s[\"reliability\"][\"SWITCH_A\"][\"attempts\"] == 1", __LINE__);
		check(s["reliability"]["SWITCH_A"]["successes"] == 1, "s[\"reliability\"][\"SWITCH_A\"][\"successes\"] == 1", __LINE__);
		check(s["reliability"]["SWITCH_A"]["success_rate"] == 100.0, "s[\"reliability\"][\"SWITCH_A\"][\"success_rate\"] == 100.0", __LINE__);
		check(!s["reliability"].contains("SWITCH_B"), "!s[\"reliability\"].contains(\"SWITCH_B\")", __LINE__);
	}
	svc.stop();
}

static void test_health_and_reset() {
	ServiceConfig cfg = fast_config();
	cfg.reset_on_startup = true;
	HubService svc(cfg);
	check(svc.register_hub(5, HubKind::Train, "Train 5") == HubErr::Ok, "svc.register_hub(5, HubKind::Train, \"Train 5\") == HubErr::Ok", __LINE__);
	check(svc.register_hub(0, HubKind::Train, "bad") == HubErr::InvalidCommand, "svc.register_hub(0, HubKind::Train, \"bad\") == HubErr::InvalidCommand", __LINE__);
	check(svc.start() == HubErr::Ok, "svc.start() == HubErr::Ok", __LINE__);
	RadioAdapter* a = svc.radio().adapter();
	check(debug_stats(a).power_cycles == 1, "debug_stats(a).power_cycles == 1", __LINE__);
	check(wait_until([&] { return svc.monitor().scanning(); }), "wait_until([&] { return svc.monitor().scanning(); })", __LINE__);

	HealthReport h = svc.health();
	check(h.bluetooth_available, "h.bluetooth_available", __LINE__);
	check(h.status == "healthy", "h.status == \"healthy\"", __LINE__);
	check(h.scanning, "h.scanning", __LINE__);
	check(h.connected_trains == 0, "h.connected_trains == 0", __LINE__); // 등록만 되고 광고 없음

	nlohmann::json j = svc.health_json();
	check(j["status"] == "healthy", "j[\"status\"] == \"healthy\"", __LINE__);
	check(j["bluetooth_available"] == true, "j[\"bluetooth_available\"] == true", __LINE__);
	check(j.contains("monitor_restarts"), "j.contains(\"monitor_restarts\")", __LINE__);

	// 요청 리셋 → 모니터가 스캔 재시작
	check(svc.reset_adapter() == HubErr::Ok, "svc.reset_adapter() == HubErr::Ok", __LINE__);
	check(wait_until([&] { return svc.monitor().scanning() && svc.health().monitor_restarts == 1; }), "wait_until([&] { return svc.monitor().scanning() && svc.health().monitor_restarts == 1; })", __LINE__);

	debug_set_available(a, false);
	check(svc.health().status == "unhealthy", "svc.health().status == \"unhealthy\"", __LINE__);
	svc.stop();
}

// start 전 명령은 막히지 않고 Stopped, stop → start 후에는 다시 동작
static void test_lifecycle() {
	HubService svc(fast_config());
	check(svc.register_hub(1, HubKind::Switch, "Technic Hub") == HubErr::Ok, "svc.register_hub(1, HubKind::Switch, \"Technic Hub\") == HubErr::Ok", __LINE__);
	check(svc.register_hub(21, HubKind::Train, "Train 21") == HubErr::Ok, "svc.register_hub(21, HubKind::Train, \"Train 21\") == HubErr::Ok", __LINE__);

	auto early = svc.submit_switch(1, Port::A, SwitchPosition::Diverging);
	check(early.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready, "early.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready", __LINE__);
	check(early.get() == HubErr::Stopped, "early.get() == HubErr::Stopped", __LINE__);
	check(svc.enqueue_switch(1, Port::A, SwitchPosition::Diverging) == HubErr::Stopped, "svc.enqueue_switch(1, Port::A, SwitchPosition::Diverging) == HubErr::Stopped", __LINE__);
	check(svc.enqueue_power(21, 20) == HubErr::Stopped, "svc.enqueue_power(21, 20) == HubErr::Stopped", __LINE__);

	check(svc.start() == HubErr::Ok, "svc.start() == HubErr::Ok", __LINE__);
	RadioAdapter* a = svc.radio().adapter();
	SimSwitchHub hub(a, 1, "Technic Hub");
	hub.attach();
	svc.stop();
	check(!svc.started(), "!svc.started()", __LINE__);
	check(svc.enqueue_power(21, 20) == HubErr::Stopped, "svc.enqueue_power(21, 20) == HubErr::Stopped", __LINE__);

	check(svc.start() == HubErr::Ok, "svc.start() == HubErr::Ok", __LINE__);
	check(wait_until([&] { return svc.monitor().scanning(); }), "wait_until([&] { return svc.monitor().scanning(); })", __LINE__);
	check(svc.enqueue_power(21, 20) == HubErr::Ok, "svc.enqueue_power(21, 20) == HubErr::Ok", __LINE__);
	check(svc.enqueue_switch(1, Port::A, SwitchPosition::Diverging) == HubErr::Ok, "svc.enqueue_switch(1, Port::A, SwitchPosition::Diverging) == HubErr::Ok", __LINE__);
	check(hub.status() == 0x08, "hub.status() == 0x08", __LINE__);
	check(wait_until([&] { return svc.registry().reliability(21, "MOTOR").successes == 1; }), "wait_until([&] { return svc.registry().reliability(21, \"MOTOR\").successes == 1; })", __LINE__);
	svc.stop();
}

int main() {
	test_no_adapter();
	test_train_listing();
	test_switch_listing();
	test_health_and_reset();
	test_lifecycle();
	return test_result();
}
