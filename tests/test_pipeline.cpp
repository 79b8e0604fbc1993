// 명령 파이프라인: 열차 배치, 전환기 재시도/검증, 종료 처리
#include "test_common.hpp"
#include "hubcast/monitor.hpp"
#include "hubcast/pipeline.hpp"

using namespace hubcast;

struct Rig {
	ServiceConfig cfg = fast_config();
	RadioAccess radio;
	DeviceRegistry reg;
	MonitorLoop monitor;

	explicit Rig(const ServiceConfig& c)
		: cfg(c), radio(create_debug_adapter(), c.radio), reg(c.registry), monitor(radio, reg, c.monitor) {}
	RadioAdapter* adapter() { return radio.adapter(); }
};

static size_t payload_count(RadioAdapter* a) { return debug_stats(a).payloads.size(); }

static void test_train_validation() {
	Rig rig(fast_config());
	TrainPipeline trains(rig.radio, rig.reg, rig.cfg.pipeline);
	rig.reg.register_hub(21, HubKind::Train, "Train");
	rig.reg.register_hub(2, HubKind::Switch, "Technic Hub");

	check(trains.enqueue_power(0, 10) == HubErr::InvalidCommand, "trains.enqueue_power(0, 10) == HubErr::InvalidCommand", __LINE__);
	check(trains.enqueue_power(31, 10) == HubErr::InvalidCommand, "trains.enqueue_power(31, 10) == HubErr::InvalidCommand", __LINE__);
	check(trains.enqueue_power(5, 10) == HubErr::UnknownDevice, "trains.enqueue_power(5, 10) == HubErr::UnknownDevice", __LINE__);
	check(trains.enqueue_power(2, 10) == HubErr::UnknownDevice, "trains.enqueue_power(2, 10) == HubErr::UnknownDevice", __LINE__); // 전환기 채널
	check(trains.enqueue_power(21, 10) == HubErr::Ok, "trains.enqueue_power(21, 10) == HubErr::Ok", __LINE__);
	check(rig.reg.is_active(21, Clock::now()), "rig.reg.is_active(21, Clock::now())", __LINE__);

	check(trains.enqueue_self_drive(21, true) == HubErr::Ok, "trains.enqueue_self_drive(21, true) == HubErr::Ok", __LINE__);
	check(rig.reg.find(21)->self_drive, "rig.reg.find(21)->self_drive", __LINE__);
	check(trains.pending() == 2, "trains.pending() == 2", __LINE__);
}

static void test_train_batching() {
	ServiceConfig cfg = fast_config();
	cfg.pipeline.train_batch = 5;
	cfg.pipeline.train_batch_gap = Millis(300);
	Rig rig(cfg);
	rig.reg.register_hub(21, HubKind::Train, "Train");

	TrainPipeline trains(rig.radio, rig.reg, cfg.pipeline);
	for (int i = 1; i <= 7; ++i) check(trains.enqueue_power(21, i * 10) == HubErr::Ok, "trains.enqueue_power(21, i * 10) == HubErr::Ok", __LINE__);
	check(trains.enqueue_power(21, 150) == HubErr::Ok, "trains.enqueue_power(21, 150) == HubErr::Ok", __LINE__); // 100으로 클램프

	trains.start();
	// 첫 사이클: 5개 송신 후 300ms 쉼
	check(wait_until([&] { return payload_count(rig.adapter()) == 5; }, 250), "wait_until([&] { return payload_count(rig.adapter()) == 5; }, 250)", __LINE__);
	sleep_ms(50);
	check(payload_count(rig.adapter()) == 5, "payload_count(rig.adapter()) == 5", __LINE__);

	// 다음 사이클에서 나머지 3개
	check(wait_until([&] { return payload_count(rig.adapter()) == 8; }, 1000), "wait_until([&] { return payload_count(rig.adapter()) == 8; }, 1000)", __LINE__);
	trains.stop();

	DebugRadioStats st = debug_stats(rig.adapter());
	bytes first, last;
	PACK::train_power(21, 10, first);
	PACK::train_power(21, 100, last);
	check(st.payloads.front() == first, "st.payloads.front() == first", __LINE__);
	check(st.payloads.back() == last, "st.payloads.back() == last", __LINE__);
	check(st.last_interval_units == RadioAccess::interval_units(cfg.pipeline.train_tx.interval), "st.last_interval_units == RadioAccess::interval_units(cfg.pipeline.train_tx.interval)", __LINE__);

	auto rc = rig.reg.reliability(21, TrainPipeline::kReliabilityKey);
	check(rc.attempts == 8 && rc.successes == 8, "rc.attempts == 8 && rc.successes == 8", __LINE__);
}

static void test_train_transmit_failure_counted() {
	Rig rig(fast_config());
	rig.reg.register_hub(3, HubKind::Train, "Train");
	TrainPipeline trains(rig.radio, rig.reg, rig.cfg.pipeline);
	debug_fail_transmit(rig.adapter(), true);
	trains.start();
	trains.enqueue_power(3, 20);
	check(wait_until([&] { return rig.reg.reliability(3, "MOTOR").attempts == 1; }), "wait_until([&] { return rig.reg.reliability(3, \"MOTOR\").attempts == 1; })", __LINE__);
	trains.stop();
	check(rig.reg.reliability(3, "MOTOR").successes == 0, "rig.reg.reliability(3, \"MOTOR\").successes == 0", __LINE__);
}

static void test_switch_confirmed() {
	Rig rig(fast_config());
	SimSwitchHub hub(rig.adapter(), 1);
	hub.attach();
	rig.monitor.start();
	check(wait_until([&] { return rig.radio.scanning(); }), "wait_until([&] { return rig.radio.scanning(); })", __LINE__);
	hub.announce();
	check(wait_until([&] { return rig.reg.contains(1, HubKind::Switch); }), "wait_until([&] { return rig.reg.contains(1, HubKind::Switch); })", __LINE__);

	SwitchPipeline switches(rig.radio, rig.reg, rig.cfg.pipeline);
	switches.start();

	check(switches.enqueue_switch(1, Port::B, SwitchPosition::Diverging) == HubErr::Ok, "switches.enqueue_switch(1, Port::B, SwitchPosition::Diverging) == HubErr::Ok", __LINE__);
	check(hub.status() == 0x04, "hub.status() == 0x04", __LINE__);
	check(rig.reg.find(1)->sw->position(Port::B) == SwitchPosition::Diverging, "rig.reg.find(1)->sw->position(Port::B) == SwitchPosition::Diverging", __LINE__);

	auto rc = rig.reg.reliability(1, "SWITCH_B");
	check(rc.attempts == 1 && rc.successes == 1, "rc.attempts == 1 && rc.successes == 1", __LINE__);
	check(rc.success_rate() == 100.0, "rc.success_rate() == 100.0", __LINE__);

	// 두 건을 비동기로: 순서대로 처리
	auto f1 = switches.submit_switch(1, Port::A, SwitchPosition::Diverging);
	auto f2 = switches.submit_switch(1, Port::B, SwitchPosition::Straight);
	check(f1.get() == HubErr::Ok, "f1.get() == HubErr::Ok", __LINE__);
	check(f2.get() == HubErr::Ok, "f2.get() == HubErr::Ok", __LINE__);
	check(hub.status() == 0x08, "hub.status() == 0x08", __LINE__);

	switches.stop();
	rig.monitor.stop();
}

static void test_switch_exhausted() {
	ServiceConfig cfg = fast_config();
	Rig rig(cfg);
	SimSwitchHub hub(rig.adapter(), 1);
	hub.attach();
	rig.monitor.start();
	check(wait_until([&] { return rig.radio.scanning(); }), "wait_until([&] { return rig.radio.scanning(); })", __LINE__);
	hub.announce();
	check(wait_until([&] { return rig.reg.contains(1, HubKind::Switch); }), "wait_until([&] { return rig.reg.contains(1, HubKind::Switch); })", __LINE__);
	hub.set_respond(false);

	SwitchPipeline switches(rig.radio, rig.reg, cfg.pipeline);
	switches.start();

	const auto t0 = Clock::now();
	HubErr e = switches.enqueue_switch(1, Port::A, SwitchPosition::Diverging);
	const auto took = std::chrono::duration_cast<Millis>(Clock::now() - t0);
	check(e == HubErr::VerificationTimeout, "e == HubErr::VerificationTimeout", __LINE__);

	// backoff 20*1 + 20*2, 검증 80ms x 3
	check(took >= Millis(60 + 240), "took >= Millis(60 + 240)", __LINE__);

	auto rc = rig.reg.reliability(1, "SWITCH_A");
	check(rc.attempts == 3, "rc.attempts == 3", __LINE__);
	check(rc.successes == 0, "rc.successes == 0", __LINE__);
	check(debug_stats(rig.adapter()).payloads.size() == 3, "debug_stats(rig.adapter()).payloads.size() == 3", __LINE__);

	switches.stop();
	rig.monitor.stop();
}

// 기본 backoff(0.5s x i)로 3회: 약 1.5초 backoff
static void test_switch_exhausted_default_backoff() {
	ServiceConfig cfg = fast_config();
	cfg.pipeline.retry_base = default_config().pipeline.retry_base;
	cfg.pipeline.verify_timeout = Millis(20);
	Rig rig(cfg);
	rig.reg.register_hub(1, HubKind::Switch, "Technic Hub");

	SwitchPipeline switches(rig.radio, rig.reg, cfg.pipeline);
	switches.start();
	const auto t0 = Clock::now();
	check(switches.enqueue_switch(1, Port::A, SwitchPosition::Diverging) == HubErr::VerificationTimeout, "switches.enqueue_switch(1, Port::A, SwitchPosition::Diverging) == HubErr::VerificationTimeout", __LINE__);
	const auto took = std::chrono::duration_cast<Millis>(Clock::now() - t0);
	check(took >= Millis(1500), "took >= Millis(1500)", __LINE__);
	check(took < Millis(3000), "took < Millis(3000)", __LINE__);

	auto rc = rig.reg.reliability(1, "SWITCH_A");
	check(rc.attempts == 3 && rc.successes == 0, "rc.attempts == 3 && rc.successes == 0", __LINE__);
	switches.stop();
}

static void test_switch_transmit_failure() {
	Rig rig(fast_config());
	rig.reg.register_hub(4, HubKind::Switch, "Technic Hub");
	debug_fail_transmit(rig.adapter(), true);

	SwitchPipeline switches(rig.radio, rig.reg, rig.cfg.pipeline);
	switches.start();
	check(switches.enqueue_switch(4, Port::C, SwitchPosition::Straight) == HubErr::TransmitFailure, "switches.enqueue_switch(4, Port::C, SwitchPosition::Straight) == HubErr::TransmitFailure", __LINE__);
	check(rig.reg.reliability(4, "SWITCH_C").attempts == 3, "rig.reg.reliability(4, \"SWITCH_C\").attempts == 3", __LINE__);
	switches.stop();
}

static void test_switch_validation_and_stop() {
	Rig rig(fast_config());
	rig.reg.register_hub(6, HubKind::Switch, "Technic Hub");
	rig.reg.register_hub(7, HubKind::Train, "Train");
	SwitchPipeline switches(rig.radio, rig.reg, rig.cfg.pipeline);

	check(switches.submit_switch(40, Port::A, SwitchPosition::Straight).get() == HubErr::InvalidCommand, "switches.submit_switch(40, Port::A, SwitchPosition::Straight).get() == HubErr::InvalidCommand", __LINE__);
	check(switches.submit_switch(8, Port::A, SwitchPosition::Straight).get() == HubErr::UnknownDevice, "switches.submit_switch(8, Port::A, SwitchPosition::Straight).get() == HubErr::UnknownDevice", __LINE__);
	check(switches.submit_switch(7, Port::A, SwitchPosition::Straight).get() == HubErr::UnknownDevice, "switches.submit_switch(7, Port::A, SwitchPosition::Straight).get() == HubErr::UnknownDevice", __LINE__);

	// 드레인 스레드가 없으면 기다리지 않고 바로 Stopped
	auto early = switches.submit_switch(6, Port::D, SwitchPosition::Diverging);
	check(early.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready, "early.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready", __LINE__);
	check(early.get() == HubErr::Stopped, "early.get() == HubErr::Stopped", __LINE__);
	check(switches.pending() == 0, "switches.pending() == 0", __LINE__);

	// 응답 없는 허브: 첫 명령이 재시도하는 동안 두 번째는 큐에서 대기
	check(switches.start() == HubErr::Ok, "switches.start() == HubErr::Ok", __LINE__);
	auto busy = switches.submit_switch(6, Port::D, SwitchPosition::Diverging);
	check(wait_until([&] { return rig.reg.reliability(6, "SWITCH_D").attempts == 1; }), "wait_until([&] { return rig.reg.reliability(6, \"SWITCH_D\").attempts == 1; })", __LINE__);
	auto queued = switches.submit_switch(6, Port::C, SwitchPosition::Diverging);
	check(switches.pending() == 1, "switches.pending() == 1", __LINE__);
	switches.stop();
	check(!switches.running(), "!switches.running()", __LINE__);
	check(busy.get() == HubErr::VerificationTimeout, "busy.get() == HubErr::VerificationTimeout", __LINE__);
	check(queued.get() == HubErr::Stopped, "queued.get() == HubErr::Stopped", __LINE__);
	check(rig.reg.reliability(6, "SWITCH_C").attempts == 0, "rig.reg.reliability(6, \"SWITCH_C\").attempts == 0", __LINE__);

	// stop 이후 제출
	check(switches.submit_switch(6, Port::D, SwitchPosition::Diverging).get() == HubErr::Stopped, "switches.submit_switch(6, Port::D, SwitchPosition::Diverging).get() == HubErr::Stopped", __LINE__);
}

// stop → start 후에도 두 파이프라인 모두 다시 명령을 처리
static void test_restart_after_stop() {
	Rig rig(fast_config());
	rig.reg.register_hub(21, HubKind::Train, "Train");
	SimSwitchHub hub(rig.adapter(), 1);
	hub.attach();
	rig.monitor.start();
	check(wait_until([&] { return rig.radio.scanning(); }), "wait_until([&] { return rig.radio.scanning(); })", __LINE__);
	hub.announce();
	check(wait_until([&] { return rig.reg.contains(1, HubKind::Switch); }), "wait_until([&] { return rig.reg.contains(1, HubKind::Switch); })", __LINE__);

	TrainPipeline trains(rig.radio, rig.reg, rig.cfg.pipeline);
	SwitchPipeline switches(rig.radio, rig.reg, rig.cfg.pipeline);
	check(trains.start() == HubErr::Ok, "trains.start() == HubErr::Ok", __LINE__);
	check(switches.start() == HubErr::Ok, "switches.start() == HubErr::Ok", __LINE__);
	trains.stop();
	switches.stop();
	check(trains.enqueue_power(21, 30) == HubErr::Stopped, "trains.enqueue_power(21, 30) == HubErr::Stopped", __LINE__);

	check(trains.start() == HubErr::Ok, "trains.start() == HubErr::Ok", __LINE__);
	check(switches.start() == HubErr::Ok, "switches.start() == HubErr::Ok", __LINE__);
	check(trains.running() && switches.running(), "trains.running() && switches.running()", __LINE__);

	check(trains.enqueue_power(21, 30) == HubErr::Ok, "trains.enqueue_power(21, 30) == HubErr::Ok", __LINE__);
	check(wait_until([&] { return rig.reg.reliability(21, "MOTOR").successes == 1; }), "wait_until([&] { return rig.reg.reliability(21, \"MOTOR\").successes == 1; })", __LINE__);
	check(switches.enqueue_switch(1, Port::A, SwitchPosition::Diverging) == HubErr::Ok, "switches.enqueue_switch(1, Port::A, SwitchPosition::Diverging) == HubErr::Ok", __LINE__);
	check(hub.status() == 0x08, "hub.status() == 0x08", __LINE__);

	trains.stop();
	switches.stop();
	rig.monitor.stop();
}

int main() {
	test_train_validation();
	test_train_batching();
	test_train_transmit_failure_counted();
	test_switch_confirmed();
	test_switch_exhausted();
	test_switch_exhausted_default_backoff();
	test_switch_transmit_failure();
	test_switch_validation_and_stop();
	test_restart_after_stop();
	return test_result();
}
