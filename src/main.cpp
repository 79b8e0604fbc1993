#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>

#include <poll.h>
#include <unistd.h>

#include "hubcast/config.hpp"
#include "hubcast/console.hpp"
#include "hubcast/log_sink.hpp"
#include "hubcast/service.hpp"

using namespace hubcast;

static std::atomic_bool g_stop{ false };
static void on_sig(int) { g_stop.store(true); }

static void usage(const char* argv0) {
	std::fprintf(stderr, "usage: %s [-c config.json] [--debug-radio]\n", argv0);
}

// 콘솔 명령 실행. false면 종료
static bool execute(HubService& svc, const ConsoleCmd& c) {
	switch (c.op) {
	case ConsoleOp::None:
		return true;
	case ConsoleOp::Help:
		std::fputs(console_help(), stdout);
		return true;
	case ConsoleOp::Quit:
		return false;
	case ConsoleOp::List: {
		nlohmann::json j;
		j["trains"] = svc.list_connected_trains();
		j["switches"] = svc.list_connected_switches();
		std::printf("%s\n", j.dump(2).c_str());
		return true;
	}
	case ConsoleOp::Health:
		std::printf("%s\n", svc.health_json().dump(2).c_str());
		return true;
	case ConsoleOp::Reset: {
		HubErr e = svc.reset_adapter();
		std::printf("[reset] %s\n", hub_err_str(e));
		return true;
	}
	case ConsoleOp::Power: {
		HubErr e = svc.enqueue_power(c.channel, c.power);
		std::printf("[train %d] power %d: %s\n", c.channel, c.power, hub_err_str(e));
		return true;
	}
	case ConsoleOp::SelfDrive: {
		HubErr e = svc.enqueue_self_drive(c.channel, c.enabled);
		std::printf("[train %d] self-drive %s: %s\n", c.channel, c.enabled ? "on" : "off", hub_err_str(e));
		return true;
	}
	case ConsoleOp::Switch: {
		std::printf("[switch %d] %c -> %s ...\n", c.channel, port_letter(c.port), position_str(c.position));
		std::fflush(stdout);
		HubErr e = svc.enqueue_switch(c.channel, c.port, c.position);
		std::printf("[switch %d] %c -> %s: %s\n", c.channel, port_letter(c.port), position_str(c.position), hub_err_str(e));
		return true;
	}
	}
	return true;
}

int main(int argc, char** argv) {
	std::signal(SIGINT, on_sig);
	std::signal(SIGTERM, on_sig);

	std::string cfg_path;
	bool debug_radio = false;
	for (int i = 1; i < argc; ++i) {
		if ((!std::strcmp(argv[i], "-c") || !std::strcmp(argv[i], "--config")) && i + 1 < argc) cfg_path = argv[++i];
		else if (!std::strcmp(argv[i], "--debug-radio")) debug_radio = true;
		else { usage(argv[0]); return 2; }
	}

	ServiceConfig cfg = default_config();
	if (!cfg_path.empty() && !load_config(cfg_path, cfg)) return 1;
	apply_env_overrides(cfg);
	if (debug_radio) cfg.device = RadioDevice::Debug;

	if (!log_init(cfg.log)) log_warn("MAIN", "log file unavailable, logging to stderr only");

	HubService svc(cfg);
	HubErr e = svc.start();
	if (e != HubErr::Ok) {
		log_error("MAIN", std::string("service start failed: ") + hub_err_str(e));
		return 1;
	}

	std::puts("[hubcastd] ready ('?' for help)");
	std::fflush(stdout);

	bool stdin_open = true;
	while (!g_stop.load()) {
		if (!stdin_open) { ::usleep(200 * 1000); continue; }

		// cin 버퍼에 남은 줄이 없을 때만 poll
		if (std::cin.rdbuf()->in_avail() <= 0) {
			pollfd pfd{ STDIN_FILENO, POLLIN, 0 };
			if (::poll(&pfd, 1, 200) <= 0) continue;
		}

		std::string line;
		if (!std::getline(std::cin, line)) {
			// stdin 닫힘: 신호로만 종료
			stdin_open = false;
			continue;
		}
		ConsoleCmd cmd;
		if (parse_console(line, cmd) != HubErr::Ok) {
			std::printf("unknown command: %s\n", line.c_str());
			continue;
		}
		if (!execute(svc, cmd)) break;
		std::fflush(stdout);
	}

	svc.stop();
	log_info("MAIN", "bye");
	return 0;
}
