#include "hubcast/log_sink.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace hubcast {

using namespace std::chrono;
using json = nlohmann::json;

namespace {
	std::atomic<LogLevel> g_level{ LogLevel::Info };
	std::atomic<LogFormat> g_format{ LogFormat::Text };
	LogSink g_file;
	std::mutex g_err_mu; ///< stderr 줄 단위 직렬화

	std::string lower(std::string s) {
		for (auto& c : s) c = (char)std::tolower((unsigned char)c);
		return s;
	}

	std::string stamp() {
		auto t = system_clock::now();
		auto tt = system_clock::to_time_t(t);
		auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;
		std::tm tm{}; localtime_r(&tt, &tm);
		std::ostringstream os;
		os << std::put_time(&tm, "%F %T") << "." << std::setw(3) << std::setfill('0') << ms.count();
		return os.str();
	}
}

bool parse_log_level(const std::string& s, LogLevel& out) {
	const std::string v = lower(s);
	if (v == "debug") { out = LogLevel::Debug; return true; }
	if (v == "info") { out = LogLevel::Info; return true; }
	if (v == "warn" || v == "warning") { out = LogLevel::Warn; return true; }
	if (v == "error") { out = LogLevel::Error; return true; }
	return false;
}

bool parse_log_format(const std::string& s, LogFormat& out) {
	const std::string v = lower(s);
	if (v == "text") { out = LogFormat::Text; return true; }
	if (v == "json") { out = LogFormat::Json; return true; }
	return false;
}

const char* log_level_str(LogLevel lv) {
	switch (lv) {
	case LogLevel::Debug: return "DEBUG";
	case LogLevel::Info:  return "INFO";
	case LogLevel::Warn:  return "WARN";
	case LogLevel::Error: return "ERROR";
	}
	return "INFO";
}

bool LogSink::open(const std::string& path) {
	std::lock_guard<std::mutex> lk(mu_);
	if (f_.is_open()) f_.close();
	f_.open(path, std::ios::app);
	return (bool)f_;
}

void LogSink::write(const std::string& line) {
	std::lock_guard<std::mutex> lk(mu_);
	if (!f_.is_open()) return;
	f_ << line << "\n";
	f_.flush();
}

bool log_init(const LogConfig& cfg) {
	g_level = cfg.level;
	g_format = cfg.format;
	if (cfg.file.empty()) return true;
	if (!g_file.open(cfg.file)) {
		logln(LogLevel::Error, "LOG", "cannot open log file " + cfg.file);
		return false;
	}
	logln(LogLevel::Info, "LOG", "logging to file " + cfg.file);
	return true;
}

void logln(LogLevel lv, const char* tag, const std::string& msg) {
	if (lv < g_level.load()) return;

	std::string line;
	if (g_format.load() == LogFormat::Json) {
		json j{
			{"timestamp", stamp()},
			{"level", log_level_str(lv)},
			{"tag", tag},
			{"message", msg}
		};
		line = j.dump(-1, ' ', false, json::error_handler_t::replace);
	}
	else {
		line = "[" + stamp() + "][" + log_level_str(lv) + "][" + tag + "] " + msg;
	}

	{
		std::lock_guard<std::mutex> lk(g_err_mu);
		std::cerr << line << "\n";
	}
	g_file.write(line);
}

} // namespace hubcast
