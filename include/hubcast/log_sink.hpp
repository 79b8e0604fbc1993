#pragma once
#include <cstdint>
#include <string>
#include <fstream>
#include <mutex>

namespace hubcast {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };
enum class LogFormat : uint8_t { Text = 0, Json = 1 };

bool parse_log_level(const std::string& s, LogLevel& out);
bool parse_log_format(const std::string& s, LogFormat& out);
const char* log_level_str(LogLevel lv);

class LogSink {
public:
	bool open(const std::string& path); ///< 파일 오픈(append)
	void write(const std::string& line);///< 한 줄 기록 (타임스탬프는 호출자가 포함)
	bool is_open() const { return f_.is_open(); }
private:
	std::ofstream f_;
	std::mutex mu_;
};

struct LogConfig {
	LogLevel level = LogLevel::Info;
	LogFormat format = LogFormat::Text;
	std::string file; ///< 비어있으면 stderr만
};

/** @brief 프로세스 로그 설정 (stderr + 선택적 파일). 파일 오픈 실패 시 false, stderr는 계속 사용 */
bool log_init(const LogConfig& cfg);

/** @brief "[%F %T.mmm][LEVEL][TAG] msg" (text) 또는 JSON 한 줄 */
void logln(LogLevel lv, const char* tag, const std::string& msg);

inline void log_debug(const char* tag, const std::string& msg) { logln(LogLevel::Debug, tag, msg); }
inline void log_info(const char* tag, const std::string& msg) { logln(LogLevel::Info, tag, msg); }
inline void log_warn(const char* tag, const std::string& msg) { logln(LogLevel::Warn, tag, msg); }
inline void log_error(const char* tag, const std::string& msg) { logln(LogLevel::Error, tag, msg); }

} // namespace hubcast
