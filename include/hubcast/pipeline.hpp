#pragma once
#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include "common.hpp"
#include "hub_err.hpp"
#include "hub_types.hpp"
#include "msg_queue.hpp"
#include "protocol.hpp"
#include "radio.hpp"
#include "registry.hpp"

namespace hubcast {

struct PipelineConfig {
	size_t queue_capacity = 64;
	uint16_t manufacturer_id = kLegoManufacturerId;

	// 열차: 배치 드레인, 확인 없음
	int train_batch = 5;
	Millis train_batch_gap{ 20 };
	TxProfile train_tx{ Millis(50), 1, Millis(20), Millis(20) };

	// 전환기: 한 건씩, 재시도 + 위치 확인
	Millis switch_gap{ 200 };
	int max_retries = 3;
	Millis retry_base{ 500 };   ///< attempt i(>0) 전 대기 = retry_base * i
	Millis verify_timeout{ 2000 };
	Millis verify_poll{ 100 };
	TxProfile switch_tx{ Millis(100), 2, Millis(100), Millis(200) };
};

// 중단 가능한 대기 (stop 시 즉시 깨어남)
class StopToken {
public:
	/** @brief d 동안 대기. stop으로 깨어나면 false */
	bool sleep_for(Millis d);
	void request_stop();
	void reset() { stop_.store(false); }
	bool stop_requested() const { return stop_.load(); }
private:
	std::mutex m_;
	std::condition_variable cv_;
	std::atomic_bool stop_{ false };
};

/**
* 열차 명령 파이프라인.
* fire-and-forget: 큐에 넣으면 바로 반환, 드레인 스레드가 최대 train_batch개씩 송신한다.
* start 전 명령은 막히지 않고 큐 용량까지만 쌓인다. stop 후에는 Stopped.
* 신뢰도 키는 "MOTOR", 송신 버스트가 끝나면 성공.
*/
class TrainPipeline {
public:
	TrainPipeline(RadioAccess& radio, DeviceRegistry& registry, const PipelineConfig& cfg);
	~TrainPipeline();

	/** @brief 드레인 스레드 시작. stop 이후 다시 호출 가능. 스레드 생성 실패 시 Io */
	HubErr start();
	void stop();
	bool running() const { return running_.load(); }

	/** @brief power는 -100..100으로 클램프 후 큐잉 */
	HubErr enqueue_power(int channel, int power);
	HubErr enqueue_self_drive(int channel, bool enabled);

	size_t pending() const { return q_.size(); }

	static constexpr const char* kReliabilityKey = "MOTOR";

private:
	HubErr admit(int channel);
	HubErr push(Command cmd);
	void run();
	void send(const Command& cmd);

	RadioAccess& radio_;
	DeviceRegistry& reg_;
	PipelineConfig cfg_;
	MsgQueue<Command> q_;
	StopToken stop_;
	std::thread th_;
	std::atomic_bool running_{ false };
};

struct SwitchJob {
	Command cmd;
	std::promise<HubErr> done;
};

/**
* 선로전환기 명령 파이프라인.
* Queued → Sending → Verifying → {Succeeded | Exhausted}
* 호출자는 결과(future)를 기다린다. 시도마다 attempts++, 확인되면 successes++.
* 드레인 스레드가 없을 때(start 전/stop 후) 제출하면 바로 Stopped.
*/
class SwitchPipeline {
public:
	SwitchPipeline(RadioAccess& radio, DeviceRegistry& registry, const PipelineConfig& cfg);
	~SwitchPipeline();

	HubErr start();
	void stop();
	bool running() const { return running_.load(); }

	/** @brief 큐잉 후 결과 future. 검증 실패는 즉시 준비된 future로 반환 */
	std::future<HubErr> submit_switch(int channel, Port port, SwitchPosition position);
	/** @brief submit_switch + 완료 대기 */
	HubErr enqueue_switch(int channel, Port port, SwitchPosition position);

	size_t pending() const { return q_.size(); }

private:
	void run();
	HubErr process(const Command& cmd);

	RadioAccess& radio_;
	DeviceRegistry& reg_;
	PipelineConfig cfg_;
	MsgQueue<SwitchJob> q_;
	StopToken stop_;
	std::thread th_;
	std::atomic_bool running_{ false };
};

} // namespace hubcast
