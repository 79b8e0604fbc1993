#include "hubcast/pipeline.hpp"
#include "hubcast/log_sink.hpp"

#include <system_error>
#include <vector>

namespace hubcast {

// ===== StopToken =====

bool StopToken::sleep_for(Millis d) {
	std::unique_lock<std::mutex> lk(m_);
	return !cv_.wait_for(lk, d, [&] { return stop_.load(); });
}

void StopToken::request_stop() {
	{ std::lock_guard<std::mutex> lk(m_); stop_.store(true); }
	cv_.notify_all();
}

static std::future<HubErr> ready(HubErr e) {
	std::promise<HubErr> p;
	p.set_value(e);
	return p.get_future();
}

// ===== Train =====

TrainPipeline::TrainPipeline(RadioAccess& radio, DeviceRegistry& registry, const PipelineConfig& cfg)
	: radio_(radio), reg_(registry), cfg_(cfg), q_(cfg.queue_capacity) {}

TrainPipeline::~TrainPipeline() { stop(); }

HubErr TrainPipeline::start() {
	if (th_.joinable()) return HubErr::Ok;
	stop_.reset();
	q_.reopen();
	try {
		th_ = std::thread(&TrainPipeline::run, this);
	}
	catch (const std::system_error& e) {
		log_error("TRAIN", std::string("drain thread failed: ") + e.what());
		q_.shutdown();
		return HubErr::Io;
	}
	running_.store(true);
	return HubErr::Ok;
}

void TrainPipeline::stop() {
	running_.store(false);
	stop_.request_stop();
	q_.shutdown();
	if (th_.joinable()) th_.join();
	size_t dropped = 0;
	q_.drain([&](Command&) { dropped++; });
	if (dropped) log_warn("TRAIN", "dropped " + std::to_string(dropped) + " queued command(s) on stop");
}

HubErr TrainPipeline::admit(int channel) {
	if (!valid_channel(channel)) return HubErr::InvalidCommand;
	if (!reg_.contains(channel, HubKind::Train)) return HubErr::UnknownDevice;
	return HubErr::Ok;
}

HubErr TrainPipeline::enqueue_power(int channel, int power) {
	HubErr e = admit(channel);
	if (e != HubErr::Ok) return e;
	reg_.mark_active(channel, Clock::now());
	return push(Command::set_power(channel, clamp_power(power)));
}

HubErr TrainPipeline::enqueue_self_drive(int channel, bool enabled) {
	HubErr e = admit(channel);
	if (e != HubErr::Ok) return e;
	reg_.set_self_drive(channel, enabled);
	reg_.mark_active(channel, Clock::now());
	return push(Command::set_self_drive(channel, enabled));
}

HubErr TrainPipeline::push(Command cmd) {
	// 드레인 스레드가 없으면 back-pressure로 막히지 않게 한다
	const bool ok = running_.load() ? q_.push(std::move(cmd)) : q_.try_push(std::move(cmd));
	return ok ? HubErr::Ok : HubErr::Stopped;
}

void TrainPipeline::send(const Command& cmd) {
	bytes payload;
	HubErr e = PACK::command(cmd, payload, cfg_.manufacturer_id);
	if (e != HubErr::Ok) {
		log_error("TRAIN", cmd.describe() + " rejected: " + hub_err_str(e));
		return;
	}
	reg_.record_attempt(cmd.channel, kReliabilityKey);
	e = radio_.transmit(payload, cfg_.train_tx);
	if (e == HubErr::Ok) {
		reg_.record_success(cmd.channel, kReliabilityKey);
		log_debug("TRAIN", cmd.describe() + " sent");
	}
	else {
		log_warn("TRAIN", cmd.describe() + " failed: " + hub_err_str(e));
	}
}

void TrainPipeline::run() {
	log_info("TRAIN", "pipeline started");
	std::vector<Command> batch;
	batch.reserve(cfg_.train_batch > 0 ? cfg_.train_batch : 1);

	Command first;
	while (q_.pop(first)) {
		batch.clear();
		batch.push_back(first);
		Command next;
		while ((int)batch.size() < cfg_.train_batch && q_.try_pop(next)) batch.push_back(next);

		for (const auto& cmd : batch) send(cmd);

		if (!stop_.sleep_for(cfg_.train_batch_gap)) break;
	}
	log_info("TRAIN", "pipeline stopped");
}

// ===== Switch =====

SwitchPipeline::SwitchPipeline(RadioAccess& radio, DeviceRegistry& registry, const PipelineConfig& cfg)
	: radio_(radio), reg_(registry), cfg_(cfg), q_(cfg.queue_capacity) {}

SwitchPipeline::~SwitchPipeline() { stop(); }

HubErr SwitchPipeline::start() {
	if (th_.joinable()) return HubErr::Ok;
	stop_.reset();
	q_.reopen();
	try {
		th_ = std::thread(&SwitchPipeline::run, this);
	}
	catch (const std::system_error& e) {
		log_error("SWITCH", std::string("drain thread failed: ") + e.what());
		q_.shutdown();
		return HubErr::Io;
	}
	running_.store(true);
	return HubErr::Ok;
}

void SwitchPipeline::stop() {
	running_.store(false);
	stop_.request_stop();
	q_.shutdown();
	if (th_.joinable()) th_.join();
	q_.drain([](SwitchJob& job) { job.done.set_value(HubErr::Stopped); });
}

std::future<HubErr> SwitchPipeline::submit_switch(int channel, Port port, SwitchPosition position) {
	if (!valid_channel(channel) || static_cast<int>(position) > 1 || port_index(port) > 3)
		return ready(HubErr::InvalidCommand);
	if (!reg_.contains(channel, HubKind::Switch)) return ready(HubErr::UnknownDevice);
	if (!running_.load()) return ready(HubErr::Stopped);

	reg_.mark_active(channel, Clock::now());

	SwitchJob job;
	job.cmd = Command::set_switch(channel, port, position);
	std::future<HubErr> f = job.done.get_future();
	if (!q_.push(std::move(job))) return ready(HubErr::Stopped);
	return f;
}

HubErr SwitchPipeline::enqueue_switch(int channel, Port port, SwitchPosition position) {
	return submit_switch(channel, port, position).get();
}

HubErr SwitchPipeline::process(const Command& cmd) {
	bytes payload;
	HubErr e = PACK::command(cmd, payload, cfg_.manufacturer_id);
	if (e != HubErr::Ok) return e;

	const std::string key = switch_key(cmd.port);
	const int retries = cfg_.max_retries > 0 ? cfg_.max_retries : 1;
	HubErr last = HubErr::VerificationTimeout;

	for (int i = 0; i < retries; ++i) {
		if (i > 0) {
			log_info("SWITCH", cmd.describe() + " retry " + std::to_string(i) + "/" + std::to_string(retries - 1));
			if (!stop_.sleep_for(cfg_.retry_base * i)) break;
		}

		reg_.record_attempt(cmd.channel, key);
		e = radio_.transmit(payload, cfg_.switch_tx);
		if (e != HubErr::Ok) {
			last = HubErr::TransmitFailure;
			log_warn("SWITCH", cmd.describe() + " transmit failed: " + hub_err_str(e));
			continue;
		}

		if (reg_.wait_for_switch_position(cmd.channel, cmd.port, cmd.position,
			cfg_.verify_timeout, cfg_.verify_poll)) {
			reg_.record_success(cmd.channel, key);
			log_info("SWITCH", cmd.describe() + " confirmed (attempt " + std::to_string(i + 1) + ")");
			return HubErr::Ok;
		}
		last = HubErr::VerificationTimeout;
		log_warn("SWITCH", cmd.describe() + " not confirmed (attempt " + std::to_string(i + 1) + ")");
	}

	log_error("SWITCH", cmd.describe() + " abandoned: " + hub_err_str(last));
	return last;
}

void SwitchPipeline::run() {
	log_info("SWITCH", "pipeline started");
	SwitchJob job;
	while (q_.pop(job)) {
		job.done.set_value(process(job.cmd));
		if (!stop_.sleep_for(cfg_.switch_gap)) break;
	}
	log_info("SWITCH", "pipeline stopped");
}

} // namespace hubcast
