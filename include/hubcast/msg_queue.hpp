#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace hubcast {

// 용량 제한 FIFO. 가득 차면 push가 자리가 날 때까지 막힌다 (back-pressure).
template<typename T>
class MsgQueue {
public:
	explicit MsgQueue(size_t capacity = 64) : cap_(capacity ? capacity : 1) {}

	/** @brief shutdown 이후면 false (값은 버려짐) */
	bool push(T v) {
		{
			std::unique_lock<std::mutex> lk(m_);
			not_full_.wait(lk, [&] { return stop_ || q_.size() < cap_; });
			if (stop_) return false;
			q_.push_back(std::move(v));
		}
		not_empty_.notify_one();
		return true;
	}
	/** @brief 자리가 없거나 shutdown 이후면 바로 false */
	bool try_push(T v) {
		{
			std::lock_guard<std::mutex> lk(m_);
			if (stop_ || q_.size() >= cap_) return false;
			q_.push_back(std::move(v));
		}
		not_empty_.notify_one();
		return true;
	}
	/** @brief 값이 올 때까지 대기. shutdown되고 비어 있으면 false */
	bool pop(T& out) {
		std::unique_lock<std::mutex> lk(m_);
		not_empty_.wait(lk, [&] { return stop_ || !q_.empty(); });
		if (stop_ || q_.empty()) return false;
		out = std::move(q_.front()); q_.pop_front();
		lk.unlock();
		not_full_.notify_one();
		return true;
	}
	bool try_pop(T& out) {
		std::unique_lock<std::mutex> lk(m_);
		if (stop_ || q_.empty()) return false;
		out = std::move(q_.front()); q_.pop_front();
		lk.unlock();
		not_full_.notify_one();
		return true;
	}
	void shutdown() {
		{ std::lock_guard<std::mutex> lk(m_); stop_ = true; }
		not_empty_.notify_all();
		not_full_.notify_all();
	}
	/** @brief shutdown 해제 (소비자 재시작 전) */
	void reopen() {
		std::lock_guard<std::mutex> lk(m_);
		stop_ = false;
	}
	/** @brief shutdown 후 남은 항목 회수 */
	template<typename Fn>
	void drain(Fn&& fn) {
		std::deque<T> rest;
		{ std::lock_guard<std::mutex> lk(m_); rest.swap(q_); }
		not_full_.notify_all();
		for (auto& v : rest) fn(v);
	}
	size_t size() const { std::lock_guard<std::mutex> lk(m_); return q_.size(); }
	size_t capacity() const { return cap_; }
	bool stopped() const { std::lock_guard<std::mutex> lk(m_); return stop_; }

private:
	std::deque<T> q_;
	const size_t cap_;
	mutable std::mutex m_;
	std::condition_variable not_empty_;
	std::condition_variable not_full_;
	bool stop_ = false;
};

} // namespace hubcast
