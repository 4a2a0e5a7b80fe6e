#include "poller.hpp"
#include "utils.hpp"

#include <chrono>
#include <sstream>

using std::stringstream;

MatrixPoller::MatrixPoller(Logger &logger, HdmiMatrix &matrix, long pollIntervalMs, int unavailableAfter) :
	logger(logger), matrix(matrix),
	pollInterval(pollIntervalMs), unavailableAfter(unavailableAfter),
	stopping(false),
	consecutiveFailures(0), unreachableStreak(0),
	// assume the best until proven otherwise
	available(true) {
}

MatrixPoller::~MatrixPoller() {
	stop();
}

void MatrixPoller::begin() {
	std::lock_guard<std::mutex> guard(lock);
	if (thread.joinable()) {
		return;
	}

	stopping = false;
	thread = std::thread(&MatrixPoller::run, this);
}

void MatrixPoller::stop() {
	{
		std::lock_guard<std::mutex> guard(lock);
		stopping = true;
	}

	wakeup.notify_all();

	if (thread.joinable()) {
		thread.join();
	}
}

void MatrixPoller::run() {
	std::unique_lock<std::mutex> guard(lock);

	while (!stopping) {
		guard.unlock();
		long wait = pollOnce();
		guard.lock();

		wakeup.wait_for(guard, std::chrono::milliseconds(wait), [this]() { return stopping; });
	}
}

long MatrixPoller::pollOnce() {
	MatrixError result = matrix.poll();

	bool changed = false;
	long wait = recordResult(result, changed);

	if (changed) {
		bool nowAvailable;
		std::list<std::function<void(bool)>> toNotify;
		{
			std::lock_guard<std::mutex> guard(lock);
			nowAvailable = available;
			toNotify = listeners;
		}

		for (auto it = toNotify.begin(); it != toNotify.end(); it++) {
			(*it)(nowAvailable);
		}
	}

	return wait;
}

long MatrixPoller::recordResult(MatrixError result, bool &changed) {
	std::lock_guard<std::mutex> guard(lock);

	if (result == MATRIX_BUSY) {
		// a command has the matrix; it'll tell us what changed, and we'll catch up next time
		logger.debug("Skipping poll, a command is in progress");
		return pollInterval;
	}

	if (result == MATRIX_OK) {
		if (!available) {
			logger.info("Matrix is responding again");
			changed = true;
		}

		consecutiveFailures = 0;
		unreachableStreak = 0;
		available = true;
		return pollInterval;
	}

	consecutiveFailures++;

	if (available && consecutiveFailures >= unavailableAfter) {
		stringstream log;
		log << "Matrix unavailable after " << consecutiveFailures << " failed polls";
		logger.error(log.str());
		available = false;
		changed = true;
	}

	if (result != MATRIX_DEVICE_UNREACHABLE) {
		// the matrix answered, just not sensibly; retrying sooner won't help
		unreachableStreak = 0;
		return pollInterval;
	}

	unreachableStreak++;

	long factor = 1;
	for (int i = 1; i < unreachableStreak && factor < POLLER_MAX_BACKOFF_FACTOR; i++) {
		factor *= 2;
	}

	long wait = pollInterval * factor;

	stringstream log;
	log << "Matrix unreachable, polling again in " << formatMillis(wait);
	logger.warning(log.str());

	return wait;
}

bool MatrixPoller::isAvailable() {
	std::lock_guard<std::mutex> guard(lock);
	return available;
}

int MatrixPoller::getConsecutiveFailures() {
	std::lock_guard<std::mutex> guard(lock);
	return consecutiveFailures;
}

void MatrixPoller::addListener(std::function<void(bool)> listener) {
	std::lock_guard<std::mutex> guard(lock);
	listeners.push_back(listener);
}
