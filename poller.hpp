#ifndef POLLER_HPP
#define POLLER_HPP

// back off up to 8x the poll interval while the matrix is unreachable
#define POLLER_MAX_BACKOFF_FACTOR 8

#include "logger.hpp"
#include "matrix.hpp"

#include <condition_variable>
#include <functional>
#include <list>
#include <mutex>
#include <thread>

/**
 * Background refresh of the matrix state. The matrix can be switched from its front panel or
 * its IR remote, so we can't rely on our own commands to know what it's doing.
 *
 * Polls run on their own thread every `pollIntervalMs`. A poll that collides with a command is
 * simply skipped until the next interval. While the matrix is unreachable the wait doubles each
 * time (capped at POLLER_MAX_BACKOFF_FACTOR intervals). After `unavailableAfter` failed polls in
 * a row the matrix is reported unavailable until a poll succeeds again.
 */
class MatrixPoller {
public:

	MatrixPoller(Logger &logger, HdmiMatrix &matrix, long pollIntervalMs, int unavailableAfter);
	~MatrixPoller();

	MatrixPoller(const MatrixPoller &) = delete;
	MatrixPoller &operator=(const MatrixPoller &) = delete;

	void begin();
	void stop();

	// run one poll cycle now; returns how long to wait before the next one
	long pollOnce();

	bool isAvailable();
	int getConsecutiveFailures();

	// called with the new availability whenever it flips
	void addListener(std::function<void(bool)> listener);

private:

	Logger &logger;
	HdmiMatrix &matrix;
	long pollInterval;
	int unavailableAfter;

	std::thread thread;
	std::mutex lock;
	std::condition_variable wakeup;
	bool stopping;

	int consecutiveFailures;
	int unreachableStreak;
	bool available;
	std::list<std::function<void(bool)>> listeners;

	void run();
	long recordResult(MatrixError result, bool &changed);
};

#endif
