#ifndef LOG_HPP
#define LOG_HPP

// default number of log entries to keep is 32, messages beyond this get purged
#define LOG_ENTRIES 32

#include <deque>
#include <functional>
#include <list>
#include <mutex>
#include <string>

enum LogEntryType {
	// various remark levels
	DEBUG_LOG, INFO_LOG, WARNING_LOG, ERROR_LOG,

	// special types for instructions sent to and replies received from the matrix
	COMM_SENT, COMM_RECV,
};

struct LogEntry {
	LogEntry(LogEntryType type, std::string entry);

	LogEntryType type;
	std::string entry;
};

/**
 * Logger that manages a rotating log of the last `LOG_ENTRIES` entries. This is available for
 * display (e.g., through the console `log` service), can optionally be echoed to stderr, and can
 * also be subscribed to externally.
 *
 * The matrix router, the poller thread and the console all log through one instance, so every
 * method takes the internal lock. Listeners are called with the lock held and must not log.
 */
class Logger {
public:

	void addListener(std::function<void(LogEntry)> listener);

	void log(LogEntryType type, std::string entry);
	void debug(std::string entry);
	void info(std::string entry);
	void warning(std::string entry);
	void error(std::string entry);
	void commSent(std::string entry);
	void commRecv(std::string entry);

	void foreach(std::function<void(LogEntry)> f);

	static const char *prefix(LogEntryType type);

private:

	std::mutex lock;
	std::list<std::function<void(LogEntry)>> listeners;
	std::deque<LogEntry> entries;

	void trimLog();
};

#endif
