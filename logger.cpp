#include "logger.hpp"

LogEntry::LogEntry(LogEntryType type, std::string entry) :
	type(type), entry(entry) {
}

void Logger::addListener(std::function<void(LogEntry)> listener) {
	std::lock_guard<std::mutex> guard(lock);
	listeners.push_back(listener);
}

void Logger::log(LogEntryType type, std::string entry) {
	LogEntry logEntry(type, entry);

	std::lock_guard<std::mutex> guard(lock);

	entries.push_back(logEntry);
	trimLog();

	for (auto it = listeners.begin(); it != listeners.end(); it++) {
		(*it)(logEntry);
	}
}

void Logger::trimLog() {
	while (entries.size() > LOG_ENTRIES) {
		entries.pop_front();
	}
}

void Logger::debug(std::string entry) { log(DEBUG_LOG, entry); }
void Logger::info(std::string entry) { log(INFO_LOG, entry); }
void Logger::warning(std::string entry) { log(WARNING_LOG, entry); }
void Logger::error(std::string entry) { log(ERROR_LOG, entry); }
void Logger::commSent(std::string entry) { log(COMM_SENT, entry); }
void Logger::commRecv(std::string entry) { log(COMM_RECV, entry); }

void Logger::foreach(std::function<void(LogEntry)> f) {
	std::lock_guard<std::mutex> guard(lock);
	for (auto it = entries.begin(); it != entries.end(); it++) {
		f(*it);
	}
}

const char *Logger::prefix(LogEntryType type) {
	switch (type) {
		case DEBUG_LOG:   return "DEBUG ";
		case INFO_LOG:    return "INFO  ";
		case WARNING_LOG: return "WARN  ";
		case ERROR_LOG:   return "ERROR ";
		case COMM_SENT:   return "  >>  ";
		case COMM_RECV:   return "  <<  ";
	}

	return "      ";
}
