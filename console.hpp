#ifndef CONSOLE_HPP
#define CONSOLE_HPP

#include "entities.hpp"
#include "logger.hpp"
#include "matrix.hpp"
#include "poller.hpp"

#include <mutex>
#include <ostream>
#include <string>

/**
 * Line-oriented JSON control surface for the host platform, spoken over stdin/stdout. Each
 * request line is a JSON object naming a "service"; each gets exactly one JSON reply line.
 * Status documents are published whenever the matrix state changes and every
 * `publishIntervalMs` regardless.
 */
class ConsoleSupport {
public:

	ConsoleSupport(
		Logger &logger, HdmiMatrix &matrix, MatrixPoller &poller, MatrixEntities &entities,
		std::ostream &out,
		long publishIntervalMs
	);

	void setup();
	void loop();

	// handle one request line and write the reply
	void handleLine(const std::string &line);

	// the reply to a request line, without writing it anywhere
	std::string handleCommand(const std::string &line);

	void publishStatus();
	std::string getStatusJson();

private:

	Logger &logger;
	HdmiMatrix &matrix;
	MatrixPoller &poller;
	MatrixEntities &entities;
	std::ostream &out;

	std::mutex outLock;
	long publishInterval;
	long nextPublish;

	void writeLine(const std::string &line);
};

#endif
