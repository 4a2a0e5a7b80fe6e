/** HDMI matrix bridge.
 * This bridge talks to an 8x8 HDMI matrix switch over its network interface and presents its
 * zones (outputs) and sources (inputs) to a smart-home host as a power switch plus one media
 * player per zone. The host drives it with JSON lines on stdin and gets status back on stdout.
 */

#include "config.h"

#include <iostream>
#include <string>
#include <vector>

#include <csignal>
#include <cerrno>
#include <poll.h>
#include <unistd.h>

#include "console.hpp"
#include "entities.hpp"
#include "logger.hpp"
#include "matrix.hpp"
#include "matrix_config.hpp"
#include "poller.hpp"
#include "tcp_transport.hpp"

using std::string;
using std::vector;

// set up logging
Logger logger;

static volatile sig_atomic_t running = 1;

static void onSignal(int) {
	running = 0;
}

static void installSignalHandlers() {
	struct sigaction action;
	action.sa_handler = onSignal;
	sigemptyset(&action.sa_mask);
	// no SA_RESTART, so a signal wakes up the poll() in the main loop
	action.sa_flags = 0;

	sigaction(SIGINT, &action, NULL);
	sigaction(SIGTERM, &action, NULL);
}

static void readPortNames(MatrixConfig &config, MatrixTransport &transport) {
	// the real router only ever sees the finished configuration, so ask through a throwaway one
	MatrixConfig nameConfig = config;
	HdmiMatrix nameReader(logger, nameConfig, transport);

	vector<string> zoneNames, sourceNames;
	if (nameReader.readPortNames(zoneNames, sourceNames) != MATRIX_OK) {
		logger.warning("Couldn't read port names from the matrix; using configured names only");
		return;
	}

	config.applyDeviceNames(zoneNames, sourceNames);
}

int main(int argc, char **argv) {
	const char *configPath = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;

	#ifdef CONSOLE_LOGGING
	logger.addListener([](LogEntry entry) {
		std::cerr << Logger::prefix(entry.type) << entry.entry << std::endl;
	});
	#endif

	MatrixConfig config;
	string error;
	if (!config.load(configPath, error)) {
		logger.error(error);
		return 1;
	}

	TcpTransport transport(logger, config.host, config.port);

	if (config.namesFromDevice) {
		readPortNames(config, transport);
	}
	config.applyDefaultNames();

	// from here on the configuration is fixed
	HdmiMatrix matrix(logger, config, transport);
	MatrixPoller poller(logger, matrix, config.pollIntervalSecs * 1000L, config.unavailableAfter);
	MatrixEntities entities(logger, matrix, poller);
	ConsoleSupport console(logger, matrix, poller, entities, std::cout, STATUS_INTERVAL);

	installSignalHandlers();

	console.setup();
	poller.begin();

	logger.info("Bridge started for matrix at " + config.host);

	string pending;
	bool stdinOpen = true;

	while (running) {
		struct pollfd pfd;
		pfd.fd = STDIN_FILENO;
		pfd.events = POLLIN;
		pfd.revents = 0;

		// keep waking up so the periodic status goes out even when the host is quiet
		int ready = poll(&pfd, stdinOpen ? 1 : 0, 250);

		if (ready > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
			char buffer[512];
			ssize_t n = read(STDIN_FILENO, buffer, sizeof(buffer));

			if (n > 0) {
				pending.append(buffer, n);

				size_t newline;
				while ((newline = pending.find('\n')) != string::npos) {
					string line = pending.substr(0, newline);
					pending.erase(0, newline + 1);

					if (!line.empty() && line[line.size() - 1] == '\r') {
						line.erase(line.size() - 1);
					}

					console.handleLine(line);
				}
			} else if (n == 0 || errno != EINTR) {
				// host went away; keep bridging until we're told to stop
				logger.info("Console input closed");
				stdinOpen = false;
			}
		}

		console.loop();
	}

	logger.info("Shutting down");
	poller.stop();

	return 0;
}
