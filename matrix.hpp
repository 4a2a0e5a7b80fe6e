#ifndef MATRIX_HPP
#define MATRIX_HPP

#include "logger.hpp"
#include "matrix_config.hpp"
#include "transport.hpp"

#include <atomic>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <vector>

enum MatrixError {
	MATRIX_OK,
	MATRIX_UNKNOWN_ZONE,
	MATRIX_UNKNOWN_SOURCE,
	MATRIX_DEVICE_UNREACHABLE,
	MATRIX_DEVICE_ERROR,
	// a poll was skipped because a command had the connection
	MATRIX_BUSY,
};

const char *matrixErrorStr(MatrixError error);

/**
 * What we last heard from the matrix. Nothing in here is ever guessed: it only changes when the
 * matrix acknowledges a command or answers a status query.
 */
struct DeviceState {
	DeviceState();

	bool powerKnown;
	bool isOn;

	// input routed to each output, indexed by zone id - 1; 0 while unknown
	int sources[MATRIX_MAX_PORTS];

	int sourceOf(int zone) const;
};

/**
 * Zone-Source Router for an HDMI matrix. Translates "route source S to zone Z" requests into
 * instructions for the matrix and keeps a cached copy of what the matrix last told us.
 *
 * The router owns the one connection to the matrix. Every instruction exchange happens with the
 * connection lock held, so commands from several zone entities queue up behind each other and
 * never interleave on the wire. Status polls are second-class: poll() gives up straight away if
 * a command is waiting for or holding the connection.
 */
class HdmiMatrix {
public:

	HdmiMatrix(Logger &logger, const MatrixConfig &config, MatrixTransport &transport);

	MatrixError route(const std::string &zoneName, const std::string &sourceName);
	MatrixError queryState(DeviceState &state);
	MatrixError setPower(bool on);

	// queryState() unless a command is pending, in which case MATRIX_BUSY
	MatrixError poll();

	// read the port names the matrix has been given on its own web UI
	MatrixError readPortNames(std::vector<std::string> &zoneNames, std::vector<std::string> &sourceNames);

	DeviceState getState();
	const MatrixConfig &getConfig() const;

	// source name currently routed to a zone, empty if not known
	std::string getZoneSource(const std::string &zoneName);

	// called with a snapshot every time the cached state changes
	void addListener(std::function<void(const DeviceState &)> listener);

	void getStats(long &sent, long &failed);

private:

	Logger &logger;
	const MatrixConfig &config;
	MatrixTransport &transport;

	// guards the transport; held for the whole of a command, including any power cycling
	std::mutex connectionLock;
	std::atomic<int> pendingCommands;

	std::mutex stateLock;
	DeviceState state;
	std::list<std::function<void(const DeviceState &)>> listeners;

	std::atomic<long> sentCount, failedCount;

	// marks a command as pending for as long as it is in scope
	struct PendingCommand {
		explicit PendingCommand(std::atomic<int> &pending);
		~PendingCommand();

		std::atomic<int> &pending;
	};

	MatrixError exchange(const char *comhead, const std::string &instr, std::string &reply);
	MatrixError sendAck(const char *comhead, const std::string &instr);

	// these expect connectionLock to be held
	MatrixError switchLocked(int zone, int source);
	MatrixError powerLocked(bool on);
	MatrixError queryLocked(DeviceState &result);

	void updateState(std::function<void(DeviceState &)> change);
};

#endif
