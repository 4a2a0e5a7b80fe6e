#include "matrix.hpp"
#include "matrix_protocol.hpp"

#include <chrono>
#include <sstream>
#include <thread>

using std::string;
using std::stringstream;
using std::vector;

const char *matrixErrorStr(MatrixError error) {
	switch (error) {
		case MATRIX_OK:                 return "ok";
		case MATRIX_UNKNOWN_ZONE:       return "unknown zone";
		case MATRIX_UNKNOWN_SOURCE:     return "unknown source";
		case MATRIX_DEVICE_UNREACHABLE: return "device unreachable";
		case MATRIX_DEVICE_ERROR:       return "device error";
		case MATRIX_BUSY:               return "busy";
	}

	return "unknown error";
}

DeviceState::DeviceState() :
	powerKnown(false), isOn(false) {
	for (int i = 0; i < MATRIX_MAX_PORTS; i++) {
		sources[i] = 0;
	}
}

int DeviceState::sourceOf(int zone) const {
	if (zone < 1 || zone > MATRIX_MAX_PORTS) {
		return 0;
	}

	return sources[zone - 1];
}

static bool sameState(const DeviceState &a, const DeviceState &b) {
	if (a.powerKnown != b.powerKnown || a.isOn != b.isOn) {
		return false;
	}

	for (int i = 0; i < MATRIX_MAX_PORTS; i++) {
		if (a.sources[i] != b.sources[i]) {
			return false;
		}
	}

	return true;
}

HdmiMatrix::PendingCommand::PendingCommand(std::atomic<int> &pending) :
	pending(pending) {
	pending++;
}

HdmiMatrix::PendingCommand::~PendingCommand() {
	pending--;
}

HdmiMatrix::HdmiMatrix(Logger &logger, const MatrixConfig &config, MatrixTransport &transport) :
	logger(logger), config(config), transport(transport),
	pendingCommands(0),
	sentCount(0), failedCount(0) {
}

MatrixError HdmiMatrix::route(const string &zoneName, const string &sourceName) {
	int zone = config.zoneId(zoneName);
	if (zone == 0) {
		logger.error("Unknown zone: '" + zoneName + "'");
		return MATRIX_UNKNOWN_ZONE;
	}

	int source = config.sourceId(sourceName);
	if (source == 0) {
		logger.error("Unknown source: '" + sourceName + "'");
		return MATRIX_UNKNOWN_SOURCE;
	}

	stringstream log;
	log << "Routing " << sourceName << " (input " << source << ") to " << zoneName << " (output " << zone << ")";
	logger.debug(log.str());

	PendingCommand pending(pendingCommands);
	std::lock_guard<std::mutex> connection(connectionLock);

	// the matrix ignores switch instructions while it's off, so wake it up for the duration
	bool wake = false;
	if (config.powerOnForRoute) {
		DeviceState current = getState();
		wake = current.powerKnown && !current.isOn;
	}

	if (wake) {
		logger.info("Matrix is off; powering on to switch " + zoneName);

		MatrixError result = powerLocked(true);
		if (result != MATRIX_OK) {
			return result;
		}
	}

	MatrixError result = switchLocked(zone, source);

	if (wake) {
		if (powerLocked(false) != MATRIX_OK) {
			logger.warning("Couldn't power the matrix back off after switching " + zoneName);
		}
	}

	return result;
}

MatrixError HdmiMatrix::queryState(DeviceState &result) {
	PendingCommand pending(pendingCommands);
	std::lock_guard<std::mutex> connection(connectionLock);

	return queryLocked(result);
}

MatrixError HdmiMatrix::setPower(bool on) {
	logger.debug(on ? "Turning matrix on..." : "Turning matrix off...");

	PendingCommand pending(pendingCommands);
	std::lock_guard<std::mutex> connection(connectionLock);

	return powerLocked(on);
}

MatrixError HdmiMatrix::poll() {
	if (pendingCommands > 0) {
		return MATRIX_BUSY;
	}

	std::unique_lock<std::mutex> connection(connectionLock, std::try_to_lock);
	if (!connection.owns_lock()) {
		return MATRIX_BUSY;
	}

	DeviceState result;
	return queryLocked(result);
}

MatrixError HdmiMatrix::readPortNames(vector<string> &zoneNames, vector<string> &sourceNames) {
	PendingCommand pending(pendingCommands);
	std::lock_guard<std::mutex> connection(connectionLock);

	string reply, error;

	MatrixError result = exchange(MATRIX_CMD_GET_OUTPUT_STATUS, MatrixProtocol::encodeQuery(MATRIX_CMD_GET_OUTPUT_STATUS), reply);
	if (result != MATRIX_OK) {
		return result;
	}

	if (!MatrixProtocol::decodeNames(reply, MATRIX_CMD_GET_OUTPUT_STATUS, "name", zoneNames, error)) {
		logger.error("Couldn't read output names: " + error);
		failedCount++;
		return MATRIX_DEVICE_ERROR;
	}

	result = exchange(MATRIX_CMD_GET_INPUT_STATUS, MatrixProtocol::encodeQuery(MATRIX_CMD_GET_INPUT_STATUS), reply);
	if (result != MATRIX_OK) {
		return result;
	}

	if (!MatrixProtocol::decodeNames(reply, MATRIX_CMD_GET_INPUT_STATUS, "inname", sourceNames, error)) {
		logger.error("Couldn't read input names: " + error);
		failedCount++;
		return MATRIX_DEVICE_ERROR;
	}

	return MATRIX_OK;
}

MatrixError HdmiMatrix::switchLocked(int zone, int source) {
	MatrixError result = sendAck(MATRIX_CMD_VIDEO_SWITCH, MatrixProtocol::encodeVideoSwitch(zone, source));
	if (result != MATRIX_OK) {
		return result;
	}

	updateState([zone, source](DeviceState &s) {
		s.sources[zone - 1] = source;
	});

	return MATRIX_OK;
}

MatrixError HdmiMatrix::powerLocked(bool on) {
	MatrixError result = sendAck(MATRIX_CMD_SET_POWER, MatrixProtocol::encodePower(on));
	if (result != MATRIX_OK) {
		return result;
	}

	updateState([on](DeviceState &s) {
		s.powerKnown = true;
		s.isOn = on;
	});

	logger.info(on ? "Matrix powered on" : "Matrix powered off");

	if (on && config.powerOnSettleMs > 0) {
		// keep hold of the connection while the matrix boots so nothing else talks to it
		std::this_thread::sleep_for(std::chrono::milliseconds(config.powerOnSettleMs));
	}

	return MATRIX_OK;
}

MatrixError HdmiMatrix::queryLocked(DeviceState &result) {
	string reply, error;

	MatrixError status = exchange(MATRIX_CMD_GET_STATUS, MatrixProtocol::encodeQuery(MATRIX_CMD_GET_STATUS), reply);
	if (status != MATRIX_OK) {
		return status;
	}

	bool on;
	if (!MatrixProtocol::decodePower(reply, on, error)) {
		logger.error("Bad status reply: " + error);
		failedCount++;
		return MATRIX_DEVICE_ERROR;
	}

	status = exchange(MATRIX_CMD_GET_OUTPUT_STATUS, MatrixProtocol::encodeQuery(MATRIX_CMD_GET_OUTPUT_STATUS), reply);
	if (status != MATRIX_OK) {
		return status;
	}

	vector<int> routing;
	if (!MatrixProtocol::decodeRouting(reply, routing, error)) {
		logger.error("Bad output status reply: " + error);
		failedCount++;
		return MATRIX_DEVICE_ERROR;
	}

	// only now that both halves came back do we touch the cached state
	updateState([on, &routing](DeviceState &s) {
		s.powerKnown = true;
		s.isOn = on;

		for (int i = 0; i < MATRIX_MAX_PORTS; i++) {
			int source = i < (int)routing.size() ? routing[i] : 0;
			s.sources[i] = (source >= 1 && source <= MATRIX_MAX_PORTS) ? source : 0;
		}
	});

	result = getState();
	return MATRIX_OK;
}

MatrixError HdmiMatrix::exchange(const char *comhead, const string &instr, string &reply) {
	logger.commSent(instr);
	sentCount++;

	string raw;
	TransportResult sent = transport.exchange(MatrixProtocol::frameRequest(config.host, config.port, instr), raw, config.timeoutMs);

	if (sent != TRANSPORT_OK) {
		failedCount++;

		stringstream log;
		log << "'" << comhead << "' failed: " << transportResultStr(sent);
		logger.error(log.str());

		// an oversized reply means the matrix answered, just with garbage
		return sent == TRANSPORT_OVERFLOW ? MATRIX_DEVICE_ERROR : MATRIX_DEVICE_UNREACHABLE;
	}

	int httpStatus = 0;
	if (!MatrixProtocol::parseHttpResponse(raw, httpStatus, reply)) {
		failedCount++;
		logger.error(string("Garbled reply to '") + comhead + "'");
		return MATRIX_DEVICE_ERROR;
	}

	logger.commRecv(reply);

	if (httpStatus != 200) {
		failedCount++;

		stringstream log;
		log << "Matrix rejected '" << comhead << "' with HTTP " << httpStatus;
		logger.error(log.str());
		return MATRIX_DEVICE_ERROR;
	}

	return MATRIX_OK;
}

MatrixError HdmiMatrix::sendAck(const char *comhead, const string &instr) {
	string reply, error;

	MatrixError result = exchange(comhead, instr, reply);
	if (result != MATRIX_OK) {
		return result;
	}

	if (!MatrixProtocol::decodeAck(reply, comhead, error)) {
		failedCount++;
		logger.error(string("Bad acknowledgement for '") + comhead + "': " + error);
		return MATRIX_DEVICE_ERROR;
	}

	return MATRIX_OK;
}

void HdmiMatrix::updateState(std::function<void(DeviceState &)> change) {
	DeviceState snapshot;
	std::list<std::function<void(const DeviceState &)>> toNotify;

	{
		std::lock_guard<std::mutex> guard(stateLock);

		DeviceState before = state;
		change(state);

		if (sameState(before, state)) {
			return;
		}

		snapshot = state;
		toNotify = listeners;
	}

	for (auto it = toNotify.begin(); it != toNotify.end(); it++) {
		(*it)(snapshot);
	}
}

DeviceState HdmiMatrix::getState() {
	std::lock_guard<std::mutex> guard(stateLock);
	return state;
}

const MatrixConfig &HdmiMatrix::getConfig() const {
	return config;
}

string HdmiMatrix::getZoneSource(const string &zoneName) {
	int zone = config.zoneId(zoneName);
	if (zone == 0) {
		return "";
	}

	return config.sourceName(getState().sourceOf(zone));
}

void HdmiMatrix::addListener(std::function<void(const DeviceState &)> listener) {
	std::lock_guard<std::mutex> guard(stateLock);
	listeners.push_back(listener);
}

void HdmiMatrix::getStats(long &sent, long &failed) {
	sent = sentCount;
	failed = failedCount;
}
