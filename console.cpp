#include "console.hpp"
#include "config.h"
#include "utils.hpp"
#include "version.h"

#include <cstring>
#include <sstream>
#include <vector>

#include <strings.h>

#include <ArduinoJson.h>

using std::string;
using std::stringstream;
using std::vector;

static string replyOk() {
	return "{\"result\":\"ok\"}";
}

static string replyError(const char *error) {
	StaticJsonDocument<256> reply;

	reply["result"] = "error";
	reply["error"] = error;

	string json;
	serializeJson(reply, json);
	return json;
}

static string replyFor(MatrixError result) {
	return result == MATRIX_OK ? replyOk() : replyError(matrixErrorStr(result));
}

ConsoleSupport::ConsoleSupport(
	Logger &logger, HdmiMatrix &matrix, MatrixPoller &poller, MatrixEntities &entities,
	std::ostream &out,
	long publishIntervalMs
) : logger(logger), matrix(matrix), poller(poller), entities(entities),
	out(out),
	publishInterval(publishIntervalMs), nextPublish(0) {
}

void ConsoleSupport::setup() {
	matrix.addListener([this](const DeviceState &) {
		publishStatus();
	});

	// "available" is part of the status too
	poller.addListener([this](bool) {
		publishStatus();
	});

	nextPublish = millis() + publishInterval;
}

void ConsoleSupport::loop() {
	auto now = millis();
	if (now >= nextPublish) {
		publishStatus();
		nextPublish = now + publishInterval;
	}
}

void ConsoleSupport::handleLine(const string &line) {
	if (line.empty()) {
		return;
	}

	writeLine(handleCommand(line));
}

string ConsoleSupport::handleCommand(const string &line) {
	DynamicJsonDocument request(1024);

	DeserializationError err = deserializeJson(request, line);
	if (err) {
		logger.error(string("Ignoring request that isn't JSON: ") + err.c_str());
		return replyError("request is not valid JSON");
	}

	JsonObjectConst req = request.as<JsonObjectConst>();
	const char *service = req["service"];
	if (service == NULL) {
		return replyError("request has no 'service'");
	}

	if (strcasecmp(service, "set_zone") == 0) {
		const char *source = req["source"];
		if (source == NULL) {
			return replyError("set_zone needs a 'source'");
		}

		// entity_id may be one id, a list of ids, or left out to mean every zone
		vector<string> entityIds;
		JsonVariantConst ids = req["entity_id"];
		if (ids.is<const char *>()) {
			entityIds.push_back(ids.as<const char *>());
		} else if (ids.is<JsonArrayConst>()) {
			for (JsonVariantConst id : ids.as<JsonArrayConst>()) {
				if (id.is<const char *>()) {
					entityIds.push_back(id.as<const char *>());
				}
			}
		}

		return replyFor(entities.setZone(entityIds, source));
	}

	if (strcasecmp(service, "route") == 0) {
		const char *zone = req["zone"];
		const char *source = req["source"];
		if (zone == NULL || source == NULL) {
			return replyError("route needs a 'zone' and a 'source'");
		}

		return replyFor(matrix.route(zone, source));
	}

	if (strcasecmp(service, "power") == 0) {
		JsonVariantConst state = req["state"];
		bool on;

		if (state.is<bool>()) {
			on = state.as<bool>();
		} else if (state.is<const char *>()) {
			const char *val = state.as<const char *>();
			on = strcasecmp(val, "on") == 0 || strcasecmp(val, "true") == 0;
		} else {
			return replyError("power needs a 'state'");
		}

		return replyFor(on ? entities.getPowerSwitch().turnOn() : entities.getPowerSwitch().turnOff());
	}

	if (strcasecmp(service, "refresh") == 0) {
		DeviceState state;
		return replyFor(matrix.queryState(state));
	}

	if (strcasecmp(service, "status") == 0) {
		return getStatusJson();
	}

	if (strcasecmp(service, "log") == 0) {
		vector<string> lines;
		size_t textSize = 0;

		logger.foreach([&lines, &textSize](LogEntry entry) {
			lines.push_back(string(Logger::prefix(entry.type)) + entry.entry);
			textSize += lines.back().size() + 1;
		});

		// comm entries can hold whole replies, so size the document from what's in the ring
		DynamicJsonDocument reply(JSON_OBJECT_SIZE(1) + JSON_ARRAY_SIZE(lines.size()) + textSize + 64);
		JsonArray entries = reply.createNestedArray("log");

		for (auto it = lines.begin(); it != lines.end(); it++) {
			entries.add(*it);
		}

		if (reply.overflowed()) {
			logger.warning("Log dump was truncated");
		}

		string json;
		serializeJson(reply, json);
		return json;
	}

	if (strcasecmp(service, "about") == 0) {
		StaticJsonDocument<128> reply;

		reply["name"] = CLIENT_NAME;
		reply["version"] = VERSION;

		string json;
		serializeJson(reply, json);
		return json;
	}

	logger.error(string("Unknown service: ") + service);
	return replyError("unknown service");
}

string ConsoleSupport::getStatusJson() {
	DynamicJsonDocument status(2048);

	DeviceState state = matrix.getState();
	const MatrixConfig &config = matrix.getConfig();

	if (state.powerKnown) {
		status["power"] = state.isOn;
	} else {
		status["power"] = (const char *)NULL;
	}

	status["available"] = poller.isAvailable();

	JsonObject zones = status.createNestedObject("zones");
	vector<int> ids = config.zoneIds();
	for (auto it = ids.begin(); it != ids.end(); it++) {
		string source = config.sourceName(state.sourceOf(*it));

		if (source.empty()) {
			zones[config.zoneName(*it)] = (const char *)NULL;
		} else {
			zones[config.zoneName(*it)] = source;
		}
	}

	long sent, failed;
	matrix.getStats(sent, failed);
	status["sent"] = sent;
	status["failed"] = failed;

	string json;
	serializeJson(status, json);
	return json;
}

void ConsoleSupport::publishStatus() {
	writeLine(getStatusJson());
}

void ConsoleSupport::writeLine(const string &line) {
	std::lock_guard<std::mutex> guard(outLock);
	out << line << std::endl;
}
