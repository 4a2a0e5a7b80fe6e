#include "matrix_config.hpp"
#include "config.h"

#include <cstdlib>
#include <fstream>
#include <functional>
#include <sstream>

#include <ArduinoJson.h>

using std::string;
using std::stringstream;
using std::vector;

MatrixConfig::MatrixConfig() :
	host(DEFAULT_MATRIX_HOST), port(DEFAULT_MATRIX_PORT),
	timeoutMs(DEFAULT_TIMEOUT_MS),
	pollIntervalSecs(DEFAULT_POLL_INTERVAL),
	unavailableAfter(DEFAULT_UNAVAILABLE_AFTER),
	powerOnForRoute(false),
	powerOnSettleMs(DEFAULT_POWER_ON_SETTLE_MS),
	namesFromDevice(false) {
}

static bool parsePortId(const char *key, int &id) {
	char *end;
	long value = strtol(key, &end, 10);

	if (end == key || *end != 0 || value < 1 || value > MATRIX_MAX_PORTS) {
		return false;
	}

	id = (int)value;
	return true;
}

static bool parsePorts(JsonVariantConst ports, const char *kind, std::function<bool(int, const string &, string &)> add, string &error) {
	if (ports.isNull()) {
		return true;
	}

	if (!ports.is<JsonObjectConst>()) {
		stringstream msg;
		msg << "'" << kind << "s' must be an object keyed by port number";
		error = msg.str();
		return false;
	}

	for (JsonPairConst kv : ports.as<JsonObjectConst>()) {
		int id;
		if (!parsePortId(kv.key().c_str(), id)) {
			stringstream msg;
			msg << kind << " id '" << kv.key().c_str() << "' is not a number from 1 to " << MATRIX_MAX_PORTS;
			error = msg.str();
			return false;
		}

		// accept both {"1": {"name": "TV"}} and the shorthand {"1": "TV"}
		JsonVariantConst value = kv.value();
		const char *name = value.is<const char *>() ? value.as<const char *>() : value["name"].as<const char *>();

		if (!add(id, name != NULL ? name : "", error)) {
			return false;
		}
	}

	return true;
}

bool MatrixConfig::parse(const string &json, string &error) {
	DynamicJsonDocument doc(4096);

	DeserializationError err = deserializeJson(doc, json);
	if (err) {
		error = string("configuration is not valid JSON: ") + err.c_str();
		return false;
	}

	if (!doc.is<JsonObject>()) {
		error = "configuration must be a JSON object";
		return false;
	}

	JsonObjectConst root = doc.as<JsonObjectConst>();

	host = root["host"] | DEFAULT_MATRIX_HOST;
	port = root["port"] | DEFAULT_MATRIX_PORT;
	timeoutMs = root["timeout_ms"] | DEFAULT_TIMEOUT_MS;
	pollIntervalSecs = root["poll_interval"] | DEFAULT_POLL_INTERVAL;
	unavailableAfter = root["unavailable_after"] | DEFAULT_UNAVAILABLE_AFTER;
	powerOnForRoute = root["power_on_for_route"] | false;
	powerOnSettleMs = root["power_on_settle_ms"] | DEFAULT_POWER_ON_SETTLE_MS;
	namesFromDevice = root["names_from_device"] | false;

	if (host.empty()) {
		error = "'host' must not be empty";
		return false;
	}

	if (port < 1 || port > 65535) {
		error = "'port' must be between 1 and 65535";
		return false;
	}

	if (timeoutMs <= 0 || pollIntervalSecs <= 0 || unavailableAfter <= 0 || powerOnSettleMs < 0) {
		error = "timing options must be positive";
		return false;
	}

	using namespace std::placeholders;

	if (!parsePorts(root["zones"], "zone", std::bind(&MatrixConfig::addZone, this, _1, _2, _3), error)) {
		return false;
	}

	if (!parsePorts(root["sources"], "source", std::bind(&MatrixConfig::addSource, this, _1, _2, _3), error)) {
		return false;
	}

	return true;
}

bool MatrixConfig::load(const char *path, string &error) {
	std::ifstream in(path);
	if (!in) {
		// no file is fine, everything has a default
		return true;
	}

	stringstream contents;
	contents << in.rdbuf();

	if (!parse(contents.str(), error)) {
		error = string(path) + ": " + error;
		return false;
	}

	return true;
}

bool MatrixConfig::addPort(PortTable &table, const char *kind, int id, const string &name, string &error) {
	stringstream msg;

	if (id < 1 || id > MATRIX_MAX_PORTS) {
		msg << kind << " id " << id << " is out of range 1 to " << MATRIX_MAX_PORTS;
	} else if (name.empty()) {
		msg << kind << " " << id << " has an empty name";
	} else if (table.names.count(id) > 0) {
		msg << kind << " " << id << " is configured twice";
	} else if (table.ids.count(name) > 0) {
		msg << kind << " name '" << name << "' is used by both " << table.ids[name] << " and " << id;
	} else {
		table.names[id] = name;
		table.ids[name] = id;
		return true;
	}

	error = msg.str();
	return false;
}

bool MatrixConfig::addZone(int id, const string &name, string &error) {
	return addPort(zones, "zone", id, name, error);
}

bool MatrixConfig::addSource(int id, const string &name, string &error) {
	return addPort(sources, "source", id, name, error);
}

void MatrixConfig::applyDefaultNames() {
	string unused;

	if (zones.names.empty()) {
		for (int i = 1; i <= MATRIX_MAX_PORTS; i++) {
			addZone(i, "Output" + std::to_string(i), unused);
		}
	}

	if (sources.names.empty()) {
		for (int i = 1; i <= MATRIX_MAX_PORTS; i++) {
			addSource(i, "Input" + std::to_string(i), unused);
		}
	}
}

void MatrixConfig::applyNames(PortTable &table, vector<string> &names) {
	deduplicateNames(names);

	// only fill gaps; a configured name always wins
	for (size_t i = 0; i < names.size() && i < MATRIX_MAX_PORTS; i++) {
		int id = (int)i + 1;
		if (table.names.count(id) > 0 || names[i].empty() || table.ids.count(names[i]) > 0) {
			continue;
		}

		table.names[id] = names[i];
		table.ids[names[i]] = id;
	}
}

void MatrixConfig::applyDeviceNames(vector<string> zoneNames, vector<string> sourceNames) {
	applyNames(zones, zoneNames);
	applyNames(sources, sourceNames);
}

void MatrixConfig::deduplicateNames(vector<string> &names) {
	std::map<string, int> seen;

	for (size_t i = 0; i < names.size(); i++) {
		auto it = seen.find(names[i]);
		if (it == seen.end()) {
			seen[names[i]] = 0;
		} else {
			it->second++;
			names[i] = names[i] + "_" + std::to_string(it->second);
		}
	}
}

int MatrixConfig::zoneId(const string &name) const {
	auto it = zones.ids.find(name);
	return it != zones.ids.end() ? it->second : 0;
}

int MatrixConfig::sourceId(const string &name) const {
	auto it = sources.ids.find(name);
	return it != sources.ids.end() ? it->second : 0;
}

string MatrixConfig::zoneName(int id) const {
	auto it = zones.names.find(id);
	return it != zones.names.end() ? it->second : "";
}

string MatrixConfig::sourceName(int id) const {
	auto it = sources.names.find(id);
	return it != sources.names.end() ? it->second : "";
}

vector<int> MatrixConfig::zoneIds() const {
	vector<int> ids;
	for (auto it = zones.names.begin(); it != zones.names.end(); it++) {
		ids.push_back(it->first);
	}
	return ids;
}

vector<int> MatrixConfig::sourceIds() const {
	vector<int> ids;
	for (auto it = sources.names.begin(); it != sources.names.end(); it++) {
		ids.push_back(it->first);
	}
	return ids;
}

vector<string> MatrixConfig::sourceNames() const {
	vector<string> names;
	for (auto it = sources.names.begin(); it != sources.names.end(); it++) {
		names.push_back(it->second);
	}
	return names;
}
