#include "entities.hpp"

#include <cctype>
#include <set>
#include <sstream>

using std::string;
using std::stringstream;
using std::vector;

string slugify(const string &name) {
	string slug;
	bool pendingUnderscore = false;

	for (size_t i = 0; i < name.size(); i++) {
		unsigned char c = name[i];

		if (isalnum(c)) {
			if (pendingUnderscore && !slug.empty()) {
				slug += '_';
			}

			slug += (char)tolower(c);
			pendingUnderscore = false;
		} else {
			// runs of anything else collapse into one underscore
			pendingUnderscore = true;
		}
	}

	return slug;
}


MatrixPowerSwitch::MatrixPowerSwitch(HdmiMatrix &matrix, MatrixPoller &poller) :
	matrix(matrix), poller(poller) {
}

string MatrixPowerSwitch::getName() const {
	return matrix.getConfig().host + " Power Switch";
}

string MatrixPowerSwitch::getUniqueId() const {
	return matrix.getConfig().host + "-power-switch";
}

bool MatrixPowerSwitch::isAvailable() {
	return poller.isAvailable();
}

bool MatrixPowerSwitch::isOn() {
	DeviceState state = matrix.getState();
	return state.powerKnown && state.isOn;
}

MatrixError MatrixPowerSwitch::turnOn() {
	return matrix.setPower(true);
}

MatrixError MatrixPowerSwitch::turnOff() {
	return matrix.setPower(false);
}


MatrixZonePlayer::MatrixZonePlayer(HdmiMatrix &matrix, MatrixPoller &poller, int zoneId, const string &entityId) :
	matrix(matrix), poller(poller), zoneId(zoneId), entityId(entityId) {
}

int MatrixZonePlayer::getZoneId() const {
	return zoneId;
}

string MatrixZonePlayer::getName() const {
	return matrix.getConfig().zoneName(zoneId);
}

string MatrixZonePlayer::getUniqueId() const {
	stringstream id;
	id << matrix.getConfig().host << "-output-" << zoneId;
	return id.str();
}

string MatrixZonePlayer::getEntityId() const {
	return entityId;
}

string MatrixZonePlayer::getState() {
	if (!poller.isAvailable()) {
		return ENTITY_STATE_UNAVAILABLE;
	}

	DeviceState state = matrix.getState();
	return state.powerKnown && state.isOn ? ENTITY_STATE_ON : ENTITY_STATE_OFF;
}

string MatrixZonePlayer::getSource() {
	return matrix.getConfig().sourceName(matrix.getState().sourceOf(zoneId));
}

vector<string> MatrixZonePlayer::getSourceList() const {
	return matrix.getConfig().sourceNames();
}

string MatrixZonePlayer::getMediaTitle() {
	if (getState() == ENTITY_STATE_OFF) {
		return "Powered Off";
	}

	string source = getSource();
	if (source.empty()) {
		return getName();
	}

	return source + " on " + getName();
}

MatrixError MatrixZonePlayer::selectSource(const string &source) {
	return matrix.route(getName(), source);
}


MatrixEntities::MatrixEntities(Logger &logger, HdmiMatrix &matrix, MatrixPoller &poller) :
	logger(logger), powerSwitch(matrix, poller) {

	const MatrixConfig &config = matrix.getConfig();
	std::set<string> taken;

	vector<int> ids = config.zoneIds();
	for (auto it = ids.begin(); it != ids.end(); it++) {
		string slug = slugify(config.zoneName(*it));
		if (slug.empty()) {
			// nothing usable in the name, fall back to the output number
			stringstream fallback;
			fallback << "zone_" << *it;
			slug = fallback.str();
		}

		// names that only differ in case or punctuation get _2, _3, ...
		string entityId = "media_player." + slug;
		for (int n = 2; taken.count(entityId) > 0; n++) {
			stringstream suffixed;
			suffixed << "media_player." << slug << "_" << n;
			entityId = suffixed.str();
		}

		if (entityId != "media_player." + slug) {
			logger.warning("Zone '" + config.zoneName(*it) + "' clashes with another zone's entity id, using " + entityId);
		}

		taken.insert(entityId);
		zones.push_back(std::unique_ptr<MatrixZonePlayer>(new MatrixZonePlayer(matrix, poller, *it, entityId)));

		stringstream log;
		log << "Added entity " << zones.back()->getEntityId() << " (" << zones.back()->getUniqueId() << ")";
		logger.debug(log.str());
	}
}

MatrixPowerSwitch &MatrixEntities::getPowerSwitch() {
	return powerSwitch;
}

vector<std::unique_ptr<MatrixZonePlayer>> &MatrixEntities::getZones() {
	return zones;
}

MatrixZonePlayer *MatrixEntities::findZone(const string &entityId) {
	for (auto it = zones.begin(); it != zones.end(); it++) {
		if ((*it)->getEntityId() == entityId) {
			return it->get();
		}
	}

	return NULL;
}

MatrixError MatrixEntities::setZone(const vector<string> &entityIds, const string &source) {
	vector<MatrixZonePlayer *> targets;
	MatrixError firstError = MATRIX_OK;

	if (entityIds.empty()) {
		for (auto it = zones.begin(); it != zones.end(); it++) {
			targets.push_back(it->get());
		}
	} else {
		for (auto it = entityIds.begin(); it != entityIds.end(); it++) {
			MatrixZonePlayer *zone = findZone(*it);
			if (zone == NULL) {
				logger.error("set_zone: no zone entity " + *it);
				if (firstError == MATRIX_OK) {
					firstError = MATRIX_UNKNOWN_ZONE;
				}
				continue;
			}

			targets.push_back(zone);
		}
	}

	for (auto it = targets.begin(); it != targets.end(); it++) {
		MatrixError result = (*it)->selectSource(source);
		if (result != MATRIX_OK && firstError == MATRIX_OK) {
			firstError = result;
		}
	}

	return firstError;
}
