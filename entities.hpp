#ifndef ENTITIES_HPP
#define ENTITIES_HPP

#include "logger.hpp"
#include "matrix.hpp"
#include "poller.hpp"

#include <memory>
#include <string>
#include <vector>

#define ENTITY_STATE_ON "on"
#define ENTITY_STATE_OFF "off"
#define ENTITY_STATE_UNAVAILABLE "unavailable"

/**
 * The whole-matrix power switch, as the smart-home host sees it.
 */
class MatrixPowerSwitch {
public:

	MatrixPowerSwitch(HdmiMatrix &matrix, MatrixPoller &poller);

	std::string getName() const;
	std::string getUniqueId() const;

	bool isAvailable();
	bool isOn();

	MatrixError turnOn();
	MatrixError turnOff();

private:

	HdmiMatrix &matrix;
	MatrixPoller &poller;
};

/**
 * One zone (matrix output) presented as a media player whose "source" is the matrix input
 * routed to it.
 */
class MatrixZonePlayer {
public:

	MatrixZonePlayer(HdmiMatrix &matrix, MatrixPoller &poller, int zoneId, const std::string &entityId);

	int getZoneId() const;
	std::string getName() const;
	std::string getUniqueId() const;

	// media_player.<name in lower case with anything else replaced by underscores>, made
	// unique by MatrixEntities
	std::string getEntityId() const;

	// "on", "off" or "unavailable"
	std::string getState();

	// empty while the matrix hasn't told us
	std::string getSource();
	std::vector<std::string> getSourceList() const;
	std::string getMediaTitle();

	MatrixError selectSource(const std::string &source);

private:

	HdmiMatrix &matrix;
	MatrixPoller &poller;
	int zoneId;
	std::string entityId;
};

/**
 * Everything the bridge exposes to the host: the power switch, one player per configured zone,
 * and the set_zone action.
 */
class MatrixEntities {
public:

	MatrixEntities(Logger &logger, HdmiMatrix &matrix, MatrixPoller &poller);

	MatrixPowerSwitch &getPowerSwitch();
	std::vector<std::unique_ptr<MatrixZonePlayer>> &getZones();

	// NULL if no zone has that entity id
	MatrixZonePlayer *findZone(const std::string &entityId);

	/**
	 * Route `source` to each of the given zone entities, or to every zone if `entityIds` is
	 * empty. Every target is attempted; the first failure is returned, and entity ids that match
	 * no zone report MATRIX_UNKNOWN_ZONE.
	 */
	MatrixError setZone(const std::vector<std::string> &entityIds, const std::string &source);

private:

	Logger &logger;
	MatrixPowerSwitch powerSwitch;
	std::vector<std::unique_ptr<MatrixZonePlayer>> zones;
};

std::string slugify(const std::string &name);

#endif
