#ifndef MATRIX_CONFIG_HPP
#define MATRIX_CONFIG_HPP

// the matrix is an 8x8 crossbar: outputs (zones) and inputs (sources) are numbered 1..8
#define MATRIX_MAX_PORTS 8

#include <map>
#include <string>
#include <vector>

/**
 * Static configuration of the bridge: where the matrix is, how to talk to it, and the names of
 * its zones (outputs) and sources (inputs).
 *
 * This is filled in once at startup (from the JSON configuration file and, optionally, from the
 * names the matrix reports for its ports) and is only handed out as a const reference after
 * that. Zone and source names are looked up by exact, case-sensitive match in both directions,
 * so names must be unique within their table.
 */
class MatrixConfig {
public:

	MatrixConfig();

	// parse the JSON configuration document; on failure `error` says what was wrong
	bool parse(const std::string &json, std::string &error);
	bool load(const char *path, std::string &error);

	// fill in Output1..8 / Input1..8 for an empty table
	void applyDefaultNames();

	// name any zone/source not named by the configuration from what the matrix reported
	void applyDeviceNames(std::vector<std::string> zoneNames, std::vector<std::string> sourceNames);

	bool addZone(int id, const std::string &name, std::string &error);
	bool addSource(int id, const std::string &name, std::string &error);

	// 0 if unknown
	int zoneId(const std::string &name) const;
	int sourceId(const std::string &name) const;

	// empty if unknown
	std::string zoneName(int id) const;
	std::string sourceName(int id) const;

	// ordered by id
	std::vector<int> zoneIds() const;
	std::vector<int> sourceIds() const;
	std::vector<std::string> sourceNames() const;

	std::string host;
	int port;
	int timeoutMs;
	int pollIntervalSecs;
	int unavailableAfter;
	bool powerOnForRoute;
	int powerOnSettleMs;
	bool namesFromDevice;

	/**
	 * Makes names unique by suffixing repeats in order of appearance, e.g. [A, A, B, A] becomes
	 * [A, A_1, B, A_2].
	 */
	static void deduplicateNames(std::vector<std::string> &names);

private:

	struct PortTable {
		std::map<int, std::string> names;
		std::map<std::string, int> ids;
	};

	PortTable zones, sources;

	bool addPort(PortTable &table, const char *kind, int id, const std::string &name, std::string &error);
	void applyNames(PortTable &table, std::vector<std::string> &names);
};

#endif
