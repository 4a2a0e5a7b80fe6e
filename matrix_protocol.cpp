#include "matrix_protocol.hpp"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <strings.h>

#include <ArduinoJson.h>

using std::string;
using std::stringstream;
using std::vector;

// replies carry the full port name lists, so leave some headroom
#define MATRIX_JSON_CAPACITY 4096

static string serializeInstruction(JsonDocument &instr) {
	string out;
	serializeJson(instr, out);
	return out;
}

string MatrixProtocol::encodeQuery(const char *comhead) {
	StaticJsonDocument<128> instr;

	instr["comhead"] = comhead;
	instr["language"] = 0;

	return serializeInstruction(instr);
}

string MatrixProtocol::encodeVideoSwitch(int zone, int source) {
	StaticJsonDocument<128> instr;

	instr["comhead"] = MATRIX_CMD_VIDEO_SWITCH;
	instr["language"] = 0;

	// the matrix wants [input, output]
	JsonArray route = instr.createNestedArray("source");
	route.add(source);
	route.add(zone);

	return serializeInstruction(instr);
}

string MatrixProtocol::encodePower(bool on) {
	StaticJsonDocument<128> instr;

	instr["comhead"] = MATRIX_CMD_SET_POWER;
	instr["language"] = 0;
	instr["power"] = on ? 1 : 0;

	return serializeInstruction(instr);
}

string MatrixProtocol::frameRequest(const string &host, int port, const string &body) {
	stringstream request;

	request
		<< "POST " << MATRIX_INSTR_PATH << " HTTP/1.1\r\n"
		<< "Host: " << host;

	if (port != 80) {
		request << ":" << port;
	}

	request
		<< "\r\n"
		<< "Content-Type: application/json; charset=utf-8\r\n"
		<< "Content-Length: " << body.size() << "\r\n"
		<< "Connection: close\r\n"
		<< "\r\n"
		<< body;

	return request.str();
}

// offset of the value of header `name` (including its colon), npos if the headers don't have it
static size_t findHeader(const string &raw, size_t headerEnd, const char *name) {
	size_t nameLen = strlen(name);

	size_t lineStart = raw.find("\r\n");
	while (lineStart != string::npos && lineStart < headerEnd) {
		lineStart += 2;

		if (strncasecmp(raw.c_str() + lineStart, name, nameLen) == 0) {
			return lineStart + nameLen;
		}

		lineStart = raw.find("\r\n", lineStart);
	}

	return string::npos;
}

// -1 if the headers don't say
static long findContentLength(const string &raw, size_t headerEnd) {
	size_t value = findHeader(raw, headerEnd, "Content-Length:");
	if (value == string::npos) {
		return -1;
	}

	return strtol(raw.c_str() + value, NULL, 10);
}

static bool isChunked(const string &raw, size_t headerEnd) {
	size_t value = findHeader(raw, headerEnd, "Transfer-Encoding:");
	if (value == string::npos) {
		return false;
	}

	size_t lineEnd = raw.find("\r\n", value);
	string encoding = raw.substr(value, lineEnd - value);

	for (size_t i = 0; i < encoding.size(); i++) {
		encoding[i] = (char)tolower((unsigned char)encoding[i]);
	}

	return encoding.find("chunked") != string::npos;
}

// reassemble a chunked body; false until the terminating chunk has arrived, or if it's garbled
static bool decodeChunked(const string &raw, size_t bodyStart, string &body) {
	body.clear();
	size_t pos = bodyStart;

	while (true) {
		size_t lineEnd = raw.find("\r\n", pos);
		if (lineEnd == string::npos) {
			return false;
		}

		// the size is hex, optionally followed by ";extensions"
		char *end;
		unsigned long size = strtoul(raw.c_str() + pos, &end, 16);
		if (end == raw.c_str() + pos || (end != raw.c_str() + lineEnd && *end != ';')) {
			return false;
		}

		if (size == 0) {
			// last chunk; the response ends after any trailers and a blank line
			return raw.compare(lineEnd + 2, 2, "\r\n") == 0 || raw.find("\r\n\r\n", lineEnd) != string::npos;
		}

		size_t dataStart = lineEnd + 2;
		if (size > MATRIX_MAX_RESPONSE_SIZE || raw.size() < dataStart + size + 2) {
			return false;
		}

		if (raw.compare(dataStart + size, 2, "\r\n") != 0) {
			return false;
		}

		body.append(raw, dataStart, size);
		pos = dataStart + size + 2;
	}
}

bool MatrixProtocol::isResponseComplete(const string &raw) {
	size_t headerEnd = raw.find("\r\n\r\n");
	if (headerEnd == string::npos) {
		return false;
	}

	if (isChunked(raw, headerEnd)) {
		string body;
		return decodeChunked(raw, headerEnd + 4, body);
	}

	long length = findContentLength(raw, headerEnd);
	if (length < 0) {
		// no length, so the end of the connection marks the end of the body
		return false;
	}

	return raw.size() >= headerEnd + 4 + (size_t)length;
}

bool MatrixProtocol::parseHttpResponse(const string &raw, int &status, string &body) {
	if (raw.compare(0, 5, "HTTP/") != 0) {
		return false;
	}

	size_t space = raw.find(' ');
	size_t headerEnd = raw.find("\r\n\r\n");
	if (space == string::npos || headerEnd == string::npos || space > headerEnd) {
		return false;
	}

	char *end;
	status = (int)strtol(raw.c_str() + space + 1, &end, 10);
	if (end == raw.c_str() + space + 1) {
		return false;
	}

	if (isChunked(raw, headerEnd)) {
		// an unfinished or garbled chunk stream is as bad as a truncated body
		return decodeChunked(raw, headerEnd + 4, body);
	}

	body = raw.substr(headerEnd + 4);

	long length = findContentLength(raw, headerEnd);
	if (length >= 0) {
		if (body.size() < (size_t)length) {
			// connection dropped before the whole body arrived
			return false;
		}

		body.resize(length);
	}

	return true;
}

static bool parseReply(const string &body, const char *comhead, JsonDocument &reply, string &error) {
	DeserializationError err = deserializeJson(reply, body);
	if (err) {
		error = string("reply is not valid JSON: ") + err.c_str();
		return false;
	}

	if (!reply.is<JsonObject>()) {
		error = "reply is not a JSON object";
		return false;
	}

	const char *echoed = reply.as<JsonObjectConst>()["comhead"].as<const char *>();
	if (echoed == NULL || strcmp(echoed, comhead) != 0) {
		stringstream msg;
		msg << "reply was for '" << (echoed != NULL ? echoed : "") << "', expected '" << comhead << "'";
		error = msg.str();
		return false;
	}

	return true;
}

bool MatrixProtocol::decodeAck(const string &body, const char *comhead, string &error) {
	DynamicJsonDocument reply(MATRIX_JSON_CAPACITY);
	return parseReply(body, comhead, reply, error);
}

bool MatrixProtocol::decodePower(const string &body, bool &on, string &error) {
	DynamicJsonDocument reply(MATRIX_JSON_CAPACITY);
	if (!parseReply(body, MATRIX_CMD_GET_STATUS, reply, error)) {
		return false;
	}

	// some firmware sends the power flag as a string
	JsonVariantConst power = reply.as<JsonObjectConst>()["power"];
	if (power.is<int>()) {
		on = power.as<int>() == 1;
	} else if (power.is<const char *>()) {
		on = atoi(power.as<const char *>()) == 1;
	} else {
		error = "status reply has no 'power'";
		return false;
	}

	return true;
}

bool MatrixProtocol::decodeRouting(const string &body, vector<int> &sources, string &error) {
	DynamicJsonDocument reply(MATRIX_JSON_CAPACITY);
	if (!parseReply(body, MATRIX_CMD_GET_OUTPUT_STATUS, reply, error)) {
		return false;
	}

	JsonArrayConst allsource = reply.as<JsonObjectConst>()["allsource"].as<JsonArrayConst>();
	if (allsource.isNull()) {
		error = "output status reply has no 'allsource'";
		return false;
	}

	sources.clear();
	for (JsonVariantConst source : allsource) {
		if (!source.is<int>()) {
			error = "'allsource' holds something other than input numbers";
			return false;
		}

		sources.push_back(source.as<int>());
	}

	return true;
}

bool MatrixProtocol::decodeNames(const string &body, const char *comhead, const char *field, vector<string> &names, string &error) {
	DynamicJsonDocument reply(MATRIX_JSON_CAPACITY);
	if (!parseReply(body, comhead, reply, error)) {
		return false;
	}

	JsonArrayConst list = reply.as<JsonObjectConst>()[field].as<JsonArrayConst>();
	if (list.isNull() || list.size() == 0) {
		error = string("reply has no '") + field + "' list";
		return false;
	}

	names.clear();
	for (JsonVariantConst name : list) {
		names.push_back(name.is<const char *>() ? name.as<const char *>() : "");
	}

	return true;
}
