#ifndef MATRIX_PROTOCOL_HPP
#define MATRIX_PROTOCOL_HPP

// instruction names ("comhead") understood by the matrix
#define MATRIX_CMD_VIDEO_SWITCH "video switch"
#define MATRIX_CMD_GET_STATUS "get status"
#define MATRIX_CMD_GET_OUTPUT_STATUS "get output status"
#define MATRIX_CMD_GET_INPUT_STATUS "get input status"
#define MATRIX_CMD_SET_POWER "set poweronoff"

// every instruction is POSTed to this path
#define MATRIX_INSTR_PATH "/cgi-bin/instr"

// replies are small; anything bigger than this is garbage
#define MATRIX_MAX_RESPONSE_SIZE 16384

#include <string>
#include <vector>

/**
 * Encoding and decoding of the JSON instructions the matrix takes over HTTP.
 *
 * Every instruction is a JSON object with a "comhead" naming the command and a "language" of 0,
 * POSTed to /cgi-bin/instr. The matrix answers with a JSON object that echoes the "comhead"
 * plus whatever fields the command returns. A reply that doesn't echo the command is treated as
 * a failure.
 */
class MatrixProtocol {
public:

	static std::string encodeQuery(const char *comhead);
	static std::string encodeVideoSwitch(int zone, int source);
	static std::string encodePower(bool on);

	// wrap an instruction body into a complete HTTP request for `host`
	static std::string frameRequest(const std::string &host, int port, const std::string &body);

	// true once `raw` holds the whole HTTP response (headers plus Content-Length bytes, or the
	// final chunk of a chunked reply)
	static bool isResponseComplete(const std::string &raw);

	// split a raw HTTP response, reassembling chunked bodies; false if it isn't HTTP at all or
	// the body is incomplete
	static bool parseHttpResponse(const std::string &raw, int &status, std::string &body);

	// check that `body` is a JSON object echoing `comhead`
	static bool decodeAck(const std::string &body, const char *comhead, std::string &error);

	// "get status"
	static bool decodePower(const std::string &body, bool &on, std::string &error);

	// "get output status": the 1-based input routed to each output, in output order
	static bool decodeRouting(const std::string &body, std::vector<int> &sources, std::string &error);

	// "get output status" → "name", "get input status" → "inname"
	static bool decodeNames(const std::string &body, const char *comhead, const char *field, std::vector<std::string> &names, std::string &error);
};

#endif
