#ifndef TRANSPORT_HPP
#define TRANSPORT_HPP

#include <string>

enum TransportResult {
	TRANSPORT_OK,
	// couldn't connect (refused, no route, name didn't resolve)
	TRANSPORT_UNREACHABLE,
	// the deadline passed before the exchange finished
	TRANSPORT_TIMEOUT,
	// the connection dropped part way through
	TRANSPORT_IO_ERROR,
	// the peer sent more than we're willing to buffer
	TRANSPORT_OVERFLOW,
};

const char *transportResultStr(TransportResult result);

/**
 * One request/response exchange with the matrix. Implementations send `request` as-is and hand
 * back whatever bytes came back, bounded by `timeoutMs` for the exchange as a whole. They are
 * not required to be thread-safe; HdmiMatrix only ever runs one exchange at a time.
 */
class MatrixTransport {
public:

	virtual ~MatrixTransport() {}

	virtual TransportResult exchange(const std::string &request, std::string &response, int timeoutMs) = 0;
};

#endif
