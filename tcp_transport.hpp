#ifndef TCP_TRANSPORT_HPP
#define TCP_TRANSPORT_HPP

#include "logger.hpp"
#include "transport.hpp"

#include <string>

#include <netdb.h>

/**
 * Connection-per-request TCP transport. Each exchange resolves the host, connects, writes the
 * request and reads until the peer closes the connection or a complete HTTP response has
 * arrived. All socket I/O is non-blocking and waits with poll() against a single deadline, so a
 * dead or silent matrix costs at most `timeoutMs`. Host names are looked up on a helper thread
 * under the same deadline, so a dead resolver can't stretch it either.
 */
class TcpTransport : public MatrixTransport {
public:

	TcpTransport(Logger &logger, const std::string &host, int port);

	TransportResult exchange(const std::string &request, std::string &response, int timeoutMs) override;

private:

	Logger &logger;
	std::string host;
	int port;

	TransportResult resolve(struct addrinfo *&addrs, long deadline);
	TransportResult connectTo(int &fd, long deadline);
	TransportResult sendAll(int fd, const std::string &request, long deadline);
	TransportResult receive(int fd, std::string &response, long deadline);
};

#endif
