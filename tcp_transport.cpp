#include "tcp_transport.hpp"
#include "matrix_protocol.hpp"
#include "utils.hpp"

#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using std::string;
using std::stringstream;

const char *transportResultStr(TransportResult result) {
	switch (result) {
		case TRANSPORT_OK:          return "ok";
		case TRANSPORT_UNREACHABLE: return "unreachable";
		case TRANSPORT_TIMEOUT:     return "timed out";
		case TRANSPORT_IO_ERROR:    return "connection lost";
		case TRANSPORT_OVERFLOW:    return "response too large";
	}

	return "unknown";
}

// closes the socket when the exchange is done, however it ends
struct SocketHolder {
	int fd;

	SocketHolder() : fd(-1) {}
	~SocketHolder() {
		if (fd >= 0) {
			close(fd);
		}
	}
};

// wait for `events` on `fd`; 1 if ready, 0 on deadline, -1 on error
static int waitFor(int fd, short events, long deadline) {
	while (true) {
		long remaining = deadline - millis();
		if (remaining <= 0) {
			return 0;
		}

		struct pollfd pfd;
		pfd.fd = fd;
		pfd.events = events;
		pfd.revents = 0;

		int rc = poll(&pfd, 1, (int)remaining);
		if (rc < 0 && errno == EINTR) {
			continue;
		}

		return rc;
	}
}

// a lookup running on its own thread; the thread may outlive the exchange that started it
struct PendingLookup {
	PendingLookup() : done(false), abandoned(false), rc(0), addrs(NULL) {}

	std::mutex lock;
	std::condition_variable finished;
	bool done;
	bool abandoned;
	int rc;
	struct addrinfo *addrs;
};

static int lookup(const string &host, const string &service, int flags, struct addrinfo *&addrs) {
	struct addrinfo hints;
	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;
	hints.ai_flags = flags;

	return getaddrinfo(host.c_str(), service.c_str(), &hints, &addrs);
}

TcpTransport::TcpTransport(Logger &logger, const string &host, int port) :
	logger(logger), host(host), port(port) {
}

TransportResult TcpTransport::exchange(const string &request, string &response, int timeoutMs) {
	long deadline = millis() + timeoutMs;
	SocketHolder sock;

	TransportResult result = connectTo(sock.fd, deadline);
	if (result != TRANSPORT_OK) {
		return result;
	}

	result = sendAll(sock.fd, request, deadline);
	if (result != TRANSPORT_OK) {
		return result;
	}

	return receive(sock.fd, response, deadline);
}

TransportResult TcpTransport::resolve(struct addrinfo *&addrs, long deadline) {
	string service = std::to_string(port);

	// an IP address needs no lookup at all
	if (lookup(host, service, AI_NUMERICHOST | AI_NUMERICSERV, addrs) == 0) {
		return TRANSPORT_OK;
	}

	// getaddrinfo() can't be given a deadline, so ask on another thread and stop waiting in time
	std::shared_ptr<PendingLookup> pending = std::make_shared<PendingLookup>();
	string name = host;

	std::thread([pending, name, service]() {
		struct addrinfo *found = NULL;
		int rc = lookup(name, service, 0, found);

		std::lock_guard<std::mutex> guard(pending->lock);
		if (pending->abandoned) {
			if (rc == 0) {
				freeaddrinfo(found);
			}
			return;
		}

		pending->rc = rc;
		pending->addrs = found;
		pending->done = true;
		pending->finished.notify_all();
	}).detach();

	std::unique_lock<std::mutex> guard(pending->lock);

	long remaining = deadline - millis();
	bool done = pending->done;
	if (!done && remaining > 0) {
		done = pending->finished.wait_for(guard, std::chrono::milliseconds(remaining), [&pending]() { return pending->done; });
	}

	if (!done) {
		pending->abandoned = true;
		logger.error("Timed out resolving matrix host " + host);
		return TRANSPORT_TIMEOUT;
	}

	if (pending->rc != 0) {
		stringstream log;
		log << "Couldn't resolve matrix host " << host << ": " << gai_strerror(pending->rc);
		logger.error(log.str());
		return TRANSPORT_UNREACHABLE;
	}

	addrs = pending->addrs;
	return TRANSPORT_OK;
}

TransportResult TcpTransport::connectTo(int &fd, long deadline) {
	struct addrinfo *addrs = NULL;

	TransportResult resolved = resolve(addrs, deadline);
	if (resolved != TRANSPORT_OK) {
		return resolved;
	}

	TransportResult result = TRANSPORT_UNREACHABLE;
	int lastError = 0;

	for (struct addrinfo *addr = addrs; addr != NULL; addr = addr->ai_next) {
		int candidate = socket(addr->ai_family, addr->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, addr->ai_protocol);
		if (candidate < 0) {
			lastError = errno;
			continue;
		}

		if (connect(candidate, addr->ai_addr, addr->ai_addrlen) == 0) {
			fd = candidate;
			result = TRANSPORT_OK;
			break;
		}

		if (errno != EINPROGRESS) {
			lastError = errno;
			close(candidate);
			continue;
		}

		int ready = waitFor(candidate, POLLOUT, deadline);
		if (ready == 0) {
			close(candidate);
			result = TRANSPORT_TIMEOUT;
			break;
		}

		int soError = 0;
		socklen_t len = sizeof(soError);
		if (ready < 0 || getsockopt(candidate, SOL_SOCKET, SO_ERROR, &soError, &len) < 0) {
			soError = errno;
		}

		if (soError == 0) {
			fd = candidate;
			result = TRANSPORT_OK;
			break;
		}

		lastError = soError;
		close(candidate);
	}

	freeaddrinfo(addrs);

	if (result == TRANSPORT_UNREACHABLE) {
		stringstream log;
		log << "Couldn't connect to matrix at " << host << ":" << port << ": " << strerror(lastError);
		logger.error(log.str());
	} else if (result == TRANSPORT_TIMEOUT) {
		stringstream log;
		log << "Timed out connecting to matrix at " << host << ":" << port;
		logger.error(log.str());
	}

	return result;
}

TransportResult TcpTransport::sendAll(int fd, const string &request, long deadline) {
	size_t sent = 0;

	while (sent < request.size()) {
		int ready = waitFor(fd, POLLOUT, deadline);
		if (ready == 0) {
			logger.error("Timed out sending instruction to matrix");
			return TRANSPORT_TIMEOUT;
		}
		if (ready < 0) {
			return TRANSPORT_IO_ERROR;
		}

		ssize_t n = send(fd, request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
		if (n < 0) {
			if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
				continue;
			}

			stringstream log;
			log << "Lost connection to matrix while sending: " << strerror(errno);
			logger.error(log.str());
			return TRANSPORT_IO_ERROR;
		}

		sent += n;
	}

	return TRANSPORT_OK;
}

TransportResult TcpTransport::receive(int fd, string &response, long deadline) {
	char buffer[1024];
	response.clear();

	while (!MatrixProtocol::isResponseComplete(response)) {
		int ready = waitFor(fd, POLLIN, deadline);
		if (ready == 0) {
			logger.error("Timed out waiting for reply from matrix");
			return TRANSPORT_TIMEOUT;
		}
		if (ready < 0) {
			return TRANSPORT_IO_ERROR;
		}

		ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
		if (n == 0) {
			// peer closed, that's the end of the reply
			break;
		}

		if (n < 0) {
			if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
				continue;
			}

			stringstream log;
			log << "Lost connection to matrix while receiving: " << strerror(errno);
			logger.error(log.str());
			return TRANSPORT_IO_ERROR;
		}

		// guard against a misbehaving peer by throwing the reply away
		if (response.size() + n > MATRIX_MAX_RESPONSE_SIZE) {
			stringstream log;
			log << "Dropping reply longer than " << MATRIX_MAX_RESPONSE_SIZE << " bytes";
			logger.error(log.str());
			return TRANSPORT_OVERFLOW;
		}

		response.append(buffer, n);
	}

	return TRANSPORT_OK;
}
