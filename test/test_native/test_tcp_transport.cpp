/**
 * @file test_tcp_transport.cpp
 * @brief Tests for TcpTransport against a loopback listener
 *
 * Each test starts a one-shot server on 127.0.0.1 that reads a request and then behaves the
 * way a real, slow or broken matrix would.
 */

#include <unity.h>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "matrix.hpp"
#include "matrix_protocol.hpp"
#include "tcp_transport.hpp"
#include "mocks/fake_matrix.hpp"

using std::string;

// ============================================================================
// Loopback server
// ============================================================================

enum ServerBehaviour {
	// reply with a Content-Length and keep the connection open for a while
	REPLY_AND_LINGER,
	// reply without a length, then close
	REPLY_AND_CLOSE,
	// read the request and say nothing
	SILENT,
	// send more than the transport will buffer
	FLOOD,
};

class LoopbackServer {
public:

	LoopbackServer(ServerBehaviour behaviour, const string &body) :
		behaviour(behaviour), body(body), listener(-1), port(0) {

		listener = socket(AF_INET, SOCK_STREAM, 0);

		int reuse = 1;
		setsockopt(listener, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

		struct sockaddr_in addr;
		memset(&addr, 0, sizeof(addr));
		addr.sin_family = AF_INET;
		addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
		addr.sin_port = 0;

		bind(listener, (struct sockaddr *)&addr, sizeof(addr));
		listen(listener, 1);

		socklen_t len = sizeof(addr);
		getsockname(listener, (struct sockaddr *)&addr, &len);
		port = ntohs(addr.sin_port);

		thread = std::thread(&LoopbackServer::serve, this);
	}

	~LoopbackServer() {
		finish();
		close(listener);
	}

	// wait until the one connection has been served
	void finish() {
		if (thread.joinable()) {
			thread.join();
		}
	}

	int getPort() const {
		return port;
	}

	string request;

private:

	ServerBehaviour behaviour;
	string body;
	int listener;
	int port;
	std::thread thread;

	void serve() {
		int client = accept(listener, NULL, NULL);
		if (client < 0) {
			return;
		}

		readRequest(client);

		string reply;
		switch (behaviour) {
			case REPLY_AND_LINGER:
				reply = FakeMatrix::http(200, body);
				break;
			case REPLY_AND_CLOSE:
				reply = "HTTP/1.0 200 OK\r\nContent-Type: application/json\r\n\r\n" + body;
				break;
			case FLOOD:
				reply = "HTTP/1.1 200 OK\r\n\r\n" + string(MATRIX_MAX_RESPONSE_SIZE + 1024, 'x');
				break;
			case SILENT:
				break;
		}

		if (!reply.empty()) {
			send(client, reply.data(), reply.size(), MSG_NOSIGNAL);
		}

		if (behaviour == REPLY_AND_LINGER || behaviour == SILENT) {
			// the client has to finish on its own, not because we hung up
			std::this_thread::sleep_for(std::chrono::milliseconds(500));
		}

		close(client);
	}

	void readRequest(int client) {
		char buffer[1024];

		while (true) {
			size_t headerEnd = request.find("\r\n\r\n");
			if (headerEnd != string::npos) {
				size_t length = 0;
				size_t header = request.find("Content-Length: ");
				if (header != string::npos) {
					length = strtoul(request.c_str() + header + 16, NULL, 10);
				}

				if (request.size() >= headerEnd + 4 + length) {
					return;
				}
			}

			ssize_t n = recv(client, buffer, sizeof(buffer), 0);
			if (n <= 0) {
				return;
			}
			request.append(buffer, n);
		}
	}
};

static long elapsedSince(std::chrono::steady_clock::time_point started) {
	return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
}

// ============================================================================
// Test: exchanges
// ============================================================================

void test_exchange_completes_on_content_length() {
	Logger logger;
	string body = "{\"comhead\":\"get status\",\"power\":1}";
	LoopbackServer server(REPLY_AND_LINGER, body);
	TcpTransport transport(logger, "127.0.0.1", server.getPort());

	string request = MatrixProtocol::frameRequest("127.0.0.1", server.getPort(), MatrixProtocol::encodeQuery(MATRIX_CMD_GET_STATUS));
	string response;

	auto started = std::chrono::steady_clock::now();
	TEST_ASSERT_EQUAL_INT(TRANSPORT_OK, transport.exchange(request, response, 2000));

	// didn't wait for the server to hang up
	TEST_ASSERT_TRUE(elapsedSince(started) < 400);

	int status = 0;
	string reply;
	TEST_ASSERT_TRUE(MatrixProtocol::parseHttpResponse(response, status, reply));
	TEST_ASSERT_EQUAL_INT(200, status);
	TEST_ASSERT_EQUAL_STRING(body.c_str(), reply.c_str());
}

void test_exchange_completes_on_close() {
	Logger logger;
	LoopbackServer server(REPLY_AND_CLOSE, "{\"comhead\":\"get status\",\"power\":0}");
	TcpTransport transport(logger, "127.0.0.1", server.getPort());

	string response;
	TEST_ASSERT_EQUAL_INT(TRANSPORT_OK, transport.exchange(
		MatrixProtocol::frameRequest("127.0.0.1", server.getPort(), "{}"), response, 2000));

	bool on = true;
	int status = 0;
	string reply, error;
	TEST_ASSERT_TRUE(MatrixProtocol::parseHttpResponse(response, status, reply));
	TEST_ASSERT_TRUE(MatrixProtocol::decodePower(reply, on, error));
	TEST_ASSERT_FALSE(on);
}

void test_refused_connection_is_unreachable() {
	Logger logger;

	// grab a free port and release it so nothing is listening there
	int spare = socket(AF_INET, SOCK_STREAM, 0);
	struct sockaddr_in addr;
	memset(&addr, 0, sizeof(addr));
	addr.sin_family = AF_INET;
	addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
	bind(spare, (struct sockaddr *)&addr, sizeof(addr));
	socklen_t len = sizeof(addr);
	getsockname(spare, (struct sockaddr *)&addr, &len);
	int port = ntohs(addr.sin_port);
	close(spare);

	TcpTransport transport(logger, "127.0.0.1", port);

	string response;
	TEST_ASSERT_EQUAL_INT(TRANSPORT_UNREACHABLE, transport.exchange("x", response, 1000));
}

void test_unresolvable_host_fails_within_bound() {
	Logger logger;
	TcpTransport transport(logger, "matrix.invalid", 80);

	string response;
	auto started = std::chrono::steady_clock::now();
	TransportResult result = transport.exchange("x", response, 300);

	// a quick NXDOMAIN is unreachable, a resolver that never answers is a timeout
	TEST_ASSERT_TRUE(result == TRANSPORT_UNREACHABLE || result == TRANSPORT_TIMEOUT);
	TEST_ASSERT_TRUE(elapsedSince(started) < 600);
}

void test_silent_peer_times_out_within_bound() {
	Logger logger;
	LoopbackServer server(SILENT, "");
	TcpTransport transport(logger, "127.0.0.1", server.getPort());

	string response;
	auto started = std::chrono::steady_clock::now();
	TEST_ASSERT_EQUAL_INT(TRANSPORT_TIMEOUT, transport.exchange(
		MatrixProtocol::frameRequest("127.0.0.1", server.getPort(), "{}"), response, 200));

	long elapsed = elapsedSince(started);
	TEST_ASSERT_TRUE(elapsed >= 150);
	TEST_ASSERT_TRUE(elapsed < 450);
}

void test_oversized_reply_is_dropped() {
	Logger logger;
	LoopbackServer server(FLOOD, "");
	TcpTransport transport(logger, "127.0.0.1", server.getPort());

	string response;
	TEST_ASSERT_EQUAL_INT(TRANSPORT_OVERFLOW, transport.exchange(
		MatrixProtocol::frameRequest("127.0.0.1", server.getPort(), "{}"), response, 2000));
}

// ============================================================================
// Test: router over the network
// ============================================================================

void test_route_over_tcp() {
	Logger logger;
	LoopbackServer server(REPLY_AND_CLOSE, "{\"comhead\":\"video switch\"}");

	MatrixConfig config;
	string error;
	config.host = "127.0.0.1";
	config.port = server.getPort();
	config.addZone(3, "Bedroom", error);
	config.addSource(6, "Cable", error);

	TcpTransport transport(logger, config.host, config.port);
	HdmiMatrix matrix(logger, config, transport);

	TEST_ASSERT_EQUAL_INT(MATRIX_OK, matrix.route("Bedroom", "Cable"));
	TEST_ASSERT_EQUAL_STRING("Cable", matrix.getZoneSource("Bedroom").c_str());

	server.finish();
	TEST_ASSERT_TRUE(server.request.find("POST " MATRIX_INSTR_PATH " HTTP/1.1\r\n") == 0);

	string body = MatrixProtocol::encodeVideoSwitch(3, 6);
	TEST_ASSERT_EQUAL_STRING(body.c_str(), server.request.substr(server.request.size() - body.size()).c_str());
}

// ============================================================================
// Unity setUp/tearDown
// ============================================================================

void setUp(void) {
}

void tearDown(void) {
}

// ============================================================================
// Test Runner
// ============================================================================

int main() {
	UNITY_BEGIN();

	RUN_TEST(test_exchange_completes_on_content_length);
	RUN_TEST(test_exchange_completes_on_close);
	RUN_TEST(test_refused_connection_is_unreachable);
	RUN_TEST(test_unresolvable_host_fails_within_bound);
	RUN_TEST(test_silent_peer_times_out_within_bound);
	RUN_TEST(test_oversized_reply_is_dropped);

	RUN_TEST(test_route_over_tcp);

	return UNITY_END();
}
