/**
 * @file test_matrix_protocol.cpp
 * @brief Unit tests for the matrix instruction codec and HTTP envelope
 */

#include <unity.h>

#include <string>
#include <vector>

#include "matrix_protocol.hpp"

using std::string;
using std::vector;

// ============================================================================
// Encoding
// ============================================================================

void test_encode_video_switch_puts_input_first() {
	TEST_ASSERT_EQUAL_STRING(
		"{\"comhead\":\"video switch\",\"language\":0,\"source\":[4,1]}",
		MatrixProtocol::encodeVideoSwitch(1, 4).c_str());
}

void test_encode_power() {
	TEST_ASSERT_EQUAL_STRING(
		"{\"comhead\":\"set poweronoff\",\"language\":0,\"power\":1}",
		MatrixProtocol::encodePower(true).c_str());
	TEST_ASSERT_EQUAL_STRING(
		"{\"comhead\":\"set poweronoff\",\"language\":0,\"power\":0}",
		MatrixProtocol::encodePower(false).c_str());
}

void test_encode_query() {
	TEST_ASSERT_EQUAL_STRING(
		"{\"comhead\":\"get output status\",\"language\":0}",
		MatrixProtocol::encodeQuery(MATRIX_CMD_GET_OUTPUT_STATUS).c_str());
}

void test_frame_request() {
	string body = MatrixProtocol::encodeQuery(MATRIX_CMD_GET_STATUS);
	string request = MatrixProtocol::frameRequest("192.168.1.50", 80, body);

	TEST_ASSERT_EQUAL_INT(0, request.find("POST /cgi-bin/instr HTTP/1.1\r\n"));
	TEST_ASSERT_TRUE(request.find("Host: 192.168.1.50\r\n") != string::npos);
	TEST_ASSERT_TRUE(request.find("Content-Length: " + std::to_string(body.size()) + "\r\n") != string::npos);
	TEST_ASSERT_TRUE(request.find("Connection: close\r\n") != string::npos);
	TEST_ASSERT_EQUAL_STRING(("\r\n\r\n" + body).c_str(), request.substr(request.size() - body.size() - 4).c_str());

	string other = MatrixProtocol::frameRequest("matrix.local", 8080, body);
	TEST_ASSERT_TRUE(other.find("Host: matrix.local:8080\r\n") != string::npos);
}

// ============================================================================
// HTTP envelope
// ============================================================================

void test_parse_http_response() {
	int status = 0;
	string body;

	TEST_ASSERT_TRUE(MatrixProtocol::parseHttpResponse(
		"HTTP/1.1 200 OK\r\nContent-Type: application/json\r\ncontent-length: 2\r\n\r\n{}trailing", status, body));
	TEST_ASSERT_EQUAL_INT(200, status);
	TEST_ASSERT_EQUAL_STRING("{}", body.c_str());

	// no length: the body runs to the end
	TEST_ASSERT_TRUE(MatrixProtocol::parseHttpResponse("HTTP/1.0 404 Not Found\r\n\r\nnope", status, body));
	TEST_ASSERT_EQUAL_INT(404, status);
	TEST_ASSERT_EQUAL_STRING("nope", body.c_str());
}

void test_parse_http_response_rejects_garbage() {
	int status = 0;
	string body;

	TEST_ASSERT_FALSE(MatrixProtocol::parseHttpResponse("", status, body));
	TEST_ASSERT_FALSE(MatrixProtocol::parseHttpResponse("{\"comhead\":\"get status\"}", status, body));
	TEST_ASSERT_FALSE(MatrixProtocol::parseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n", status, body));

	// truncated body
	TEST_ASSERT_FALSE(MatrixProtocol::parseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 20\r\n\r\n{}", status, body));
}

// a reply split into two chunks: "{\"comhead\":" is 0xb bytes, "\"video switch\"}" is 0xf
#define CHUNKED_HEAD "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\ntransfer-encoding: chunked\r\n\r\n"
#define CHUNKED_BODY "b\r\n{\"comhead\":\r\nf;ext=1\r\n\"video switch\"}\r\n"

void test_parse_chunked_response() {
	int status = 0;
	string body, error;

	TEST_ASSERT_TRUE(MatrixProtocol::parseHttpResponse(CHUNKED_HEAD CHUNKED_BODY "0\r\n\r\n", status, body));
	TEST_ASSERT_EQUAL_INT(200, status);
	TEST_ASSERT_EQUAL_STRING("{\"comhead\":\"video switch\"}", body.c_str());
	TEST_ASSERT_TRUE(MatrixProtocol::decodeAck(body, MATRIX_CMD_VIDEO_SWITCH, error));

	// missing last chunk
	TEST_ASSERT_FALSE(MatrixProtocol::parseHttpResponse(CHUNKED_HEAD CHUNKED_BODY, status, body));

	// chunk shorter than its size line claims
	TEST_ASSERT_FALSE(MatrixProtocol::parseHttpResponse(CHUNKED_HEAD "20\r\n{}\r\n0\r\n\r\n", status, body));

	// size line that isn't hex
	TEST_ASSERT_FALSE(MatrixProtocol::parseHttpResponse(CHUNKED_HEAD "zz\r\n{}\r\n0\r\n\r\n", status, body));
}

void test_chunked_response_complete() {
	TEST_ASSERT_FALSE(MatrixProtocol::isResponseComplete(CHUNKED_HEAD));
	TEST_ASSERT_FALSE(MatrixProtocol::isResponseComplete(CHUNKED_HEAD CHUNKED_BODY));
	TEST_ASSERT_FALSE(MatrixProtocol::isResponseComplete(CHUNKED_HEAD CHUNKED_BODY "0\r\n"));
	TEST_ASSERT_TRUE(MatrixProtocol::isResponseComplete(CHUNKED_HEAD CHUNKED_BODY "0\r\n\r\n"));

	// trailers after the last chunk
	TEST_ASSERT_TRUE(MatrixProtocol::isResponseComplete(CHUNKED_HEAD CHUNKED_BODY "0\r\nX-Trailer: 1\r\n\r\n"));
}

void test_response_complete() {
	TEST_ASSERT_FALSE(MatrixProtocol::isResponseComplete(""));
	TEST_ASSERT_FALSE(MatrixProtocol::isResponseComplete("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n"));
	TEST_ASSERT_FALSE(MatrixProtocol::isResponseComplete("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\n{"));
	TEST_ASSERT_TRUE(MatrixProtocol::isResponseComplete("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\n{}"));

	// without a length only the peer closing ends the response
	TEST_ASSERT_FALSE(MatrixProtocol::isResponseComplete("HTTP/1.1 200 OK\r\n\r\n{}"));
}

// ============================================================================
// Decoding
// ============================================================================

void test_decode_ack() {
	string error;

	TEST_ASSERT_TRUE(MatrixProtocol::decodeAck("{\"comhead\":\"video switch\",\"result\":1}", MATRIX_CMD_VIDEO_SWITCH, error));

	TEST_ASSERT_FALSE(MatrixProtocol::decodeAck("{\"comhead\":\"get status\"}", MATRIX_CMD_VIDEO_SWITCH, error));
	TEST_ASSERT_FALSE(MatrixProtocol::decodeAck("{\"result\":1}", MATRIX_CMD_VIDEO_SWITCH, error));
	TEST_ASSERT_FALSE(MatrixProtocol::decodeAck("[\"video switch\"]", MATRIX_CMD_VIDEO_SWITCH, error));
	TEST_ASSERT_FALSE(MatrixProtocol::decodeAck("{\"comhead\":", MATRIX_CMD_VIDEO_SWITCH, error));
	TEST_ASSERT_TRUE(error.size() > 0);
}

void test_decode_power() {
	string error;
	bool on = false;

	TEST_ASSERT_TRUE(MatrixProtocol::decodePower("{\"comhead\":\"get status\",\"power\":1}", on, error));
	TEST_ASSERT_TRUE(on);

	TEST_ASSERT_TRUE(MatrixProtocol::decodePower("{\"comhead\":\"get status\",\"power\":\"0\"}", on, error));
	TEST_ASSERT_FALSE(on);

	TEST_ASSERT_FALSE(MatrixProtocol::decodePower("{\"comhead\":\"get status\"}", on, error));
}

void test_decode_routing() {
	string error;
	vector<int> sources;

	TEST_ASSERT_TRUE(MatrixProtocol::decodeRouting(
		"{\"comhead\":\"get output status\",\"allsource\":[4,1,1,2,3,8,7,6],\"name\":[\"a\"]}", sources, error));
	TEST_ASSERT_EQUAL_UINT(8, sources.size());
	TEST_ASSERT_EQUAL_INT(4, sources[0]);
	TEST_ASSERT_EQUAL_INT(6, sources[7]);

	TEST_ASSERT_FALSE(MatrixProtocol::decodeRouting("{\"comhead\":\"get output status\"}", sources, error));
	TEST_ASSERT_FALSE(MatrixProtocol::decodeRouting("{\"comhead\":\"get output status\",\"allsource\":[\"x\"]}", sources, error));
}

void test_decode_names() {
	string error;
	vector<string> names;

	TEST_ASSERT_TRUE(MatrixProtocol::decodeNames(
		"{\"comhead\":\"get input status\",\"inname\":[\"Xbox 360\",\"Apple TV\"]}",
		MATRIX_CMD_GET_INPUT_STATUS, "inname", names, error));
	TEST_ASSERT_EQUAL_UINT(2, names.size());
	TEST_ASSERT_EQUAL_STRING("Apple TV", names[1].c_str());

	TEST_ASSERT_FALSE(MatrixProtocol::decodeNames(
		"{\"comhead\":\"get input status\",\"inname\":[]}",
		MATRIX_CMD_GET_INPUT_STATUS, "inname", names, error));
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

	RUN_TEST(test_encode_video_switch_puts_input_first);
	RUN_TEST(test_encode_power);
	RUN_TEST(test_encode_query);
	RUN_TEST(test_frame_request);

	RUN_TEST(test_parse_http_response);
	RUN_TEST(test_parse_http_response_rejects_garbage);
	RUN_TEST(test_response_complete);
	RUN_TEST(test_parse_chunked_response);
	RUN_TEST(test_chunked_response_complete);

	RUN_TEST(test_decode_ack);
	RUN_TEST(test_decode_power);
	RUN_TEST(test_decode_routing);
	RUN_TEST(test_decode_names);

	return UNITY_END();
}
