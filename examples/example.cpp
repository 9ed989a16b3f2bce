#include "CurlTransport.hpp"
#include "HttpClient.hpp"
#include "Interceptors.hpp"
#include "RetryStrategies.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace http_pipeline;

void printResponse(const HttpResponse& response) {
	std::cout << "Elapsed: " << response.transferInfo.total << "s" << std::endl;
	std::cout << "Status: " << response.status << std::endl;
	std::cout << "Headers:" << std::endl;
	for (const auto& h : response.headers) {
		std::cout << "  " << h.name << ": " << h.value << std::endl;
	}
	std::cout << "Body: " << std::endl << response.body << std::endl;
};

void printTime() {
	auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	std::cout << "[" << std::put_time(std::localtime(&now), "%Y-%m-%d %H:%M:%S") << "] ";
}

void testGET(const HttpClient& client) {
	std::cout << "GET request..." << std::endl;

	// httpbin echoes the request as JSON
	Json::Value echoed = client.fetch("https://httpbin.org/get", "GET", Payload::empty(), parsers::json());

	std::cout << "Echoed Accept: " << echoed["headers"]["Accept"].asString() << std::endl;
	std::cout << "Origin: " << echoed["origin"].asString() << std::endl;
}

void testPOST(const HttpClient& client) {
	std::cout << "POST request..." << std::endl;

	Json::Value body;
	body["name"] = "test";
	body["value"] = "123";

	// Content-Type and Accept follow from the payload and parser
	HttpResponse response = client.fetch("https://httpbin.org/post", "POST", Payload::json(body), parsers::passthrough());

	printResponse(response);
}

void testNotFound(const HttpClient& client) {
	std::cout << "GET of a missing resource..." << std::endl;

	try {
		client.fetch("https://httpbin.org/status/404", "GET", Payload::empty(), parsers::discard());
	} catch (const HttpError& e) {
		std::cout << "Failed as " << e.kindName() << " with status " << e.response()->status << std::endl;
	}
}

void testNoContent(const HttpClient& client) {
	std::cout << "DELETE with an empty 204 answer..." << std::endl;

	std::optional<Json::Value> result = client.fetch("https://httpbin.org/status/204", "DELETE", Payload::empty(),
		parsers::json(), std::set<long>{204});

	std::cout << (result ? "Got a document" : "Got no content") << std::endl;
}

// Global mutex for protecting cout in multi-threaded tests
std::mutex cout_mutex;

void testConcurrent(const HttpClient& client) {
	const int numRequests = 5;

	std::cout << "\nLaunching " << numRequests << " concurrent requests..." << std::endl;

	auto startTime = std::chrono::high_resolution_clock::now();

	std::vector<std::shared_ptr<HttpClient::PendingCall>> calls;
	for (int i = 0; i < numRequests; ++i) {
		HttpRequest request;
		request.url = "https://httpbin.org/get?thread=" + std::to_string(i);
		request.methodName = "GET";

		calls.push_back(client.submit(request, {}, {{"thread", std::to_string(i)}}));
	}

	for (int i = 0; i < numRequests; ++i) {
		try {
			const HttpResponse& response = calls[i]->future.get();
			std::lock_guard<std::mutex> lock(cout_mutex);
			std::cout << "[Call " << i << "] Status: " << response.status << ", elapsed: " << response.transferInfo.total
					  << "s, body length: " << response.body.length() << std::endl;
		} catch (const std::exception& e) {
			std::lock_guard<std::mutex> lock(cout_mutex);
			std::cerr << "[Call " << i << "] Exception: " << e.what() << std::endl;
		}
	}

	auto endTime = std::chrono::high_resolution_clock::now();
	auto totalDuration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

	std::cout << "Total wall-clock time: " << totalDuration.count() / 1000.0 << "s" << std::endl;
}

void testCancel(const HttpClient& client) {
	std::cout << "Cancel a slow request..." << std::endl;

	HttpRequest request;
	request.url = "https://httpbin.org/delay/10";
	request.methodName = "GET";

	auto call = client.submit(request);

	printTime();
	std::cout << "Wait for 3 seconds." << std::endl;
	std::this_thread::sleep_for(std::chrono::seconds(3));
	call->cancel();

	try {
		call->future.get();
	} catch (const HttpError& e) {
		printTime();
		std::cout << "Transfer ended as " << e.kindName() << std::endl;
	}
}

void testRetry(const HttpClient& client) {
	// Retry on HTTP 5xx errors with exponential backoff
	RetryPolicy retryPolicy;
	retryPolicy.shouldRetry = retry::httpStatusCondition({500, 502, 503, 504});
	retryPolicy.getRetryDelay = retry::exponentialBackoff(
		1.0,   // baseDelay: 1s
		10.0,  // maxDelay: 10s
		2.0,   // multiplier
		0.2    // jitterFactor
	);

	Interceptors interceptors{std::make_shared<RetryInterceptor>(retryPolicy)};

	printTime();
	std::cout << "Sending request with retry (expecting 503 response)..." << std::endl;
	std::cout << "Max retries: " << client.options().maxRetryCount << std::endl;

	auto startTime = std::chrono::high_resolution_clock::now();
	try {
		client.fetch("https://httpbin.org/status/503", "GET", Payload::empty(), parsers::discard(), interceptors);
	} catch (const HttpError& e) {
		auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::high_resolution_clock::now() - startTime);
		printTime();
		std::cout << "Request failed after " << duration.count() / 1000.0 << "s: " << e.what() << std::endl;
	}

	printTime();
	std::cout << "Sending request (expecting 200 response, no retry needed)..." << std::endl;
	std::string body = client.fetch("https://httpbin.org/get", "GET", Payload::empty(), parsers::text(), interceptors);
	std::cout << "Body length: " << body.length() << " bytes" << std::endl;
}

int main() {
	std::cout << "========================================" << std::endl;
	std::cout << "   HttpPipeline Example" << std::endl;
	std::cout << "========================================" << std::endl << std::endl;

	std::cout << "Note: These examples require internet connection" << std::endl;
	std::cout << "      to reach https://httpbin.org/" << std::endl << std::endl;

	spdlog::set_level(spdlog::level::debug);

	try {
		CurlTransportSettings settings = CurlTransportSettings::getDefault();
		settings.userAgent = "http-pipeline-example/1.0";

		HttpClientOptions options = HttpClientOptions::getDefault();
		options.maxRetryCount = 3;

		HttpClient client(std::make_shared<CurlTransport>(settings),
			{std::make_shared<HeaderInterceptor>(Headers{Header{"X-Client", "example"}})},
			{std::make_shared<LoggingObserver>()},
			options);

		std::cout << "\n[1] GET" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testGET(client);

		std::cout << "\n[2] POST" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testPOST(client);

		std::cout << "\n[3] Client error" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testNotFound(client);

		std::cout << "\n[4] Empty response" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testNoContent(client);

		std::cout << "\n[5] Concurrent Requests" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testConcurrent(client);

		std::cout << "\n[6] Cancel Request" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testCancel(client);

		std::cout << "\n[7] Retry Request" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testRetry(client);

		return 0;
	} catch (const std::exception& e) {
		std::cerr << "Failed with exception: " << e.what() << std::endl;
		return 1;
	}
}
