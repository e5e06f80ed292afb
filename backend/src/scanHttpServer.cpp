#include "scanHttpServer.hpp"
#include <iostream>
#include <sstream>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <chrono>
#include <algorithm>
#include <system_error>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

const size_t MAX_REQUEST_SIZE = 8192;

const char* reasonPhrase(int status) {
	switch (status) {
		case 200: return "OK";
		case 400: return "Bad Request";
		case 404: return "Not Found";
		case 405: return "Method Not Allowed";
		default: return "Internal Server Error";
	}
}

HttpResponse errorResponse(int status, const std::string& message) {
	json body = {{"status", "error"}, {"message", message}};
	return HttpResponse{status, "application/json", body.dump()};
}

bool sendAll(int socket_fd, const std::string& data) {
	int flags = 0;
#ifdef MSG_NOSIGNAL
	flags = MSG_NOSIGNAL;
#endif
	size_t total_sent = 0;
	while (total_sent < data.size()) {
		ssize_t sent = send(socket_fd, data.c_str() + total_sent, data.size() - total_sent, flags);
		if (sent < 0) {
			if (errno == EINTR) continue;
			return false;
		}
		total_sent += static_cast<size_t>(sent);
	}
	return true;
}

} // namespace

std::string HttpResponse::serialize() const {
	std::ostringstream out;
	out << "HTTP/1.1 " << status << " " << reasonPhrase(status) << "\r\n"
	    << "Content-Type: " << content_type << "\r\n"
	    << "Access-Control-Allow-Origin: *\r\n"
	    << "Content-Length: " << body.size() << "\r\n"
	    << "Connection: close\r\n"
	    << "\r\n"
	    << body;
	return out.str();
}

/**
 * Constructor - creates the listening socket
 */
ScanHttpServer::ScanHttpServer(const ResultCache& cache, int port)
	: cache(cache), server_fd(-1), port(port), is_running(false), accept_thread(nullptr) {

	server_fd = socket(AF_INET, SOCK_STREAM, 0);

	if (server_fd < 0) {
		std::cerr << "Failed to create server socket. Error: " << strerror(errno) << std::endl;
		return;
	}

	int opt = 1;
	if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
		std::cerr << "Failed to set socket options: " << strerror(errno) << std::endl;
		close(server_fd);
		server_fd = -1;
		return;
	}
}

/**
 * Destructor - ensures clean shutdown
 */
ScanHttpServer::~ScanHttpServer() {
	stop();
	if (server_fd >= 0) {
		close(server_fd);
		server_fd = -1;
	}
}

/**
 * Starts the server
 */
bool ScanHttpServer::start() {
	if (server_fd < 0) {
		std::cerr << "Invalid server socket" << std::endl;
		return false;
	}

	struct sockaddr_in server_addr;
	memset(&server_addr, 0, sizeof(server_addr));
	server_addr.sin_family = AF_INET;
	server_addr.sin_addr.s_addr = INADDR_ANY;
	server_addr.sin_port = htons(port);

	if (bind(server_fd, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
		std::cerr << "Failed to bind to port " << port << ": " << strerror(errno) << std::endl;
		return false;
	}

	// Port 0 was resolved by the kernel; read back the real one
	socklen_t addr_len = sizeof(server_addr);
	if (getsockname(server_fd, (struct sockaddr*)&server_addr, &addr_len) < 0) {
		std::cerr << "Failed to read bound port: " << strerror(errno) << std::endl;
		return false;
	}
	port = ntohs(server_addr.sin_port);

	if (listen(server_fd, 16) < 0) {
		std::cerr << "Failed to listen on socket: " << strerror(errno) << std::endl;
		return false;
	}

	is_running = true;
	std::cout << "HTTP server started on port " << port << std::endl;
	std::cout << "Access the API at: http://0.0.0.0:" << port << "/scan" << std::endl;

	// Start accept thread
	accept_thread = new std::thread(&ScanHttpServer::acceptConnections, this);

	return true;
}

/**
 * Stops the server gracefully
 */
void ScanHttpServer::stop() {
	if (!is_running) return;

	std::cout << "Shutting down HTTP server..." << std::endl;
	is_running = false;

	// Close server socket to interrupt accept()
	if (server_fd >= 0) {
		shutdown(server_fd, SHUT_RDWR);  // SHUT_RDWR: Stop both reading and writing
		close(server_fd);
		server_fd = -1;
	}

	if (accept_thread) {
		if (accept_thread->joinable()) {
			accept_thread->join();
		}
		delete accept_thread;
		accept_thread = nullptr;
	}

	// Interrupt connections still being served
	{
		std::lock_guard<std::mutex> lock(clients_mutex);
		for (auto& client : clients) {
			if (client.socket_fd >= 0) {
				shutdown(client.socket_fd, SHUT_RDWR);
			}
		}
	}

	// Wait for client threads to remove themselves (with timeout)
	auto start = std::chrono::steady_clock::now();
	while (std::chrono::steady_clock::now() - start < 3s) {
		{
			std::lock_guard<std::mutex> lock(clients_mutex);
			if (clients.empty()) {
				break;
			}
		}
		std::this_thread::sleep_for(100ms);
	}

	// Clean up any remaining threads
	std::lock_guard<std::mutex> lock(clients_mutex);
	for (auto& client : clients) {
		if (client.handler_thread) {
			if (client.handler_thread->joinable()) {
				client.handler_thread->detach();  // Detach instead of join to avoid deadlock
			}
			delete client.handler_thread;
		}
		if (client.socket_fd >= 0) {
			close(client.socket_fd);
		}
	}
	clients.clear();

	std::cout << "HTTP server shutdown complete" << std::endl;
}

/**
 * Main accept loop
 */
void ScanHttpServer::acceptConnections() {
	// Set socket timeout for accept() to allow checking is_running
	struct timeval timeout;
	timeout.tv_sec = 1;  // 1 second timeout
	timeout.tv_usec = 0;
	setsockopt(server_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

	while (is_running) {
		struct sockaddr_in client_addr;
		socklen_t client_len = sizeof(client_addr);

		// accept() will now timeout after 1 second if no connection
		int client_socket = accept(server_fd, (struct sockaddr*)&client_addr, &client_len);

		if (!is_running) {
			if (client_socket >= 0) close(client_socket);
			break;
		}

		if (client_socket < 0) {
			if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
				std::cerr << "Failed to accept connection: " << strerror(errno) << std::endl;
			}
			continue;
		}

		char client_ip[INET_ADDRSTRLEN];
		inet_ntop(AF_INET, &(client_addr.sin_addr), client_ip, INET_ADDRSTRLEN);

		// Register before the thread starts so removeClient always finds the entry
		std::lock_guard<std::mutex> lock(clients_mutex);

		ClientInfo info;
		info.socket_fd = client_socket;
		info.ip_address = client_ip;
		info.port = ntohs(client_addr.sin_port);
		info.handler_thread = nullptr;

		try {
			info.handler_thread = new std::thread(&ScanHttpServer::handleClient,
							      this, client_socket, client_addr);
		} catch (const std::system_error& e) {
			std::cerr << "Failed to start handler for " << client_ip << ": " << e.what() << std::endl;
			close(client_socket);
			continue;
		}

		clients.push_back(info);
	}
}

/**
 * Handles one HTTP exchange
 */
void ScanHttpServer::handleClient(int client_socket, struct sockaddr_in client_addr) {
	char client_ip[INET_ADDRSTRLEN];
	inet_ntop(AF_INET, &(client_addr.sin_addr), client_ip, INET_ADDRSTRLEN);

	// Set socket timeout for recv()
	struct timeval timeout;
	timeout.tv_sec = 5;  // 5 second timeout
	timeout.tv_usec = 0;
	setsockopt(client_socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

	std::string request;
	char buffer[2048];

	// Only the request line and headers are needed; bodies are ignored
	while (is_running && request.find("\r\n\r\n") == std::string::npos &&
	       request.size() < MAX_REQUEST_SIZE) {
		ssize_t bytes_received = recv(client_socket, buffer, sizeof(buffer), 0);

		if (bytes_received < 0) {
			if (errno == EINTR) continue;
			if (errno != EAGAIN && errno != EWOULDBLOCK && errno != ECONNRESET) {
				std::cerr << "Error receiving from client " << client_ip << ": "
					<< strerror(errno) << std::endl;
			}
			break;
		}

		if (bytes_received == 0) {
			break;
		}

		request.append(buffer, static_cast<size_t>(bytes_received));
	}

	size_t line_end = request.find("\r\n");
	if (line_end == std::string::npos) {
		line_end = request.find('\n');
	}

	if (!request.empty()) {
		HttpResponse response;
		std::istringstream request_line(request.substr(0, line_end));
		std::string method;
		std::string target;
		std::string version;

		if (line_end != std::string::npos && (request_line >> method >> target >> version) &&
		    version.compare(0, 5, "HTTP/") == 0) {
			response = handleRequest(method, target);
		} else {
			response = errorResponse(400, "Malformed request");
		}

		if (!sendAll(client_socket, response.serialize())) {
			std::cerr << "Failed to send response to " << client_ip << ": " << strerror(errno) << std::endl;
		}
	}

	// Clean up
	removeClient(client_socket);
}

HttpResponse ScanHttpServer::handleRequest(const std::string& method, const std::string& target) const {
	std::string path = target.substr(0, target.find('?'));

	if (path != "/scan") {
		return errorResponse(404, "Endpoint not found");
	}

	if (method != "GET") {
		return errorResponse(405, "Only GET is supported");
	}

	try {
		ScanResult devices = cache.snapshot();
		return HttpResponse{200, "application/json", makeScanResponse(devices).dump(2)};
	} catch (const json::exception& e) {
		std::cerr << "Failed to encode scan results: " << e.what() << std::endl;
		return errorResponse(500, "Failed to encode scan results");
	}
}

/**
 * Removes a client from the clients list
 */
void ScanHttpServer::removeClient(int socket_fd) {
	std::lock_guard<std::mutex> lock(clients_mutex);

	auto it = std::find_if(clients.begin(), clients.end(),
			[socket_fd](const ClientInfo& client) { return client.socket_fd == socket_fd; });

	if (it != clients.end()) {
		if (it->socket_fd >= 0) {
			shutdown(it->socket_fd, SHUT_RDWR);
			close(it->socket_fd);
			it->socket_fd = -1;
		}

		// Called from the handler thread itself: detach, never join
		if (it->handler_thread && it->handler_thread->joinable()) {
			it->handler_thread->detach();
		}

		// Delete the thread object (safe after detach)
		delete it->handler_thread;

		clients.erase(it);
	}
}
