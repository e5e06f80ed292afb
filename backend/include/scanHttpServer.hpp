#pragma once

#include <string>
#include <vector>
#include <thread>
#include <cstdint>
#include <mutex>
#include <atomic>
#include <netinet/in.h>
#include "resultCache.hpp"

/**
 * Response produced for one request
 */
struct HttpResponse {
	int status;
	std::string content_type;
	std::string body;

	/**
	 * Status line, headers and body, ready to be written to the socket
	 * Always closes the connection and allows any origin
	 */
	std::string serialize() const;
};

/**
 * Structure to hold information about a connection being served
 */
struct ClientInfo {
	int socket_fd;                    // Client socket file descriptor
	std::string ip_address;           // Client IP address
	int port;                         // Client port
	std::thread* handler_thread;      // Thread handling this client
};

/**
 * ScanHttpServer exposes the cached scan over HTTP
 * GET /scan returns the devices as JSON, every other path is a 404
 */
class ScanHttpServer {
private:
	const ResultCache& cache;           // Read only, shared with the scanner
	int server_fd;                      // Server socket file descriptor
	int port;                           // Requested port, bound port after start()
	std::atomic<bool> is_running;       // Server status flag
	std::vector<ClientInfo> clients;    // Connections being served
	std::thread* accept_thread;         // Thread for accepting new connections
	std::mutex clients_mutex;           // Mutex for thread-safe client list access

	/**
	 * Main server loop that accepts incoming connections
	 * Runs in a separate thread
	 */
	void acceptConnections();

	/**
	 * Reads one request, writes the response and closes the connection
	 * @param client_socket: Socket descriptor for the client
	 * @param client_addr: Client address information
	 * Runs in a separate thread per client
	 */
	void handleClient(int client_socket, struct sockaddr_in client_addr);

	/**
	 * Removes a client from the clients list and closes its socket
	 * @param socket_fd: Socket of client to remove
	 */
	void removeClient(int socket_fd);

public:
	/**
	 * Constructor - creates the listening socket
	 * @param cache: Source of the devices served on /scan
	 * @param port: Port to listen on, 0 lets the OS pick one
	 */
	ScanHttpServer(const ResultCache& cache, int port = 0);

	/**
	 * Destructor - ensures clean shutdown
	 */
	~ScanHttpServer();

	/**
	 * Binds, listens and starts the accept thread
	 * @return: false if the port cannot be bound
	 */
	bool start();

	/**
	 * Stops the server gracefully
	 */
	void stop();

	/**
	 * Route a request
	 * @param method: Request method, e.g. GET
	 * @param target: Request target, the query string is ignored
	 */
	HttpResponse handleRequest(const std::string& method, const std::string& target) const;

	bool isRunning() const { return is_running; }

	/**
	 * Gets the port the server listens on
	 * @return: Bound port once started
	 */
	int getPort() const { return port; }
};
