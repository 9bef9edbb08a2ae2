#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <vector>

class UnixSocketServer : public IpcServer {
public:
    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    bool read_commands(int client_fd, std::vector<nlohmann::json>& cmds) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

    // Splits complete lines off the front of `buf`. Lines that are not JSON
    // become {"cmd": ""} so the caller still answers them.
    static std::vector<nlohmann::json> take_lines(std::string& buf);

private:
    static constexpr size_t MAX_LINE = 64 * 1024;
    static constexpr int SEND_TIMEOUT_MS = 1000;

    int server_fd_ = -1;
    std::string socket_path_;

    // Per-client read buffers for partial reads.
    struct ClientBuffer {
        int fd;
        std::string buf;
    };
    std::vector<ClientBuffer> clients_;

    ClientBuffer* find_client(int fd);
};
