#pragma once

#include "sway/ipc.hpp"

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

// In-process i3-ipc peer on a socket pair. Answers GET_TREE with the
// configured tree and RUN_COMMAND with success, unless the command contains
// the configured failure marker. Records every command it receives.
class FakeSwayServer {
public:
    explicit FakeSwayServer(nlohmann::json tree);
    ~FakeSwayServer();

    FakeSwayServer(const FakeSwayServer&) = delete;
    FakeSwayServer& operator=(const FakeSwayServer&) = delete;

    // Client end of the pair; ownership passes to the caller (SwayIpc::adopt).
    int client_fd() const { return client_fd_; }

    void set_tree(nlohmann::json tree);
    void fail_commands_containing(std::string marker);

    std::vector<std::string> commands() const;
    size_t tree_requests() const;

private:
    void serve();
    bool read_exact(char* buf, size_t len);

    int server_fd_ = -1;
    int client_fd_ = -1;

    mutable std::mutex mutex_;
    nlohmann::json tree_;
    std::string fail_marker_;
    std::vector<std::string> commands_;
    size_t tree_requests_ = 0;

    std::thread thread_;
};
