#pragma once

#include "window_error.hpp"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

class SwayIpc {
public:
    // i3-ipc binary protocol
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr size_t HEADER_SIZE = 14;
    static constexpr uint32_t MSG_RUN_COMMAND = 0;
    static constexpr uint32_t MSG_GET_TREE = 4;

    SwayIpc();
    ~SwayIpc();

    SwayIpc(const SwayIpc&) = delete;
    SwayIpc& operator=(const SwayIpc&) = delete;

    // Connect to Sway IPC. An empty path means $SWAYSOCK.
    // Returns false if no socket is known or the connection fails.
    bool connect(const std::string& socket_path = {});

    // Take ownership of an already connected socket.
    void adopt(int fd);

    bool connected() const { return fd_ >= 0; }
    void close();

    // Send a request and parse the JSON reply.
    WindowResult<nlohmann::json> request(uint32_t type, const std::string& payload = "");

    WindowResult<nlohmann::json> get_tree();

    // Run a command list, e.g. "[con_id=5] focus". Fails with
    // native_call_failed if sway rejects any command of the list.
    WindowResult<void> run_command(const std::string& command);

    // Header ("i3-ipc" + length + type, native byte order) followed by payload.
    static std::string encode_message(uint32_t type, const std::string& payload);
    static bool decode_header(const char* header, uint32_t& length, uint32_t& type);

private:
    bool send_message(uint32_t type, const std::string& payload);
    bool recv_message(uint32_t& type, std::string& payload);

    static int connect_socket(const std::string& path);

    int fd_ = -1;
};
