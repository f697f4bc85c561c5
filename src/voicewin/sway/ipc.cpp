#include "sway/ipc.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

SwayIpc::SwayIpc() = default;

SwayIpc::~SwayIpc() {
    close();
}

bool SwayIpc::connect(const std::string& socket_path) {
    std::string path = socket_path;
    if (path.empty()) {
        const char* sock = std::getenv("SWAYSOCK");
        if (!sock) {
            std::println(stderr, "sway: $SWAYSOCK not set");
            return false;
        }
        path = sock;
    }

    close();
    fd_ = connect_socket(path);
    return fd_ >= 0;
}

void SwayIpc::adopt(int fd) {
    close();
    fd_ = fd;
}

void SwayIpc::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

WindowResult<nlohmann::json> SwayIpc::request(uint32_t type, const std::string& payload) {
    if (fd_ < 0) {
        return std::unexpected(WindowError{WindowErrc::ipc_error, "not connected to sway"});
    }
    if (!send_message(type, payload)) {
        return std::unexpected(WindowError{WindowErrc::ipc_error,
            std::format("sending message type {} failed", type)});
    }

    uint32_t reply_type;
    std::string reply;
    if (!recv_message(reply_type, reply)) {
        return std::unexpected(WindowError{WindowErrc::ipc_error,
            std::format("no reply to message type {}", type)});
    }
    if (reply_type != type) {
        return std::unexpected(WindowError{WindowErrc::ipc_error,
            std::format("expected reply type {}, got {}", type, reply_type)});
    }

    try {
        return nlohmann::json::parse(reply);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(WindowError{WindowErrc::ipc_error,
            std::format("malformed reply: {}", e.what())});
    }
}

WindowResult<nlohmann::json> SwayIpc::get_tree() {
    return request(MSG_GET_TREE);
}

WindowResult<void> SwayIpc::run_command(const std::string& command) {
    auto reply = request(MSG_RUN_COMMAND, command);
    if (!reply) return std::unexpected(reply.error());

    if (!reply->is_array()) {
        return std::unexpected(WindowError{WindowErrc::ipc_error, "RUN_COMMAND reply is not a list"});
    }
    for (const auto& result : *reply) {
        auto success = result.is_object() ? result.find("success") : result.end();
        if (success != result.end() && success->is_boolean() && success->get<bool>()) continue;

        std::string error = "unknown error";
        if (result.is_object()) {
            auto it = result.find("error");
            if (it != result.end() && it->is_string()) error = it->get<std::string>();
        }
        return std::unexpected(WindowError{WindowErrc::native_call_failed,
            std::format("sway rejected '{}': {}", command, error)});
    }
    return {};
}

std::string SwayIpc::encode_message(uint32_t type, const std::string& payload) {
    uint32_t len = static_cast<uint32_t>(payload.size());
    std::string msg(HEADER_SIZE, '\0');
    std::memcpy(msg.data(), MAGIC, 6);
    std::memcpy(msg.data() + 6, &len, 4);
    std::memcpy(msg.data() + 10, &type, 4);
    msg += payload;
    return msg;
}

bool SwayIpc::decode_header(const char* header, uint32_t& length, uint32_t& type) {
    if (std::memcmp(header, MAGIC, 6) != 0) return false;
    std::memcpy(&length, header + 6, 4);
    std::memcpy(&type, header + 10, 4);
    return true;
}

int SwayIpc::connect_socket(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "sway: connect to {} failed: {}", path, std::strerror(errno));
        ::close(fd);
        return -1;
    }
    return fd;
}

bool SwayIpc::send_message(uint32_t type, const std::string& payload) {
    auto msg = encode_message(type, payload);
    size_t sent_total = 0;
    while (sent_total < msg.size()) {
        ssize_t n = ::send(fd_, msg.data() + sent_total, msg.size() - sent_total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent_total += static_cast<size_t>(n);
    }
    return true;
}

bool SwayIpc::recv_message(uint32_t& type, std::string& payload) {
    // Read header
    char header[HEADER_SIZE];
    size_t read_total = 0;
    while (read_total < HEADER_SIZE) {
        ssize_t n = ::recv(fd_, header + read_total, HEADER_SIZE - read_total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    uint32_t len;
    if (!decode_header(header, len, type)) return false;

    payload.resize(len);
    read_total = 0;
    while (read_total < len) {
        ssize_t n = ::recv(fd_, payload.data() + read_total, len - read_total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    return true;
}
