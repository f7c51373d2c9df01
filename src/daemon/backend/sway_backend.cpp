#include "backend/sway_backend.hpp"

#include "backend/unix_stream.hpp"
#include "backend/utf8.hpp"

#include <cstring>
#include <format>
#include <nlohmann/json.hpp>
#include <vector>

using json = nlohmann::json;

namespace {

std::string node_id(const json& node) {
    auto it = node.find("id");
    if (it == node.end()) return {};
    if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
    if (it->is_string()) return it->get<std::string>();
    return {};
}

std::string string_field(const json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

bool is_leaf_container(const json& node) {
    auto type = string_field(node, "type");
    return type == "con" || type == "floating_con";
}

} // namespace

SwayBackend::SwayBackend(std::string socket_path, std::chrono::milliseconds timeout)
    : socket_path_(std::move(socket_path)), timeout_(timeout) {}

PollResult SwayBackend::poll() {
    if (socket_path_.empty()) {
        return std::unexpected(PollError{PollErrorKind::Connection, "$SWAYSOCK not set"});
    }

    UnixStream stream(timeout_);
    if (auto r = stream.connect(socket_path_); !r) return std::unexpected(r.error());

    auto request = encode_header(MSG_GET_TREE, 0);
    if (auto r = stream.write_all({request.data(), request.size()}); !r) {
        return std::unexpected(r.error());
    }

    Header header;
    if (auto r = stream.read_exact(header.data(), header.size()); !r) {
        return std::unexpected(r.error());
    }

    auto decoded = decode_header(header);
    if (!decoded) return std::unexpected(decoded.error());
    if (decoded->type != MSG_GET_TREE) {
        return std::unexpected(PollError{
            PollErrorKind::Protocol,
            std::format("unexpected reply type {} to get_tree", decoded->type)});
    }

    std::string payload(decoded->payload_len, '\0');
    if (auto r = stream.read_exact(payload.data(), payload.size()); !r) {
        return std::unexpected(r.error());
    }

    return parse_tree(payload);
}

SwayBackend::Header SwayBackend::encode_header(uint32_t type, uint32_t payload_len) {
    // "i3-ipc" (6 bytes) + length (4 bytes) + type (4 bytes)
    Header header{};
    std::memcpy(header.data(), MAGIC, MAGIC_LEN);
    std::memcpy(header.data() + 6, &payload_len, 4);
    std::memcpy(header.data() + 10, &type, 4);
    return header;
}

std::expected<SwayBackend::DecodedHeader, PollError>
SwayBackend::decode_header(const Header& header) {
    if (std::memcmp(header.data(), MAGIC, MAGIC_LEN) != 0) {
        return std::unexpected(PollError{PollErrorKind::Protocol, "bad i3-ipc magic"});
    }

    DecodedHeader out{};
    std::memcpy(&out.payload_len, header.data() + 6, 4);
    std::memcpy(&out.type, header.data() + 10, 4);

    if (out.payload_len > MAX_PAYLOAD) {
        return std::unexpected(PollError{
            PollErrorKind::Protocol,
            std::format("payload length {} exceeds limit", out.payload_len)});
    }
    return out;
}

PollResult SwayBackend::parse_tree(std::string_view payload) {
    json root;
    try {
        root = json::parse(replace_invalid_utf8(payload));
    } catch (const json::exception& e) {
        return std::unexpected(PollError{PollErrorKind::Protocol,
                                         std::string("JSON parse error: ") + e.what()});
    }
    if (!root.is_object()) {
        return std::unexpected(PollError{PollErrorKind::Protocol, "tree root is not an object"});
    }

    std::vector<WindowRecord> windows;

    // Explicit stack: the tree comes from another process and may be deep.
    // Children are pushed in reverse so records come out in pre-order.
    std::vector<const json*> stack{&root};
    while (!stack.empty()) {
        const json& node = *stack.back();
        stack.pop_back();

        if (is_leaf_container(node)) {
            auto app_id = string_field(node, "app_id");
            if (!app_id.empty()) {
                auto focused = node.find("focused");
                windows.push_back(WindowRecord{
                    .id = node_id(node),
                    .title = string_field(node, "name"),
                    .app_id = std::move(app_id),
                    .is_focused = focused != node.end() && focused->is_boolean() &&
                                  focused->get<bool>(),
                });
            }
        }

        for (const char* key : {"floating_nodes", "nodes"}) {
            auto it = node.find(key);
            if (it == node.end() || !it->is_array()) continue;
            for (auto child = it->rbegin(); child != it->rend(); ++child) {
                if (child->is_object()) stack.push_back(&*child);
            }
        }
    }

    return WindowSnapshot::from_windows(std::move(windows));
}
