#pragma once

#include "backend/backend.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

class SwayBackend : public WindowBackend {
public:
    SwayBackend(std::string socket_path, std::chrono::milliseconds timeout);

    BackendKind kind() const override { return BackendKind::Sway; }
    PollResult poll() override;

    // i3-ipc binary protocol. Length and type are uint32 in host byte order,
    // as the i3 IPC documentation defines them.
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr size_t MAGIC_LEN = 6;
    static constexpr size_t HEADER_LEN = 14;
    static constexpr uint32_t MSG_GET_TREE = 4;
    static constexpr uint32_t MAX_PAYLOAD = 64u << 20;

    using Header = std::array<char, HEADER_LEN>;

    static Header encode_header(uint32_t type, uint32_t payload_len);

    struct DecodedHeader {
        uint32_t payload_len;
        uint32_t type;
    };
    static std::expected<DecodedHeader, PollError> decode_header(const Header& header);

    // Walk a GET_TREE reply and collect leaf containers with an app_id.
    static PollResult parse_tree(std::string_view json);

private:
    std::string socket_path_;
    std::chrono::milliseconds timeout_;
};
