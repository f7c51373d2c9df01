#pragma once

#include "backend/backend.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

class HyprlandBackend : public WindowBackend {
public:
    HyprlandBackend(std::string signature, std::string runtime_dir,
                    std::chrono::milliseconds timeout);

    BackendKind kind() const override { return BackendKind::Hyprland; }
    PollResult poll() override;

    // `j/` asks hyprctl's request socket for JSON output.
    static constexpr std::string_view CLIENTS_REQUEST = "j/clients";
    static constexpr size_t MAX_RESPONSE = 16u << 20;

    // Candidate request-socket paths, most specific first:
    // $XDG_RUNTIME_DIR/hypr/<sig>/.socket.sock, then /tmp/hypr/<sig>/.socket.sock.
    static std::vector<std::string> socket_paths(const std::string& signature,
                                                 const std::string& runtime_dir);

    static PollResult parse_clients(std::string_view json);

private:
    std::string signature_;
    std::string runtime_dir_;
    std::chrono::milliseconds timeout_;
};
