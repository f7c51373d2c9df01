#pragma once

#include "backend/backend.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <systemd/sd-bus.h>
#include <variant>

namespace dbus {

struct BusDeleter {
    void operator()(sd_bus* bus) const { sd_bus_flush_close_unref(bus); }
};
struct MessageDeleter {
    void operator()(sd_bus_message* m) const { sd_bus_message_unref(m); }
};
struct SlotDeleter {
    void operator()(sd_bus_slot* slot) const { sd_bus_slot_unref(slot); }
};

using BusPtr = std::unique_ptr<sd_bus, BusDeleter>;
using MessagePtr = std::unique_ptr<sd_bus_message, MessageDeleter>;
using SlotPtr = std::unique_ptr<sd_bus_slot, SlotDeleter>;

struct CallError {
    std::string name;     // D-Bus error name, empty for transport errors
    std::string message;
    int error = 0;        // negative errno from sd-bus

    // Missing service, object or interface means the compositor does not
    // offer this API at all: a connection failure. Everything else,
    // including timeouts, is a protocol failure.
    PollError to_poll_error() const;
    bool unknown_method() const;
    bool unknown_object() const;
};

struct MethodTarget {
    const char* destination;
    const char* path;
    const char* interface;
    const char* member;
};

std::expected<BusPtr, PollError> open_session_bus();

namespace detail {
std::expected<MessagePtr, CallError> new_call(sd_bus* bus, const MethodTarget& target);
std::expected<MessagePtr, CallError> send_call(sd_bus* bus, sd_bus_message* call,
                                               std::chrono::microseconds timeout);
} // namespace detail

// Synchronous method call bounded by `timeout`. `types` and `args` follow
// sd_bus_message_append(); pass nullptr for no arguments.
template <typename... Args>
std::expected<MessagePtr, CallError> call(sd_bus* bus, const MethodTarget& target,
                                          std::chrono::microseconds timeout,
                                          const char* types = nullptr, Args... args) {
    auto msg = detail::new_call(bus, target);
    if (!msg) return std::unexpected(msg.error());

    if (types) {
        int r = sd_bus_message_append(msg->get(), types, args...);
        if (r < 0) return std::unexpected(CallError{{}, "failed to append arguments", r});
    }
    return detail::send_call(bus, msg->get(), timeout);
}

// Loosely typed a{sv} value. Types other than these are skipped on read.
using PropertyValue = std::variant<std::monostate, std::string, bool, int64_t, uint64_t>;
using PropertyBag = std::map<std::string, PropertyValue>;

// Read one a{sv} at the message's current position. Returns negative errno.
int read_property_bag(sd_bus_message* m, PropertyBag& out);

// Typed lookups; a value of the wrong type counts as absent.
std::optional<std::string> string_property(const PropertyBag& bag, const std::string& key);
std::optional<bool> bool_property(const PropertyBag& bag, const std::string& key);

} // namespace dbus
