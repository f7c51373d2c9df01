#include "backend/dbus_util.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <string_view>

namespace dbus {

namespace {

bool one_of(const std::string& name, std::initializer_list<std::string_view> names) {
    for (auto n : names) {
        if (name == n) return true;
    }
    return false;
}

} // namespace

PollError CallError::to_poll_error() const {
    auto text = name.empty() ? message : std::format("{}: {}", name, message);

    if (one_of(name, {SD_BUS_ERROR_SERVICE_UNKNOWN, SD_BUS_ERROR_NAME_HAS_NO_OWNER,
                      SD_BUS_ERROR_UNKNOWN_OBJECT, SD_BUS_ERROR_UNKNOWN_INTERFACE,
                      SD_BUS_ERROR_DISCONNECTED, SD_BUS_ERROR_NO_SERVER})) {
        return {PollErrorKind::Connection, text};
    }
    if (name.empty() && (error == -ECONNREFUSED || error == -ENOENT ||
                         error == -ECONNRESET || error == -ENOTCONN)) {
        return {PollErrorKind::Connection, text};
    }
    return {PollErrorKind::Protocol, text};
}

bool CallError::unknown_method() const {
    return one_of(name, {SD_BUS_ERROR_UNKNOWN_METHOD, SD_BUS_ERROR_UNKNOWN_INTERFACE});
}

bool CallError::unknown_object() const {
    return name == SD_BUS_ERROR_UNKNOWN_OBJECT;
}

std::expected<BusPtr, PollError> open_session_bus() {
    sd_bus* bus = nullptr;
    int r = sd_bus_open_user(&bus);
    if (r < 0) {
        return std::unexpected(PollError{
            PollErrorKind::Connection,
            std::format("session bus: {}", std::strerror(-r))});
    }
    return BusPtr(bus);
}

namespace detail {

std::expected<MessagePtr, CallError> new_call(sd_bus* bus, const MethodTarget& target) {
    sd_bus_message* m = nullptr;
    int r = sd_bus_message_new_method_call(bus, &m, target.destination, target.path,
                                           target.interface, target.member);
    if (r < 0) {
        return std::unexpected(CallError{
            {}, std::format("cannot build call {}.{}", target.interface, target.member), r});
    }
    return MessagePtr(m);
}

std::expected<MessagePtr, CallError> send_call(sd_bus* bus, sd_bus_message* call,
                                               std::chrono::microseconds timeout) {
    sd_bus_error err = SD_BUS_ERROR_NULL;
    sd_bus_message* reply = nullptr;

    int r = sd_bus_call(bus, call, static_cast<uint64_t>(timeout.count()), &err, &reply);
    if (r < 0) {
        CallError ce{
            err.name ? err.name : "",
            err.message ? err.message : std::strerror(-r),
            r,
        };
        sd_bus_error_free(&err);
        return std::unexpected(std::move(ce));
    }
    sd_bus_error_free(&err);
    return MessagePtr(reply);
}

} // namespace detail

int read_property_bag(sd_bus_message* m, PropertyBag& out) {
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0) return r;

    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0) {
        const char* key = nullptr;
        r = sd_bus_message_read_basic(m, SD_BUS_TYPE_STRING, &key);
        if (r < 0) return r;
        std::string name = key;

        char type = 0;
        const char* contents = nullptr;
        r = sd_bus_message_peek_type(m, &type, &contents);
        if (r < 0) return r;

        r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, contents);
        if (r < 0) return r;

        std::string_view sig = contents ? contents : "";
        PropertyValue value;
        if (sig == "s" || sig == "o") {
            const char* s = nullptr;
            r = sd_bus_message_read_basic(m, sig[0], &s);
            if (r >= 0) value = std::string(s ? s : "");
        } else if (sig == "b") {
            int b = 0;
            r = sd_bus_message_read_basic(m, SD_BUS_TYPE_BOOLEAN, &b);
            if (r >= 0) value = b != 0;
        } else if (sig == "i") {
            int32_t v = 0;
            r = sd_bus_message_read_basic(m, SD_BUS_TYPE_INT32, &v);
            if (r >= 0) value = static_cast<int64_t>(v);
        } else if (sig == "u") {
            uint32_t v = 0;
            r = sd_bus_message_read_basic(m, SD_BUS_TYPE_UINT32, &v);
            if (r >= 0) value = static_cast<int64_t>(v);
        } else if (sig == "x") {
            int64_t v = 0;
            r = sd_bus_message_read_basic(m, SD_BUS_TYPE_INT64, &v);
            if (r >= 0) value = v;
        } else if (sig == "t") {
            uint64_t v = 0;
            r = sd_bus_message_read_basic(m, SD_BUS_TYPE_UINT64, &v);
            if (r >= 0) value = v;
        } else {
            r = sd_bus_message_skip(m, contents);
        }
        if (r < 0) return r;

        r = sd_bus_message_exit_container(m);  // variant
        if (r < 0) return r;
        r = sd_bus_message_exit_container(m);  // dict entry
        if (r < 0) return r;

        out[std::move(name)] = std::move(value);
    }
    if (r < 0) return r;

    return sd_bus_message_exit_container(m);
}

std::optional<std::string> string_property(const PropertyBag& bag, const std::string& key) {
    auto it = bag.find(key);
    if (it == bag.end()) return std::nullopt;
    if (auto* s = std::get_if<std::string>(&it->second)) return *s;
    return std::nullopt;
}

std::optional<bool> bool_property(const PropertyBag& bag, const std::string& key) {
    auto it = bag.find(key);
    if (it == bag.end()) return std::nullopt;
    if (auto* b = std::get_if<bool>(&it->second)) return *b;
    return std::nullopt;
}

} // namespace dbus
