#pragma once

/// @file event.hpp
/// @brief Structural events emitted by the event front-end.

#include "error.hpp"
#include "json_pointer.hpp"
#include "value.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

namespace quarry {

enum class EventKind : uint8_t {
    StartDocument,
    EndDocument,
    ObjectBegin,
    ObjectEnd,
    ArrayBegin,
    ArrayEnd,
    Key,
    Scalar
};

inline const char* event_kind_name(EventKind k) noexcept {
    switch (k) {
        case EventKind::StartDocument: return "start-document";
        case EventKind::EndDocument:   return "end-document";
        case EventKind::ObjectBegin:   return "object-begin";
        case EventKind::ObjectEnd:     return "object-end";
        case EventKind::ArrayBegin:    return "array-begin";
        case EventKind::ArrayEnd:      return "array-end";
        case EventKind::Key:           return "key";
        case EventKind::Scalar:        return "scalar";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, EventKind k) {
    return os << event_kind_name(k);
}

/// @brief One structural event.
///
/// `key` is set for Key events, `value` for Scalar events. `path` is the
/// JSON Pointer of the value the event concerns: for a Key event, the
/// member about to be parsed; for container events, the container itself.
struct Event {
    EventKind kind = EventKind::StartDocument;
    std::string key;
    Value value;
    Coordinate coordinate;
    JsonPointer path;

    Event() = default;
    Event(EventKind k, Coordinate c, JsonPointer p)
        : kind(k), coordinate(c), path(std::move(p)) {}

    [[nodiscard]] bool is_container_begin() const noexcept {
        return kind == EventKind::ObjectBegin || kind == EventKind::ArrayBegin;
    }
    [[nodiscard]] bool is_container_end() const noexcept {
        return kind == EventKind::ObjectEnd || kind == EventKind::ArrayEnd;
    }
};

} // namespace quarry
