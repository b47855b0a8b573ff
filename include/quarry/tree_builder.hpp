#pragma once

/// @file tree_builder.hpp
/// @brief Builds a Value from grammar callbacks or from a stream of events.
///
/// The tree front-end is this class plugged directly into the grammar.
/// apply() accepts the events of the event front-end, so any event stream
/// can be turned back into the tree the tree front-end would have built.

#include "config.hpp"
#include "error.hpp"
#include "event.hpp"
#include "value.hpp"

#include <string>
#include <utility>
#include <vector>

namespace quarry {

class TreeBuilder {
public:
    TreeBuilder() = default;

    // ─── Grammar actions ─────────────────────────────────────────────────

    void begin_object(Coordinate) { open(Value::object()); }
    void begin_array(Coordinate) { open(Value::array()); }
    void end_object(Coordinate at) { close(Type::Object, at); }
    void end_array(Coordinate at) { close(Type::Array, at); }
    void key(std::string&& k, Coordinate) { key_ = std::move(k); }
    void scalar(Value&& v, Coordinate) { attach(std::move(v)); }
    void end_document(Coordinate) noexcept {}

    // ─── Event replay ────────────────────────────────────────────────────

    /// @brief Feed one event of the event front-end.
    /// @throws SyntaxError if a container end does not match its begin.
    void apply(const Event& e) {
        switch (e.kind) {
            case EventKind::StartDocument: reset(); break;
            case EventKind::EndDocument:   end_document(e.coordinate); break;
            case EventKind::ObjectBegin:   begin_object(e.coordinate); break;
            case EventKind::ObjectEnd:     end_object(e.coordinate); break;
            case EventKind::ArrayBegin:    begin_array(e.coordinate); break;
            case EventKind::ArrayEnd:      end_array(e.coordinate); break;
            case EventKind::Key:           key(std::string(e.key), e.coordinate); break;
            case EventKind::Scalar:        scalar(Value(e.value), e.coordinate); break;
        }
    }

    // ─── Result ──────────────────────────────────────────────────────────

    /// True once the root value has been closed.
    [[nodiscard]] bool complete() const noexcept { return complete_; }

    [[nodiscard]] const Value& root() const noexcept { return root_; }

    /// Move the root out and start over.
    [[nodiscard]] Value release() {
        Value out = std::move(root_);
        reset();
        return out;
    }

    void reset() {
        stack_.clear();
        key_.clear();
        root_ = Value();
        complete_ = false;
    }

private:
    /// A container under construction and the key it will be stored under
    /// in its parent (empty when the parent is an array or there is none).
    struct Slot {
        Value value;
        std::string key;
    };

    void open(Value container) {
        stack_.push_back(Slot{std::move(container), std::move(key_)});
        key_.clear();
    }

    void close(Type expected, Coordinate at) {
        if (QUARRY_UNLIKELY(stack_.empty() || stack_.back().value.type() != expected)) {
            throw SyntaxError(std::string("unmatched end of ") + type_name(expected), at,
                              Expectation::Value);
        }
        Slot slot = std::move(stack_.back());
        stack_.pop_back();
        key_ = std::move(slot.key);
        attach(std::move(slot.value));
    }

    void attach(Value v) {
        if (stack_.empty()) {
            root_ = std::move(v);
            complete_ = true;
            return;
        }
        Value& parent = stack_.back().value;
        if (parent.is_array()) {
            parent.push_back(std::move(v));
        } else {
            parent.insert(std::move(key_), std::move(v));
            key_.clear();
        }
    }

    std::vector<Slot> stack_;
    std::string key_;
    Value root_;
    bool complete_ = false;
};

} // namespace quarry
