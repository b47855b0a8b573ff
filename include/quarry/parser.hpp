#pragma once

/// @file parser.hpp
/// @brief Tree and event front-ends of the parser.
///
/// Both front-ends run the same detail::Grammar:
///   - parse() / try_parse() plug in TreeBuilder and return the document
///   - EventReader plugs in an event emitter and hands out one structural
///     event per pull; parse_events() drives a reader into a callback
///
/// Faults of every stage propagate unchanged. Once a reader has raised a
/// fault, every later next() rethrows that same fault.

#include "byte_source.hpp"
#include "config.hpp"
#include "detail/grammar.hpp"
#include "error.hpp"
#include "event.hpp"
#include "json_pointer.hpp"
#include "lexer.hpp"
#include "parse_options.hpp"
#include "pipeline.hpp"
#include "tree_builder.hpp"
#include "value.hpp"

#include <exception>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quarry {

namespace detail {

/// Grammar actions that turn each transition into an Event and keep the
/// JSON Pointer path of the value being parsed.
class EventEmitter {
public:
    void begin_object(Coordinate at) {
        enter_value();
        emit(EventKind::ObjectBegin, at);
        frames_.push_back(Frame{true, 0});
    }

    void end_object(Coordinate at) {
        if (frames_.back().count > 0) path_.pop();
        frames_.pop_back();
        emit(EventKind::ObjectEnd, at);
    }

    void begin_array(Coordinate at) {
        enter_value();
        emit(EventKind::ArrayBegin, at);
        frames_.push_back(Frame{false, 0});
        path_.push(size_t{0});
    }

    void end_array(Coordinate at) {
        path_.pop();
        frames_.pop_back();
        emit(EventKind::ArrayEnd, at);
    }

    void key(std::string&& k, Coordinate at) {
        if (frames_.back().count++ > 0) path_.replace_back(k);
        else path_.push(k);
        emit(EventKind::Key, at);
        event_.key = std::move(k);
    }

    void scalar(Value&& v, Coordinate at) {
        enter_value();
        emit(EventKind::Scalar, at);
        event_.value = std::move(v);
    }

    void end_document(Coordinate at) { emit(EventKind::EndDocument, at); }

    [[nodiscard]] bool ready() const noexcept { return ready_; }

    Event take() {
        ready_ = false;
        return std::move(event_);
    }

private:
    struct Frame {
        bool object;
        size_t count;  ///< keys seen (object) or elements started (array)
    };

    /// Array elements get their index as the last path token.
    void enter_value() {
        if (frames_.empty() || frames_.back().object) return;
        path_.replace_back(std::to_string(frames_.back().count++));
    }

    void emit(EventKind kind, Coordinate at) {
        event_ = Event(kind, at, path_);
        ready_ = true;
    }

    std::vector<Frame> frames_;
    JsonPointer path_;
    Event event_;
    bool ready_ = false;
};

} // namespace detail

// =====================================================================
// Event front-end
// =====================================================================

/// @brief Pull-based event stream.
///
/// The sequence is StartDocument, the structural events of the root value,
/// then EndDocument; after that next() returns nullptr. The stream is not
/// restartable.
class EventReader {
public:
    /// Reads from a caller-driven lexer. ParseOptions::encoding and
    /// ParseOptions::numerics are the lexer's business and are ignored here.
    explicit EventReader(Lexer& lexer, const ParseOptions& options = {})
        : grammar_(lexer, emitter_, options) {}

    /// Borrows `text`; it must outlive the reader.
    explicit EventReader(std::string_view text, const ParseOptions& options = {})
        : EventReader(std::make_unique<Pipeline>(text, options)) {}

    explicit EventReader(ByteSource& source, const ParseOptions& options = {})
        : EventReader(std::make_unique<Pipeline>(source, options)) {}

    explicit EventReader(std::istream& is, const ParseOptions& options = {})
        : EventReader(std::make_unique<Pipeline>(is, options)) {}

    EventReader(const EventReader&) = delete;
    EventReader& operator=(const EventReader&) = delete;

    /// @brief Produce the next event.
    /// @return the event, valid until the next call; nullptr once the
    ///         stream is finished.
    /// @throws DecodeError, ScanError, LexError, SyntaxError.
    const Event* next() {
        if (QUARRY_UNLIKELY(fault_)) std::rethrow_exception(fault_);
        if (done_) return nullptr;

        if (!started_) {
            started_ = true;
            current_ = Event(EventKind::StartDocument, Coordinate{}, JsonPointer{});
            return &current_;
        }

        try {
            for (;;) {
                if (emitter_.ready()) {
                    current_ = emitter_.take();
                    return &current_;
                }
                if (grammar_.finished()) {
                    done_ = true;
                    return nullptr;
                }
                grammar_.step();
            }
        } catch (const Fault&) {
            fault_ = std::current_exception();
            throw;
        }
    }

    /// Nesting depth of the value currently being read.
    [[nodiscard]] size_t depth() const noexcept { return grammar_.depth(); }

private:
    explicit EventReader(std::unique_ptr<Pipeline> pipeline)
        : pipeline_(std::move(pipeline))
        , grammar_(pipeline_->lexer(), emitter_, pipeline_->options()) {}

    std::unique_ptr<Pipeline> pipeline_;
    detail::EventEmitter emitter_;
    detail::Grammar<detail::EventEmitter> grammar_;
    Event current_;
    std::exception_ptr fault_;
    bool started_ = false;
    bool done_ = false;
};

/// @brief Drive an EventReader to the end, passing each event to `callback`.
template <typename Callback>
void parse_events(std::string_view text, Callback&& callback,
                  const ParseOptions& options = {}) {
    EventReader reader(text, options);
    while (const Event* e = reader.next()) callback(*e);
}

template <typename Callback>
void parse_events(ByteSource& source, Callback&& callback,
                  const ParseOptions& options = {}) {
    EventReader reader(source, options);
    while (const Event* e = reader.next()) callback(*e);
}

/// @brief Collect every event of `text`.
[[nodiscard]] inline std::vector<Event> read_events(std::string_view text,
                                                    const ParseOptions& options = {}) {
    std::vector<Event> events;
    parse_events(text, [&](const Event& e) { events.push_back(e); }, options);
    return events;
}

// =====================================================================
// Tree front-end
// =====================================================================

/// @brief Parse the whole token stream of `lexer` into a document.
[[nodiscard]] inline Value parse(Lexer& lexer, const ParseOptions& options = {}) {
    TreeBuilder builder;
    detail::Grammar<TreeBuilder> grammar(lexer, builder, options);
    grammar.run();
    return builder.release();
}

/// @brief Parse JSON text.
/// @throws DecodeError, ScanError, LexError, SyntaxError.
[[nodiscard]] inline Value parse(std::string_view text, const ParseOptions& options = {}) {
    Pipeline pipeline(text, options);
    return parse(pipeline.lexer(), options);
}

[[nodiscard]] inline Value parse(ByteSource& source, const ParseOptions& options = {}) {
    Pipeline pipeline(source, options);
    return parse(pipeline.lexer(), options);
}

/// @brief Parse from a stream, reading it in chunks.
[[nodiscard]] inline Value parse(std::istream& is, const ParseOptions& options = {}) {
    Pipeline pipeline(is, options);
    return parse(pipeline.lexer(), options);
}

/// @brief Parse a file (memory-mapped where available).
/// @throws DecodeError (invalid_file) if the file cannot be opened.
[[nodiscard]] inline Value parse_file(const std::string& path,
                                      const ParseOptions& options = {}) {
    Pipeline pipeline(std::make_unique<FileSource>(path), options);
    return parse(pipeline.lexer(), options);
}

namespace detail {

/// Run `fn`, translating a pipeline fault into an error code. Anything
/// that is not a Fault (std::bad_alloc, ...) propagates.
template <typename Fn>
result<Value> capture(Fn&& fn) {
    result<Value> r{};
    try {
        r.value = fn();
    } catch (const Fault& e) {
        r.ec = make_error_code(e.error());
        r.coordinate = e.coordinate();
    }
    return r;
}

} // namespace detail

/// @brief Parse JSON text without throwing pipeline faults.
[[nodiscard]] inline result<Value> try_parse(std::string_view text,
                                             const ParseOptions& options = {}) {
    return detail::capture([&] { return parse(text, options); });
}

[[nodiscard]] inline result<Value> try_parse(ByteSource& source,
                                             const ParseOptions& options = {}) {
    return detail::capture([&] { return parse(source, options); });
}

[[nodiscard]] inline result<Value> try_parse(std::istream& is,
                                             const ParseOptions& options = {}) {
    return detail::capture([&] { return parse(is, options); });
}

[[nodiscard]] inline result<Value> try_parse_file(const std::string& path,
                                                  const ParseOptions& options = {}) {
    return detail::capture([&] { return parse_file(path, options); });
}

} // namespace quarry
