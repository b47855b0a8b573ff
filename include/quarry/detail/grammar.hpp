#pragma once

/// @file grammar.hpp
/// @brief JSON grammar state machine shared by both parser front-ends.
///
/// The grammar pulls tokens from a Lexer and fires callbacks on an
/// Actions object. The tree front-end plugs in TreeBuilder, the event
/// front-end plugs in an emitter, so they accept exactly the same inputs.
///
/// Actions must provide:
///   void begin_object(Coordinate);
///   void end_object(Coordinate);
///   void begin_array(Coordinate);
///   void end_array(Coordinate);
///   void key(std::string&&, Coordinate);
///   void scalar(Value&&, Coordinate);
///   void end_document(Coordinate);
///
/// Every token fires at most one callback.

#include "../config.hpp"
#include "../error.hpp"
#include "../lexer.hpp"
#include "../parse_options.hpp"
#include "../token.hpp"
#include "../value.hpp"

#include <cstddef>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace quarry::detail {

template <typename Actions>
class Grammar {
public:
    Grammar(Lexer& lexer, Actions& actions, const ParseOptions& options)
        : lexer_(lexer)
        , actions_(actions)
        , max_depth_(options.max_depth > 0 ? options.max_depth : QUARRY_MAX_DEPTH)
        , allow_duplicate_keys_(options.allow_duplicate_keys)
        , require_container_root_(options.require_container_root) {}

    Grammar(const Grammar&) = delete;
    Grammar& operator=(const Grammar&) = delete;

    /// @brief Consume one token and apply its transition.
    /// @return false once the end-of-input token after the root value has
    ///         been consumed; further calls do nothing.
    /// @throws SyntaxError, plus whatever the lexer raises.
    bool step() {
        if (finished_) return false;
        Token tok = lexer_.next();

        switch (state_) {
            case Expectation::Value:
                value(tok);
                break;

            case Expectation::ValueOrArrayEnd:
                if (tok.kind == TokenKind::ArrayClose) close(tok);
                else value(tok);
                break;

            case Expectation::KeyOrObjectEnd:
                if (tok.kind == TokenKind::ObjectClose) close(tok);
                else key(tok);
                break;

            case Expectation::Key:
                key(tok);
                break;

            case Expectation::Colon:
                if (tok.kind != TokenKind::Colon) fail(tok);
                state_ = Expectation::Value;
                break;

            case Expectation::CommaOrObjectEnd:
                if (tok.kind == TokenKind::Comma) state_ = Expectation::Key;
                else if (tok.kind == TokenKind::ObjectClose) close(tok);
                else fail(tok);
                break;

            case Expectation::CommaOrArrayEnd:
                if (tok.kind == TokenKind::Comma) state_ = Expectation::Value;
                else if (tok.kind == TokenKind::ArrayClose) close(tok);
                else fail(tok);
                break;

            case Expectation::EndOfInput:
                if (!tok.is_end()) {
                    throw SyntaxError(std::string("unexpected ") + token_kind_name(tok.kind) +
                                      " after the root value", tok.coordinate,
                                      Expectation::EndOfInput, errc::trailing_content);
                }
                finished_ = true;
                actions_.end_document(tok.coordinate);
                break;
        }
        return !finished_;
    }

    /// @brief Drive the grammar to its terminal state.
    void run() {
        while (step()) {}
    }

    [[nodiscard]] bool finished() const noexcept { return finished_; }
    [[nodiscard]] Expectation expecting() const noexcept { return state_; }
    [[nodiscard]] size_t depth() const noexcept { return frames_.size(); }

private:
    struct Frame {
        bool object = false;
        std::unordered_set<std::string> keys;  ///< only filled when duplicates are rejected
    };

    // ─── Transitions ─────────────────────────────────────────────────────

    void value(Token& tok) {
        if (QUARRY_UNLIKELY(!tok.starts_value())) fail(tok);

        if (tok.kind == TokenKind::ObjectOpen || tok.kind == TokenKind::ArrayOpen) {
            open(tok);
            return;
        }

        if (QUARRY_UNLIKELY(frames_.empty() && require_container_root_)) {
            throw SyntaxError(std::string("root value must be an object or an array, got ") +
                              token_kind_name(tok.kind), tok.coordinate,
                              Expectation::Value, errc::invalid_root);
        }

        switch (tok.kind) {
            case TokenKind::String: actions_.scalar(Value(std::move(tok.text())), tok.coordinate); break;
            case TokenKind::Number: actions_.scalar(Value(std::move(tok.number())), tok.coordinate); break;
            case TokenKind::True:   actions_.scalar(Value(true), tok.coordinate); break;
            case TokenKind::False:  actions_.scalar(Value(false), tok.coordinate); break;
            default:                actions_.scalar(Value(nullptr), tok.coordinate); break;
        }
        after_value();
    }

    void open(const Token& tok) {
        if (QUARRY_UNLIKELY(frames_.size() >= max_depth_)) {
            throw SyntaxError("maximum nesting depth " + std::to_string(max_depth_) +
                              " exceeded", tok.coordinate, state_,
                              errc::max_depth_exceeded);
        }
        Frame frame;
        frame.object = tok.kind == TokenKind::ObjectOpen;
        frames_.push_back(std::move(frame));
        if (frames_.back().object) {
            actions_.begin_object(tok.coordinate);
            state_ = Expectation::KeyOrObjectEnd;
        } else {
            actions_.begin_array(tok.coordinate);
            state_ = Expectation::ValueOrArrayEnd;
        }
    }

    void close(const Token& tok) {
        const bool object = frames_.back().object;
        frames_.pop_back();
        if (object) actions_.end_object(tok.coordinate);
        else actions_.end_array(tok.coordinate);
        after_value();
    }

    void key(Token& tok) {
        if (QUARRY_UNLIKELY(tok.kind != TokenKind::String)) fail(tok);
        if (!allow_duplicate_keys_) {
            if (QUARRY_UNLIKELY(!frames_.back().keys.insert(tok.text()).second)) {
                throw SyntaxError("duplicate key \"" + tok.text() + "\"", tok.coordinate,
                                  state_, errc::duplicate_key);
            }
        }
        actions_.key(std::move(tok.text()), tok.coordinate);
        state_ = Expectation::Colon;
    }

    void after_value() noexcept {
        if (frames_.empty()) state_ = Expectation::EndOfInput;
        else if (frames_.back().object) state_ = Expectation::CommaOrObjectEnd;
        else state_ = Expectation::CommaOrArrayEnd;
    }

    [[noreturn]] QUARRY_NOINLINE void fail(const Token& tok) const {
        const std::string wanted = std::string(", expected ") + expectation_name(state_);
        if (tok.is_end()) {
            throw SyntaxError("unexpected end of input" + wanted, tok.coordinate, state_,
                              errc::unexpected_end_of_input);
        }
        throw SyntaxError(std::string("unexpected ") + token_kind_name(tok.kind) + wanted,
                          tok.coordinate, state_, errc::unexpected_token);
    }

    Lexer& lexer_;
    Actions& actions_;
    std::vector<Frame> frames_;
    Expectation state_ = Expectation::Value;
    size_t max_depth_;
    bool allow_duplicate_keys_;
    bool require_container_root_;
    bool finished_ = false;
};

} // namespace quarry::detail
