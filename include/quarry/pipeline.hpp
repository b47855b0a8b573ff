#pragma once

/// @file pipeline.hpp
/// @brief One decode/scan/lex chain over a byte source.
///
/// A Pipeline owns its decoder, scanner and lexer (and the byte source,
/// when it created it). Pipelines share no state, so independent
/// pipelines may run concurrently on separate threads.

#include "byte_source.hpp"
#include "decoder.hpp"
#include "lexer.hpp"
#include "parse_options.hpp"
#include "scanner.hpp"
#include "token.hpp"

#include <istream>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace quarry {

class Pipeline {
public:
    /// Borrows `text`; it must outlive the pipeline.
    explicit Pipeline(std::string_view text, const ParseOptions& options = {})
        : Pipeline(std::make_unique<MemorySource>(text), options) {}

    /// Reads `is` in chunks; the stream must outlive the pipeline.
    explicit Pipeline(std::istream& is, const ParseOptions& options = {})
        : Pipeline(std::make_unique<StreamSource>(is), options) {}

    /// Borrows a caller-owned byte source.
    explicit Pipeline(ByteSource& source, const ParseOptions& options = {})
        : options_(options)
        , source_(&source)
        , decoder_(make_decoder(source, options.encoding))
        , scanner_(*decoder_)
        , lexer_(scanner_, options.numerics) {}

    /// Takes ownership of a byte source.
    explicit Pipeline(std::unique_ptr<ByteSource> source, const ParseOptions& options = {})
        : options_(options)
        , owned_(std::move(source))
        , source_(owned_.get())
        , decoder_(make_decoder(*source_, options.encoding))
        , scanner_(*decoder_)
        , lexer_(scanner_, options.numerics) {}

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    [[nodiscard]] ByteSource& source() noexcept { return *source_; }
    [[nodiscard]] Decoder& decoder() noexcept { return *decoder_; }
    [[nodiscard]] Scanner& scanner() noexcept { return scanner_; }
    [[nodiscard]] Lexer& lexer() noexcept { return lexer_; }
    [[nodiscard]] const ParseOptions& options() const noexcept { return options_; }

private:
    ParseOptions options_;
    std::unique_ptr<ByteSource> owned_;
    ByteSource* source_;
    std::unique_ptr<Decoder> decoder_;
    Scanner scanner_;
    Lexer lexer_;
};

/// @brief Lex `text` completely.
/// @return every token, the final one being EndOfInput.
[[nodiscard]] inline std::vector<Token> tokenize(std::string_view text,
                                                 const ParseOptions& options = {}) {
    Pipeline pipeline(text, options);
    std::vector<Token> tokens;
    for (;;) {
        tokens.push_back(pipeline.lexer().next());
        if (tokens.back().is_end()) break;
    }
    return tokens;
}

} // namespace quarry
