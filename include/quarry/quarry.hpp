#pragma once

/// @file quarry.hpp
/// @brief Main header file for the quarry library.
///
/// Pipeline: ByteSource -> Decoder -> Scanner -> Lexer -> Grammar, with
/// two grammar front-ends (document tree and event stream).

#include "config.hpp"
#include "error.hpp"
#include "parse_options.hpp"
#include "byte_source.hpp"
#include "decoder.hpp"
#include "scanner.hpp"
#include "number.hpp"
#include "token.hpp"
#include "lexer.hpp"
#include "fwd.hpp"
#include "value.hpp"
#include "json_pointer.hpp"
#include "event.hpp"
#include "tree_builder.hpp"
#include "pipeline.hpp"
#include "parser.hpp"
