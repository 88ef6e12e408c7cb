#pragma once

/// @file rdjson.hpp
/// @brief Main header file for the rdjson library.

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "value.hpp"
#include "token.hpp"
#include "lexer.hpp"
#include "parse_options.hpp"
#include "parser.hpp"
