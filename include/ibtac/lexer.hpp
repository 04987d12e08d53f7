#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ibtac/token.hpp"
#include "ibtac/errors.hpp"


namespace ibtac {


// Single-pass scanner. Malformed input becomes error tokens (also kept in
// `errs`); the scan never stops early and always ends with EndOfInput.
struct Lexer {
std::string src; size_t pos{0}; int line{1}; int col{1};
int cont_left{0};  // continuation bytes still owed to the last UTF-8 lead byte
ErrorHandler errs;

explicit Lexer(std::string s): src(std::move(s)) {}

// Rewinds to the start of `src` and clears `errs` first, so repeated
// calls on one instance give the same sequence.
std::vector<Token> tokenize();

const ErrorHandler& errors() const { return errs; }

// Cursor. Past the end both return '\0'.
bool at_end() const { return pos >= src.size(); }
char cur() const { return at_end() ? '\0' : src[pos]; }
char peek(size_t off=1) const { return pos+off < src.size() ? src[pos+off] : '\0'; }
char advance();

private:
std::optional<Token> scan_token();
Token scan_line_comment();
Token scan_block_comment();
Token scan_string();
Token scan_prefixed_identifier();
Token scan_number();
Token scan_underscore();
Token scan_word();
Token scan_operator();
Token scan_invalid();
};


} // namespace ibtac
