#pragma once
#include <optional>
#include <string>
#include <unordered_map>


namespace ibtac {


enum class TokKind {
// literals
Identifier, Integer, Float, String,
// keywords
If, Else, While, Return, Func,
// operators
Plus, Minus, Multiply, Divide,
Equal, NotEqual, LessThan, GreaterThan, LessEqual, GreaterEqual,
// delimiters
LParen, RParen, LBrace, RBrace, Semicolon, Comma,
// structure
Comment, Whitespace, Newline, EndOfInput,
// errors
GenericError, UnterminatedString, InvalidNumber, InvalidSymbol,
};


struct Token {
TokKind k;
std::string text;            // lexeme, exactly as written
int line{1}; int col{1};     // 1-based start position
std::optional<std::string> err;  // set on error kinds only

bool is_error() const;
std::string str() const;
};


bool is_error_kind(TokKind k);
bool is_structural(TokKind k);
const char* to_string(TokKind k);


using KindTable = std::unordered_map<std::string, TokKind>;

// Built once, never modified.
const KindTable& keywords();    // lowercase spelling
const KindTable& operators();   // one- and two-character spellings
const KindTable& delimiters();

std::optional<TokKind> lookup(const KindTable& table, const std::string& spelling);


// Character classes (ASCII; bytes >= 0x80 belong to none of them)
bool is_digit(char c);
bool is_letter(char c);
bool is_ident_char(char c);
bool is_blank(char c);    // space, tab, CR
bool is_newline(char c);


} // namespace ibtac
