#include "ibtac/token.hpp"
#include <cctype>

namespace ibtac {

bool is_error_kind(TokKind k){
  switch(k){
    case TokKind::GenericError: case TokKind::UnterminatedString:
    case TokKind::InvalidNumber: case TokKind::InvalidSymbol: return true;
    default: return false;
  }
}

bool is_structural(TokKind k){
  switch(k){
    case TokKind::Comment: case TokKind::Whitespace:
    case TokKind::Newline: case TokKind::EndOfInput: return true;
    default: return false;
  }
}

bool Token::is_error() const { return is_error_kind(k); }

std::string Token::str() const {
  std::string pos = " at line " + std::to_string(line) + ", col " + std::to_string(col);
  if(err) return std::string("ERROR(") + to_string(k) + "): " + *err + pos;
  return std::string(to_string(k)) + "(" + text + ")" + pos;
}

const char* to_string(TokKind k){
  switch(k){
    case TokKind::Identifier:         return "IDENTIFIER";
    case TokKind::Integer:            return "INTEGER";
    case TokKind::Float:              return "FLOAT";
    case TokKind::String:             return "STRING";
    case TokKind::If:                 return "IF";
    case TokKind::Else:               return "ELSE";
    case TokKind::While:              return "WHILE";
    case TokKind::Return:             return "RETURN";
    case TokKind::Func:               return "FUNC";
    case TokKind::Plus:               return "PLUS";
    case TokKind::Minus:              return "MINUS";
    case TokKind::Multiply:           return "MULTIPLY";
    case TokKind::Divide:             return "DIVIDE";
    case TokKind::Equal:              return "EQUAL";
    case TokKind::NotEqual:           return "NOT_EQUAL";
    case TokKind::LessThan:           return "LESS_THAN";
    case TokKind::GreaterThan:        return "GREATER_THAN";
    case TokKind::LessEqual:          return "LESS_EQUAL";
    case TokKind::GreaterEqual:       return "GREATER_EQUAL";
    case TokKind::LParen:             return "LPAREN";
    case TokKind::RParen:             return "RPAREN";
    case TokKind::LBrace:             return "LBRACE";
    case TokKind::RBrace:             return "RBRACE";
    case TokKind::Semicolon:          return "SEMICOLON";
    case TokKind::Comma:              return "COMMA";
    case TokKind::Comment:            return "COMMENT";
    case TokKind::Whitespace:         return "WHITESPACE";
    case TokKind::Newline:            return "NEWLINE";
    case TokKind::EndOfInput:         return "EOF";
    case TokKind::GenericError:       return "ERROR";
    case TokKind::UnterminatedString: return "UNTERMINATED_STRING";
    case TokKind::InvalidNumber:      return "INVALID_NUMBER";
    case TokKind::InvalidSymbol:      return "INVALID_SYMBOL";
  }
  return "UNKNOWN";
}

/* ---------------- lookup tables ---------------- */

const KindTable& keywords(){
  static const KindTable t = {
    {"if",     TokKind::If},
    {"else",   TokKind::Else},
    {"while",  TokKind::While},
    {"return", TokKind::Return},
    {"func",   TokKind::Func},
  };
  return t;
}

const KindTable& operators(){
  static const KindTable t = {
    {"+",  TokKind::Plus},
    {"-",  TokKind::Minus},
    {"*",  TokKind::Multiply},
    {"/",  TokKind::Divide},
    {"==", TokKind::Equal},
    {"!=", TokKind::NotEqual},
    {"<",  TokKind::LessThan},
    {">",  TokKind::GreaterThan},
    {"<=", TokKind::LessEqual},
    {">=", TokKind::GreaterEqual},
  };
  return t;
}

const KindTable& delimiters(){
  static const KindTable t = {
    {"(", TokKind::LParen},
    {")", TokKind::RParen},
    {"{", TokKind::LBrace},
    {"}", TokKind::RBrace},
    {";", TokKind::Semicolon},
    {",", TokKind::Comma},
  };
  return t;
}

std::optional<TokKind> lookup(const KindTable& table, const std::string& spelling){
  auto it = table.find(spelling);
  if(it == table.end()) return std::nullopt;
  return it->second;
}

/* ---------------- character classes ---------------- */

bool is_digit(char c){ return std::isdigit((unsigned char)c) != 0; }
bool is_letter(char c){ return std::isalpha((unsigned char)c) != 0; }
bool is_ident_char(char c){ return std::isalnum((unsigned char)c) || c=='_'; }
bool is_blank(char c){ return c==' ' || c=='\t' || c=='\r'; }
bool is_newline(char c){ return c=='\n'; }

} // namespace ibtac
