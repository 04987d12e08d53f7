#include "ibtac/lexer.hpp"
#include "ibtac/utils.hpp"
#include <string_view>

namespace ibtac {

static bool is_utf8_cont(char c){ return ((unsigned char)c & 0xC0) == 0x80; }

// continuation bytes a lead byte announces; 0 for ASCII, strays and bad leads
static int utf8_tail(char c){
  unsigned char u = (unsigned char)c;
  if(u >= 0xC0 && u <= 0xDF) return 1;
  if(u >= 0xE0 && u <= 0xEF) return 2;
  if(u >= 0xF0 && u <= 0xF7) return 3;
  return 0;
}
static bool is_operator_start(char c){ return std::string_view("+-*/=!<>").find(c) != std::string_view::npos; }

char Lexer::advance(){
  if(at_end()) return '\0';
  char c = src[pos++];
  if(c=='\n'){ ++line; col = 1; cont_left = 0; }
  else if(is_utf8_cont(c) && cont_left > 0) --cont_left;  // one column per code point
  else { ++col; cont_left = utf8_tail(c); }
  return c;
}

std::vector<Token> Lexer::tokenize(){
  pos = 0; line = 1; col = 1; cont_left = 0;
  errs.clear();

  std::vector<Token> out;
  while(!at_end()){
    int sl = line, sc = col;
    auto t = scan_token();
    if(!t) continue;
    // lookahead may have crossed newlines; report where the lexeme began
    t->line = sl; t->col = sc;
    out.push_back(std::move(*t));
  }
  out.push_back({TokKind::EndOfInput, "", line, col});
  return out;
}

std::optional<Token> Lexer::scan_token(){
  int sl = line, sc = col;
  char c = cur();

  if(is_blank(c)){ advance(); return std::nullopt; }

  if(is_newline(c)){ advance(); return Token{TokKind::Newline, "\n", sl, sc}; }

  if(c=='/' && peek()=='/') return scan_line_comment();
  if(c=='/' && peek()=='*') return scan_block_comment();

  if(c=='$') return scan_string();

  // 071 / 070 / 048 lead an identifier, every other numeral is a number
  if(c=='0' && ((peek()=='7' && (peek(2)=='0' || peek(2)=='1')) ||
                (peek()=='4' && peek(2)=='8')))
    return scan_prefixed_identifier();

  if(is_digit(c) || (c=='.' && is_digit(peek()))) return scan_number();

  if(c=='_') return scan_underscore();

  if(is_letter(c)) return scan_word();

  if(is_operator_start(c)) return scan_operator();

  if(auto k = lookup(delimiters(), std::string(1, c))){
    advance();
    return Token{*k, std::string(1, c), sl, sc};
  }

  return scan_invalid();
}

Token Lexer::scan_line_comment(){
  int sl = line, sc = col;
  std::string text;
  text += advance();  // '/'
  text += advance();  // '/'
  while(!at_end() && !is_newline(cur())) text += advance();
  return Token{TokKind::Comment, text, sl, sc};
}

Token Lexer::scan_block_comment(){
  int sl = line, sc = col;
  std::string text;
  text += advance();  // '/'
  text += advance();  // '*'

  while(!at_end()){
    // no nesting: stop at the inner opener and resume scanning there
    if(cur()=='/' && peek()=='*') return errs.nested_comment(sl, sc);

    if(cur()=='*' && peek()=='/'){
      text += advance();
      text += advance();
      return Token{TokKind::Comment, text, sl, sc};
    }
    text += advance();
  }
  return errs.unterminated_comment(sl, sc);
}

Token Lexer::scan_string(){
  int sl = line, sc = col;
  std::string text;
  text += advance();  // opening '$'

  while(!at_end() && !is_newline(cur())){
    char ch = advance();
    text += ch;
    if(ch=='$') return Token{TokKind::String, text, sl, sc};
  }
  return errs.unterminated_string(sl, sc, text);
}

Token Lexer::scan_prefixed_identifier(){
  int sl = line, sc = col;
  std::string prefix;
  prefix += advance();
  prefix += advance();
  prefix += advance();

  std::string text = prefix;
  while(is_ident_char(cur())) text += advance();

  if(validate_identifier_format(prefix)) return Token{TokKind::Identifier, text, sl, sc};
  return errs.invalid_identifier(sl, sc, text);
}

Token Lexer::scan_number(){
  int sl = line, sc = col;
  std::string text;
  bool has_dot = false, has_exp = false;

  if(cur()=='.'){ text += advance(); has_dot = true; }

  while(is_digit(cur())) text += advance();

  if(cur()=='.' && !has_dot){
    text += advance();
    has_dot = true;
    while(is_digit(cur())) text += advance();
  }

  if(cur()=='e' || cur()=='E'){
    has_exp = true;
    text += advance();
    if(cur()=='+' || cur()=='-') text += advance();
    if(!is_digit(cur())) return errs.invalid_number(sl, sc, text);
    while(is_digit(cur())) text += advance();
  }

  if(!validate_number_format(text)) return errs.invalid_number(sl, sc, text);

  return Token{(has_dot || has_exp) ? TokKind::Float : TokKind::Integer, text, sl, sc};
}

Token Lexer::scan_underscore(){
  int sl = line, sc = col;
  std::string text;
  text += advance();  // '_'
  while(is_ident_char(cur())) text += advance();
  return errs.underscore_identifier(sl, sc, text);
}

Token Lexer::scan_word(){
  int sl = line, sc = col;
  std::string word;
  while(is_ident_char(cur())) word += advance();

  if(auto k = lookup(keywords(), to_lower(word))) return Token{*k, word, sl, sc};

  // a bare word is never an identifier
  return errs.invalid_identifier(sl, sc, word);
}

Token Lexer::scan_operator(){
  int sl = line, sc = col;
  char c = cur();

  std::string two{c, peek()};
  if(auto k = lookup(operators(), two)){
    advance(); advance();
    return Token{*k, two, sl, sc};
  }

  std::string one(1, c);
  advance();
  if(auto k = lookup(operators(), one)) return Token{*k, one, sl, sc};

  // '=' and '!' only exist as the first half of "==" / "!="
  return errs.invalid_symbol(sl, sc, one);
}

Token Lexer::scan_invalid(){
  int sl = line, sc = col;
  std::string sym(1, advance());
  // keep a multi-byte character together; extra continuation bytes are strays
  for(int n = utf8_tail(sym[0]); n > 0 && is_utf8_cont(cur()); --n) sym += advance();
  return errs.invalid_symbol(sl, sc, sym);
}

} // namespace ibtac
