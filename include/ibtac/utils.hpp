#pragma once
#include <string>
#include <optional>


namespace ibtac {


// Host-level failure (file I/O, command line). Lexical errors are tokens, not Errors.
struct Error { int line{-1}; std::string msg; };


struct Result {
std::optional<Error> err;
};


// Simple string helpers
std::string trim(std::string s);
bool starts_with(const std::string& s, const std::string& p);
std::string to_lower(std::string s);
std::string to_upper(std::string s);

// Makes control characters visible for one-line display: "\n" -> "\\n".
std::string escape_visible(const std::string& s);

// Reads a whole source file into out, dropping a UTF-8 BOM.
Result read_source(const std::string& path, std::string& out);


} // namespace ibtac
