#include "ibtac/utils.hpp"
#include <cctype>
#include <fstream>
#include <iterator>


namespace ibtac {


std::string trim(std::string s){
size_t a=0,b=s.size();
while(a<b && std::isspace((unsigned char)s[a])) ++a;
while(b>a && std::isspace((unsigned char)s[b-1])) --b;
return s.substr(a,b-a);
}


bool starts_with(const std::string& s, const std::string& p){
return s.rfind(p,0)==0;
}


std::string to_lower(std::string s){
for(char& c: s) c=(char)std::tolower((unsigned char)c);
return s;
}


std::string to_upper(std::string s){
for(char& c: s) c=(char)std::toupper((unsigned char)c);
return s;
}


std::string escape_visible(const std::string& s){
std::string out; out.reserve(s.size());
for(char c: s){
  switch(c){
    case '\n': out += "\\n"; break;
    case '\t': out += "\\t"; break;
    case '\r': out += "\\r"; break;
    default: out.push_back(c);
  }
}
return out;
}


Result read_source(const std::string& path, std::string& out){
Result r;
std::ifstream f(path, std::ios::in | std::ios::binary);
if(!f){ r.err = Error{-1, "No such file: " + path}; return r; }
out.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
if(f.bad()){ r.err = Error{-1, "Read failed: " + path}; return r; }

// Strip UTF-8 BOM if present
if(out.size() >= 3 &&
   (unsigned char)out[0] == 0xEF &&
   (unsigned char)out[1] == 0xBB &&
   (unsigned char)out[2] == 0xBF){
  out.erase(0, 3);
}
return r;
}


} // namespace ibtac
