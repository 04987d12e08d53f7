#include "ibtac/options.hpp"
#include <string_view>
#include <vector>

namespace ibtac {

void print_usage(std::ostream& os){
  os <<
  "usage: ibtac [options] <file>     scan a source file\n"
  "       ibtac [options] -e <code>  scan inline source\n"
  "       ibtac [options]            interactive mode\n"
  "\n"
  "options:\n"
  "  -e, --eval <code>   scan <code> instead of a file\n"
  "  --show-newlines     list NEWLINE tokens\n"
  "  --hide-comments     leave COMMENT tokens out of the listing\n"
  "  --suggest           print a hint under each error\n"
  "  -h, --help          show this text\n"
  "  --version           print the version\n";
}

Options parse_options(int argc, char** argv){
  Options out;
  std::vector<std::string_view> args;
  for(int i=1;i<argc;++i) args.emplace_back(argv[i]);

  auto set_input = [&](Mode m, std::string_view v){
    if(out.mode == Mode::File || out.mode == Mode::Eval){
      out.ok = false;
      out.error = "only one input may be given";
      return;
    }
    out.mode = m;
    out.input = std::string(v);
  };

  for(size_t i=0; i<args.size() && out.ok; ++i){
    std::string_view a = args[i];

    if(a == "-h" || a == "--help"){ out.mode = Mode::Usage; return out; }
    if(a == "--version"){ out.mode = Mode::Version; return out; }

    if(a == "--show-newlines"){ out.report.show_newlines = true; continue; }
    if(a == "--hide-comments"){ out.report.hide_comments = true; continue; }
    if(a == "--suggest"){ out.report.suggest = true; continue; }

    if(a == "-e" || a == "--eval"){
      if(i + 1 >= args.size()){
        out.ok = false;
        out.error = "missing source after " + std::string(a);
        break;
      }
      set_input(Mode::Eval, args[++i]);
      continue;
    }

    if(a.size() > 1 && a[0] == '-'){
      out.ok = false;
      out.error = "unknown option: " + std::string(a);
      break;
    }

    set_input(Mode::File, a);
  }
  return out;
}

} // namespace ibtac
