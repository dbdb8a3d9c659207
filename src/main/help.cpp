#include "help.hpp"

#include <iostream>

void PrintHelp() {
  std::cout << "use: lenicss [-option] ... [file ...]\n"
               "\t-h print this message\n"
               "\t-V print version number and stop\n"
               "\t-t annotate every line with its kind\n"
               "\t-T dump the token stream instead of lines\n"
               "\t-sN indent with N spaces instead of tabs (default 4)\n"
               "\t-v verbose, trace lines on stderr\n"
               "\t-vv very verbose, also trace tokens\n"
               "\twith no file, or with -, read standard input\n";
}

void PrintVersion() { std::cout << kVersion << std::endl; }
