#pragma once
#include <iostream>

inline void showVersion(const char *pname, const char *hash) {
  std::cout <<"nmeacast (" <<pname <<") " <<hash <<std::endl;
  std::cout <<"built date " <<__DATE__ <<std::endl;
  std::cout <<"License GPLv3: GNU GPL version 3  https://gnu.org/licenses/gpl.html" <<std::endl;
}
