#include "Shell.hpp"
#include "Util.hpp"

#ifndef SQLDB_NAME
#define SQLDB_NAME "sqldb"
#endif

#ifndef SQLDB_VERSION
#define SQLDB_VERSION "0.0.0"
#endif

int main() {
  Shell shell{DbDetails{SQLDB_NAME, SQLDB_VERSION}};
  return shell.run();
}
