#include <csignal>
#include <cstdlib>

int main(int argc, char** argv) {
  if (argc < 2) return 2;
  raise(atoi(argv[1]));
  return 0;
}
