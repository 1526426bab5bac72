#include <cstdio>

// Copies stdin to stdout, and writes a marker on stderr.
int main() {
  int c;
  while ((c = getchar()) != EOF) putchar(c);
  fputs("done", stderr);
  return 0;
}
