#include <cstdlib>
#include <cstring>

// Allocates and touches argv[1] MiB of memory. Returns 1 if the allocation
// fails.
int main(int argc, char** argv) {
  if (argc < 2) return 2;
  const size_t size = atoi(argv[1]) * 1024 * 1024LL;
  char* data = static_cast<char*>(malloc(size));
  if (data == nullptr) return 1;
  memset(data, 1, size);
  int ret = data[size / 2] == 1 ? 0 : 3;
  free(data);
  return ret;
}
