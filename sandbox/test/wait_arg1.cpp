#include <chrono>
#include <cstdlib>
#include <thread>

// Sleeps for argv[1] seconds.
int main(int argc, char** argv) {
  if (argc < 2) return 2;
  std::this_thread::sleep_for(
      std::chrono::microseconds(static_cast<int64_t>(atof(argv[1]) * 1e6)));
  return 0;
}
