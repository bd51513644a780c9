#include <stdlib.h>
#include <chrono>
#include <thread>

// Sleeps for argv[1] seconds.
int main(int argc, char** argv) {
  std::this_thread::sleep_for(
      std::chrono::milliseconds(static_cast<int64_t>(atof(argv[1]) * 1000)));
  return 0;
}
