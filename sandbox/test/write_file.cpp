#include <signal.h>
#include <stdio.h>

// Returns 0 if it could write a file, named by the first argument or
// output.txt in the working directory.
int main(int argc, char** argv) {
  signal(SIGXFSZ, SIG_IGN);
  FILE* f = fopen(argc > 1 ? argv[1] : "output.txt", "w");
  if (f == nullptr) return 1;
  if (fputs("some data", f) < 0) return 2;
  if (fclose(f) != 0) return 3;
  return 0;
}
