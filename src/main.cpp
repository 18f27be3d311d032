#include "app.hpp"

/**
 * Program entry point.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application.
 */
int main(int argc, char **argv) {
  gitext::App app;
  return app.run(argc, argv);
}
