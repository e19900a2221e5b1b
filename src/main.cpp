#include "postbox/cli/commands.hpp"

#include <curl/curl.h>

#include <csignal>

int main(int argc, char **argv) {
  // A peer closing mid-write must surface as an error, not kill the process.
  std::signal(SIGPIPE, SIG_IGN);
  curl_global_init(CURL_GLOBAL_DEFAULT);
  const int status = postbox::cli::run_cli(argc, argv);
  curl_global_cleanup();
  return status;
}
