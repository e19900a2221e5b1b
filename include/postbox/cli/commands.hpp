#pragma once

namespace postbox::cli {

/// Entry point behind `main`; returns the process exit status.
int run_cli(int argc, char **argv);

} // namespace postbox::cli
