#pragma once

namespace benchtel::cli {

// Routes `benchtel` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   20 => supervised command could not be launched
//   30 => summary table could not be written anywhere
// `capture` instead returns the captured command's own exit status once it ran.
int Dispatch(int argc, char** argv);

} // namespace benchtel::cli
