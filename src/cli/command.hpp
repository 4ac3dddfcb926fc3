#pragma once

namespace revhub::cli {

// Handler signature: argv[0] is the subcommand name.
// Returns 0 on success, 1 on failure, 2 on a usage error.
using command_fn = int (*)(int, char **);

} // namespace revhub::cli
