#pragma once

// Handler for the 'swap-format' subcommand.
int cmd_swap_format(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
