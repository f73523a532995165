#pragma once

// Handler for the 'config' subcommand.
int cmd_config(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
