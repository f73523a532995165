#pragma once

// Handler for the 'generate' subcommand.
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
