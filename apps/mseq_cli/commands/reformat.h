#pragma once

// Handler for the 'reformat' subcommand.
int cmd_reformat(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
