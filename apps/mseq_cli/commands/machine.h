#pragma once

// Handler for the 'machine' subcommand.
int cmd_machine(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
