#pragma once

// Handler for the 'category' subcommand.
int cmd_category(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
