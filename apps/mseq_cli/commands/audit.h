#pragma once

// Handler for the 'audit' subcommand.
int cmd_audit(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
