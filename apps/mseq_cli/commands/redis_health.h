#pragma once

// Handler for the 'redis-health' subcommand.
int cmd_redis_health(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
