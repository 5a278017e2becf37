#pragma once

// cmd_inspect: print what the engine extracts from one text.
// Usage: pmlink_cli inspect --text "<text>" [--json]
int cmd_inspect(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
