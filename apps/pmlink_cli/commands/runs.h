#pragma once

// cmd_show_run: print a persisted MatchSet by --run-id, or list stored runs
// cmd_audit: print the audit trail of a --trace-id
int cmd_show_run(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_audit(int argc, char* argv[]);     // NOLINT(modernize-avoid-c-arrays)
