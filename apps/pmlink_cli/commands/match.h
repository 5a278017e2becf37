#pragma once

// cmd_match: link two catalog files and write the one-to-one MatchSet.
// Usage: pmlink_cli match --left <file> --right <file>
//                         [--left-profile kalshi|polymarket|generic] [--right-profile ...]
//                         [--output <file>] [--db <db-path>] [--config <json-file>]
//                         [--score-cutoff N] [--max-time-diff-hours H] [--workers N]
//                         [--reject-conflicting-bps] [--top N]
// Flags given on the command line override values read from --config.
int cmd_match(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
