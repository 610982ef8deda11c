#pragma once

// cmd_inspect: print the components of one or more ids as JSON.
// Usage: xid_cli inspect <id> [<id> ...]
int cmd_inspect(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
