#pragma once

// cmd_generate: mint identifiers.
// Usage: xid_cli generate [--count N] [--mode random|nano|low|medium|high]
//                         [--format text|json] [--db <path>] [--label <text>]
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
