#pragma once

// cmd_decode: print the fields packed into an Id.
// Usage: flakeid_cli decode <id> [--json]
int cmd_decode(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
