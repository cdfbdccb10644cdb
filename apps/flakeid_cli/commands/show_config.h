#pragma once

// cmd_config: print the resolved runtime configuration snapshot as JSON.
// Usage: flakeid_cli config [--datacenter-id D] [--worker-id W] [--state-db <path>]
int cmd_config(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
