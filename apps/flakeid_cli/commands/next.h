#pragma once

// cmd_next: issue one or more Snowflake Ids.
// Usage: flakeid_cli next [--count N] [--json]
//                         [--datacenter-id D] [--worker-id W] [--state-db <path>]
int cmd_next(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
