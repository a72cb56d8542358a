#pragma once

// Subcommands of toolgate_cli. Each returns the process exit code:
// 0 success, 1 operation failed, 2 usage error.
int cmd_servers(int argc, char** argv);
int cmd_discover(int argc, char** argv);
int cmd_call(int argc, char** argv);
