#pragma once

// Interactive session on stdin/stdout with line editing and history
// (~/.quill_history). Returns when the user types exit / quit, sends EOF or
// calls exit(); the result is the process exit code.
int run_repl_mode(bool color);
