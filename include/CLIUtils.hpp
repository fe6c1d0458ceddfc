#ifndef CLI_UTILS_HPP
#define CLI_UTILS_HPP

class RunDeadline;

// Print usage information
void print_usage(const char* program_name);

// SIGINT cancels the given run instead of killing the process, so partial
// results still get written.
void setup_signal_handlers(RunDeadline* deadline);

#endif // CLI_UTILS_HPP
