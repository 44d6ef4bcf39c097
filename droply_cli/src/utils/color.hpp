#ifndef DROPLY_COLOR_HPP
#define DROPLY_COLOR_HPP

// ANSI escape sequences for terminal output
#define RESET   "\033[0m"
#define RED     "\033[31m"
#define GREEN   "\033[32m"
#define YELLOW  "\033[33m"
#define CYAN    "\033[36m"
#define GRAY    "\033[90m"
#define BOLD    "\033[1m"

#endif // DROPLY_COLOR_HPP
