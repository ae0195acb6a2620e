#ifndef TUI_SIGNAL_HPP
#define TUI_SIGNAL_HPP

#include <atomic>

// Global flag flipped by the SIGINT handler so loops can wind down safely.
extern std::atomic_bool g_sigint_received;

// Installs a minimal SIGINT handler that only sets the flag (async-signal-safe),
// and ignores SIGPIPE.
void InitSignalHandlers();

// Writes to a picker that already exited must fail with EPIPE instead of killing us.
void IgnoreSigpipe();

#endif // TUI_SIGNAL_HPP
