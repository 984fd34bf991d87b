#pragma once

#include <expected>
#include <string>

// SIGINT and SIGTERM are taken from a signalfd on the main loop. They must
// be blocked before any thread exists (QtDBus starts one as soon as the bus
// is touched): threads inherit the creator's mask, and an unblocked thread
// would take the default action and kill the process.
std::expected<void, std::string> block_shutdown_signals();

// Non-blocking signalfd for the blocked shutdown signals.
std::expected<int, std::string> open_shutdown_signalfd();
