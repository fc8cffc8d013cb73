#ifndef SURFDOC_TTY_HPP
#define SURFDOC_TTY_HPP

#include <cstdio>

namespace surfdoc {

// https://pubs.opengroup.org/onlinepubs/009695399/functions/isatty.html
[[nodiscard]] bool is_tty(std::FILE*) noexcept;

/// @brief True if `is_tty(stdout)` is `true`.
/// Computed once, so that the CLI and the tests make a single `isatty` call per stream.
extern const bool is_stdout_tty;
/// @brief True if `is_tty(stderr)` is `true`.
extern const bool is_stderr_tty;

} // namespace surfdoc

#endif
