#pragma once
#include <libintl.h>
#include <iosfwd>
#include <string>

#ifndef TEKTON_GETTEXT_DEFINED
#define _(String) gettext(String)
#define TEKTON_GETTEXT_DEFINED
#endif

namespace tekton {
    /**
     * @brief Print an OpenRC style status line: " * message      [ status ]".
     *
     * The status block is right aligned to the terminal width (80 columns when
     * stdout is not a terminal). Stars are green, the status is green or bold
     * red when @p error is set.
     *
     * @param log Stream receiving the line.
     * @param msg Message printed after the star.
     * @param status Short status word, e.g. "ok" or "!!".
     * @param error Print the status in red.
     */
    void print_status(std::ostream &log, const std::string &msg, const std::string &status, bool error = false);

    /**
     * @brief Width of the controlling terminal in columns.
     * @return The width reported by TIOCGWINSZ, or 80 when unavailable.
     */
    [[nodiscard]] int terminal_width();
} // namespace tekton
