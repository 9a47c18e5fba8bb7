#include "../include/Console.hpp"
#include <ostream>
#include <unistd.h>
#include <sys/ioctl.h>

using namespace std;

int tekton::terminal_width() {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return 80;
}

void tekton::print_status(ostream &log, const string &msg, const string &status, const bool error) {
    const int term_width = terminal_width();

    // Colors: Stars (Green), Brackets (White), Status (Green/Red)
    const string green_star = "\033[32m*\033[0m";
    const string white_bracket_open = "\033[37m[\033[0m";
    const string white_bracket_close = "\033[37m]\033[0m";
    const string status_text = error ? "\033[31;1m" + status + "\033[0m" : "\033[32;1m" + status + "\033[0m";
    const string status_block = " " + white_bracket_open + " " + status_text + " " + white_bracket_close;
    const int msg_display_len = 3 + static_cast<int>(msg.length());
    int padding = term_width - msg_display_len - 7 - static_cast<int>(status.length());
    if (padding < 1) padding = 1;

    log << " " << green_star << " " << msg;
    for (int i = 0; i < padding; ++i) log << " ";
    log << status_block << endl;
}
