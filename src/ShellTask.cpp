#include "../include/ShellTask.hpp"
#include "../include/Errors.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>

using namespace tekton;
using namespace std;

int tekton::run_shell(const string &cmd, const string &out_path, const string &err_path, const string &dir) {
    const pid_t pid = fork();
    if (pid < 0) {
        throw TaskExecutionError(string(_("failed to fork: ")) + strerror(errno));
    }
    if (pid == 0) {
        // Redirect stdout/stderr to files
        if (!out_path.empty()) {
            if (const int fd = open(out_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644); fd >= 0) {
                dup2(fd, STDOUT_FILENO);
                close(fd);
            }
        }
        if (!err_path.empty()) {
            if (const int fd = open(err_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644); fd >= 0) {
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }
        // after the redirections: their paths are relative to the caller
        if (!dir.empty() && chdir(dir.c_str()) != 0) {
            _exit(127);
        }
        execl("/bin/sh", "sh", "-c", cmd.c_str(), static_cast<char *>(nullptr));
        _exit(127);
    }
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw TaskExecutionError(string(_("failed to wait for: ")) + cmd);
        }
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

ShellTask::ShellTask(string command, const string &description) : cmd(std::move(command)) {
    set_task_description(description);
}

shared_ptr<ShellTask> ShellTask::create(const string &command, const string &description) {
    return make_shared<ShellTask>(command, description);
}

ShellTask &ShellTask::do_not_fail_on_error() {
    fail_on_error = false;
    return *this;
}

ShellTask &ShellTask::redirect_output(const string &out, const string &err) {
    stdout_path = out;
    stderr_path = err;
    return *this;
}

ShellTask &ShellTask::working_directory(const string &dir) {
    work_dir = dir;
    return *this;
}

string ShellTask::description_for_log() const {
    return description().empty() ? cmd : description();
}

int ShellTask::do_execute(TaskContext &context) {
    const string expanded = context.expand(cmd);
    context.log_info("$ " + expanded);
    const int rc = run_shell(expanded, context.expand(stdout_path), context.expand(stderr_path),
                             context.expand(work_dir));
    if (rc != 0) {
        const string msg = description_for_log() + ": " + _("command failed with code") + " " + to_string(rc);
        if (fail_on_error) throw TaskExecutionError(msg);
        context.log_error(msg);
    }
    return rc;
}
