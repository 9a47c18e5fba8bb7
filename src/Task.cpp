#include "../include/Task.hpp"
#include <chrono>
#include <iomanip>
#include <ios>
#include <sstream>

using namespace tekton;

namespace {
    void log_finished(TaskContext &context, const std::string &what,
                      const std::chrono::steady_clock::time_point start) {
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
        std::ostringstream line;
        line << what << ' ' << _("finished") << " (" << _("took") << ' '
             << std::fixed << std::setprecision(2) << elapsed.count() << ' ' << _("seconds") << ")";
        context.log_info(line.str());
    }
}

int TaskBase::execute(TaskContext &context) {
    if (!log_duration()) return do_execute(context);
    const std::string what = description_for_log();
    const auto start = std::chrono::steady_clock::now();
    int code = 0;
    try {
        code = do_execute(context);
    } catch (...) {
        // the task fault wins over a failing log stream
        try {
            log_finished(context, what, start);
        } catch (const std::ios_base::failure &) {
        }
        throw;
    }
    log_finished(context, what, start);
    return code;
}

FunctionTask::FunctionTask(Function fn, const std::string &description) : function(std::move(fn)) {
    set_task_description(description);
}

TaskPtr FunctionTask::create(Function fn, const std::string &description) {
    return std::make_shared<FunctionTask>(std::move(fn), description);
}

int FunctionTask::do_execute(TaskContext &context) {
    return function ? function(context) : 0;
}
