#include "job.h"

#include <stdexcept>
#include <string>
#include <thread>
#include <glog/logging.h>

namespace Cadence {

std::exception_ptr InvokeJob(const Job& job) {
    try {
        job.fn();
    } catch (...) {
        return std::current_exception();
    }
    return nullptr;
}

void SleepFor(std::chrono::milliseconds d) {
    if (d.count() > 0) {
        std::this_thread::sleep_for(d);
    }
}

std::string DescribeFailure(const std::exception_ptr& error) {
    if (!error) return "no error";
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

void ReportJobFailure(const SequencerOptions& options, FailurePolicy policy,
                      int64_t index, const std::exception_ptr& error) {
    if (policy == FailurePolicy::kPropagate) {
        LOG(ERROR) << "Job " << index << " failed, sequence halts at this index: "
                   << DescribeFailure(error);
    } else {
        LOG(WARNING) << "Job " << index << " failed, continuing: " << DescribeFailure(error);
    }
    if (options.on_failure) {
        options.on_failure(index, error);
    }
}

} // namespace Cadence
