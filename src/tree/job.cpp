// ============================================================================
// cotree/tree/job.cpp - Job Creation and Submission
// ============================================================================

#include "cotree/tree/job.hpp"

#include "cotree/core/log.hpp"

#include <utility>

namespace cotree {

Job::Job(std::string name, JobBody body, Args args)
    : TaskNode(NodeKind::Job, std::move(name)), body_(std::move(body)), args_(std::move(args)) {}

std::shared_ptr<Job> Job::Create(std::string name, JobBody body, Args args) {
    return std::shared_ptr<Job>(new Job(std::move(name), std::move(body), std::move(args)));
}

Result<std::shared_ptr<Job>, Error> Job::Submit(TaskNode& parent, std::shared_ptr<Job> job, SubmitOptions options) {
    if (!job || !job->body_) {
        return Err(make_error_code(Errc::InvalidArgument));
    }
    if (job->parent_ != nullptr || job->status_ != NodeStatus::Pending) {
        return Err(make_error_code(Errc::AlreadySubmitted));
    }
    if (!parent.AcceptsChildren()) {
        LOG_WARNING(Logger(), "{}#{} refused job {}: parent is {}", parent.Name(), parent.Id(), job->Name(),
                    ToString(parent.Status()));
        return Err(make_error_code(Errc::ParentClosed));
    }

    Attach(parent, job, options, false);
    return Ok(std::move(job));
}

Result<std::shared_ptr<Job>, Error> SubmitJob(TaskNode& parent, std::string name, JobBody body, Args args,
                                              SubmitOptions options) {
    return Job::Submit(parent, Job::Create(std::move(name), std::move(body), std::move(args)), options);
}

Result<std::shared_ptr<Job>, Error> SubmitJob(TaskNode& parent, std::shared_ptr<Job> job, SubmitOptions options) {
    return Job::Submit(parent, std::move(job), options);
}

}  // namespace cotree
