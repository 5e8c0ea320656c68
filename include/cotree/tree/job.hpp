// ============================================================================
// cotree/tree/job.hpp - Self-Contained Unit of Work
// ============================================================================
//
// A Job runs its body exactly once. The body receives the Job itself, so it
// can grow the tree below it and observe termination:
//
//   Task<NodeResult> Crawl(Job& self, Args args) {
//       auto url = std::any_cast<std::string>(args.at(0));
//       for (auto& link : co_await FetchLinks(url)) {
//           auto child = SubmitJob(self, "crawl", Crawl, {std::any(link)});
//           if (child.IsErr()) co_return Err(MakeFault(child.Error()));
//       }
//       co_return Ok(url);  // Completed once every child resolved too
//   }
//
//   Commander commander;
//   commander.Submit(Job::Create("root", Crawl, {std::any(start)}));
//   commander.Run();
//
// ============================================================================

#pragma once

#include "cotree/tree/task_node.hpp"

#include <functional>
#include <memory>
#include <string>

namespace cotree {

using JobBody = std::function<Task<NodeResult>(Job& self, Args args)>;

class Job : public TaskNode {
   public:
    // A detached Pending Job; attach it with Commander::Submit or SubmitJob.
    static std::shared_ptr<Job> Create(std::string name, JobBody body, Args args = {});

    const Args& GetArgs() const noexcept { return args_; }

    // Attach an existing Job under `parent` and schedule it.
    //   InvalidArgument  - null job or empty body
    //   AlreadySubmitted - the Job was attached before
    //   ParentClosed     - `parent` no longer accepts children
    static Result<std::shared_ptr<Job>, Error> Submit(TaskNode& parent, std::shared_ptr<Job> job,
                                                      SubmitOptions options = {});

   private:
    friend class TaskNode;

    Job(std::string name, JobBody body, Args args);

    Task<NodeResult> StartBody() { return body_(*this, args_); }

    JobBody body_;
    Args args_;
};

// Create a Job and attach it under `parent` (a running node or a Commander).
Result<std::shared_ptr<Job>, Error> SubmitJob(TaskNode& parent, std::string name, JobBody body, Args args = {},
                                              SubmitOptions options = {});

Result<std::shared_ptr<Job>, Error> SubmitJob(TaskNode& parent, std::shared_ptr<Job> job,
                                              SubmitOptions options = {});

}  // namespace cotree
