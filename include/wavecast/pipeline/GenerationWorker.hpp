// Repository: Retrovue-wavecast
// Component: Generation Worker
// Purpose: Single dedicated thread that runs queued generation requests one
//          at a time through a PipelineController.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_PIPELINE_GENERATION_WORKER_HPP_
#define WAVECAST_PIPELINE_GENERATION_WORKER_HPP_

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "wavecast/pipeline/GenerationTypes.hpp"
#include "wavecast/pipeline/PipelineController.hpp"

namespace wavecast::pipeline {

constexpr size_t kDefaultMaxQueueDepth = 8;

enum class SubmitStatus {
  kAccepted = 0,
  kDuplicateOutput,  // A queued or running job already targets output_path
  kQueueFull,
  kInvalidRequest,
  kShuttingDown,
};

const char* SubmitStatusToString(SubmitStatus status);

struct JobCallbacks {
  // Invoked on the worker thread.
  ProgressCallback on_progress;

  // Invoked exactly once per accepted job: on the worker thread when the job
  // ran, or on the cancelling thread when it was removed from the queue.
  std::function<void(const std::string& job_id, const GenerationResult& result)> on_complete;
};

class GenerationWorker {
 public:
  explicit GenerationWorker(std::unique_ptr<PipelineController> controller,
                            size_t max_queue_depth = kDefaultMaxQueueDepth);
  ~GenerationWorker();

  GenerationWorker(const GenerationWorker&) = delete;
  GenerationWorker& operator=(const GenerationWorker&) = delete;

  void Start();

  // Cancels the running job, completes every queued job with kCancelled and
  // joins the worker thread. Further submissions return kShuttingDown.
  void Stop();

  // On kAccepted, *job_id receives the request's id (assigned when empty).
  SubmitStatus Submit(const GenerationRequest& request, JobCallbacks callbacks,
                      std::string* job_id);

  // Returns false when no queued or running job has this id.
  bool Cancel(const std::string& job_id);

  size_t QueueDepth() const;
  bool Busy() const;

 private:
  struct Job {
    GenerationRequest request;
    JobCallbacks callbacks;
    std::atomic<bool> cancel{false};
  };

  void WorkerLoop();
  static void CompleteCancelled(const std::shared_ptr<Job>& job, const std::string& detail);

  std::unique_ptr<PipelineController> controller_;
  const size_t max_queue_depth_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::shared_ptr<Job>> queue_;
  std::shared_ptr<Job> active_;
  std::set<std::string> output_paths_;  // queued + active
  uint64_t next_job_number_ = 1;
  bool started_ = false;
  bool stopping_ = false;
  std::thread thread_;
};

}  // namespace wavecast::pipeline

#endif  // WAVECAST_PIPELINE_GENERATION_WORKER_HPP_
