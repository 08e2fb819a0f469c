// Repository: Retrovue-wavecast
// Component: Generation Worker
// Purpose: Bounded job queue and the worker thread that drains it.
// Copyright (c) 2025 RetroVue

#include "wavecast/pipeline/GenerationWorker.hpp"

#include <sstream>
#include <utility>
#include <vector>

#include "wavecast/util/Logger.hpp"

namespace wavecast::pipeline {

using util::Logger;

const char* SubmitStatusToString(SubmitStatus status) {
  switch (status) {
    case SubmitStatus::kAccepted: return "Accepted";
    case SubmitStatus::kDuplicateOutput: return "DuplicateOutput";
    case SubmitStatus::kQueueFull: return "QueueFull";
    case SubmitStatus::kInvalidRequest: return "InvalidRequest";
    case SubmitStatus::kShuttingDown: return "ShuttingDown";
  }
  return "Unknown";
}

GenerationWorker::GenerationWorker(std::unique_ptr<PipelineController> controller,
                                   size_t max_queue_depth)
    : controller_(std::move(controller)),
      max_queue_depth_(max_queue_depth > 0 ? max_queue_depth : 1) {}

GenerationWorker::~GenerationWorker() {
  Stop();
}

void GenerationWorker::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (started_ || stopping_) return;
  started_ = true;
  thread_ = std::thread(&GenerationWorker::WorkerLoop, this);
}

void GenerationWorker::Stop() {
  std::vector<std::shared_ptr<Job>> dropped;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    if (active_) active_->cancel.store(true, std::memory_order_release);
    dropped.assign(queue_.begin(), queue_.end());
    queue_.clear();
    for (const auto& job : dropped) output_paths_.erase(job->request.output_path);
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();

  for (const auto& job : dropped) CompleteCancelled(job, "worker shutting down");
}

SubmitStatus GenerationWorker::Submit(const GenerationRequest& request, JobCallbacks callbacks,
                                      std::string* job_id) {
  const std::string invalid = PipelineController::ValidateRequest(request);
  if (!invalid.empty()) {
    Logger::Warn("[GenerationWorker] Rejected submission: " + invalid);
    return SubmitStatus::kInvalidRequest;
  }

  auto job = std::make_shared<Job>();
  job->request = request;
  job->callbacks = std::move(callbacks);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) return SubmitStatus::kShuttingDown;
    if (output_paths_.count(request.output_path) > 0) {
      Logger::Warn("[GenerationWorker] Duplicate output path: " + request.output_path);
      return SubmitStatus::kDuplicateOutput;
    }
    if (queue_.size() >= max_queue_depth_) return SubmitStatus::kQueueFull;

    if (job->request.job_id.empty()) {
      std::ostringstream oss;
      oss << "job-" << next_job_number_;
      job->request.job_id = oss.str();
    }
    next_job_number_++;
    output_paths_.insert(request.output_path);
    queue_.push_back(job);
    if (job_id != nullptr) *job_id = job->request.job_id;
  }
  cv_.notify_one();

  std::ostringstream oss;
  oss << "[GenerationWorker] Queued job=" << job->request.job_id << " output="
      << request.output_path;
  Logger::Info(oss.str());
  return SubmitStatus::kAccepted;
}

bool GenerationWorker::Cancel(const std::string& job_id) {
  std::shared_ptr<Job> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ && active_->request.job_id == job_id) {
      active_->cancel.store(true, std::memory_order_release);
      Logger::Info("[GenerationWorker] Cancel requested for running job=" + job_id);
      return true;
    }
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
      if ((*it)->request.job_id == job_id) {
        removed = *it;
        queue_.erase(it);
        output_paths_.erase(removed->request.output_path);
        break;
      }
    }
  }
  if (!removed) return false;

  Logger::Info("[GenerationWorker] Cancelled queued job=" + job_id);
  CompleteCancelled(removed, "cancelled while queued");
  return true;
}

size_t GenerationWorker::QueueDepth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool GenerationWorker::Busy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_ != nullptr || !queue_.empty();
}

void GenerationWorker::CompleteCancelled(const std::shared_ptr<Job>& job,
                                         const std::string& detail) {
  if (job->callbacks.on_complete) {
    job->callbacks.on_complete(
        job->request.job_id,
        GenerationResult::Failure(GenerationError::kCancelled, GenerationError::kCancelled,
                                  detail, 0));
  }
}

void GenerationWorker::WorkerLoop() {
  for (;;) {
    std::shared_ptr<Job> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (stopping_) return;
      job = queue_.front();
      queue_.pop_front();
      active_ = job;
    }

    const GenerationResult result =
        controller_->Run(job->request, job->cancel, job->callbacks.on_progress);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      active_.reset();
      output_paths_.erase(job->request.output_path);
    }

    std::ostringstream oss;
    oss << "[GenerationWorker] Finished job=" << job->request.job_id
        << " success=" << (result.success ? "true" : "false")
        << " error=" << GenerationErrorToString(result.error)
        << " attempts=" << result.attempts;
    if (result.success) {
      Logger::Info(oss.str());
    } else {
      Logger::Warn(oss.str());
    }
    if (job->callbacks.on_complete) job->callbacks.on_complete(job->request.job_id, result);
  }
}

}  // namespace wavecast::pipeline
