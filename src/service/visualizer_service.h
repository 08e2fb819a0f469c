// Repository: Retrovue-wavecast
// Component: VisualizerControl gRPC Service Implementation
// Purpose: Implements the VisualizerControl service on top of the generation
//          worker and the live level meter.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_VISUALIZER_SERVICE_H_
#define WAVECAST_VISUALIZER_SERVICE_H_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "wavecast.grpc.pb.h"
#include "wavecast.pb.h"
#include "wavecast/pipeline/GenerationTypes.hpp"
#include "wavecast/pipeline/GenerationWorker.hpp"

namespace wavecast {
namespace service {

extern const char kApiVersion[];

// Upper bound on PreviewLevels input, in samples.
constexpr size_t kMaxPreviewSamples = 1u << 20;

// Converts wire requests into pipeline requests. Returns false and sets *error
// on a malformed request.
bool ToGenerationRequest(const GenerateVideoRequest& in,
                         pipeline::GenerationRequest* out,
                         std::string* error);

PipelineState ToProtoState(pipeline::PipelineState state);
GenerationError ToProtoError(pipeline::GenerationError error);

// VisualizerControlImpl is a thin adapter: each GenerateVideo call submits one
// job to the shared worker and relays its events until the job finishes.
class VisualizerControlImpl final : public VisualizerControl::Service {
 public:
  explicit VisualizerControlImpl(std::shared_ptr<pipeline::GenerationWorker> worker);
  ~VisualizerControlImpl() override;

  VisualizerControlImpl(const VisualizerControlImpl&) = delete;
  VisualizerControlImpl& operator=(const VisualizerControlImpl&) = delete;

  grpc::Status GenerateVideo(grpc::ServerContext* context,
                             const GenerateVideoRequest* request,
                             grpc::ServerWriter<GenerationEvent>* writer) override;

  grpc::Status CancelGeneration(grpc::ServerContext* context,
                                const CancelGenerationRequest* request,
                                CancelGenerationResponse* response) override;

  grpc::Status PreviewLevels(grpc::ServerContext* context,
                             const PreviewLevelsRequest* request,
                             PreviewLevelsResponse* response) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const ApiVersionRequest* request,
                          ApiVersion* response) override;

 private:
  std::shared_ptr<pipeline::GenerationWorker> worker_;
};

}  // namespace service
}  // namespace wavecast

#endif  // WAVECAST_VISUALIZER_SERVICE_H_
