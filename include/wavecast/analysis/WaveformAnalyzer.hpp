// Repository: Retrovue-wavecast
// Component: Waveform Analyzer
// Purpose: Streams an audio track through bounded chunks and reduces it to a
//          fixed number of RMS/peak points.
// Copyright (c) 2025 RetroVue

#ifndef WAVECAST_ANALYSIS_WAVEFORM_ANALYZER_HPP_
#define WAVECAST_ANALYSIS_WAVEFORM_ANALYZER_HPP_

#include <cstdint>
#include <string>
#include <utility>

#include "wavecast/analysis/WaveformTypes.hpp"
#include "wavecast/decode/IAudioDecoder.hpp"
#include "wavecast/timing/StopSignal.hpp"

namespace wavecast::analysis {

enum class AnalysisError {
  kNone = 0,
  kNoAudioTrack,   // No decodable audio, or a source that produced no samples
  kReaderFailure,  // Open or read failed terminally
  kCancelled,      // Stop requested (caller cancel or attempt deadline)
};

const char* AnalysisErrorToString(AnalysisError error);

struct AnalysisResult {
  bool ok;
  AnalysisError error;
  std::string detail;
  WaveformData waveform;
  uint64_t skipped_chunks = 0;

  static AnalysisResult Success(WaveformData data, uint64_t skipped) {
    return {true, AnalysisError::kNone, "", std::move(data), skipped};
  }

  static AnalysisResult Failure(AnalysisError err, const std::string& detail = "") {
    return {false, err, detail, WaveformData(), 0};
  }
};

struct AnalyzerConfig {
  uint32_t target_points = kDefaultWaveformPoints;  // Clamped to [1, 500]

  // Used when the container reports no usable duration. A hint that is not
  // finite, not positive or beyond kMaxSourceDurationSec counts as unknown,
  // in which case the analyzer counts samples in a first pass and re-opens
  // the decoder.
  double duration_hint_sec = 0.0;
};

// WaveformAnalyzer reduces an audio track to exactly
// ClampPointCount(target_points) points.
//
// The decoder is expected to be configured for kAnalysisSampleRate mono; the
// analyzer opens it, installs the stop predicate as its interrupt callback
// and closes it before returning. Only one chunk plus one rolling window of
// samples are held at any time.
class WaveformAnalyzer {
 public:
  explicit WaveformAnalyzer(const AnalyzerConfig& config = AnalyzerConfig());

  AnalysisResult Analyze(decode::IAudioDecoder& decoder,
                         const timing::StopSignal& stop = timing::StopSignal()) const;

  const AnalyzerConfig& config() const { return config_; }

  // floor(sample_rate * duration / target_points), at least 1.
  static uint64_t SamplesPerPoint(int sample_rate, double duration_sec,
                                  uint32_t target_points);

 private:
  // Decodes the whole track once, counting sample frames. Returns false and
  // fills *failure when the pass could not complete.
  bool CountFrames(decode::IAudioDecoder& decoder,
                   const timing::StopSignal& stop,
                   uint64_t* frames,
                   AnalysisResult* failure) const;

  AnalyzerConfig config_;
};

}  // namespace wavecast::analysis

#endif  // WAVECAST_ANALYSIS_WAVEFORM_ANALYZER_HPP_
