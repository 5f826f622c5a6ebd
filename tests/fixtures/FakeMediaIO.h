// In-memory IAudioExtractor and a recording IMuxer for DubbingJob tests.

#ifndef REDUB_TESTS_FIXTURES_FAKE_MEDIA_IO_H_
#define REDUB_TESTS_FIXTURES_FAKE_MEDIA_IO_H_

#include <string>
#include <utility>
#include <vector>

#include "redub/core/Errors.hpp"
#include "redub/media/AudioExtractor.hpp"
#include "redub/mux/Muxer.hpp"

namespace redub::tests::fixtures {

// Returns a fixed buffer for one known path; anything else is unreadable.
class FakeAudioExtractor : public media::IAudioExtractor {
 public:
  FakeAudioExtractor(std::string path, media::PcmBuffer audio)
      : path_(std::move(path)), audio_(std::move(audio)) {}

  media::PcmBuffer Extract(const std::string& path, int sample_rate) override {
    ++calls_;
    if (path != path_) throw core::SegmentationError("cannot open " + path);
    if (sample_rate != audio_.sample_rate) {
      throw core::SegmentationError("fake extractor cannot resample");
    }
    return audio_;
  }

  int calls() const { return calls_; }

 private:
  std::string path_;
  media::PcmBuffer audio_;
  int calls_ = 0;
};

class RecordingMuxer : public mux::IMuxer {
 public:
  explicit RecordingMuxer(bool fail = false) : fail_(fail) {}

  void Mux(const mux::MuxRequest& request) override {
    requests_.push_back(request);
    if (fail_) throw core::MuxError("[Muxer] MUX_FAILED exit_code=1 tool=fake");
  }

  const std::vector<mux::MuxRequest>& requests() const { return requests_; }

 private:
  bool fail_;
  std::vector<mux::MuxRequest> requests_;
};

}  // namespace redub::tests::fixtures

#endif  // REDUB_TESTS_FIXTURES_FAKE_MEDIA_IO_H_
