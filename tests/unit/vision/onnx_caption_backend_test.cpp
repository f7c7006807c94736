// Unit tests for OnnxCaptionBackend.
// One test runs without a model (constructor with missing files). The rest need an exported
// BLIP-style captioning model: set PICTOR_TEST_CAPTION_MODEL_DIR to a directory holding
// vision_encoder.onnx, text_decoder.onnx and vocab.txt. They are skipped otherwise.
#include <pictor/vision/captioner.hpp>
#include <pictor/vision/onnx_caption_backend.hpp>
#include <pictor/vision/wordpiece_vocab.hpp>
#include "support/test_images.hpp"
#include <onnxruntime_cxx_api.h>
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace pc = pictor::core;
namespace pv = pictor::vision;
namespace pt = pictor::testing;

namespace {

struct ModelFiles {
  std::string encoder;
  std::string decoder;
  std::string vocab;
};

std::optional<ModelFiles> test_model_files() {
  const char* env = std::getenv("PICTOR_TEST_CAPTION_MODEL_DIR");
  if (!env || env[0] == '\0') return std::nullopt;
  const std::filesystem::path dir(env);
  ModelFiles files{(dir / "vision_encoder.onnx").string(), (dir / "text_decoder.onnx").string(),
                   (dir / "vocab.txt").string()};
  if (!std::filesystem::exists(files.encoder) || !std::filesystem::exists(files.decoder) ||
      !std::filesystem::exists(files.vocab)) {
    return std::nullopt;
  }
  return files;
}

std::unique_ptr<pv::OnnxCaptionBackend> load_backend(const ModelFiles& files) {
  auto vocab = pv::WordPieceVocab::load(files.vocab);
  if (!vocab) return nullptr;
  return std::make_unique<pv::OnnxCaptionBackend>(files.encoder, files.decoder,
                                                  std::move(*vocab));
}

}  // namespace

// --- Tests that run without a model ---

TEST(OnnxCaptionBackend, ConstructorThrowsWhenFilesMissing) {
  EXPECT_THROW(
      {
        pv::OnnxCaptionBackend backend("nonexistent_encoder_12345.onnx",
                                       "nonexistent_decoder_12345.onnx", pv::WordPieceVocab{});
      },
      Ort::Exception);
}

// --- Tests that require a real model ---

TEST(OnnxCaptionBackend, RejectsNonBgrFrame) {
  const auto files = test_model_files();
  if (!files) GTEST_SKIP() << "Set PICTOR_TEST_CAPTION_MODEL_DIR to run";
  auto backend = load_backend(*files);
  ASSERT_NE(backend, nullptr);
  auto caption = backend->describe(pc::Frame{}, pv::kDefaultCaptionPrompt);
  ASSERT_FALSE(caption.has_value());
  EXPECT_EQ(caption.error().code, pc::ErrorCode::StageFailure);
}

TEST(OnnxCaptionBackend, DescribeIsDeterministicAndNonEmpty) {
  const auto files = test_model_files();
  if (!files) GTEST_SKIP() << "Set PICTOR_TEST_CAPTION_MODEL_DIR to run";
  pv::Captioner captioner(load_backend(*files));
  const pc::Frame frame = pt::make_bgr_frame(320, 240);

  auto first = captioner.describe(frame);
  auto second = captioner.describe(frame);
  ASSERT_TRUE(first.has_value()) << first.error().message;
  ASSERT_TRUE(second.has_value()) << second.error().message;
  EXPECT_FALSE(first->empty());
  EXPECT_EQ(*first, *second);
}
