#include <pictor/vision/onnx_caption_backend.hpp>
#include "frame_cv_utils.hpp"
#include <pictor/core/error.hpp>
#include <pictor/core/frame.hpp>
#include <onnxruntime_cxx_api.h>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <set>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace pictor::vision {

namespace pc = pictor::core;

namespace {

constexpr int64_t kNumChannels = 3;
constexpr std::array<float, 3> kMean{0.48145466f, 0.4578275f, 0.40821073f};
constexpr std::array<float, 3> kStd{0.26862954f, 0.26130258f, 0.27577711f};

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Copy normalized HWC RGB float image to NCHW.
void HwcToNchw(const cv::Mat& rgb, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(rgb.rows) * rgb.cols;
  for (int y = 0; y < rgb.rows; ++y) {
    const float* row = rgb.ptr<float>(y);
    for (int x = 0; x < rgb.cols; ++x) {
      const std::size_t dst = static_cast<std::size_t>(y) * rgb.cols + x;
      for (int c = 0; c < kNumChannels; ++c) {
        nchw[c * hw + dst] = (row[x * kNumChannels + c] - kMean[c]) / kStd[c];
      }
    }
  }
}

enum class DecoderInput { InputIds, AttentionMask, EncoderHiddenStates, EncoderAttentionMask };

}  // namespace

struct OnnxCaptionBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "pictor"};
  Ort::SessionOptions session_options;
  Ort::Session encoder{nullptr};
  Ort::Session decoder{nullptr};

  std::string encoder_input_name;
  std::string encoder_output_name;
  std::vector<std::string> decoder_input_names;
  std::vector<DecoderInput> decoder_input_roles;
  std::string decoder_output_name;

  WordPieceVocab vocab;
  OnnxCaptionOptions options;
  std::vector<float> pixel_buffer;  // scratch for NCHW input

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxCaptionBackend::OnnxCaptionBackend(const std::string& encoder_path,
                                       const std::string& decoder_path,
                                       WordPieceVocab vocab,
                                       OnnxCaptionOptions options)
    : impl_(std::make_unique<Impl>()) {
  impl_->vocab = std::move(vocab);
  impl_->options = options;
  impl_->encoder = Ort::Session(impl_->env, encoder_path.c_str(), impl_->session_options);
  impl_->decoder = Ort::Session(impl_->env, decoder_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->encoder.GetInputCount() != 1u || impl_->encoder.GetOutputCount() == 0u) {
    throw std::runtime_error("OnnxCaptionBackend: encoder must have one input and an output");
  }
  impl_->encoder_input_name = impl_->encoder.GetInputNameAllocated(0, allocator).get();
  impl_->encoder_output_name = impl_->encoder.GetOutputNameAllocated(0, allocator).get();

  const auto enc_dims =
      impl_->encoder.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (enc_dims.size() != 4u || (enc_dims[1] > 0 && enc_dims[1] != kNumChannels)) {
    throw std::runtime_error("OnnxCaptionBackend: expected encoder input shape [1,3,S,S]");
  }
  if (enc_dims[2] > 0) {
    impl_->options.image_size = static_cast<std::uint32_t>(enc_dims[2]);
  }

  bool has_ids = false;
  bool has_states = false;
  for (std::size_t i = 0; i < impl_->decoder.GetInputCount(); ++i) {
    std::string name = impl_->decoder.GetInputNameAllocated(i, allocator).get();
    DecoderInput role;
    if (name == "input_ids") {
      role = DecoderInput::InputIds;
      has_ids = true;
    } else if (name == "attention_mask") {
      role = DecoderInput::AttentionMask;
    } else if (name == "encoder_hidden_states") {
      role = DecoderInput::EncoderHiddenStates;
      has_states = true;
    } else if (name == "encoder_attention_mask") {
      role = DecoderInput::EncoderAttentionMask;
    } else {
      throw std::runtime_error("OnnxCaptionBackend: unexpected decoder input '" + name + "'");
    }
    impl_->decoder_input_names.push_back(std::move(name));
    impl_->decoder_input_roles.push_back(role);
  }
  if (!has_ids || !has_states) {
    throw std::runtime_error(
        "OnnxCaptionBackend: decoder needs input_ids and encoder_hidden_states inputs");
  }
  if (impl_->decoder.GetOutputCount() == 0u) {
    throw std::runtime_error("OnnxCaptionBackend: decoder has no outputs");
  }
  impl_->decoder_output_name = impl_->decoder.GetOutputNameAllocated(0, allocator).get();
}

OnnxCaptionBackend::~OnnxCaptionBackend() = default;

std::expected<std::string, pc::Error> OnnxCaptionBackend::describe(const pc::Frame& image,
                                                                   std::string_view prompt) {
  auto mat = detail::frame_to_mat(image);
  if (!mat || image.format() != pc::PixelFormat::BGR8) {
    return std::unexpected(
        pc::make_error(pc::ErrorCode::StageFailure, "caption input must be a BGR8 frame"));
  }

  const int size = static_cast<int>(impl_->options.image_size);
  cv::Mat resized;
  cv::Mat rgb;
  cv::resize(*mat, resized, cv::Size(size, size), 0, 0, cv::INTER_CUBIC);
  cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);
  rgb.convertTo(rgb, CV_32FC3, 1.0 / 255.0);

  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels) * size * size;
  impl_->pixel_buffer.resize(num_floats);
  HwcToNchw(rgb, impl_->pixel_buffer.data());

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  const std::array<int64_t, 4> pixel_shape{1, kNumChannels, size, size};
  Ort::Value pixels = Ort::Value::CreateTensor<float>(
      mem_info, impl_->pixel_buffer.data(), num_floats, pixel_shape.data(), pixel_shape.size());

  std::vector<std::int64_t> ids{impl_->options.bos_token_id};
  const auto prompt_ids = impl_->vocab.tokenize(prompt);
  ids.insert(ids.end(), prompt_ids.begin(), prompt_ids.end());

  try {
    const char* enc_in[] = {impl_->encoder_input_name.c_str()};
    const char* enc_out[] = {impl_->encoder_output_name.c_str()};
    auto encoded = impl_->encoder.Run(Ort::RunOptions{nullptr}, enc_in, &pixels, 1, enc_out, 1);
    Ort::Value& states = encoded.front();
    const auto states_shape = states.GetTensorTypeAndShapeInfo().GetShape();
    if (states_shape.size() != 3u) {
      return std::unexpected(
          pc::make_error(pc::ErrorCode::StageFailure, "unexpected encoder output rank"));
    }
    std::vector<std::int64_t> encoder_mask(static_cast<std::size_t>(states_shape[1]), 1);
    const std::array<int64_t, 2> encoder_mask_shape{1, states_shape[1]};

    std::vector<const char*> dec_in;
    for (const auto& name : impl_->decoder_input_names) dec_in.push_back(name.c_str());
    const char* dec_out[] = {impl_->decoder_output_name.c_str()};

    for (std::size_t step = 0; step < impl_->options.max_new_tokens; ++step) {
      std::vector<std::int64_t> mask(ids.size(), 1);
      const std::array<int64_t, 2> ids_shape{1, static_cast<int64_t>(ids.size())};

      std::vector<Ort::Value> inputs;
      inputs.reserve(impl_->decoder_input_roles.size());
      for (const DecoderInput role : impl_->decoder_input_roles) {
        switch (role) {
          case DecoderInput::InputIds:
            inputs.push_back(Ort::Value::CreateTensor<std::int64_t>(
                mem_info, ids.data(), ids.size(), ids_shape.data(), ids_shape.size()));
            break;
          case DecoderInput::AttentionMask:
            inputs.push_back(Ort::Value::CreateTensor<std::int64_t>(
                mem_info, mask.data(), mask.size(), ids_shape.data(), ids_shape.size()));
            break;
          case DecoderInput::EncoderHiddenStates:
            inputs.push_back(Ort::Value::CreateTensor<float>(
                mem_info, states.GetTensorMutableData<float>(),
                states.GetTensorTypeAndShapeInfo().GetElementCount(), states_shape.data(),
                states_shape.size()));
            break;
          case DecoderInput::EncoderAttentionMask:
            inputs.push_back(Ort::Value::CreateTensor<std::int64_t>(
                mem_info, encoder_mask.data(), encoder_mask.size(), encoder_mask_shape.data(),
                encoder_mask_shape.size()));
            break;
        }
      }

      auto outputs = impl_->decoder.Run(Ort::RunOptions{nullptr}, dec_in.data(), inputs.data(),
                                        inputs.size(), dec_out, 1);
      const auto logits_shape = outputs.front().GetTensorTypeAndShapeInfo().GetShape();
      if (logits_shape.size() != 3u || logits_shape[1] != static_cast<int64_t>(ids.size())) {
        return std::unexpected(
            pc::make_error(pc::ErrorCode::StageFailure, "unexpected decoder logits shape"));
      }
      const auto vocab_size = static_cast<std::size_t>(logits_shape[2]);
      const float* last =
          outputs.front().GetTensorData<float>() + (ids.size() - 1) * vocab_size;
      std::vector<float> scores(last, last + vocab_size);

      const std::set<std::int64_t> seen(ids.begin(), ids.end());
      for (const std::int64_t id : seen) {
        if (id < 0 || static_cast<std::size_t>(id) >= vocab_size) continue;
        float& s = scores[static_cast<std::size_t>(id)];
        s = s < 0.f ? s * impl_->options.repetition_penalty : s / impl_->options.repetition_penalty;
      }

      const auto next = static_cast<std::int64_t>(
          std::distance(scores.begin(), std::max_element(scores.begin(), scores.end())));
      if (next == impl_->options.eos_token_id) break;
      ids.push_back(next);
    }
  } catch (const Ort::Exception& e) {
    return std::unexpected(
        pc::make_error(pc::ErrorCode::StageFailure, std::string("caption model: ") + e.what()));
  }

  return impl_->vocab.decode(std::span<const std::int64_t>(ids).subspan(1));
}

void OnnxCaptionBackend::warmup() {
  const std::uint32_t size = impl_->options.image_size;
  std::vector<std::byte> buffer(pc::Frame::min_bytes(size, size, pc::PixelFormat::BGR8),
                                std::byte{0});
  pc::Frame frame(size, size, pc::PixelFormat::BGR8, std::move(buffer));
  (void)describe(frame, {});
}

}  // namespace pictor::vision
