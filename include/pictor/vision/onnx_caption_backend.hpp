#pragma once

#include <pictor/core/error.hpp>
#include <pictor/core/frame.hpp>
#include <pictor/vision/caption_backend.hpp>
#include <pictor/vision/wordpiece_vocab.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace pictor::vision {

/// Decoding parameters for OnnxCaptionBackend. Defaults match BLIP base.
struct OnnxCaptionOptions {
  std::uint32_t image_size{384};
  std::size_t max_new_tokens{20};
  float repetition_penalty{1.2f};
  std::int64_t bos_token_id{30522};  // [DEC]
  std::int64_t eos_token_id{102};    // [SEP]
};

/// ONNX Runtime image-captioning backend built from an exported encoder/decoder pair.
///
/// Expected models:
/// - **Vision encoder**: one float input [1,3,S,S] (CLIP-normalized RGB) and the image
///   embeddings [1,N,D] as first output.
/// - **Text decoder**: inputs `input_ids` [1,T] (int64), optional `attention_mask` [1,T],
///   `encoder_hidden_states` [1,N,D], optional `encoder_attention_mask` [1,N];
///   first output is `logits` [1,T,V].
///
/// Decoding is greedy (no sampling) with a repetition penalty, so identical input yields
/// identical text. The prompt conditions the decoder and is part of the returned text.
class OnnxCaptionBackend : public ICaptionBackend {
 public:
  /// \param encoder_path Path to the vision encoder .onnx file.
  /// \param decoder_path Path to the text decoder .onnx file.
  /// \param vocab WordPiece vocabulary matching the decoder.
  /// Throws Ort::Exception if a model cannot be loaded, std::runtime_error on an
  /// unexpected model signature.
  OnnxCaptionBackend(const std::string& encoder_path,
                     const std::string& decoder_path,
                     WordPieceVocab vocab,
                     OnnxCaptionOptions options = {});

  ~OnnxCaptionBackend() override;

  OnnxCaptionBackend(const OnnxCaptionBackend&) = delete;
  OnnxCaptionBackend& operator=(const OnnxCaptionBackend&) = delete;

  [[nodiscard]] std::expected<std::string, pictor::core::Error>
  describe(const pictor::core::Frame& image, std::string_view prompt) override;

  void warmup() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace pictor::vision
