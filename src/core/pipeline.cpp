#include <pictor/core/pipeline.hpp>
#include <chrono>
#include <exception>
#include <string>
#include <utility>

namespace pictor::core {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
  const auto end = std::chrono::steady_clock::now();
  return 1e-3 * static_cast<double>(
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count());
}

Error tag_stage(std::string_view stage, Error error) {
  std::string message(stage);
  message += ": ";
  message += error.message.empty() ? std::string(to_string(error.code)) : error.message;
  return make_error(ErrorCode::StageFailure, std::move(message));
}

}  // namespace

Pipeline::Pipeline(ImageDecoder decoder) : decoder_(std::move(decoder)) {}

void Pipeline::add_stage(std::unique_ptr<IDerivationStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<Derivation, Error> Pipeline::run(std::span<const std::byte> encoded,
                                               std::uint64_t size_bytes,
                                               const StageTimingCallback* timing_cb) const {
  if (!decoder_) {
    return std::unexpected(make_error(ErrorCode::InvalidConfig, "pipeline has no decoder"));
  }
  if (stages_.empty()) {
    return std::unexpected(make_error(ErrorCode::InvalidConfig, "pipeline has no stages"));
  }

  const auto decode_start = std::chrono::steady_clock::now();
  auto decoded = decoder_(encoded);
  if (timing_cb && *timing_cb) {
    (*timing_cb)("decode", elapsed_ms(decode_start));
  }
  if (!decoded) {
    return std::unexpected(tag_stage("decode", std::move(decoded.error())));
  }

  const StageInput input{decoded->frame, decoded->format, size_bytes};
  Derivation out;
  for (const auto& stage : stages_) {
    const auto stage_start = std::chrono::steady_clock::now();
    std::expected<void, Error> result;
    try {
      result = stage->process(input, out);
    } catch (const std::exception& e) {
      result = std::unexpected(make_error(ErrorCode::StageFailure, e.what()));
    }
    if (timing_cb && *timing_cb) {
      (*timing_cb)(stage->name(), elapsed_ms(stage_start));
    }
    if (!result) {
      return std::unexpected(tag_stage(stage->name(), std::move(result.error())));
    }
  }
  return out;
}

}  // namespace pictor::core
