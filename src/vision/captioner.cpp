#include <pictor/vision/captioner.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace pictor::vision {

namespace pc = pictor::core;

namespace {

std::string_view trim_view(std::string_view s, std::string_view chars) {
  const auto start = s.find_first_not_of(chars);
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(chars);
  return s.substr(start, end - start + 1);
}

bool istarts_with(std::string_view s, std::string_view prefix) {
  if (prefix.empty() || s.size() < prefix.size()) return false;
  return std::equal(prefix.begin(), prefix.end(), s.begin(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
  });
}

constexpr std::string_view kWhitespace = " \t\r\n";

}  // namespace

std::string clean_caption(std::string_view raw, std::string_view prompt,
                          std::string_view fallback) {
  std::string_view caption = trim_view(raw, kWhitespace);
  if (istarts_with(caption, prompt)) {
    caption = trim_view(caption.substr(prompt.size()), " .:");
  }
  if (caption.empty()) return std::string(fallback);
  return std::string(caption);
}

Captioner::Captioner(std::unique_ptr<ICaptionBackend> backend, CaptionOptions options)
    : backend_(std::move(backend)), options_(std::move(options)) {
  if (!backend_) {
    throw std::invalid_argument("Captioner: backend must not be null");
  }
}

std::expected<std::string, pc::Error> Captioner::describe(const pc::Frame& image) {
  std::expected<std::string, pc::Error> raw;
  {
    std::lock_guard lock(mutex_);
    raw = backend_->describe(image, options_.prompt);
  }
  if (!raw) return std::unexpected(std::move(raw.error()));
  return clean_caption(*raw, options_.prompt, options_.fallback);
}

}  // namespace pictor::vision
