#pragma once

#include <pictor/core/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pictor::vision {

/// BERT-style uncased WordPiece vocabulary (vocab.txt, one token per line; id = line index).
/// Used to tokenize the caption prompt and to turn generated ids back into text.
class WordPieceVocab {
 public:
  WordPieceVocab() = default;
  explicit WordPieceVocab(std::vector<std::string> tokens);

  [[nodiscard]] static std::expected<WordPieceVocab, pictor::core::Error>
  load(const std::string& path);

  [[nodiscard]] std::size_t size() const noexcept { return tokens_.size(); }
  [[nodiscard]] std::optional<std::int64_t> id_of(std::string_view token) const;

  /// Lowercase, split on whitespace and punctuation, greedy longest-match WordPiece.
  /// Unknown words map to [UNK]. No [CLS]/[SEP] is added.
  [[nodiscard]] std::vector<std::int64_t> tokenize(std::string_view text) const;

  /// Join tokens, merge "##" continuations, drop special and out-of-range ids,
  /// and remove the space before punctuation.
  [[nodiscard]] std::string decode(std::span<const std::int64_t> ids) const;

 private:
  std::vector<std::string> tokens_;
  std::unordered_map<std::string, std::int64_t> ids_;
};

}  // namespace pictor::vision
