#include <pictor/vision/wordpiece_vocab.hpp>
#include <cctype>
#include <fstream>
#include <utility>

namespace pictor::vision {

namespace pc = pictor::core;

namespace {

constexpr std::size_t kMaxCharsPerWord = 100;

bool is_special(std::string_view token) {
  return token.size() > 2 && token.front() == '[' && token.back() == ']';
}

bool is_punct(unsigned char c) {
  return std::ispunct(c) != 0;
}

/// Split lowercased text into words and single punctuation characters.
std::vector<std::string> basic_split(std::string_view text) {
  std::vector<std::string> words;
  std::string current;
  auto flush = [&]() {
    if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  };
  for (const char ch : text) {
    const auto c = static_cast<unsigned char>(ch);
    if (std::isspace(c)) {
      flush();
    } else if (is_punct(c)) {
      flush();
      words.emplace_back(1, ch);
    } else {
      current.push_back(static_cast<char>(std::tolower(c)));
    }
  }
  flush();
  return words;
}

}  // namespace

WordPieceVocab::WordPieceVocab(std::vector<std::string> tokens) : tokens_(std::move(tokens)) {
  ids_.reserve(tokens_.size());
  for (std::size_t i = 0; i < tokens_.size(); ++i) {
    ids_.emplace(tokens_[i], static_cast<std::int64_t>(i));
  }
}

std::expected<WordPieceVocab, pc::Error> WordPieceVocab::load(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected(
        pc::make_error(pc::ErrorCode::InvalidConfig, "cannot open vocabulary: " + path));
  }
  std::vector<std::string> tokens;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    tokens.push_back(line);
  }
  if (tokens.empty()) {
    return std::unexpected(
        pc::make_error(pc::ErrorCode::InvalidConfig, "empty vocabulary: " + path));
  }
  return WordPieceVocab(std::move(tokens));
}

std::optional<std::int64_t> WordPieceVocab::id_of(std::string_view token) const {
  const auto it = ids_.find(std::string(token));
  if (it == ids_.end()) return std::nullopt;
  return it->second;
}

std::vector<std::int64_t> WordPieceVocab::tokenize(std::string_view text) const {
  const std::int64_t unk = id_of("[UNK]").value_or(0);
  std::vector<std::int64_t> out;
  for (const std::string& word : basic_split(text)) {
    if (word.size() > kMaxCharsPerWord) {
      out.push_back(unk);
      continue;
    }
    std::vector<std::int64_t> pieces;
    std::size_t start = 0;
    bool bad = false;
    while (start < word.size()) {
      std::size_t end = word.size();
      std::optional<std::int64_t> match;
      while (start < end) {
        std::string candidate = word.substr(start, end - start);
        if (start > 0) candidate.insert(0, "##");
        match = id_of(candidate);
        if (match) break;
        --end;
      }
      if (!match) {
        bad = true;
        break;
      }
      pieces.push_back(*match);
      start = end;
    }
    if (bad) {
      out.push_back(unk);
    } else {
      out.insert(out.end(), pieces.begin(), pieces.end());
    }
  }
  return out;
}

std::string WordPieceVocab::decode(std::span<const std::int64_t> ids) const {
  std::string text;
  for (const std::int64_t id : ids) {
    if (id < 0 || static_cast<std::size_t>(id) >= tokens_.size()) continue;
    const std::string& token = tokens_[static_cast<std::size_t>(id)];
    if (token.empty() || is_special(token)) continue;

    if (token.starts_with("##")) {
      text.append(token, 2, std::string::npos);
    } else if (token.size() == 1 && is_punct(static_cast<unsigned char>(token[0])) &&
               token[0] != '(' && token[0] != '"') {
      text += token;
    } else {
      if (!text.empty()) text += ' ';
      text += token;
    }
  }
  return text;
}

}  // namespace pictor::vision
