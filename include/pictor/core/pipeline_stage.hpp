#pragma once

#include <pictor/core/derivation.hpp>
#include <pictor/core/error.hpp>
#include <expected>
#include <string_view>

namespace pictor::core {

/// Abstract derivation stage: reads the decoded image, writes its part of the Derivation.
/// process() must not modify the stage; one stage instance serves concurrent runs.
class IDerivationStage {
 public:
  virtual ~IDerivationStage() = default;

  /// Short tag used in failure messages and timing logs ("metadata", "thumbnails", ...).
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  [[nodiscard]] virtual std::expected<void, Error> process(const StageInput& input,
                                                           Derivation& out) const = 0;
};

}  // namespace pictor::core
