#include "core/mint/artifact_assembler.hpp"

namespace scanmint {

Result ArtifactAssembler::assemble(std::uint64_t up_to_index, Artifact& out) const {
  if (!store_.contains(up_to_index)) {
    return Result::failure(MintError::NotYetClaimed,
                           "Scan " + std::to_string(up_to_index) + " has not been claimed yet.");
  }

  std::string_view phase_label;
  if (const Result phased = phase(up_to_index, phase_label); !phased.ok) {
    return phased;
  }

  const std::string_view body = store_.prefix(up_to_index);
  const std::string& header = registry_.header();
  const std::string& footer = registry_.footer();

  out.index = up_to_index;
  out.bytes.clear();
  out.bytes.reserve(header.size() + body.size() + footer.size());
  out.bytes.append(header);
  out.bytes.append(body.data(), body.size());
  out.bytes.append(footer);
  out.size_kb = body.size() / 1024U;
  out.phase = std::string{phase_label};
  return Result::success();
}

Result ArtifactAssembler::phase(std::uint64_t index, std::string_view& out) {
  if (index >= kChunkCount) {
    return Result::failure(MintError::IndexOutOfRange,
                           "Scan index " + std::to_string(index) + " is out of range.");
  }

  if (index <= kLastBlackAndWhiteIndex) {
    out = kPhaseBlackAndWhite;
  } else if (index <= kLastColorIndex) {
    out = kPhaseColor;
  } else {
    out = kPhaseResolution;
  }
  return Result::success();
}

}  // namespace scanmint
