#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#ifndef SCANMINT_APP_VERSION
#define SCANMINT_APP_VERSION "0.3.0"
#endif

#ifndef SCANMINT_BUILD_RELEASE
#define SCANMINT_BUILD_RELEASE "Sequential Mint Phase 1"
#endif

namespace scanmint {

inline constexpr std::string_view kAppDisplayName = "scanmint::Progressive Image Mint";
inline constexpr std::string_view kAppVersion = SCANMINT_APP_VERSION;
inline constexpr std::string_view kBuildRelease = SCANMINT_BUILD_RELEASE;

inline constexpr std::uint64_t kChunkCount = 100;
inline constexpr std::size_t kDigestBytes = 32;

// Execution-cost schedule, in metered units.
inline constexpr std::uint64_t kFeeSlopeUnits = 70707;
inline constexpr std::uint64_t kFeeBaseUnits = 3000000;
inline constexpr std::uint64_t kFeeEstimationBiasUnits = 260000;

inline constexpr std::uint64_t kLastBlackAndWhiteIndex = 10;
inline constexpr std::uint64_t kLastColorIndex = 32;
inline constexpr std::string_view kPhaseBlackAndWhite = "Black & White";
inline constexpr std::string_view kPhaseColor = "Color";
inline constexpr std::string_view kPhaseResolution = "Resolution";

// Base64 of the JPEG end-of-image marker (FF D9).
inline constexpr std::string_view kDefaultFooter = "/9k=";
inline constexpr std::string_view kDefaultCollectionName = "JPEG Mining";
inline constexpr std::string_view kDefaultDescription =
    "A progressive image assembled one scan at a time; each copy shows the image as it stood when "
    "its scan was mined.";
inline constexpr std::string_view kImageDataUriPrefix = "data:image/jpeg;base64,";

}  // namespace scanmint
