#pragma once
#include "analyzer.hpp"

#include <istream>

// ============================================================================
// Type Listing Analyzer
// ============================================================================
// Reads type metadata from a listing in the dumper's own annotated format
// instead of decoding global-metadata.dat, one declaration per line:
//
//   // Image 0: GameAssembly
//   // Dll : Assembly-CSharp.dll
//   // Attribute: [assembly: AssemblyVersion("1.0.0.0")]
//   // Namespace: Game.Core
//   public sealed class Player : MonoBehaviour // TypeDefIndex: 1200
//
// The binary is only checked for readability.

namespace CSD {
namespace Model {

class ListingAnalyzer : public Analyzer {
public:
    std::optional<std::vector<Image>> LoadFromFile(const std::string& binary_path,
                                                   const std::string& metadata_path) override;

    /// Parse a listing. `default_image_name` names the image when the listing
    /// has no "// Image" header. Returns no images if the listing has no types.
    static std::vector<Image> ParseListing(std::istream& in, const std::string& default_image_name);
};

} // namespace Model
} // namespace CSD
