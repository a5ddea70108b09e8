#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace greekeval::processing
{

enum class Orthography
{
    Monotonic, // Modern Greek, single tonos (since 1982); also the default
    Polytonic, // Traditional spelling with breathings, varia, perispomeni
    Mixed      // Both systems in the same text
};

// Classifies raw, un-normalized text. Normalizing first would fold the
// polytonic signal away.
[[nodiscard]] Orthography DetectOrthography(std::string_view text);

[[nodiscard]] std::string toString(Orthography orthography);

// Inverse of toString; nullopt for any other name
[[nodiscard]] std::optional<Orthography> orthographyFromString(std::string_view name);

} // namespace greekeval::processing
