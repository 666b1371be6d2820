#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string_view>
#include <vector>
#include <placemerge/core/place.h>
#include <placemerge/core/types.h>

namespace placemerge::io {

struct ReadReport {
    std::vector<PlaceRecord> records;
    std::size_t lines = 0;         // non-blank lines seen
    std::size_t skipped_lines = 0; // unparseable, not an object, or without an id
};

/**
 * @brief Read provider records from JSON Lines.
 *
 * One object per line. "id" (string or integer) becomes record_id, "confidence" (any scalar)
 * is kept verbatim in raw_confidence, an optional "provider" overrides `provider`, and every
 * other scalar field becomes a raw attribute. Arrays of strings are joined with ", " and an
 * object with a "primary" string contributes that string. Bad lines are skipped with a
 * warning; only a missing file is an error.
 */
Result<ReadReport> readPlaceRecords(const std::filesystem::path& path, Provider provider);

ReadReport readPlaceRecords(std::istream& in, Provider provider,
                            std::string_view sourceName = "<stream>");

} // namespace placemerge::io
