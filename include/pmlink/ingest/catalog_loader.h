#pragma once

#include "pmlink/core/result.h"
#include "pmlink/domain/raw_record.h"
#include "pmlink/ingest/catalog_profile.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace pmlink::ingest {

/// Result of reading one catalog: raw records in source order.
using CatalogResult = core::Result<std::vector<domain::RawRecord>, std::string>;

/// Extract raw records from a parsed catalog document.
///
/// The document is either a JSON array of market objects or an object holding
/// that array under "markets". Field values are read through the profile:
/// - strings are taken as-is, numbers are rendered in decimal, null is an empty string
/// - a key that is absent (or holds an array, object or boolean) leaves the field unset
/// - array entries that are not objects yield a record with every field unset,
///   which normalization rejects without stopping the run
///
/// Returns an error only when the document shape itself is wrong.
[[nodiscard]] CatalogResult parse_catalog(const nlohmann::json& document,
                                          const CatalogProfile& profile);

/// Read and parse a catalog file from disk.
/// Unreadable files and malformed JSON are reported as errors.
[[nodiscard]] CatalogResult load_catalog_file(const std::string& path,
                                              const CatalogProfile& profile);

}  // namespace pmlink::ingest
