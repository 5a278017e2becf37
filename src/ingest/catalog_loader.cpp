#include "pmlink/ingest/catalog_loader.h"

#include <fstream>
#include <optional>

namespace pmlink::ingest {

namespace {

/// Render a scalar JSON value as text; nullopt when the value is not a scalar.
std::optional<std::string> scalar_text(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer() || value.is_number_unsigned()) {
    return value.dump();
  }
  if (value.is_number_float()) {
    return value.dump();
  }
  if (value.is_null()) {
    return std::string{};
  }
  return std::nullopt;
}

/// First present key from the list, rendered as text.
std::optional<std::string> first_field(const nlohmann::json& object,
                                       const std::vector<std::string>& keys) {
  for (const auto& key : keys) {
    const auto it = object.find(key);
    if (it == object.end()) {
      continue;
    }
    auto text = scalar_text(*it);
    if (text.has_value()) {
      return text;
    }
  }
  return std::nullopt;
}

domain::RawRecord to_raw_record(const nlohmann::json& entry, const CatalogProfile& profile) {
  domain::RawRecord raw;
  if (!entry.is_object()) {
    return raw;
  }

  raw.source_id = first_field(entry, profile.id_fields);
  raw.title = first_field(entry, profile.title_fields);
  raw.description = first_field(entry, profile.description_fields);

  // Empty end dates degrade to "unknown" the same way an absent key does.
  auto end_date = first_field(entry, profile.end_date_fields);
  if (end_date.has_value() && !end_date->empty()) {
    raw.end_date = std::move(end_date);
  }
  return raw;
}

}  // namespace

CatalogResult parse_catalog(const nlohmann::json& document, const CatalogProfile& profile) {
  const nlohmann::json* entries = &document;
  if (document.is_object()) {
    const auto it = document.find("markets");
    if (it == document.end()) {
      return CatalogResult::err("Catalog object has no \"markets\" array");
    }
    entries = &(*it);
  }

  if (!entries->is_array()) {
    return CatalogResult::err("Catalog must be a JSON array of market objects");
  }

  std::vector<domain::RawRecord> records;
  records.reserve(entries->size());
  for (const auto& entry : *entries) {
    records.push_back(to_raw_record(entry, profile));
  }

  return CatalogResult::ok(std::move(records));
}

CatalogResult load_catalog_file(const std::string& path, const CatalogProfile& profile) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return CatalogResult::err("Failed to open catalog: " + path);
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error& e) {
    return CatalogResult::err("Invalid JSON in " + path + ": " + e.what());
  }

  return parse_catalog(document, profile);
}

}  // namespace pmlink::ingest
