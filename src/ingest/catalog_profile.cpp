#include "pmlink/ingest/catalog_profile.h"

namespace pmlink::ingest {

CatalogProfile kalshi_profile() {
  return CatalogProfile{
      .name = "kalshi",
      .id_fields = {"conditionId", "ticker"},
      .title_fields = {"title"},
      .description_fields = {"description"},
      .end_date_fields = {"endDate", "close_time"},
  };
}

CatalogProfile polymarket_profile() {
  return CatalogProfile{
      .name = "polymarket",
      .id_fields = {"id", "conditionId"},
      .title_fields = {"question", "title"},
      .description_fields = {"description"},
      .end_date_fields = {"endDate"},
  };
}

CatalogProfile generic_profile() {
  return CatalogProfile{
      .name = "generic",
      .id_fields = {"id"},
      .title_fields = {"title"},
      .description_fields = {"description"},
      .end_date_fields = {"end_time", "endDate"},
  };
}

std::optional<CatalogProfile> profile_by_name(const std::string_view name) {
  if (name == "kalshi") {
    return kalshi_profile();
  }
  if (name == "polymarket") {
    return polymarket_profile();
  }
  if (name == "generic") {
    return generic_profile();
  }
  return std::nullopt;
}

}  // namespace pmlink::ingest
