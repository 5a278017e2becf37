#include "pmlink/domain/record.h"

#include "pmlink/core/normalization.h"

namespace pmlink::domain {

core::Result<bool, std::string> Record::validate() const {
  if (source_id.value.empty()) {
    return core::Result<bool, std::string>::err("source_id must not be empty");
  }

  if (core::trim(title).empty()) {
    return core::Result<bool, std::string>::err("title must not be empty");
  }

  if (raw_text.empty()) {
    return core::Result<bool, std::string>::err("raw_text must not be empty");
  }

  return core::Result<bool, std::string>::ok(true);
}

}  // namespace pmlink::domain
