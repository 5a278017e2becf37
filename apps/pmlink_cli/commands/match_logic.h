#pragma once

#include "pmlink/app/app_service.h"
#include "pmlink/core/clock.h"
#include "pmlink/core/id_generator.h"
#include "pmlink/core/services.h"

#include <cstddef>
#include <string>

// execute_match: run the pipeline, write the MatchSet to output_path and print the
// summary. Takes only interface types; no concrete storage headers may be included
// in this TU. Returns the process exit code.
int execute_match(const pmlink::app::MatchPipelineRequest& request, const std::string& output_path,
                  std::size_t top_n, pmlink::core::Services& services,
                  pmlink::core::IIdGenerator& id_gen, pmlink::core::IClock& clock);
