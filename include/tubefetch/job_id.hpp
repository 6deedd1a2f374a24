#pragma once

#include <tubefetch/tubefetch_export.h>

#include <string_view>
#include <tubefetch/types.hpp>

namespace tubefetch {

/// Generates a random (version 4) UUID in canonical lowercase form.
/// Uniqueness is probabilistic; ids are not checked against a registry.
TUBEFETCH_EXPORT JobId allocate_job_id();

/// True if `id` has the canonical 8-4-4-4-12 hex layout.
TUBEFETCH_EXPORT bool is_well_formed_job_id(std::string_view id);

}  // namespace tubefetch
