#pragma once

#include "rowan/discovery/test_catalog.hpp"

namespace rowan::samples {

// Name of the sample assembly built by PopulateSampleCatalog().
inline constexpr const char* kSampleAssemblyName = "rowan-samples";

// Registers a small set of types and theories covering every kind of data
// source: fields, properties and methods (inherited from a base class),
// sync, async and deferred sequences, class data, inline data, a source
// that disables discovery enumeration and a skipped theory.
void PopulateSampleCatalog(discovery::TestCatalog& catalog);

}  // namespace rowan::samples
