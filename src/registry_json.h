#pragma once

#include "package.h"
#include "store.h"

#include <string>
#include <string_view>

namespace knapsac {

// Pretty-printed registry document.
std::string registry_to_json(registry_snapshot const &snapshot);

// Throws registry_error(invalid_registry) on malformed JSON, missing fields, unknown
// dependency kinds, unparseable versions or map keys that disagree with identifiers.
registry_snapshot registry_from_json(std::string_view text);

std::string manifest_to_json(package_manifest const &manifest);
package_manifest manifest_from_json(std::string_view text);

}  // namespace knapsac
