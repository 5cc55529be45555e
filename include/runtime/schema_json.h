#pragma once

#include "runtime/schema.h"
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace keel {
namespace runtime {

/**
 * @brief Read a constraint declaration
 *
 * Keys: owner, address (base58), signer, writable (bool), has_one (array of
 * account names), seeds (array of {"literal": text} | {"hex": bytes} |
 * {"account": name} | {"field": name}) with bump ({"literal": n} |
 * {"arg": name} | {"field": name}), init ({"payer": name, "space": n}),
 * close (account name). Unknown keys are rejected.
 */
Result<ConstraintSet> constraints_from_json(const nlohmann::json &json);

/**
 * @brief Read an account descriptor
 *
 * {"name", "role": signer|mut|readonly|account|program|unchecked,
 *  "size", "layout": name, "program": base58, ...constraint keys}. Layout
 * names resolve against `layouts`.
 */
Result<AccountDescriptor> descriptor_from_json(const nlohmann::json &json,
                                               const std::map<std::string, DataLayout> &layouts);

} // namespace runtime
} // namespace keel
