//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.h
// Purpose: Validation of tool arguments against the JSON Schema subset tools declare
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "mcpgate/JSONRPCTypes.h"

namespace mcpgate {
namespace validation {

//==========================================================================================================
// ValidationError
// Fields:
//   path: Dotted path to the offending value ("" for the root, "items.2.name" for nested values).
//   message: Human-readable description.
//==========================================================================================================
struct ValidationError {
    std::string path;
    std::string message;
};

struct ValidationResult {
    bool valid{true};
    std::vector<ValidationError> errors;

    // { errors: [ { path, message } ] }, the invalid-params detail payload
    JSONValue ToJSON() const;
};

//==========================================================================================================
// ValidateInput
// Purpose: Checks input against schema. Supported keywords: type (object, string, number, integer,
//          boolean, array, null), properties, required, enum, items. Unknown keywords are ignored and
//          an empty or non-object schema accepts everything.
//==========================================================================================================
ValidationResult ValidateInput(const JSONValue& input, const JSONValue& schema);

// Structural equality of two JSON values (integers and doubles compare numerically).
bool JsonEquals(const JSONValue& a, const JSONValue& b);

} // namespace validation
} // namespace mcpgate
