#pragma once

#include "data_types.hpp"

namespace data
{

    /**
     * Referential-integrity checks over a parsed document. All violations are
     * collected; nothing is mutated. A result with isValid == false must not
     * be handed to the mapping stage.
     */
    ValidationResult validateDocument(const Document& doc);

} // namespace data
