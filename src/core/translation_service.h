#pragma once

#include "core/error.h"
#include "core/translation_table.h"

#include <functional>
#include <string>
#include <vector>

namespace lingua
{

struct TranslationRequest
{
    std::vector<std::string> texts; // keys; the source text doubles as the key
    LanguageKey              from;
    std::vector<LanguageKey> to;
    TranslationTable         seed;  // current stored table scoped to to + from
};

struct TranslationResult
{
    bool             ok = false;
    TranslationTable table; // filled table (seed plus new translations) when ok
    Error            error; // opaque cause when !ok; surfaced unchanged
};

// External machine-translation capability.
//
// Translate() must not block for the duration of the translation: it starts
// the work and returns. `done` may be invoked on any thread and is expected
// exactly once; extra invocations are ignored by the caller.
class TranslationService
{
public:
    using Completion = std::function<void(TranslationResult)>;

    virtual ~TranslationService() = default;

    virtual void Translate(TranslationRequest request, Completion done) = 0;
};

} // namespace lingua
