#pragma once

#include "core/error.h"
#include "core/signal.h"

namespace lingua
{

// Observable event streams of a store. Emitted on the completion context only.
struct StoreEvents
{
    Signal<>             changed; // a write committed
    Signal<const Error&> failed;  // an unrecovered failure (or a non-fatal cleanup warning)
    Signal<>             cleaned; // the stored bundle was wiped
};

} // namespace lingua
