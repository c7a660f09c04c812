#pragma once

#include "exchange/session.hpp"
#include <cstdio>

namespace exchange {

/// Built-in sample session: TESLA (partial fills across two offer levels and
/// a sweep of the bids), TOYOTA (one sell taking two bids at the same price)
/// and BYD (an idle book), followed by per-book and cross-book summaries.
void run_demo(Session& session, FILE* out = stdout, bool display_books = true);

} // namespace exchange
