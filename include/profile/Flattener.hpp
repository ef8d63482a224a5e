#pragma once

#include <string>

#include "profile/Models.hpp"

namespace profile {

// Deterministic text projection used as embedding input:
//   Full Name / Headline / Skills lines, then "Experience:" and "Education:"
//   sections with one "- a | b | c" line per entry. Blank parts are skipped,
//   sections with no lines are omitted. Never throws; may return "".
std::string flatten_profile(const ResumeProfile& p);

}  // namespace profile
