#pragma once
#include <string>
#include <vector>

#include "profile/Models.hpp"

// Parses an extracted profile document into the canonical ResumeProfile.
// Fields that may arrive in more than one shape are normalized here, once.
// Throws core::ValidationError when the text is not JSON or the root is not an object.
profile::ResumeProfile parseResumeProfile(const std::string& json_text, const std::string& where = "profile");

// Reads and parses a profile file. Throws core::NotFoundError if it cannot be opened.
profile::ResumeProfile loadResumeProfile(const std::string& path);

// Canonical serialization (sorted keys, empty strings written as null).
std::string dumpResumeProfile(const profile::ResumeProfile& p);

// Reads a JSON array of numbers (a pre-embedded query vector).
std::vector<float> loadVector(const std::string& path);
