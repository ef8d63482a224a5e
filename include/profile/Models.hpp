#pragma once
#include <string>
#include <vector>

namespace profile {

// Canonical shape of an extracted resume. Empty string == field absent.

struct PersonalInformation {
    std::string full_name;
    std::string headline;
    std::string location;
    std::string linkedin_url;
};

struct Skills {
    std::vector<std::string> top_skills;   // ordered as extracted
    std::vector<std::string> languages;
};

struct ExperienceEntry {
    std::string company;
    std::string title;
    std::string start_date;
    std::string end_date;
    std::string duration;
    std::string location;
    std::vector<std::string> description_bullets;
};

struct EducationEntry {
    std::string institution;
    std::string degree;
    std::string field_of_study;
    std::string start_year;
    std::string end_year;
};

struct ResumeProfile {
    PersonalInformation personal_information;
    Skills skills;
    std::vector<ExperienceEntry> experience;
    std::vector<EducationEntry> education;
};

} // namespace profile
