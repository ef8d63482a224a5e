#include "profile/Flattener.hpp"
#include "util/TextUtil.hpp"

#include <vector>

namespace profile {

static std::string range_part(const std::string& start_raw, const std::string& end_raw) {
    const std::string start = textutil::trim(start_raw);
    const std::string end = textutil::trim(end_raw);
    if (start.empty() && end.empty()) return "";
    return (start.empty() ? std::string("Unknown") : start) + " - " + (end.empty() ? std::string("Present") : end);
}

static std::string experience_line(const ExperienceEntry& e) {
    std::vector<std::string> parts;

    const std::string company = textutil::trim(e.company);
    if (!company.empty()) parts.push_back(company);

    const std::string title = textutil::trim(e.title);
    if (!title.empty()) parts.push_back(title);

    const std::string dates = range_part(e.start_date, e.end_date);
    if (!dates.empty()) parts.push_back(dates);

    const auto bullets = textutil::non_blank(e.description_bullets);
    if (!bullets.empty()) parts.push_back(textutil::join(bullets, "; "));

    if (parts.empty()) return "";
    return "- " + textutil::join(parts, " | ");
}

static std::string education_line(const EducationEntry& e) {
    std::vector<std::string> parts;

    const std::string institution = textutil::trim(e.institution);
    if (!institution.empty()) parts.push_back(institution);

    const std::string degree = textutil::trim(e.degree);
    const std::string field = textutil::trim(e.field_of_study);
    if (!degree.empty() && !field.empty()) parts.push_back(degree + " in " + field);
    else if (!degree.empty()) parts.push_back(degree);
    else if (!field.empty()) parts.push_back(field);

    const std::string years = range_part(e.start_year, e.end_year);
    if (!years.empty()) parts.push_back(years);

    if (parts.empty()) return "";
    return "- " + textutil::join(parts, " | ");
}

std::string flatten_profile(const ResumeProfile& p) {
    std::vector<std::string> lines;

    const std::string name = textutil::trim(p.personal_information.full_name);
    if (!name.empty()) lines.push_back("Full Name: " + name);

    const std::string headline = textutil::trim(p.personal_information.headline);
    if (!headline.empty()) lines.push_back("Headline: " + headline);

    const auto skills = textutil::non_blank(p.skills.top_skills);
    if (!skills.empty()) lines.push_back("Skills: " + textutil::join(skills, ", "));

    std::vector<std::string> exp_lines;
    for (const auto& e : p.experience) {
        std::string l = experience_line(e);
        if (!l.empty()) exp_lines.push_back(std::move(l));
    }
    if (!exp_lines.empty()) {
        lines.push_back("Experience:");
        lines.insert(lines.end(), exp_lines.begin(), exp_lines.end());
    }

    std::vector<std::string> edu_lines;
    for (const auto& e : p.education) {
        std::string l = education_line(e);
        if (!l.empty()) edu_lines.push_back(std::move(l));
    }
    if (!edu_lines.empty()) {
        lines.push_back("Education:");
        lines.insert(lines.end(), edu_lines.begin(), edu_lines.end());
    }

    return textutil::join(lines, "\n");
}

}  // namespace profile
