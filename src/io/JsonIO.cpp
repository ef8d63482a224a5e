#include "io/JsonIO.hpp"
#include "core/Errors.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace profile;

namespace {

// skills: {"top_skills": [...], "languages": [...]} or a bare list of skills
using SkillsField = std::variant<std::monostate, std::vector<std::string>, Skills>;

// description_bullets: list of bullets or one bullet as a plain string
using BulletsField = std::variant<std::monostate, std::string, std::vector<std::string>>;

}

// string or integral number -> text; anything else counts as absent
static std::string scalar_text(const json& j, const char* key) {
    if (!j.contains(key)) return "";
    const json& v = j.at(key);
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    if (v.is_number_float()) {
        double d = v.get<double>();
        // outside this range the cast below is undefined
        if (!std::isfinite(d) || std::fabs(d) >= 9.2e18) return "";
        long long n = static_cast<long long>(d);
        if (static_cast<double>(n) == d) return std::to_string(n);
    }
    return "";
}

static std::vector<std::string> string_items(const json& arr) {
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (const auto& it : arr) {
        if (it.is_string()) out.push_back(it.get<std::string>());
    }
    return out;
}

static std::vector<std::string> string_list(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_array()) return {};
    return string_items(j.at(key));
}

static SkillsField read_skills(const json& root) {
    if (!root.contains("skills")) return std::monostate{};
    const json& s = root.at("skills");
    if (s.is_array()) return string_items(s);
    if (s.is_object()) {
        Skills sk;
        sk.top_skills = string_list(s, "top_skills");
        sk.languages  = string_list(s, "languages");
        return sk;
    }
    return std::monostate{};
}

static Skills normalize(const SkillsField& f) {
    if (const auto* list = std::get_if<std::vector<std::string>>(&f)) {
        Skills sk;
        sk.top_skills = *list;
        return sk;
    }
    if (const auto* sk = std::get_if<Skills>(&f)) return *sk;
    return Skills{};
}

static BulletsField read_bullets(const json& entry) {
    if (!entry.contains("description_bullets")) return std::monostate{};
    const json& b = entry.at("description_bullets");
    if (b.is_string()) return b.get<std::string>();
    if (b.is_array()) return string_items(b);
    return std::monostate{};
}

static std::vector<std::string> normalize(const BulletsField& f) {
    if (const auto* one = std::get_if<std::string>(&f)) return {*one};
    if (const auto* list = std::get_if<std::vector<std::string>>(&f)) return *list;
    return {};
}

static ExperienceEntry parseExperience(const json& j) {
    ExperienceEntry e;
    e.company    = scalar_text(j, "company");
    e.title      = scalar_text(j, "title");
    e.start_date = scalar_text(j, "start_date");
    e.end_date   = scalar_text(j, "end_date");
    e.duration   = scalar_text(j, "duration");
    e.location   = scalar_text(j, "location");
    e.description_bullets = normalize(read_bullets(j));
    return e;
}

static EducationEntry parseEducation(const json& j) {
    EducationEntry e;
    e.institution    = scalar_text(j, "institution");
    e.degree         = scalar_text(j, "degree");
    e.field_of_study = scalar_text(j, "field_of_study");
    e.start_year     = scalar_text(j, "start_year");
    e.end_year       = scalar_text(j, "end_year");
    return e;
}

ResumeProfile parseResumeProfile(const std::string& json_text, const std::string& where) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw core::ValidationError(where + " is not valid JSON: " + e.what());
    }

    if (!j.is_object()) {
        throw core::ValidationError(where + " must decode to an object");
    }

    ResumeProfile p;

    if (j.contains("personal_information") && j.at("personal_information").is_object()) {
        const json& pi = j.at("personal_information");
        p.personal_information.full_name    = scalar_text(pi, "full_name");
        p.personal_information.headline     = scalar_text(pi, "headline");
        p.personal_information.location     = scalar_text(pi, "location");
        p.personal_information.linkedin_url = scalar_text(pi, "linkedin_url");
    }

    p.skills = normalize(read_skills(j));

    if (j.contains("experience") && j.at("experience").is_array()) {
        for (const auto& e : j.at("experience")) {
            if (!e.is_object()) continue;
            p.experience.push_back(parseExperience(e));
        }
    }

    if (j.contains("education") && j.at("education").is_array()) {
        for (const auto& e : j.at("education")) {
            if (!e.is_object()) continue;
            p.education.push_back(parseEducation(e));
        }
    }

    return p;
}

ResumeProfile loadResumeProfile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw core::NotFoundError("failed to open profile file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parseResumeProfile(ss.str(), path);
}

static json text_or_null(const std::string& s) {
    if (s.empty()) return nullptr;
    return s;
}

std::string dumpResumeProfile(const ResumeProfile& p) {
    json j;

    j["personal_information"] = {
        {"full_name", text_or_null(p.personal_information.full_name)},
        {"headline", text_or_null(p.personal_information.headline)},
        {"location", text_or_null(p.personal_information.location)},
        {"linkedin_url", text_or_null(p.personal_information.linkedin_url)},
    };

    j["skills"] = {
        {"top_skills", p.skills.top_skills},
        {"languages", p.skills.languages},
    };

    json exps = json::array();
    for (const auto& e : p.experience) {
        exps.push_back({
            {"company", text_or_null(e.company)},
            {"title", text_or_null(e.title)},
            {"start_date", text_or_null(e.start_date)},
            {"end_date", text_or_null(e.end_date)},
            {"duration", text_or_null(e.duration)},
            {"location", text_or_null(e.location)},
            {"description_bullets", e.description_bullets},
        });
    }
    j["experience"] = std::move(exps);

    json edus = json::array();
    for (const auto& e : p.education) {
        edus.push_back({
            {"institution", text_or_null(e.institution)},
            {"degree", text_or_null(e.degree)},
            {"field_of_study", text_or_null(e.field_of_study)},
            {"start_year", text_or_null(e.start_year)},
            {"end_year", text_or_null(e.end_year)},
        });
    }
    j["education"] = std::move(edus);

    return j.dump();
}

std::vector<float> loadVector(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw core::NotFoundError("failed to open vector file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw core::ValidationError("vector file " + path + " is not valid JSON: " + e.what());
    }

    if (!j.is_array()) {
        throw core::ValidationError("vector file " + path + " must contain a JSON array");
    }

    std::vector<float> v;
    v.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        if (!j.at(i).is_number()) {
            std::ostringstream oss;
            oss << "vector file " << path << "[" << i << "] must be a number";
            throw core::ValidationError(oss.str());
        }
        v.push_back(j.at(i).get<float>());
    }
    return v;
}
