#include "profiles.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>

#include "cli_parse.h"

namespace atlasfix::core {

namespace fs = std::filesystem;

namespace {

constexpr int k_max_alpha_threshold = 254;

ProfileDefinition make_profile(const std::string& name, AlignmentMode mode) {
    ProfileDefinition def;
    def.name = name;
    def.mode = mode;
    return def;
}

bool file_exists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && !ec;
}

} // namespace

EngineOptions resolve_profile_options(const ProfileDefinition& profile) {
    EngineOptions options = options_for_mode(profile.mode);
    if (profile.filter) {
        options.filter = *profile.filter;
    }
    if (profile.placement) {
        options.placement = *profile.placement;
    }
    if (profile.separate_bridges) {
        options.separate_bridges = *profile.separate_bridges;
    }
    if (profile.alpha_threshold) {
        options.alpha_threshold = static_cast<unsigned char>(*profile.alpha_threshold);
    }
    if (profile.min_part_pixels) {
        options.min_part_pixels = static_cast<size_t>(*profile.min_part_pixels);
    }
    return options;
}

bool parse_filter_from_string(const std::string& value, OwnershipFilter& out, std::string& error) {
    const std::string lower = to_lower_copy(value);
    if (lower == "icon") {
        out = OwnershipFilter::Icon;
        return true;
    }
    if (lower == "generic") {
        out = OwnershipFilter::Generic;
        return true;
    }
    if (lower == "silhouette") {
        out = OwnershipFilter::Silhouette;
        return true;
    }
    error = "invalid filter '" + value + "'";
    return false;
}

bool parse_placement_from_string(const std::string& value, Placement& out, std::string& error) {
    const std::string lower = to_lower_copy(value);
    if (lower == "center") {
        out = Placement::Center;
        return true;
    }
    if (lower == "bottom") {
        out = Placement::Bottom;
        return true;
    }
    error = "invalid placement '" + value + "'";
    return false;
}

namespace {

std::string strip_comment(const std::string& line) {
    const size_t comment = line.find('#');
    return trim_copy(comment == std::string::npos ? line : line.substr(0, comment));
}

// Reads "[profile NAME]" into name. Messages leave the line number to the caller.
bool parse_section_header(const std::string& header, std::string& name, std::string& error) {
    std::istringstream iss(header);
    std::string section_type;
    if (!(iss >> section_type)) {
        error = "empty section header";
        return false;
    }
    section_type = to_lower_copy(section_type);
    if (section_type != "profile") {
        error = "unsupported section '" + section_type + "'";
        return false;
    }
    if (!(iss >> name)) {
        error = "missing profile name";
        return false;
    }
    std::string extra;
    if (iss >> extra) {
        error = "unexpected token '" + extra + "' in profile header";
        return false;
    }
    return true;
}

bool split_entry(const std::string& entry, std::string& key, std::string& value, std::string& error) {
    const size_t equals = entry.find('=');
    if (equals == std::string::npos) {
        error = "invalid line '" + entry + "'";
        return false;
    }
    key = trim_copy(entry.substr(0, equals));
    value = trim_copy(entry.substr(equals + 1));
    if (key.empty()) {
        error = "empty key";
        return false;
    }
    if (value.empty()) {
        error = "empty value for key '" + key + "'";
        return false;
    }
    return true;
}

bool apply_profile_key(ProfileDefinition& profile,
                       const std::string& key,
                       const std::string& value,
                       std::string& error) {
    const std::string lower_key = to_lower_copy(key);
    if (lower_key == "mode") {
        AlignmentMode mode = AlignmentMode::Icon;
        if (!parse_alignment_mode(value, mode, error)) {
            return false;
        }
        profile.mode = mode;
        return true;
    }
    if (lower_key == "filter") {
        OwnershipFilter filter = OwnershipFilter::Icon;
        if (!parse_filter_from_string(value, filter, error)) {
            return false;
        }
        profile.filter = filter;
        return true;
    }
    if (lower_key == "placement") {
        Placement placement = Placement::Center;
        if (!parse_placement_from_string(value, placement, error)) {
            return false;
        }
        profile.placement = placement;
        return true;
    }

    bool flag = false;
    int number = 0;
    if (lower_key == "separate_bridges" && parse_bool_value(value, flag)) {
        profile.separate_bridges = flag;
        return true;
    }
    if (lower_key == "alpha_threshold" && parse_non_negative_int(value, number)
        && number <= k_max_alpha_threshold) {
        profile.alpha_threshold = number;
        return true;
    }
    if (lower_key == "min_part_pixels" && parse_positive_int(value, number)) {
        profile.min_part_pixels = number;
        return true;
    }

    if (lower_key == "separate_bridges" || lower_key == "alpha_threshold" || lower_key == "min_part_pixels") {
        error = "invalid " + lower_key + " '" + value + "'";
    } else {
        error = "unknown key '" + key + "'";
    }
    return false;
}

} // namespace

bool parse_profiles_config(std::istream& input, std::vector<ProfileDefinition>& out, std::string& error) {
    out.clear();
    std::unordered_set<std::string> seen_names;
    std::optional<ProfileDefinition> current;
    std::string line;
    size_t line_number = 0;

    const auto fail = [&error, &line_number]() {
        error += " at line " + std::to_string(line_number);
        return false;
    };

    while (std::getline(input, line)) {
        ++line_number;
        const std::string entry = strip_comment(line);
        if (entry.empty() || entry.front() == ';') {
            continue;
        }

        if (entry.front() == '[' && entry.back() == ']') {
            if (current) {
                out.push_back(*current);
                current.reset();
            }
            std::string name;
            if (!parse_section_header(entry.substr(1, entry.size() - 2), name, error)) {
                return fail();
            }
            if (!seen_names.insert(name).second) {
                error = "duplicate profile '" + name + "'";
                return fail();
            }
            current = make_profile(name, AlignmentMode::Icon);
            continue;
        }

        if (!current) {
            error = "entry outside of profile section";
            return fail();
        }
        std::string key;
        std::string value;
        if (!split_entry(entry, key, value, error) || !apply_profile_key(*current, key, value, error)) {
            return fail();
        }
    }

    if (current) {
        out.push_back(*current);
    }
    if (out.empty()) {
        error = "no profiles defined";
        return false;
    }
    return true;
}

bool load_profiles_config_from_file(const fs::path& path,
                                    std::vector<ProfileDefinition>& out,
                                    std::string& error) {
    std::ifstream input(path);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    if (!parse_profiles_config(input, out, error)) {
        error = path.string() + ": " + error;
        return false;
    }
    return true;
}

std::vector<ProfileDefinition> builtin_profiles() {
    std::vector<ProfileDefinition> profiles;
    profiles.push_back(make_profile("icons", AlignmentMode::Icon));
    profiles.push_back(make_profile("faces", AlignmentMode::Silhouette));

    // Background tolerant variant: keeps parts that spill over up to five
    // cells and centers them.
    ProfileDefinition generic = make_profile("generic", AlignmentMode::Icon);
    generic.filter = OwnershipFilter::Generic;
    profiles.push_back(generic);
    return profiles;
}

void merge_profiles(std::vector<ProfileDefinition>& base, const std::vector<ProfileDefinition>& overrides) {
    for (const ProfileDefinition& profile : overrides) {
        bool replaced = false;
        for (ProfileDefinition& existing : base) {
            if (existing.name == profile.name) {
                existing = profile;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            base.push_back(profile);
        }
    }
}

const ProfileDefinition* find_profile(const std::vector<ProfileDefinition>& profiles, const std::string& name) {
    for (const ProfileDefinition& profile : profiles) {
        if (profile.name == name) {
            return &profile;
        }
    }
    return nullptr;
}

std::optional<fs::path> resolve_user_profiles_config_path() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return std::nullopt;
    }
    return fs::path(home) / k_user_profiles_config_relpath;
}

std::optional<fs::path> find_default_profiles_config() {
    const fs::path local = fs::path(k_profiles_config_filename);
    if (file_exists(local)) {
        return local;
    }
    if (const auto user = resolve_user_profiles_config_path(); user && file_exists(*user)) {
        return user;
    }
    const fs::path global = fs::path(k_global_profiles_config_path);
    if (file_exists(global)) {
        return global;
    }
    return std::nullopt;
}

} // namespace atlasfix::core
