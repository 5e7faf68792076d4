#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "atlas_engine.h"

#ifndef ATLASFIX_GLOBAL_PROFILE_CONFIG
#define ATLASFIX_GLOBAL_PROFILE_CONFIG "/usr/local/share/atlasfix/atlasprofiles.cfg"
#endif

namespace atlasfix::core {

constexpr const char* k_profiles_config_filename = "atlasprofiles.cfg";
constexpr const char* k_user_profiles_config_relpath = ".config/atlasfix/atlasprofiles.cfg";
constexpr const char* k_global_profiles_config_path = ATLASFIX_GLOBAL_PROFILE_CONFIG;

// One [profile NAME] section. Unset keys fall back to the defaults of the
// profile's mode.
struct ProfileDefinition {
    std::string name;
    AlignmentMode mode = AlignmentMode::Icon;
    std::optional<OwnershipFilter> filter;
    std::optional<Placement> placement;
    std::optional<bool> separate_bridges;
    std::optional<int> alpha_threshold;
    std::optional<int> min_part_pixels;
};

EngineOptions resolve_profile_options(const ProfileDefinition& profile);

bool parse_filter_from_string(const std::string& value, OwnershipFilter& out, std::string& error);
bool parse_placement_from_string(const std::string& value, Placement& out, std::string& error);

bool parse_profiles_config(std::istream& input, std::vector<ProfileDefinition>& out, std::string& error);
bool load_profiles_config_from_file(const std::filesystem::path& path,
                                    std::vector<ProfileDefinition>& out,
                                    std::string& error);

// icons, faces and generic.
std::vector<ProfileDefinition> builtin_profiles();

// Replaces profiles of the same name and appends new ones.
void merge_profiles(std::vector<ProfileDefinition>& base, const std::vector<ProfileDefinition>& overrides);

const ProfileDefinition* find_profile(const std::vector<ProfileDefinition>& profiles, const std::string& name);

std::optional<std::filesystem::path> resolve_user_profiles_config_path();

// First existing config among the working directory, the user config and the
// global config; nullopt when none exists.
std::optional<std::filesystem::path> find_default_profiles_config();

} // namespace atlasfix::core
