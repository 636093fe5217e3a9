#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <iostream>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "ImageFormats.h"
#include "MergeEngine.h"

// Значения по умолчанию из comicmerge.json. Флаги командной строки
// перекрывают их.
struct MergeDefaults {
    MergeOptions options;
    std::string output_dir;        // where a bare output file name is placed
    std::string log_dir = "logs";
};

class ConfigLoader {
public:
    // Missing file, malformed JSON or a key of the wrong type: the affected
    // values keep their defaults and a warning goes to stderr.
    static MergeDefaults load(const std::string& filepath) {
        MergeDefaults cfg;
        std::ifstream f(filepath);

        if (!f.is_open()) {
            std::cerr << "[ConfigLoader] Warning: Could not open " << filepath << ", using defaults\n";
            return cfg;
        }

        try {
            nlohmann::json j;
            f >> j;
            apply(j, cfg);
        }
        catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] JSON Error: " << e.what() << "\n";
            return MergeDefaults{};
        }
        return cfg;
    }

    static MergeDefaults parse(const std::string& text) {
        MergeDefaults cfg;
        try {
            apply(nlohmann::json::parse(text), cfg);
        }
        catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] JSON Error: " << e.what() << "\n";
            return MergeDefaults{};
        }
        return cfg;
    }

private:
    // larger values overflow the byte count
    static constexpr uint64_t MAX_ENTRY_SIZE_MB = UINT64_MAX >> 20;

    static void apply(const nlohmann::json& j, MergeDefaults& cfg) {
        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] Error: Root must be an object {}\n";
            return;
        }

        if (j.contains("selected_formats")) {
            const auto& item = j["selected_formats"];
            if (!item.is_array()) {
                warn_type("selected_formats", "array of strings");
            } else {
                FormatSet formats;
                for (size_t idx = 0; idx < item.size(); ++idx) {
                    if (!item[idx].is_string()) {
                        std::cerr << "[ConfigLoader] Warning: selected_formats #" << idx << " is not a string, skipped\n";
                        continue;
                    }
                    std::vector<std::string> rejected;
                    FormatSet one = parse_format_list(item[idx].get<std::string>(), &rejected);
                    for (const auto& r : rejected)
                        std::cerr << "[ConfigLoader] Warning: unknown format '" << r << "' dropped\n";
                    formats.insert(one.begin(), one.end());
                }
                // пустой список допустим: движок ответит NoFormatsSelected
                cfg.options.selected_formats = formats;
            }
        }

        read_bool(j, "strict_mode", cfg.options.strict_mode);
        read_bool(j, "copy_comic_info", cfg.options.copy_comic_info);
        read_bool(j, "overwrite", cfg.options.overwrite);
        read_string(j, "output_dir", cfg.output_dir);
        read_string(j, "log_dir", cfg.log_dir);

        if (j.contains("progress_batch")) {
            const auto& item = j["progress_batch"];
            if (!item.is_number_unsigned() || item.get<uint64_t>() == 0)
                warn_type("progress_batch", "positive integer");
            else
                cfg.options.progress_batch = item.get<size_t>();
        }

        if (j.contains("max_entry_size_mb")) {
            const auto& item = j["max_entry_size_mb"];
            if (!item.is_number_unsigned() || item.get<uint64_t>() == 0)
                warn_type("max_entry_size_mb", "positive integer");
            else if (item.get<uint64_t>() > MAX_ENTRY_SIZE_MB)
                warn_type("max_entry_size_mb", "integer up to " + std::to_string(MAX_ENTRY_SIZE_MB));
            else
                cfg.options.max_entry_size = item.get<uint64_t>() * 1024 * 1024;
        }
    }

    static void read_bool(const nlohmann::json& j, const char* key, bool& out) {
        if (!j.contains(key)) return;
        if (!j[key].is_boolean()) { warn_type(key, "boolean"); return; }
        out = j[key].get<bool>();
    }

    static void read_string(const nlohmann::json& j, const char* key, std::string& out) {
        if (!j.contains(key)) return;
        if (!j[key].is_string()) { warn_type(key, "string"); return; }
        out = j[key].get<std::string>();
    }

    static void warn_type(const char* key, const std::string& expected) {
        std::cerr << "[ConfigLoader] Warning: '" << key << "' must be a " << expected << ", default kept\n";
    }
};
