#pragma once
#include <string>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include "MergeEngine.h"

class ReportWriter {
public:
    static nlohmann::json to_json(const MergeResult& result) {
        nlohmann::json j;
        j["success"] = result.success;
        j["output"] = result.output_path.string();
        j["total_pages"] = result.total_pages;
        j["comic_info_copied"] = result.comic_info_copied;
        j["resequenced"] = result.resequenced;
        if (result.error_kind) {
            j["error_kind"] = error_kind_name(*result.error_kind);
            j["error"] = result.error;
        }

        nlohmann::json chapters = nlohmann::json::array();
        for (const auto& c : result.chapters) {
            chapters.push_back({
                { "source", c.source.string() },
                { "kind", source_kind_name(c.kind) },
                { "chapter", c.chapter },
                { "pages", c.pages },
            });
        }
        j["chapters"] = chapters;

        nlohmann::json issues = nlohmann::json::array();
        for (const auto& i : result.issues) {
            issues.push_back({
                { "kind", error_kind_name(i.kind) },
                { "subject", i.subject },
                { "reason", i.reason },
            });
        }
        j["issues"] = issues;
        return j;
    }

    static bool write_json(const std::string& path, const MergeResult& result) {
        std::ofstream f(path, std::ios::out | std::ios::trunc);
        if (!f.is_open()) return false;
        f << to_json(result).dump(2) << "\n";
        return static_cast<bool>(f);
    }

    static bool write_txt(const std::string& path, const MergeResult& result) {
        std::ofstream f(path, std::ios::out | std::ios::trunc);
        if (!f.is_open()) return false;

        f << "--- РЕЗУЛЬТАТ СЛИЯНИЯ ---\n";
        f << "Файл:    " << result.output_path.string() << "\n";
        f << "Статус:  " << (result.success ? "OK" : "FAILED") << "\n";
        if (result.error_kind)
            f << "Ошибка:  [" << error_kind_name(*result.error_kind) << "] " << result.error << "\n";
        f << "--------------------------\n";
        f << std::left << std::setw(8) << "Глава" << " | " << std::setw(6) << "Стр." << " | " << "Источник\n";
        f << "--------------------------\n";
        for (const auto& c : result.chapters) {
            f << std::left << std::setw(8) << c.chapter << " | " << std::setw(6) << c.pages
              << " | " << c.source.filename().string() << "\n";
        }
        f << "--------------------------\n";
        f << "Всего страниц: " << result.total_pages << "\n";
        f << "ComicInfo.xml: " << (result.comic_info_copied ? "скопирован" : "нет") << "\n";
        if (!result.issues.empty()) {
            f << "Пропущено (" << result.issues.size() << "):\n";
            for (const auto& i : result.issues)
                f << "  [" << error_kind_name(i.kind) << "] " << i.subject << ": " << i.reason << "\n";
        }
        return static_cast<bool>(f);
    }
};
