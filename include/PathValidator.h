#pragma once
#include <string>
#include <memory>
#include <filesystem>

// Forward declaration, re2.h stays in the .cpp
namespace re2 { class RE2; }

struct PathCheck {
    bool ok = true;
    std::string reason;

    static PathCheck accept() { return {}; }
    static PathCheck reject(std::string why) { return { false, std::move(why) }; }
    explicit operator bool() const { return ok; }
};

// Проверка имён записей архива до того, как из них строится путь на диске
// или имя записи в выходном архиве. Вызывается для КАЖДОЙ записи,
// даже если источник выглядит доверенным.
class PathValidator {
public:
    PathValidator();
    ~PathValidator();
    PathValidator(const PathValidator&) = delete;
    PathValidator& operator=(const PathValidator&) = delete;

    // Lexical checks: empty, control bytes, absolute root, drive specifier,
    // UNC prefix, ".." segment.
    PathCheck validate(const std::string& entry_name) const;

    // Lexical checks plus containment: base_dir / entry_name, with existing
    // symlinks resolved, must stay inside base_dir.
    PathCheck validate(const std::string& entry_name, const std::filesystem::path& base_dir) const;

    // Destination archive checks (.cbz extension, reserved device names,
    // writable parent, existing file only with overwrite).
    PathCheck validate_output_file(const std::filesystem::path& path, bool overwrite) const;

    static bool is_within(const std::filesystem::path& base, const std::filesystem::path& candidate);

private:
    std::unique_ptr<re2::RE2> m_drive;
    std::unique_ptr<re2::RE2> m_control;
    std::unique_ptr<re2::RE2> m_reserved;
};
