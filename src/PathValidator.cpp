#include "PathValidator.h"
#include <re2/re2.h>
#include <algorithm>
#include <sstream>
#include <system_error>
#include <boost/algorithm/string/case_conv.hpp>

namespace fs = std::filesystem;

namespace {
    constexpr size_t MAX_FILENAME_BYTES = 255;

    re2::RE2::Options latin1_options() {
        re2::RE2::Options opt;
        opt.set_encoding(re2::RE2::Options::EncodingLatin1);
        opt.set_log_errors(false);
        return opt;
    }

    bool has_parent_segment(const std::string& name) {
        std::string normalized = name;
        std::replace(normalized.begin(), normalized.end(), '\\', '/');
        std::istringstream iss(normalized);
        std::string segment;
        while (std::getline(iss, segment, '/')) {
            if (segment == "..") return true;
        }
        return false;
    }
}

PathValidator::PathValidator()
    : m_drive(std::make_unique<re2::RE2>("^[A-Za-z]:", latin1_options())),
      m_control(std::make_unique<re2::RE2>("[\\x00-\\x1f\\x7f]", latin1_options())),
      m_reserved(std::make_unique<re2::RE2>("(?i)(con|prn|aux|nul|com[1-9]|lpt[1-9])", latin1_options())) {}

PathValidator::~PathValidator() = default;

PathCheck PathValidator::validate(const std::string& entry_name) const {
    if (entry_name.empty())
        return PathCheck::reject("empty entry name");

    re2::StringPiece input(entry_name.data(), entry_name.size());
    if (re2::RE2::PartialMatch(input, *m_control))
        return PathCheck::reject("control character in entry name");

    if (entry_name.rfind("\\\\", 0) == 0 || entry_name.rfind("//", 0) == 0)
        return PathCheck::reject("UNC path prefix");

    if (entry_name.front() == '/' || entry_name.front() == '\\')
        return PathCheck::reject("absolute path");

    if (re2::RE2::PartialMatch(input, *m_drive))
        return PathCheck::reject("drive specifier");

    if (has_parent_segment(entry_name))
        return PathCheck::reject("parent directory segment '..'");

    return PathCheck::accept();
}

PathCheck PathValidator::validate(const std::string& entry_name, const fs::path& base_dir) const {
    PathCheck lexical = validate(entry_name);
    if (!lexical) return lexical;

    std::string normalized = entry_name;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    std::error_code ec;
    fs::path base = fs::weakly_canonical(base_dir, ec);
    if (ec) return PathCheck::reject("cannot resolve directory " + base_dir.string() + ": " + ec.message());

    fs::path target = fs::weakly_canonical(base / fs::path(normalized), ec);
    if (ec) return PathCheck::reject("cannot resolve " + entry_name + ": " + ec.message());

    if (!is_within(base, target))
        return PathCheck::reject("resolves outside " + base_dir.string());

    return PathCheck::accept();
}

PathCheck PathValidator::validate_output_file(const fs::path& path, bool overwrite) const {
    if (path.empty()) return PathCheck::reject("output path is empty");

    std::string filename = path.filename().string();
    if (filename.empty()) return PathCheck::reject("output path has no file name");
    if (filename.size() > MAX_FILENAME_BYTES)
        return PathCheck::reject("file name longer than 255 bytes");
    if (filename.front() == '.' || filename.front() == ' ' ||
        filename.back() == '.' || filename.back() == ' ')
        return PathCheck::reject("file name cannot start or end with a dot or space");

    re2::StringPiece name_piece(filename.data(), filename.size());
    if (re2::RE2::PartialMatch(name_piece, *m_control))
        return PathCheck::reject("control character in file name");

    std::string stem = path.stem().string();
    if (re2::RE2::FullMatch(stem, *m_reserved))
        return PathCheck::reject("reserved device name: " + boost::algorithm::to_upper_copy(stem));

    if (boost::algorithm::to_lower_copy(path.extension().string()) != ".cbz")
        return PathCheck::reject("output file must use the .cbz extension");

    std::error_code ec;
    fs::path parent = path.parent_path().empty() ? fs::path(".") : path.parent_path();
    if (!fs::is_directory(parent, ec))
        return PathCheck::reject("directory does not exist: " + parent.string());

    if (fs::exists(path, ec)) {
        if (!overwrite) return PathCheck::reject("file already exists: " + filename);
        if (!fs::is_regular_file(path, ec)) return PathCheck::reject("target exists and is not a regular file");
    }
    return PathCheck::accept();
}

bool PathValidator::is_within(const fs::path& base, const fs::path& candidate) {
    fs::path rel = candidate.lexically_normal().lexically_relative(base.lexically_normal());
    if (rel.empty() || rel == ".") return false;
    auto first = rel.begin();
    return first != rel.end() && *first != "..";
}
