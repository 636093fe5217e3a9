#include "SourceInfo.h"
#include "ComicInfo.h"
#include "MergeError.h"
#include "NaturalSort.h"
#include <system_error>

namespace fs = std::filesystem;

SourceInfo inspect_source(const fs::path& path, uint64_t max_entry_size) {
    ArchiveReader reader(path, max_entry_size);

    SourceInfo info;
    info.path = path;
    info.file_name = path.filename().string();
    std::error_code ec;
    info.file_size = fs::file_size(path, ec);
    if (ec) info.file_size = 0;
    info.total_files = reader.entry_count();

    for (const auto& e : reader.list_image_entries()) {
        info.image_files.push_back(e.name);
        info.formats.insert(e.extension);
    }
    natural_sort(info.image_files);
    info.page_count = info.image_files.size();
    info.has_comic_info = reader.find_entry(COMIC_INFO_NAME).has_value();
    return info;
}

fs::path unique_output_path(const fs::path& dir, const std::string& stem, const std::string& ext) {
    std::error_code ec;
    fs::path candidate = dir / (stem + ext);
    for (unsigned counter = 1; fs::exists(candidate, ec); ++counter) {
        candidate = dir / (stem + "_" + std::to_string(counter) + ext);
    }
    return candidate;
}
