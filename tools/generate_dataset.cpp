#include <filesystem>
#include <string>
#include <iostream>
#include <exception>
#include "generator/Generator.h"

namespace fs = std::filesystem;

// generate_dataset [out_dir] [archives] [pages_per_archive] [seed]
int main(int argc, char** argv) {
    fs::path out_dir = (argc > 1) ? fs::path(argv[1]) : fs::path("test_data");
    try {
        size_t archives = (argc > 2) ? std::stoul(argv[2]) : 10;
        size_t pages = (argc > 3) ? std::stoul(argv[3]) : 20;
        uint32_t seed = (argc > 4) ? static_cast<uint32_t>(std::stoul(argv[4])) : 42;

        ComicGenerator gen(seed);
        GenStats stats = gen.generate_library(out_dir, archives, pages);
        stats.print();
    }
    catch (const std::exception& e) {
        std::cerr << "Не удалось сгенерировать набор: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Папка: " << out_dir.string() << "\n";
    std::cout << "Соберите главы: ComicMerge merged.cbz " << (out_dir / "chapter_001.cbz").string() << " ...\n";
    return 0;
}
