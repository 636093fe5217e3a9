#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <vector>

#include "MergeEngine.h"
#include "MergeError.h"
#include "SourceInfo.h"
#include "generator/Generator.h"
#include "TestUtil.h"

class SourceInfoTest : public TempDirTest {
protected:
    ComicGenerator gen{ TEST_SEED };

    static SourceEntry source(const fs::path& p, size_t position) {
        SourceEntry s;
        s.path = p;
        s.position = position;
        s.kind = detect_source_kind(p).value_or(SourceKind::CBZ);
        return s;
    }

    static void touch(const fs::path& p) {
        std::ofstream(p) << "x";
    }
};

// ==========================================
// 1. СВОДКА ПО АРХИВУ
// ==========================================

TEST_F(SourceInfoTest, Lists_Pages_In_Reading_Order) {
    fs::path src = temp_dir / "vol1.cbz";
    ComicGenerator::write_zip(src, {
        { "10.jpg", gen.image_bytes("jpg", 100) },
        { "2.png", gen.image_bytes("png", 100) },
        { "notes.txt", "text" },
        { "1.jpg", gen.image_bytes("jpg", 100) },
        { "ComicInfo.xml", ComicGenerator::comic_info_xml("vol1", 3) },
    });

    SourceInfo info = inspect_source(src);
    EXPECT_EQ(info.file_name, "vol1.cbz");
    EXPECT_EQ(info.file_size, fs::file_size(src));
    EXPECT_EQ(info.total_files, 5u);
    EXPECT_EQ(info.page_count, 3u);
    EXPECT_EQ(info.image_files, (std::vector<std::string>{ "1.jpg", "2.png", "10.jpg" }));
    EXPECT_EQ(info.formats, (FormatSet{ "jpg", "png" }));
    EXPECT_TRUE(info.has_comic_info);
}

TEST_F(SourceInfoTest, Without_ComicInfo) {
    fs::path src = gen.make_comic(temp_dir / "plain.zip", 4, "webp");
    SourceInfo info = inspect_source(src);
    EXPECT_EQ(info.page_count, 4u);
    EXPECT_EQ(info.formats, FormatSet{ "webp" });
    EXPECT_FALSE(info.has_comic_info);
}

TEST_F(SourceInfoTest, Not_An_Archive) {
    fs::path src = temp_dir / "fake.cbz";
    gen.write_not_an_archive(src);
    try {
        inspect_source(src);
        FAIL() << "inspect_source() did not fail";
    } catch (const MergeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnreadableArchive);
    }
}

TEST_F(SourceInfoTest, No_Images_Is_Empty) {
    fs::path src = temp_dir / "text.zip";
    ComicGenerator::write_zip(src, { { "readme.txt", "nothing here" } });
    try {
        inspect_source(src);
        FAIL() << "inspect_source() did not fail";
    } catch (const MergeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::EmptyArchive);
    }
}

// ==========================================
// 2. ПРОВЕРКА СПИСКА ИСТОЧНИКОВ
// ==========================================

TEST_F(SourceInfoTest, Splits_Valid_And_Invalid) {
    fs::path a = gen.make_comic(temp_dir / "a.cbz", 3);
    fs::path b = gen.make_comic(temp_dir / "b.zip", 5, "png", true);
    fs::path fake = temp_dir / "fake.cbz";
    gen.write_not_an_archive(fake);

    SourceValidation summary = validate_sources({ source(a, 0), source(fake, 1), source(b, 2) });
    EXPECT_FALSE(summary.all_valid());
    ASSERT_EQ(summary.valid.size(), 2u);
    EXPECT_EQ(summary.valid[0].file_name, "a.cbz");
    EXPECT_EQ(summary.valid[1].file_name, "b.zip");
    EXPECT_EQ(summary.total_pages, 8u);
    EXPECT_EQ(summary.total_size, fs::file_size(a) + fs::file_size(b));

    ASSERT_EQ(summary.invalid.size(), 1u);
    EXPECT_EQ(summary.invalid[0].kind, ErrorKind::UnreadableArchive);
    EXPECT_EQ(summary.invalid[0].subject, fake.string());
}

TEST_F(SourceInfoTest, Missing_File_And_Wrong_Kind) {
    fs::path a = gen.make_comic(temp_dir / "a.cbz", 1);
    SourceEntry declared_zip = source(a, 0);
    declared_zip.kind = SourceKind::ZIP;

    SourceValidation summary = validate_sources({ declared_zip, source(temp_dir / "gone.cbz", 1) });
    EXPECT_TRUE(summary.valid.empty());
    ASSERT_EQ(summary.invalid.size(), 2u);
    EXPECT_EQ(summary.invalid[0].kind, ErrorKind::UnreadableArchive);
    EXPECT_EQ(summary.invalid[1].kind, ErrorKind::UnreadableArchive);
    EXPECT_EQ(summary.total_pages, 0u);
}

TEST_F(SourceInfoTest, Chapter_Below_One_Is_Invalid) {
    fs::path a = gen.make_comic(temp_dir / "a.cbz", 2);
    SourceEntry s = source(a, 0);
    s.chapter = 0;

    SourceValidation summary = validate_sources({ s });
    ASSERT_EQ(summary.invalid.size(), 1u);
    EXPECT_EQ(summary.invalid[0].kind, ErrorKind::InvalidChapter);
    EXPECT_TRUE(summary.valid.empty());
}

TEST_F(SourceInfoTest, All_Valid) {
    fs::path a = gen.make_comic(temp_dir / "a.cbz", 2);
    SourceEntry s = source(a, 0);
    s.chapter = 5;
    SourceValidation summary = validate_sources({ s });
    EXPECT_TRUE(summary.all_valid());
    EXPECT_EQ(summary.total_pages, 2u);
}

// ==========================================
// 3. СВОБОДНОЕ ИМЯ ВЫХОДНОГО ФАЙЛА
// ==========================================

TEST_F(SourceInfoTest, Unique_Name_Counts_Up) {
    EXPECT_EQ(unique_output_path(temp_dir, "merged"), temp_dir / "merged.cbz");

    touch(temp_dir / "merged.cbz");
    EXPECT_EQ(unique_output_path(temp_dir, "merged"), temp_dir / "merged_1.cbz");

    touch(temp_dir / "merged_1.cbz");
    EXPECT_EQ(unique_output_path(temp_dir, "merged"), temp_dir / "merged_2.cbz");

    // другое расширение не занято
    EXPECT_EQ(unique_output_path(temp_dir, "merged", ".zip"), temp_dir / "merged.zip");
}
