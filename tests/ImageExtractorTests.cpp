#include <gtest/gtest.h>
#include <atomic>
#include <fstream>
#include <string>
#include <vector>

#include "ImageExtractor.h"
#include "MergeError.h"
#include "generator/Generator.h"
#include "TestUtil.h"

class ExtractionRecorder : public ProgressObserver {
public:
    std::vector<ExtractionProgress> seen;
    void on_extraction_progress(ExtractionProgress snapshot) override { seen.push_back(snapshot); }
};

class ImageExtractorTest : public TempDirTest {
protected:
    ComicGenerator gen{ TEST_SEED };
    ImageExtractor extractor;
    fs::path out_dir;

    void SetUp() override {
        TempDirTest::SetUp();
        out_dir = temp_dir / "out";
    }

    MergeError extract_error(const fs::path& source, int chapter, const FormatSet& formats) {
        try {
            extractor.extract(source, chapter, formats, out_dir);
        } catch (const MergeError& e) {
            return e;
        }
        ADD_FAILURE() << "extract() did not fail";
        return MergeError(ErrorKind::IOFailure, "no error");
    }
};

// ==========================================
// 1. ФИЛЬТР И ПЕРЕИМЕНОВАНИЕ
// ==========================================

TEST(ChapterEntryName, Pads_Page_To_Three_Digits) {
    EXPECT_EQ(chapter_entry_name(1, 1, "jpg"), "ch1_001.jpg");
    EXPECT_EQ(chapter_entry_name(12, 7, "png"), "ch12_007.png");
    EXPECT_EQ(chapter_entry_name(3, 1000, "webp"), "ch3_1000.webp");
}

TEST_F(ImageExtractorTest, Filters_Selected_Formats) {
    fs::path src = temp_dir / "mixed.zip";
    ComicGenerator::write_zip(src, {
        { "a.txt", "text" },
        { "img1.jpg", gen.image_bytes("jpg", 300) },
        { "img2.gif", gen.image_bytes("gif", 300) },
    });

    ChapterGroup group = extractor.extract(src, 3, { "jpg" }, out_dir);
    ASSERT_EQ(group.entries.size(), 1u);
    EXPECT_EQ(group.chapter, 3);
    EXPECT_EQ(group.entries[0].source_name, "img1.jpg");
    EXPECT_EQ(group.entries[0].target_name, "ch3_001.jpg");
    EXPECT_EQ(list_files(out_dir), std::vector<std::string>{ "ch3_001.jpg" });
}

TEST_F(ImageExtractorTest, Renames_In_Natural_Order) {
    fs::path src = temp_dir / "chapter.zip";
    auto pages = gen.pages("page", 12, "png");
    ComicGenerator::write_zip(src, pages);

    ChapterGroup group = extractor.extract(src, 2, supported_formats(), out_dir);
    ASSERT_EQ(group.entries.size(), 12u);
    for (int i = 0; i < 12; ++i) {
        const RenamedEntry& e = group.entries[i];
        EXPECT_EQ(e.page, i + 1);
        EXPECT_EQ(e.source_name, "page" + std::to_string(i + 1) + ".png");
        EXPECT_EQ(e.target_name, chapter_entry_name(2, i + 1, "png"));
        EXPECT_EQ(e.staged_path, out_dir / e.target_name);
    }

    // contents follow the rename
    for (const auto& p : pages) {
        if (p.name == "page10.png") EXPECT_EQ(read_file(out_dir / "ch2_010.png"), p.data);
    }
}

TEST_F(ImageExtractorTest, Keeps_Extension_Case_Folded) {
    fs::path src = temp_dir / "upper.zip";
    ComicGenerator::write_zip(src, { { "P1.JPEG", gen.image_bytes("jpeg", 100) } });
    ChapterGroup group = extractor.extract(src, 1, { "jpeg" }, out_dir);
    ASSERT_EQ(group.entries.size(), 1u);
    EXPECT_EQ(group.entries[0].target_name, "ch1_001.jpeg");
}

TEST_F(ImageExtractorTest, Extraction_Is_Idempotent) {
    fs::path src = temp_dir / "chapter.zip";
    ComicGenerator::write_zip(src, gen.pages("p", 11, "webp"));

    ChapterGroup first = extractor.extract(src, 4, supported_formats(), temp_dir / "run1");
    ChapterGroup second = extractor.extract(src, 4, supported_formats(), temp_dir / "run2");

    std::vector<std::string> first_names, second_names;
    for (const auto& e : first.entries) first_names.push_back(e.target_name);
    for (const auto& e : second.entries) second_names.push_back(e.target_name);
    EXPECT_EQ(first_names, second_names);
    EXPECT_EQ(list_files(temp_dir / "run1"), list_files(temp_dir / "run2"));
    EXPECT_EQ(read_file(temp_dir / "run1" / "ch4_011.webp"), read_file(temp_dir / "run2" / "ch4_011.webp"));
}

// ==========================================
// 2. ОШИБКИ ВСЕЙ ОПЕРАЦИИ
// ==========================================

TEST_F(ImageExtractorTest, Chapter_Below_One_Rejected) {
    fs::path src = temp_dir / "chapter.zip";
    ComicGenerator::write_zip(src, { { "p1.jpg", gen.image_bytes("jpg", 64) } });

    EXPECT_EQ(extract_error(src, 0, { "jpg" }).kind(), ErrorKind::InvalidChapter);
    EXPECT_EQ(extract_error(src, -2, { "jpg" }).kind(), ErrorKind::InvalidChapter);
    EXPECT_FALSE(fs::exists(out_dir / "ch0_001.jpg"));
    EXPECT_FALSE(fs::exists(out_dir / "ch-2_001.jpg"));
}

TEST_F(ImageExtractorTest, Existing_Target_Is_Never_Overwritten) {
    fs::path src = temp_dir / "chapter.zip";
    ComicGenerator::write_zip(src, {
        { "p1.jpg", gen.image_bytes("jpg", 64) },
        { "p2.jpg", gen.image_bytes("jpg", 64) },
    });
    fs::create_directories(out_dir);
    {
        std::ofstream f(out_dir / "ch1_002.jpg", std::ios::binary);
        f << "keep me";
    }

    EXPECT_EQ(extract_error(src, 1, { "jpg" }).kind(), ErrorKind::IOFailure);
    // own page removed, foreign file untouched
    EXPECT_EQ(list_files(out_dir), std::vector<std::string>{ "ch1_002.jpg" });
    EXPECT_EQ(read_file(out_dir / "ch1_002.jpg"), "keep me");

    extractor.set_strict(true);
    EXPECT_EQ(extract_error(src, 1, { "jpg" }).kind(), ErrorKind::IOFailure);
    EXPECT_EQ(read_file(out_dir / "ch1_002.jpg"), "keep me");
}

TEST_F(ImageExtractorTest, Empty_Selection_Fails_Before_Opening) {
    MergeError e = extract_error(temp_dir / "does_not_exist.zip", 1, {});
    EXPECT_EQ(e.kind(), ErrorKind::NoFormatsSelected);
}

TEST_F(ImageExtractorTest, No_Match_Is_Empty) {
    fs::path src = temp_dir / "gifs.zip";
    ComicGenerator::write_zip(src, { { "a.gif", gen.image_bytes("gif", 50) } });
    EXPECT_EQ(extract_error(src, 1, { "png" }).kind(), ErrorKind::EmptyArchive);
    EXPECT_TRUE(list_files(out_dir).empty());
}

TEST_F(ImageExtractorTest, Unreadable_Source) {
    fs::path src = temp_dir / "fake.zip";
    gen.write_not_an_archive(src);
    EXPECT_EQ(extract_error(src, 1, supported_formats()).kind(), ErrorKind::UnreadableArchive);
}

// ==========================================
// 3. ПРОПУСК ОТДЕЛЬНЫХ ЗАПИСЕЙ
// ==========================================

TEST_F(ImageExtractorTest, Traversal_Entry_Skipped) {
    fs::path src = temp_dir / "evil.zip";
    ComicGenerator::write_zip(src, {
        { "../../etc/passwd.jpg", gen.image_bytes("jpg", 64) },
        { "p1.jpg", gen.image_bytes("jpg", 64) },
    });

    ChapterGroup group = extractor.extract(src, 1, { "jpg" }, out_dir);
    ASSERT_EQ(group.entries.size(), 1u);
    EXPECT_EQ(group.entries[0].source_name, "p1.jpg");
    ASSERT_EQ(group.issues.size(), 1u);
    EXPECT_EQ(group.issues[0].kind, ErrorKind::PathRejected);
    EXPECT_NE(group.issues[0].subject.find("passwd.jpg"), std::string::npos);
    EXPECT_FALSE(fs::exists(temp_dir.parent_path() / "etc"));
    EXPECT_EQ(list_files(out_dir), std::vector<std::string>{ "ch1_001.jpg" });
}

TEST_F(ImageExtractorTest, Traversal_Entry_Fails_In_Strict_Mode) {
    fs::path src = temp_dir / "evil.zip";
    ComicGenerator::write_zip(src, {
        { "p1.jpg", gen.image_bytes("jpg", 64) },
        { "p2/../../../x.jpg", gen.image_bytes("jpg", 64) },
    });
    extractor.set_strict(true);
    EXPECT_EQ(extract_error(src, 1, { "jpg" }).kind(), ErrorKind::PathRejected);
    EXPECT_TRUE(list_files(out_dir).empty());
}

TEST_F(ImageExtractorTest, Symlink_Entry_Rejected) {
    fs::path src = temp_dir / "link.zip";
    GenEntry link{ "a_link.jpg", "/etc/passwd" };
    link.symlink = true;
    ComicGenerator::write_zip(src, { link, { "p1.jpg", gen.image_bytes("jpg", 64) } });

    ChapterGroup group = extractor.extract(src, 1, { "jpg" }, out_dir);
    ASSERT_EQ(group.entries.size(), 1u);
    ASSERT_EQ(group.issues.size(), 1u);
    EXPECT_EQ(group.issues[0].kind, ErrorKind::PathRejected);
}

TEST_F(ImageExtractorTest, Corrupt_Entry_Skipped_Pages_Stay_Dense) {
    fs::path src = temp_dir / "corrupt.zip";
    GenEntry broken{ "p2.jpg", gen.image_bytes("jpg", 500) };
    broken.corrupt_crc = true;
    std::string p3 = gen.image_bytes("jpg", 500);
    ComicGenerator::write_zip(src, { { "p1.jpg", gen.image_bytes("jpg", 500) }, broken, { "p3.jpg", p3 } });

    ChapterGroup group = extractor.extract(src, 1, { "jpg" }, out_dir);
    ASSERT_EQ(group.entries.size(), 2u);
    EXPECT_EQ(group.entries[1].source_name, "p3.jpg");
    EXPECT_EQ(group.entries[1].target_name, "ch1_002.jpg");
    ASSERT_EQ(group.issues.size(), 1u);
    EXPECT_EQ(group.issues[0].kind, ErrorKind::CorruptEntry);
    EXPECT_EQ(list_files(out_dir), (std::vector<std::string>{ "ch1_001.jpg", "ch1_002.jpg" }));
    EXPECT_EQ(read_file(out_dir / "ch1_002.jpg"), p3);
}

TEST_F(ImageExtractorTest, All_Entries_Corrupt_Is_Empty) {
    fs::path src = temp_dir / "dead.zip";
    GenEntry broken{ "p1.png", gen.image_bytes("png", 500) };
    broken.corrupt_crc = true;
    ComicGenerator::write_zip(src, { broken });
    EXPECT_EQ(extract_error(src, 1, { "png" }).kind(), ErrorKind::EmptyArchive);
    EXPECT_TRUE(list_files(out_dir).empty());
}

TEST_F(ImageExtractorTest, Oversized_Entry_Skipped) {
    fs::path src = temp_dir / "big.zip";
    ComicGenerator::write_zip(src, {
        { "p1.jpg", gen.image_bytes("jpg", 4096) },
        { "p2.jpg", gen.image_bytes("jpg", 100) },
    });
    extractor.set_max_entry_size(1024);
    ChapterGroup group = extractor.extract(src, 1, { "jpg" }, out_dir);
    ASSERT_EQ(group.entries.size(), 1u);
    EXPECT_EQ(group.entries[0].source_name, "p2.jpg");
    EXPECT_EQ(group.issues[0].kind, ErrorKind::CorruptEntry);
}

// ==========================================
// 4. ПРОГРЕСС И ОТМЕНА
// ==========================================

TEST_F(ImageExtractorTest, One_Progress_Snapshot_Per_Page) {
    fs::path src = temp_dir / "chapter.zip";
    ComicGenerator::write_zip(src, gen.pages("p", 5, "jpg"));
    ExtractionRecorder observer;
    extractor.set_observer(&observer);

    extractor.extract(src, 1, { "jpg" }, out_dir);
    ASSERT_EQ(observer.seen.size(), 5u);
    for (size_t i = 0; i < observer.seen.size(); ++i) {
        EXPECT_EQ(observer.seen[i].entries_found, 5u);
        EXPECT_EQ(observer.seen[i].entries_extracted, i + 1);
        EXPECT_EQ(observer.seen[i].current_file, "p" + std::to_string(i + 1) + ".jpg");
    }
}

TEST_F(ImageExtractorTest, Cancel_Removes_Written_Files) {
    fs::path src = temp_dir / "chapter.zip";
    ComicGenerator::write_zip(src, gen.pages("p", 5, "jpg"));

    std::atomic<bool> cancel{ false };
    struct CancelAfterTwo : ProgressObserver {
        std::atomic<bool>* flag = nullptr;
        void on_extraction_progress(ExtractionProgress s) override {
            if (s.entries_extracted == 2) *flag = true;
        }
    } observer;
    observer.flag = &cancel;

    extractor.set_observer(&observer);
    extractor.set_cancel_flag(&cancel);
    EXPECT_EQ(extract_error(src, 1, { "jpg" }).kind(), ErrorKind::Cancelled);
    EXPECT_TRUE(list_files(out_dir).empty());
}
