#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <vector>

#include "ArchiveReader.h"
#include "ArchiveWriter.h"
#include "MergeError.h"
#include "StagingDir.h"
#include "TestUtil.h"

// ==========================================
// 1. ARCHIVE WRITER
// ==========================================

class ArchiveWriterTest : public TempDirTest {
protected:
    fs::path page(const std::string& name, const std::string& data) {
        fs::path p = temp_dir / name;
        std::ofstream(p, std::ios::binary) << data;
        return p;
    }
};

TEST_F(ArchiveWriterTest, Commit_Moves_Archive_Into_Place) {
    fs::path out = temp_dir / "out.cbz";
    {
        ArchiveWriter writer(out);
        EXPECT_FALSE(fs::exists(out));
        writer.add_file("ch1_001.jpg", page("a.jpg", "AAAA"), false);
        writer.add_bytes("ComicInfo.xml", "<ComicInfo/>", true);
        EXPECT_EQ(writer.entry_count(), 2u);

        double last_fraction = 0.0;
        writer.commit([&](double f) { last_fraction = f; });
        EXPECT_GT(last_fraction, 0.0);
    }
    ASSERT_TRUE(fs::exists(out));

    ArchiveReader reader(out);
    EXPECT_EQ(reader.entry_count(), 2u);
    auto info = reader.read_small("ComicInfo.xml", 1024);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(*info, "<ComicInfo/>");
    EXPECT_EQ(list_files(temp_dir), (std::vector<std::string>{ "a.jpg", "out.cbz" }));
}

TEST_F(ArchiveWriterTest, Discarded_Without_Commit) {
    fs::path out = temp_dir / "out.cbz";
    {
        ArchiveWriter writer(out);
        writer.add_file("ch1_001.jpg", page("a.jpg", "AAAA"), false);
    }
    EXPECT_FALSE(fs::exists(out));
    EXPECT_EQ(list_files(temp_dir), std::vector<std::string>{ "a.jpg" });
}

TEST_F(ArchiveWriterTest, Empty_Archive_Refused) {
    fs::path out = temp_dir / "out.cbz";
    {
        ArchiveWriter writer(out);
        try {
            writer.commit();
            ADD_FAILURE() << "commit() of an empty archive succeeded";
        } catch (const MergeError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::EmptyArchive);
        }
    }
    EXPECT_TRUE(list_files(temp_dir).empty());
}

TEST_F(ArchiveWriterTest, Cancel_During_Write) {
    fs::path out = temp_dir / "out.cbz";
    {
        ArchiveWriter writer(out);
        writer.add_file("ch1_001.jpg", page("a.jpg", std::string(4096, 'a')), false);
        writer.add_file("ch1_002.jpg", page("b.jpg", std::string(4096, 'b')), false);
        try {
            writer.commit({}, [] { return true; });
            ADD_FAILURE() << "commit() ignored cancellation";
        } catch (const MergeError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::Cancelled);
        }
    }
    EXPECT_FALSE(fs::exists(out));
    EXPECT_EQ(list_files(temp_dir), (std::vector<std::string>{ "a.jpg", "b.jpg" }));
}

// ==========================================
// 2. STAGING DIR
// ==========================================

class StagingDirTest : public TempDirTest {};

TEST_F(StagingDirTest, Removed_On_Scope_Exit) {
    fs::path kept;
    {
        StagingDir staging(temp_dir);
        kept = staging.path();
        EXPECT_TRUE(fs::is_directory(kept));
        EXPECT_EQ(kept.filename().string().rfind(StagingDir::PREFIX, 0), 0u);

        fs::path sub = staging.subdir("source_1");
        std::ofstream(sub / "ch1_001.jpg") << "x";
        EXPECT_TRUE(fs::exists(sub / "ch1_001.jpg"));
    }
    EXPECT_FALSE(fs::exists(kept));
}

TEST_F(StagingDirTest, Removed_On_Exception) {
    fs::path kept;
    try {
        StagingDir staging(temp_dir);
        kept = staging.path();
        throw MergeError(ErrorKind::Cancelled, "stop");
    } catch (const MergeError&) {
    }
    EXPECT_FALSE(kept.empty());
    EXPECT_FALSE(fs::exists(kept));
}

TEST_F(StagingDirTest, Two_Directories_Never_Collide) {
    StagingDir a(temp_dir);
    StagingDir b(temp_dir);
    EXPECT_NE(a.path(), b.path());
}

TEST_F(StagingDirTest, Sweep_Removes_Dead_Owners_Only) {
    // pid above any pid_max
    fs::path dead = temp_dir / (std::string(StagingDir::PREFIX) + "999999999_0_1");
    fs::path unrelated = temp_dir / "comicmerge";
    fs::create_directories(dead / "source_1");
    fs::create_directories(unrelated);
    StagingDir live(temp_dir);

    EXPECT_EQ(StagingDir::sweep_stale(temp_dir), 1u);
    EXPECT_FALSE(fs::exists(dead));
    EXPECT_TRUE(fs::exists(unrelated));
    EXPECT_TRUE(fs::exists(live.path()));
}
