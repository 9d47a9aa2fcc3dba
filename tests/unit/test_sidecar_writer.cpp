#include "../framework/SimpleTest.hpp"
#include "../framework/Fakes.hpp"
#include "core/SidecarWriter.hpp"

using namespace lyricflow;
using lyricflow::core::SidecarWriter;
using lyricflow::core::WriteResult;

namespace {
    size_t file_count(const std::filesystem::path& dir) {
        size_t n = 0;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            (void)entry;
            ++n;
        }
        return n;
    }
}

TEST_CASE(test_write_text_exact_content) {
    test::TempDir dir;
    auto target = dir.path() / "01.lrc";

    ASSERT_TRUE(SidecarWriter::write_text(target, "[00:01.00]La la") == WriteResult::Written);
    ASSERT_EQ(test::read_file(target), "[00:01.00]La la");
    ASSERT_EQ(file_count(dir.path()), 1u);
}

TEST_CASE(test_write_bytes_binary_safe) {
    test::TempDir dir;
    auto target = dir.path() / "cover.jpg";
    model::Bytes bytes{0xFF, 0xD8, 0x00, 0x10, 0x00, 0xFF};

    ASSERT_TRUE(SidecarWriter::write_bytes(target, bytes.data(), bytes.size()) == WriteResult::Written);
    auto content = test::read_file(target);
    ASSERT_EQ(content.size(), bytes.size());
    ASSERT_EQ(static_cast<uint8_t>(content[2]), 0x00);
    ASSERT_EQ(static_cast<uint8_t>(content[5]), 0xFF);
}

TEST_CASE(test_identical_content_unchanged) {
    test::TempDir dir;
    auto target = dir.path() / "01.lrc";
    SidecarWriter::write_text(target, "[00:01.00]La la");
    auto before = std::filesystem::last_write_time(target);

    ASSERT_TRUE(SidecarWriter::write_text(target, "[00:01.00]La la") == WriteResult::Unchanged);
    ASSERT_TRUE(std::filesystem::last_write_time(target) == before);
}

TEST_CASE(test_different_content_replaced) {
    test::TempDir dir;
    auto target = dir.path() / "01.lrc";
    SidecarWriter::write_text(target, "old");

    ASSERT_TRUE(SidecarWriter::write_text(target, "[00:02.00]new") == WriteResult::Written);
    ASSERT_EQ(test::read_file(target), "[00:02.00]new");
    ASSERT_EQ(file_count(dir.path()), 1u);
}

TEST_CASE(test_missing_directory_fails_cleanly) {
    test::TempDir dir;
    auto target = dir.path() / "missing" / "01.lrc";

    ASSERT_TRUE(SidecarWriter::write_text(target, "text") == WriteResult::Failed);
    ASSERT_FALSE(std::filesystem::exists(target));
    ASSERT_EQ(file_count(dir.path()), 0u);
}

int main() {
    return lyricflow::test::TestRunner::instance().run_all();
}
