#include <gtest/gtest.h>
#include <ssh/remote_path.hpp>
#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

// ── validate_path ───────────────────────────────────────────

TEST(RemotePath, NormalisesSlashesAndDots) {
    auto p = validate_path("//var/./log//nginx/");
    ASSERT_TRUE(p.is_ok()) << p.error;
    EXPECT_EQ(p.value, "/var/log/nginx");
}

TEST(RemotePath, RelativeBecomesAbsolute) {
    auto p = validate_path("tmp/upload.bin");
    ASSERT_TRUE(p.is_ok());
    EXPECT_EQ(p.value, "/tmp/upload.bin");
}

TEST(RemotePath, RootStaysRoot) {
    EXPECT_EQ(validate_path("/").value, "/");
    EXPECT_EQ(validate_path("/./").value, "/");
}

TEST(RemotePath, RejectsTraversal) {
    for (const char* bad : {"..", "/etc/../root", "a/b/..", "../x"}) {
        auto p = validate_path(bad);
        EXPECT_TRUE(p.is_err()) << bad;
        EXPECT_EQ(p.kind, ErrorKind::Resource) << bad;
    }
}

TEST(RemotePath, DotsInsideNamesAreFine) {
    auto p = validate_path("/srv/app..old/.env");
    ASSERT_TRUE(p.is_ok());
    EXPECT_EQ(p.value, "/srv/app..old/.env");
}

TEST(RemotePath, RejectsEmptyAndNul) {
    EXPECT_TRUE(validate_path("").is_err());
    std::string with_nul("/tmp/a");
    with_nul.push_back('\0');
    with_nul += "b";
    EXPECT_TRUE(validate_path(with_nul).is_err());
}

TEST(RemotePath, ParentAndBaseName) {
    EXPECT_EQ(parent_path("/var/log"), "/var");
    EXPECT_EQ(parent_path("/var"), "/");
    EXPECT_EQ(parent_path("/"), "/");
    EXPECT_EQ(base_name("/var/log/syslog"), "syslog");
    EXPECT_EQ(base_name("/"), "/");
    EXPECT_EQ(join_path("/var/log", "syslog"), "/var/log/syslog");
    EXPECT_EQ(join_path("/", "etc"), "/etc");
}

// ── Modes ───────────────────────────────────────────────────

TEST(RemotePath, ParseMode) {
    EXPECT_EQ(parse_mode("755").value, 0755u);
    EXPECT_EQ(parse_mode("0700").value, 0700u);
    EXPECT_EQ(parse_mode(" 644 ").value, 0644u);
    EXPECT_EQ(parse_mode("1777").value, 01777u);
}

TEST(RemotePath, ParseModeRejectsGarbage) {
    for (const char* bad : {"", "rwx", "0x1ff", "888", "07550", "-755"}) {
        auto m = parse_mode(bad);
        EXPECT_TRUE(m.is_err()) << bad;
        EXPECT_EQ(m.kind, ErrorKind::Resource) << bad;
    }
}

TEST(RemotePath, ModeString) {
    EXPECT_EQ(mode_string(0040755), "drwxr-xr-x");
    EXPECT_EQ(mode_string(0100644), "-rw-r--r--");
    EXPECT_EQ(mode_string(0120777), "lrwxrwxrwx");
    EXPECT_EQ(mode_string(0100000), "----------");
}

TEST(RemotePath, PermissionString) {
    EXPECT_EQ(permission_string(0100644), "0644");
    EXPECT_EQ(permission_string(0040755), "0755");
    EXPECT_EQ(permission_string(01777), "1777");
}

// ── copy_chunks ─────────────────────────────────────────────

namespace {

ChunkReader reader_over(const std::string& src, size_t& pos) {
    return [&src, &pos](char* buf, size_t cap) {
        size_t n = std::min(cap, src.size() - pos);
        std::memcpy(buf, src.data() + pos, n);
        pos += n;
        return Result<size_t>::Ok(n);
    };
}

}  // namespace

TEST(CopyChunks, CopiesEverythingAndReportsProgress) {
    std::string src(10000, 'x');
    size_t pos = 0;
    std::string dst;
    std::vector<uint64_t> seen;

    auto r = copy_chunks(
        reader_over(src, pos),
        [&](const char* buf, size_t len) {
            dst.append(buf, len);
            return Result<size_t>::Ok(len);
        },
        src.size(),
        [&](uint64_t done, uint64_t total) {
            EXPECT_EQ(total, 10000u);
            seen.push_back(done);
        },
        4096);

    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, 10000u);
    EXPECT_EQ(dst, src);
    std::vector<uint64_t> want{4096, 8192, 10000};
    EXPECT_EQ(seen, want);
}

TEST(CopyChunks, EmptySource) {
    std::string src;
    size_t pos = 0;
    int writes = 0;
    auto r = copy_chunks(reader_over(src, pos),
                         [&](const char*, size_t len) { ++writes; return Result<size_t>::Ok(len); },
                         0, nullptr);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, 0u);
    EXPECT_EQ(writes, 0);
}

TEST(CopyChunks, WriteFailureIsPartialWithBytesLanded) {
    std::string src(3000, 'y');
    size_t pos = 0;
    int chunk = 0;

    auto r = copy_chunks(
        reader_over(src, pos),
        [&](const char*, size_t len) {
            if (++chunk == 3) return Result<size_t>::Err(ErrorKind::Connection, "channel closed", 200);
            return Result<size_t>::Ok(len);
        },
        src.size(), nullptr, 1000);

    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::PartialTransfer);
    EXPECT_EQ(r.value, 2200u);
}

TEST(CopyChunks, ReadFailureIsPartial) {
    int calls = 0;
    auto r = copy_chunks(
        [&](char* buf, size_t cap) {
            if (++calls == 2) return Result<size_t>::Err(ErrorKind::Timeout, "read stalled");
            std::memset(buf, 'z', cap);
            return Result<size_t>::Ok(cap);
        },
        [](const char*, size_t len) { return Result<size_t>::Ok(len); },
        0, nullptr, 512);

    EXPECT_EQ(r.kind, ErrorKind::PartialTransfer);
    EXPECT_EQ(r.value, 512u);
    EXPECT_NE(r.error.find("read stalled"), std::string::npos);
}
