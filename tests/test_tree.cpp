#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "hash.h"
#include "tree.h"

// 本文件包含针对 tree 对象编码与解析的单元测试

namespace {

miniodb::TreeEntry make_entry(const std::string& mode, const std::string& path,
                              const std::string& sha) {
    miniodb::TreeEntry e;
    e.mode = mode;
    e.path = path;
    e.sha = sha;
    return e;
}

// 手工拼出单个条目的字节
std::string raw_entry(const std::string& mode, const std::string& path,
                      const std::string& sha) {
    std::string out = mode + " " + path;
    out.push_back('\0');
    out.append(miniodb::hex_to_raw(sha));
    return out;
}

std::string with_tree_header(const std::string& body) {
    std::string bytes = "tree " + std::to_string(body.size());
    bytes.push_back('\0');
    bytes.append(body);
    return bytes;
}

const char kShaA[] = "2aae6c35c94fcfb415dbe95f408b9ce91ee846ed";
const char kShaB[] = "da39a3ee5e6b4b0d3255bfef95601890afd80709";

}  // namespace

// 验证 encode_tree 与 decode_tree 的互逆性，并保持调用方给定的顺序
TEST(TreeTest, EncodeAndDecodeRoundtrip) {
    std::vector<miniodb::TreeEntry> entries;
    entries.push_back(make_entry("100644", "zeta.txt", kShaA));
    entries.push_back(make_entry("040000", "dir", kShaB));
    entries.push_back(make_entry("100755", "run.sh", kShaA));

    std::string bytes = miniodb::encode_tree(entries);

    miniodb::Result<miniodb::Tree> tree = miniodb::decode_tree(bytes);
    ASSERT_TRUE(tree.ok());
    ASSERT_EQ(tree.value().entries.size(), entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        EXPECT_EQ(tree.value().entries[i].path, entries[i].path);
        EXPECT_EQ(tree.value().entries[i].mode, entries[i].mode);
        EXPECT_EQ(tree.value().entries[i].sha, entries[i].sha);
    }
    EXPECT_EQ(tree.value().sha, miniodb::sha1_hex(bytes));
}

TEST(TreeTest, EncodeLayout) {
    std::vector<miniodb::TreeEntry> entries;
    entries.push_back(make_entry("100644", "a", kShaA));

    std::string body = raw_entry("100644", "a", kShaA);
    EXPECT_EQ(body.size(), 29U);
    EXPECT_EQ(miniodb::encode_tree(entries), with_tree_header(body));
}

// 空 tree 与 git 的空树哈希一致
TEST(TreeTest, EmptyTree) {
    std::string bytes = miniodb::encode_tree(std::vector<miniodb::TreeEntry>());
    EXPECT_EQ(bytes, std::string("tree 0\0", 7));

    miniodb::Result<miniodb::Tree> tree = miniodb::decode_tree(bytes);
    ASSERT_TRUE(tree.ok());
    EXPECT_TRUE(tree.value().entries.empty());
    EXPECT_EQ(tree.value().sha, "4b825dc642cb6eb9a060e54bf8d69288fbee4904");
}

TEST(TreeTest, ModeClassification) {
    std::string body = raw_entry("100644", "file", kShaA) +
                       raw_entry("040000", "dir", kShaB) +
                       raw_entry("120000", "link", kShaA) +
                       raw_entry("100755", "exe", kShaB);
    miniodb::Result<miniodb::Tree> tree = miniodb::decode_tree(with_tree_header(body));
    ASSERT_TRUE(tree.ok());
    ASSERT_EQ(tree.value().entries.size(), 4U);
    EXPECT_EQ(tree.value().entries[0].type, miniodb::EntryType::Blob);
    EXPECT_EQ(tree.value().entries[1].type, miniodb::EntryType::Tree);
    EXPECT_EQ(tree.value().entries[2].type, miniodb::EntryType::Unknown);
    EXPECT_EQ(tree.value().entries[3].type, miniodb::EntryType::Blob);

    EXPECT_STREQ(miniodb::entry_type_name(tree.value().entries[0].type), "blob");
    EXPECT_STREQ(miniodb::entry_type_name(tree.value().entries[1].type), "tree");
    EXPECT_STREQ(miniodb::entry_type_name(tree.value().entries[2].type), "unknown");

    // 只有六位的 "040000" 被识别为目录
    EXPECT_EQ(miniodb::classify_mode("40000"), miniodb::EntryType::Unknown);
    EXPECT_EQ(miniodb::classify_mode(""), miniodb::EntryType::Unknown);
}

TEST(TreeTest, DuplicateNamesAreKept) {
    std::string body = raw_entry("100644", "same", kShaA) + raw_entry("100644", "same", kShaB);
    miniodb::Result<miniodb::Tree> tree = miniodb::decode_tree(with_tree_header(body));
    ASSERT_TRUE(tree.ok());
    ASSERT_EQ(tree.value().entries.size(), 2U);
    EXPECT_EQ(tree.value().entries[1].sha, kShaB);
}

// tree 头部只要求以 '\0' 结尾，不校验类型与长度
TEST(TreeTest, HeaderIsNotCrossChecked) {
    std::string bytes("blob 999", 8);
    bytes.push_back('\0');
    bytes.append(raw_entry("100644", "file", kShaA));
    miniodb::Result<miniodb::Tree> tree = miniodb::decode_tree(bytes);
    ASSERT_TRUE(tree.ok());
    EXPECT_EQ(tree.value().entries.size(), 1U);
}

TEST(TreeTest, RejectsMissingHeaderTerminator) {
    miniodb::Result<miniodb::Tree> tree = miniodb::decode_tree("tree 0");
    ASSERT_FALSE(tree.ok());
    EXPECT_EQ(tree.error().kind, miniodb::ErrorKind::TreeDecodeFailure);
    EXPECT_EQ(tree.error().code, "TreeParseError");
}

TEST(TreeTest, RejectsEntryWithoutSpace) {
    std::string body = raw_entry("100644", "ok", kShaA) + "100644";
    miniodb::Result<miniodb::Tree> tree = miniodb::decode_tree(with_tree_header(body));
    ASSERT_FALSE(tree.ok());
    EXPECT_EQ(tree.error().kind, miniodb::ErrorKind::TreeDecodeFailure);
}

TEST(TreeTest, RejectsEntryWithoutPathTerminator) {
    std::string body = "100644 unterminated-name";
    miniodb::Result<miniodb::Tree> tree = miniodb::decode_tree(with_tree_header(body));
    ASSERT_FALSE(tree.ok());
    EXPECT_EQ(tree.error().kind, miniodb::ErrorKind::TreeDecodeFailure);
}

// 单个截断条目使整个 tree 解析失败，不返回部分结果
TEST(TreeTest, RejectsTruncatedHash) {
    std::string body = raw_entry("100644", "first", kShaA) + raw_entry("100644", "second", kShaB);
    body.resize(body.size() - 1);
    miniodb::Result<miniodb::Tree> tree = miniodb::decode_tree(with_tree_header(body));
    ASSERT_FALSE(tree.ok());
    EXPECT_EQ(tree.error().kind, miniodb::ErrorKind::TreeDecodeFailure);
    EXPECT_NE(tree.error().message.find("truncated hash"), std::string::npos);
}

TEST(TreeTest, EncodeRejectsInvalidEntries) {
    std::vector<miniodb::TreeEntry> bad_sha(1, make_entry("100644", "a", "xyz"));
    EXPECT_THROW(miniodb::encode_tree(bad_sha), std::invalid_argument);

    std::vector<miniodb::TreeEntry> bad_mode(1, make_entry("100 644", "a", kShaA));
    EXPECT_THROW(miniodb::encode_tree(bad_mode), std::invalid_argument);

    std::vector<miniodb::TreeEntry> bad_path(1, make_entry("100644", std::string("a\0b", 3), kShaA));
    EXPECT_THROW(miniodb::encode_tree(bad_path), std::invalid_argument);
}
