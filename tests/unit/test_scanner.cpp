#include "../framework/SimpleTest.hpp"
#include "../framework/TestFiles.hpp"
#include "backend/FingerprintResolver.hpp"
#include "util/DirectoryScanner.hpp"
#include <algorithm>

using lorchestre::backend::FingerprintResolver;
using lorchestre::test::TempDir;
using lorchestre::test::write_file;
using lorchestre::util::DirectoryScanner;

namespace {
    bool contains(const std::vector<std::string>& v, const std::string& s) {
        return std::find(v.begin(), v.end(), s) != v.end();
    }

    void populate(const TempDir& music) {
        write_file(music / "a/one.mp3", "x");
        write_file(music / "a/two.flac", "x");
        write_file(music / "a/b/c/deep.ogg", "x");
        write_file(music / "mix.m3u", "a/one.mp3\n");
        write_file(music / "a/cover.jpg", "x");
        write_file(music / "notes.txt", "x");
    }
}

TEST_CASE(test_scan_classifies_media) {
    TempDir music;
    populate(music);

    auto result = DirectoryScanner::scan_directory(music.path());

    ASSERT_EQ(result.audio_files.size(), 3u);
    ASSERT_EQ(result.playlist_files.size(), 1u);
    ASSERT_TRUE(contains(result.audio_files, (music / "a/one.mp3").string()));
    ASSERT_TRUE(contains(result.audio_files, (music / "a/b/c/deep.ogg").string()));
    ASSERT_TRUE(contains(result.playlist_files, (music / "mix.m3u").string()));
    ASSERT_FALSE(contains(result.audio_files, (music / "a/cover.jpg").string()));
    ASSERT_FALSE(contains(result.audio_files, (music / "notes.txt").string()));
}

TEST_CASE(test_scan_tolerates_trailing_slash) {
    TempDir music;
    write_file(music / "one.mp3", "x");

    auto result = DirectoryScanner::scan_directory(music.path().string() + "/");
    ASSERT_EQ(result.audio_files.size(), 1u);
    ASSERT_EQ(result.audio_files.front(), (music / "one.mp3").string());
}

TEST_CASE(test_scan_empty_and_missing_roots) {
    TempDir music;
    auto empty = DirectoryScanner::scan_directory(music.path());
    ASSERT_TRUE(empty.audio_files.empty());
    ASSERT_TRUE(empty.playlist_files.empty());

    auto missing = DirectoryScanner::scan_directory(music / "nope");
    ASSERT_TRUE(missing.audio_files.empty());
    ASSERT_EQ(missing.tree_digest, empty.tree_digest);
}

TEST_CASE(test_fingerprint_matches_scan_digest) {
    TempDir music;
    populate(music);

    auto result = DirectoryScanner::scan_directory(music.path());
    auto digest = DirectoryScanner::fingerprint(music.path());

    ASSERT_EQ(digest.size(), 32u);
    ASSERT_EQ(digest, result.tree_digest);
    ASSERT_EQ(DirectoryScanner::fingerprint(music.path()), digest);
}

TEST_CASE(test_fingerprint_ignores_non_media) {
    TempDir music;
    populate(music);
    auto before = DirectoryScanner::fingerprint(music.path());

    write_file(music / "a/readme.txt", "x");
    write_file(music / "a/back.png", "x");
    ASSERT_EQ(DirectoryScanner::fingerprint(music.path()), before);
}

TEST_CASE(test_fingerprint_tracks_path_changes) {
    TempDir music;
    populate(music);
    auto before = DirectoryScanner::fingerprint(music.path());

    std::filesystem::rename(music / "a/one.mp3", music / "a/uno.mp3");
    auto renamed = DirectoryScanner::fingerprint(music.path());
    ASSERT_TRUE(renamed != before);

    write_file(music / "a/new.mp3", "x");
    ASSERT_TRUE(DirectoryScanner::fingerprint(music.path()) != renamed);
}

TEST_CASE(test_resolver_reuses_unchanged_library) {
    TempDir music;
    TempDir cache;
    populate(music);

    FingerprintResolver resolver(cache.path());
    auto first = resolver.resolve(music.path());
    ASSERT_FALSE(first.reused_cache);
    ASSERT_EQ(first.files.size(), 4u);
    ASSERT_EQ(first.audio_files().size(), 3u);
    ASSERT_EQ(first.playlist_files().size(), 1u);
    ASSERT_TRUE(std::filesystem::exists(resolver.digest_path()));
    ASSERT_TRUE(std::filesystem::exists(resolver.files_path()));

    auto second = resolver.resolve(music.path());
    ASSERT_TRUE(second.reused_cache);
    ASSERT_EQ(second.files, first.files);
    ASSERT_EQ(second.digest, first.digest);
}

TEST_CASE(test_resolver_playlists_come_last) {
    TempDir music;
    TempDir cache;
    populate(music);

    auto resolution = FingerprintResolver(cache.path()).resolve(music.path());
    ASSERT_EQ(resolution.files.back(), (music / "mix.m3u").string());
}

TEST_CASE(test_resolver_trusts_stored_list_on_match) {
    TempDir music;
    TempDir cache;
    populate(music);

    FingerprintResolver resolver(cache.path());
    (void)resolver.resolve(music.path());

    // Same digest: the stored list is returned as-is
    write_file(resolver.files_path(), "/elsewhere/x.mp3\n");
    auto reused = resolver.resolve(music.path());
    ASSERT_TRUE(reused.reused_cache);
    ASSERT_EQ(reused.files.size(), 1u);
    ASSERT_EQ(reused.files.front(), std::string("/elsewhere/x.mp3"));
}

TEST_CASE(test_resolver_rescans_after_rename) {
    TempDir music;
    TempDir cache;
    populate(music);

    FingerprintResolver resolver(cache.path());
    (void)resolver.resolve(music.path());

    std::filesystem::rename(music / "a/two.flac", music / "a/zwei.flac");
    auto after = resolver.resolve(music.path());
    ASSERT_FALSE(after.reused_cache);
    ASSERT_TRUE(contains(after.files, (music / "a/zwei.flac").string()));
    ASSERT_FALSE(contains(after.files, (music / "a/two.flac").string()));

    ASSERT_TRUE(resolver.resolve(music.path()).reused_cache);
}

TEST_CASE(test_resolver_treats_bad_cache_as_miss) {
    TempDir music;
    TempDir cache;
    populate(music);

    FingerprintResolver resolver(cache.path());
    (void)resolver.resolve(music.path());

    write_file(resolver.digest_path(), "");
    ASSERT_FALSE(resolver.resolve(music.path()).reused_cache);

    write_file(resolver.digest_path(), "0123456789abcdef0123456789abcdef\n");
    ASSERT_FALSE(resolver.resolve(music.path()).reused_cache);

    std::filesystem::remove(resolver.files_path());
    ASSERT_FALSE(resolver.resolve(music.path()).reused_cache);
    ASSERT_TRUE(resolver.resolve(music.path()).reused_cache);
}

TEST_CASE(test_resolver_creates_cache_directory) {
    TempDir music;
    TempDir cache;
    populate(music);

    FingerprintResolver resolver(cache / "nested/dir");
    (void)resolver.resolve(music.path());
    ASSERT_TRUE(std::filesystem::exists(cache / "nested/dir/library.digest"));
}

int main() {
    return lorchestre::test::TestRunner::instance().run_all();
}
