#include "support/fakes.hpp"

#include "updatechecker/detail/curl_utils.hpp"
#include "updatechecker/detail/string_utils.hpp"
#include "updatechecker/file_hash.hpp"
#include "updatechecker/file_replacer.hpp"
#include "updatechecker/launcher.hpp"
#include "updatechecker/process_manager.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <unistd.h>

using namespace updatechecker;
using namespace updatechecker::test;

TEST(StringUtils, TrimLowerAndParse) {
    EXPECT_EQ(detail::trim("  \tvalue\r\n"), "value");
    EXPECT_EQ(detail::toLower("ETag"), "etag");
    EXPECT_EQ(detail::parseUnsigned(" 1234 "), std::optional<std::uint64_t>(1234));
    EXPECT_FALSE(detail::parseUnsigned("12a"));
    EXPECT_FALSE(detail::parseUnsigned("-1"));
    EXPECT_EQ(detail::firstToken("  d41d8cd98f00b204  file.bin\n"), "d41d8cd98f00b204");
    EXPECT_EQ(detail::firstToken("   "), "");
}

TEST(ResponseHeaders, ParsesIdentityHeaders) {
    detail::ResponseHeaders headers;
    headers.consumeLine("HTTP/1.1 200 OK\r\n");
    headers.consumeLine("ETag: \"abc\"\r\n");
    headers.consumeLine("last-modified: Wed, 21 Oct 2015 07:28:00 GMT\r\n");
    headers.consumeLine("Content-Length: 2048\r\n");
    headers.consumeLine("Accept-Ranges: bytes\r\n");
    headers.consumeLine("\r\n");

    EXPECT_EQ(headers.etag, std::optional<std::string>("\"abc\""));
    EXPECT_EQ(headers.last_modified, std::optional<std::string>("Wed, 21 Oct 2015 07:28:00 GMT"));
    EXPECT_EQ(headers.content_length, std::optional<std::uint64_t>(2048));
    EXPECT_TRUE(headers.accepts_ranges);
}

TEST(ResponseHeaders, RedirectResetsState) {
    detail::ResponseHeaders headers;
    headers.consumeLine("HTTP/1.1 302 Found\r\n");
    headers.consumeLine("Content-Length: 12\r\n");
    headers.consumeLine("ETag: redirect\r\n");
    headers.consumeLine("HTTP/2 206\r\n");
    headers.consumeLine("content-range: bytes 0-9/100\r\n");

    EXPECT_FALSE(headers.etag);
    EXPECT_FALSE(headers.content_length);
    EXPECT_EQ(headers.content_range, std::optional<std::string>("bytes 0-9/100"));
    EXPECT_FALSE(headers.accepts_ranges);
}

TEST(FileHash, Md5OfKnownInputs) {
    EXPECT_EQ(md5Hex(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(md5Hex("abc"), "900150983cd24fb0d6963f7d28e17f72");

    TempDir dir;
    writeFile(dir / "abc.txt", "abc");
    EXPECT_EQ(md5File(dir / "abc.txt"), std::optional<std::string>("900150983cd24fb0d6963f7d28e17f72"));
    EXPECT_FALSE(md5File(dir / "missing.txt"));
}

TEST(FileReplacer, BackupReplacesOlderBackup) {
    TempDir dir;
    writeFile(dir / "app", "current");
    writeFile(dir / "app.bak", "ancient");

    FilesystemReplacer replacer;
    EXPECT_FALSE(replacer.backup(dir / "app", dir / "app.bak"));
    EXPECT_FALSE(fs::exists(dir / "app"));
    EXPECT_EQ(readFile(dir / "app.bak"), "current");
}

TEST(FileReplacer, RestoreAndMoveIntoPlace) {
    TempDir dir;
    writeFile(dir / "app.bak", "old");
    writeFile(dir / "app", "broken");

    FilesystemReplacer replacer;
    EXPECT_FALSE(replacer.restore(dir / "app.bak", dir / "app"));
    EXPECT_EQ(readFile(dir / "app"), "old");

    writeFile(dir / "staged", "new");
    EXPECT_FALSE(replacer.moveIntoPlace(dir / "staged", dir / "sub" / "app"));
    EXPECT_EQ(readFile(dir / "sub" / "app"), "new");
    EXPECT_FALSE(fs::exists(dir / "staged"));
}

TEST(FileReplacer, MissingTargetIsAnError) {
    TempDir dir;
    FilesystemReplacer replacer;
    const auto ec = replacer.backup(dir / "nothing", dir / "nothing.bak");
    EXPECT_TRUE(ec);
    EXPECT_FALSE(isLockError(ec));
}

TEST(FileReplacer, ClassifiesLockErrors) {
    EXPECT_TRUE(isLockError(std::make_error_code(std::errc::permission_denied)));
    EXPECT_TRUE(isLockError(std::make_error_code(std::errc::text_file_busy)));
    EXPECT_FALSE(isLockError(std::make_error_code(std::errc::no_such_file_or_directory)));
}

TEST(Launcher, BuildsBackgroundCommandLine) {
    EXPECT_EQ(ShellLauncher::buildCommandLine("/opt/app/run", "--fast"), "/opt/app/run --fast &");
    EXPECT_EQ(ShellLauncher::buildCommandLine("/opt/app/run", ""), "/opt/app/run &");
}

TEST(ProcessManager, NormalizesCommandLineArguments) {
    EXPECT_EQ(normalizeCommandLineArgument("C:\\Games\\Tool.EXE"), "c:/games/tool.exe");
    EXPECT_EQ(normalizeCommandLineArgument("/usr/bin/tool/"), "usr/bin/tool");
    EXPECT_EQ(normalizeCommandLineArgument("///"), "");
}

TEST(ProcessManager, FindsOwnProcessByExecutable) {
    const fs::path self = fs::read_symlink("/proc/self/exe");
    ProcfsProcessManager manager;

    ProcessQuery query;
    query.exe_path = self.string();
    const auto matches = manager.findProcesses(query);
    const bool found = std::any_of(matches.begin(), matches.end(),
                                   [](const ProcessInfo& p) { return p.pid == ::getpid(); });
    EXPECT_TRUE(found);
}

TEST(ProcessManager, UnmatchedNameFindsNothing) {
    ProcfsProcessManager manager;
    ProcessQuery query;
    query.name = "no-such-process-name-xyz";
    EXPECT_TRUE(manager.findProcesses(query).empty());
}
