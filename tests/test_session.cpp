#include <catch2/catch.hpp>

#include "config.hpp"
#include "crypto.hpp"
#include "editors.hpp"
#include "host_io.hpp"
#include "sample_save.hpp"
#include "session.hpp"
#include <cstdio>
#include <map>
#include <stdexcept>

namespace {

class MemoryHost : public FileHost {
public:
    std::map<std::string, std::string> files;
    int writes = 0;

    std::string read_text(const std::string& path) override {
        auto it = files.find(path);
        if (it == files.end()) throw std::runtime_error("cannot open: " + path);
        return it->second;
    }
    void write_text(const std::string& path, const std::string& data) override {
        ++writes;
        files[path] = data;
    }
    std::string copy_file(const std::string& path) override {
        std::string dest = path + ".bak";
        files[dest] = read_text(path);
        return dest;
    }
};

std::string temp_path(const char* name){
    return std::string(P_tmpdir) + "/vaultedit_test_" + name;
}

} // namespace

TEST_CASE("SaveDocument parse keeps key order and rejects bad JSON")
{
    SaveDocument doc = SaveDocument::parse(" {\"z\":1,\"a\":[true,null,\"s/t\"],\"m\":{\"k\":2.50}}\n");
    CHECK(doc.serialize() == "{\"z\":1,\"a\":[true,null,\"s/t\"],\"m\":{\"k\":2.50}}");

    CHECK_THROWS_AS(SaveDocument::parse(""), ParseError);
    CHECK_THROWS_AS(SaveDocument::parse("{\"a\":"), ParseError);
    CHECK_THROWS_AS(SaveDocument::parse("{\"a\":1} trailing"), ParseError);
    CHECK_THROWS_AS(SaveDocument::parse("{'a':1}"), ParseError);
    CHECK_NOTHROW(SaveDocument::parse("42"));
}

TEST_CASE("deeply nested JSON is not a parse error")
{
    std::string text;
    for (int i = 0; i < 40; ++i) text += "{\"n\":";
    text += "1";
    text += std::string(40, '}');

    SaveDocument doc = SaveDocument::parse(text);
    CHECK(doc.serialize() == text);
}

TEST_CASE("pretty output parses back to the same document")
{
    SaveDocument doc = SaveDocument::parse(sample_save_json());
    std::string pretty = doc.pretty();
    CHECK(pretty.find('\n') != std::string::npos);
    CHECK(SaveDocument::parse(pretty).serialize() == doc.serialize());
}

TEST_CASE("session edits round trip through the cipher")
{
    EditSession session;
    CHECK_FALSE(session.has_document());
    CHECK_THROWS_AS(session.document(), std::logic_error);

    session.open_text(encrypt_save(sample_save_json()), "Vault1.sav");
    CHECK(session.origin() == "Vault1.sav");
    CHECK_FALSE(session.modified());

    session.mark_modified(max_all_resources(session.document()));
    CHECK(session.modified());

    std::string cipher = session.save_text();
    CHECK_FALSE(session.modified());

    EditSession reopened;
    reopened.open_text(cipher);
    REQUIRE(read_resource(reopened.document(), "caps").has_value());
    CHECK(*read_resource(reopened.document(), "caps") == 999999);
    CHECK(reopened.document().serialize() == session.document().serialize());
}

TEST_CASE("mark_modified ignores empty batches")
{
    EditSession session;
    session.open_json("{}");
    session.mark_modified(0);
    CHECK_FALSE(session.modified());
}

TEST_CASE("failed loads keep the open document")
{
    EditSession session;
    session.open_json("{\"keep\":true}", "a.sav");

    CHECK_THROWS_AS(session.open_text("not-base64!!", "b.sav"), DecodeError);
    CHECK_THROWS_AS(session.open_text(encrypt_save("{broken"), "c.sav"), ParseError);
    CHECK(session.origin() == "a.sav");
    CHECK(session.document().serialize() == "{\"keep\":true}");
}

TEST_CASE("file operations go through the host")
{
    MemoryHost host;
    host.files["Vault1.sav"] = encrypt_save(sample_save_json()) + "\n";

    EditSession session;
    session.open_file(host, "Vault1.sav");
    CHECK(resident_count(session.document()) == 2);

    CHECK(session.backup(host) == "Vault1.sav.bak");
    session.mark_modified(max_all_residents(session.document()));
    CHECK(session.save_file(host) == "Vault1.sav");
    CHECK(session.save_file(host, "Vault2.sav") == "Vault2.sav");
    CHECK(host.files["Vault1.sav"] == host.files["Vault2.sav"]);
    CHECK(host.files["Vault1.sav.bak"] == encrypt_save(sample_save_json()) + "\n");

    EditSession check;
    check.open_file(host, "Vault2.sav");
    CHECK(read_resident(resident_at(check.document(), 1)).level == 50.0);
}

TEST_CASE("save without a destination writes nothing")
{
    MemoryHost host;
    EditSession session;
    session.open_json("{}");
    CHECK_THROWS_AS(session.save_file(host), std::logic_error);
    CHECK_THROWS_AS(session.backup(host), std::logic_error);
    CHECK(host.writes == 0);
}

TEST_CASE("backup names carry a timestamp")
{
    std::tm tm{};
    tm.tm_year = 2024 - 1900; tm.tm_mon = 2; tm.tm_mday = 7;
    tm.tm_hour = 9; tm.tm_min = 5; tm.tm_sec = 3; tm.tm_isdst = -1;
    CHECK(backup_path_for("saves/Vault1.sav", std::mktime(&tm)) == "saves/Vault1.sav.backup_20240307_090503");
}

TEST_CASE("local host reads, writes and copies files")
{
    LocalFileHost host;
    const std::string path = temp_path("local.sav");
    host.write_text(path, "payload");
    CHECK(host.read_text(path) == "payload");

    std::string copy = host.copy_file(path);
    CHECK(copy.rfind(path + ".backup_", 0) == 0);
    CHECK(host.read_text(copy) == "payload");

    std::remove(copy.c_str());
    std::remove(path.c_str());
    CHECK_THROWS_AS(host.read_text(path), std::runtime_error);
}

TEST_CASE("config loads with defaults for missing keys")
{
    LocalFileHost host;
    const std::string path = temp_path("config.json");

    host.write_text(path, "{\"backup_before_save\":false,\"verbose\":2}");
    EditorCfg cfg = load_cfg(path);
    CHECK_FALSE(cfg.backup_before_save);
    CHECK(cfg.pretty_indent_export);
    CHECK(cfg.verbose == 2);

    host.write_text(path, "{\"verbose\":7}");
    CHECK_THROWS_AS(load_cfg(path), std::runtime_error);
    host.write_text(path, "not json");
    CHECK_THROWS_AS(load_cfg(path), std::runtime_error);

    std::remove(path.c_str());
    CHECK_THROWS_AS(load_cfg(path), std::runtime_error);
    CHECK(load_cfg_if_present(path).backup_before_save);
}
