#include "TempTree.hpp"
#include "config/Config.hpp"

#include <map>

using namespace dp::config;

class ConfigTest : public TempTreeTest {
protected:
    Config validConfig() const {
        Config cfg;
        cfg.file_roots.push_back({"/docs", mkdir("docs").string()});
        return cfg;
    }
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    const auto cfg = loadConfig(test_dir / "absent.yaml");
    EXPECT_EQ(cfg.main.listen, "127.0.0.1");
    EXPECT_EQ(cfg.main.port, 3000);
    EXPECT_EQ(cfg.log.level, "info");
    EXPECT_EQ(cfg.log.format, "text");
    EXPECT_TRUE(cfg.log.file.empty());
    EXPECT_TRUE(cfg.file_roots.empty());
}

TEST_F(ConfigTest, ParsesYaml) {
    const auto cfg = parseConfig(R"(
main:
  listen: 0.0.0.0
  port: 8080
  worker_threads: 2
log:
  file: "-"
  level: debug
  format: json
file_roots:
  - virtual: /docs
    source: /srv/docs
  - "/media:/srv/media"
)");
    EXPECT_EQ(cfg.main.listen, "0.0.0.0");
    EXPECT_EQ(cfg.main.port, 8080);
    EXPECT_EQ(cfg.main.worker_threads, 2u);
    EXPECT_EQ(cfg.main.request_timeout_ms, 30000u);
    EXPECT_EQ(cfg.log.file, "-");
    EXPECT_EQ(cfg.log.level, "debug");
    EXPECT_EQ(cfg.log.format, "json");
    ASSERT_EQ(cfg.file_roots.size(), 2u);
    EXPECT_EQ(cfg.file_roots[0].virtual_root, "/docs");
    EXPECT_EQ(cfg.file_roots[0].source, "/srv/docs");
    EXPECT_EQ(cfg.file_roots[1].virtual_root, "/media");
    EXPECT_EQ(cfg.file_roots[1].source, "/srv/media");
}

TEST_F(ConfigTest, LoadsFromFile) {
    const auto path = write("dendrite.yaml", "main:\n  port: 4000\nfile-root: /a:/srv/a,/b:/srv/b\n");
    const auto cfg = loadConfig(path);
    EXPECT_EQ(cfg.main.port, 4000);
    ASSERT_EQ(cfg.file_roots.size(), 2u);
    EXPECT_EQ(cfg.file_roots[1].virtual_root, "/b");
}

TEST_F(ConfigTest, MalformedYamlThrows) {
    EXPECT_THROW(parseConfig("main: [unterminated"), std::runtime_error);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    auto cfg = parseConfig("main:\n  port: 4000\n  listen: 10.0.0.1\n");
    const std::map<std::string, std::string> env{
        {"DENDRITE_MAIN_PORT", "5000"},
        {"DENDRITE_LOG_LEVEL", "warn"},
        {"DENDRITE_FILE_ROOT", "/x:/srv/x"},
    };
    applyEnvironment(cfg, [&env](const char* name) -> const char* {
        const auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    });

    EXPECT_EQ(cfg.main.port, 5000);
    EXPECT_EQ(cfg.main.listen, "10.0.0.1");
    EXPECT_EQ(cfg.log.level, "warn");
    ASSERT_EQ(cfg.file_roots.size(), 1u);
    EXPECT_EQ(cfg.file_roots[0].virtual_root, "/x");
}

TEST_F(ConfigTest, InvalidEnvironmentPortThrows) {
    Config cfg;
    EXPECT_THROW(applyEnvironment(cfg, [](const char* name) -> const char* {
        return std::string(name) == "DENDRITE_MAIN_PORT" ? "80a" : nullptr;
    }), std::invalid_argument);
}

TEST_F(ConfigTest, FileRootDefinitions) {
    const auto roots = parseFileRootDefinitions({"/a:/srv/a,/b:/srv/b", "/c:/srv/c"});
    ASSERT_EQ(roots.size(), 3u);
    EXPECT_EQ(roots[2].virtual_root, "/c");
    EXPECT_EQ(roots[2].source, "/srv/c");

    EXPECT_THROW(parseFileRootDefinitions({""}), std::invalid_argument);
    EXPECT_THROW(parseFileRootDefinitions({"/a"}), std::invalid_argument);
    EXPECT_THROW(parseFileRootDefinitions({":/srv"}), std::invalid_argument);
    EXPECT_THROW(parseFileRootDefinitions({"/a:"}), std::invalid_argument);
    EXPECT_THROW(parseFileRootDefinitions({"/a:/srv/a,"}), std::invalid_argument);
}

TEST_F(ConfigTest, ValidConfigPasses) {
    EXPECT_NO_THROW(validate(validConfig()));
}

TEST_F(ConfigTest, ValidationRejectsBadMainAndLogSettings) {
    auto cfg = validConfig();
    cfg.main.listen = "not-an-ip";
    EXPECT_THROW(validate(cfg), std::invalid_argument);

    cfg = validConfig();
    cfg.main.port = 0;
    EXPECT_THROW(validate(cfg), std::invalid_argument);
    cfg.main.port = 65536;
    EXPECT_THROW(validate(cfg), std::invalid_argument);

    cfg = validConfig();
    cfg.log.level = "verbose";
    EXPECT_THROW(validate(cfg), std::invalid_argument);
    cfg.log.level = "DEBUG";
    EXPECT_NO_THROW(validate(cfg));

    cfg = validConfig();
    cfg.log.format = "xml";
    EXPECT_THROW(validate(cfg), std::invalid_argument);
}

TEST_F(ConfigTest, ValidationRejectsBadFileRoots) {
    const auto docs = mkdir("docs").string();
    const auto file = write("plain.txt").string();

    const auto rejects = [&](const std::vector<FileRootConfig>& roots) {
        Config cfg;
        cfg.file_roots = roots;
        EXPECT_THROW(validate(cfg), std::invalid_argument);
    };

    rejects({});
    rejects({{" /docs", docs}});
    rejects({{"docs", docs}});
    rejects({{"/a/b", docs}});
    rejects({{"/docs", "relative/path"}});
    rejects({{"/docs", (test_dir / "missing").string()}});
    rejects({{"/docs", file}});
    rejects({{"/docs", docs}, {"/docs", docs}});
}
