#include "framework.hpp"

#include "../shared-libs/ConfigManager.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {
    const std::vector<std::string> TEST_KEYS = {"configVersion", "outputCase", "nodeSource", "orgId", "verbose", "bench"};

    const std::string DEFAULT_JSON =
        R"({"configVersion": "1.0", "outputCase": "lower", "nodeSource": "mac", "orgId": "", "verbose": false, "bench": 100000})";

    void writeFile(const fs::path& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
    }

    // directory temporanea cancellata alla fine del test
    struct TempDir {
        fs::path mPath;

        explicit TempDir(const std::string& name) : mPath(fs::temp_directory_path() / name) {
            fs::remove_all(mPath);
            fs::create_directories(mPath);
            writeFile(mPath / "default-config.json", DEFAULT_JSON);
        }
        ~TempDir() {
            std::error_code ec;
            fs::remove_all(mPath, ec);
        }

        std::string defaults() const { return (mPath / "default-config.json").string(); }
        std::string config() const { return (mPath / "config.json").string(); }
    };
}

void test_config_created_from_default() {
    TempDir dir("unik-config-created");

    ConfigManager config(dir.config(), TEST_KEYS, dir.defaults());

    ASSERT_TRUE(config.wasCreated());
    ASSERT_TRUE(fs::exists(dir.config()));
    ASSERT_EQ(config.getString("outputCase"), std::string("lower"));
    ASSERT_EQ(config.getLong("bench"), 100000LL);
    ASSERT_EQ(config.getInt("bench"), 100000);
    ASSERT_FALSE(config.getBool("verbose"));
    ASSERT_FALSE(config.hasKey("orgId"));
    ASSERT_TRUE(config.hasKey("nodeSource"));
}

void test_config_user_values() {
    TempDir dir("unik-config-user");
    writeFile(dir.config(),
        R"({"configVersion": "1.0", "outputCase": "upper", "nodeSource": "random", "orgId": "42", "verbose": true, "bench": 10})");

    ConfigManager config(dir.config(), TEST_KEYS, dir.defaults());

    ASSERT_FALSE(config.wasCreated());
    ASSERT_EQ(config.getString("outputCase"), std::string("upper"));
    ASSERT_EQ(config.getString("nodeSource"), std::string("random"));
    ASSERT_TRUE(config.hasKey("orgId"));
    ASSERT_EQ(config.getLong("orgId"), 42LL);
    ASSERT_TRUE(config.getBool("verbose"));
    ASSERT_THROWS(config.getBool("outputCase"), std::runtime_error);
    ASSERT_THROWS(config.getString("missing"), std::runtime_error);
}

void test_config_version_mismatch() {
    TempDir dir("unik-config-version");

    writeFile(dir.config(),
        R"({"configVersion": "0.9", "outputCase": "lower", "nodeSource": "mac", "orgId": "", "verbose": false, "bench": 1})");
    ASSERT_THROWS(ConfigManager(dir.config(), TEST_KEYS, dir.defaults()), std::runtime_error);

    writeFile(dir.config(),
        R"({"configVersion": "2.0", "outputCase": "lower", "nodeSource": "mac", "orgId": "", "verbose": false, "bench": 1})");
    ASSERT_THROWS(ConfigManager(dir.config(), TEST_KEYS, dir.defaults()), std::runtime_error);

    // confronto numerico: "1" e "1.0" sono la stessa versione
    writeFile(dir.config(),
        R"({"configVersion": "1", "outputCase": "lower", "nodeSource": "mac", "orgId": "", "verbose": false, "bench": 1})");
    ConfigManager sameVersion(dir.config(), TEST_KEYS, dir.defaults());
    ASSERT_EQ(sameVersion.getString("configVersion"), std::string("1"));
}

void test_config_invalid_files() {
    TempDir dir("unik-config-invalid");

    // chiave obbligatoria mancante
    writeFile(dir.config(), R"({"configVersion": "1.0", "outputCase": "lower"})");
    ASSERT_THROWS(ConfigManager(dir.config(), TEST_KEYS, dir.defaults()), std::runtime_error);

    writeFile(dir.config(), "{ non json");
    ASSERT_THROWS(ConfigManager(dir.config(), TEST_KEYS, dir.defaults()), std::runtime_error);

    // default assente
    ASSERT_THROWS(ConfigManager(dir.config(), TEST_KEYS, (dir.mPath / "missing.json").string()), std::runtime_error);
}

void test_config_numeric_errors() {
    TempDir dir("unik-config-numeric");
    writeFile(dir.config(),
        R"({"configVersion": "1.0", "outputCase": "lower", "nodeSource": "mac", "orgId": "abc", "verbose": false, "bench": "12x"})");

    ConfigManager config(dir.config(), TEST_KEYS, dir.defaults());

    // il messaggio nomina la chiave
    std::string message;
    try {
        config.getLong("orgId");
    } catch (const std::runtime_error& e) {
        message = e.what();
    }
    ASSERT_TRUE(message.find("'orgId'") != std::string::npos);
    ASSERT_THROWS(config.getLong("bench"), std::runtime_error);
    ASSERT_THROWS(config.getInt("bench"), std::runtime_error);

    writeFile(dir.config(),
        R"({"configVersion": "1.0", "outputCase": "lower", "nodeSource": "mac", "orgId": "99999999999999999999", "verbose": false, "bench": 4294967296})");
    ConfigManager large(dir.config(), TEST_KEYS, dir.defaults());
    ASSERT_THROWS(large.getLong("orgId"), std::runtime_error);
    ASSERT_EQ(large.getLong("bench"), 4294967296LL);
    ASSERT_THROWS(large.getInt("bench"), std::runtime_error);
}
