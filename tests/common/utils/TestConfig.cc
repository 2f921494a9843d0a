#include <folly/experimental/TestUtil.h>
#include <gtest/gtest.h>
#include <type_traits>

#include "common/utils/ConfigBase.h"
#include "common/utils/FileUtils.h"
#include "tests/GtestHelpers.h"

namespace ostmig::test {
namespace {

enum class Mode { Real, Local };

class Config : public ConfigBase<Config> {
  CONFIG_ITEM(name, "ing");
  CONFIG_ITEM(mode, Mode::Real);
  CONFIG_ITEM(threshold, -1l, ConfigCheckers::checkPercentage);
  CONFIG_SECT(sect, {
    CONFIG_ITEM(val, 100l, [](int64_t val) { return val < 200; });
    CONFIG_ITEM(score, 0.0);
    CONFIG_ITEM(ok, false);
    CONFIG_SECT(sub, { CONFIG_ITEM(path, "/mnt/fs", ConfigCheckers::checkNotEmpty); });
  });
  CONFIG_ITEM(targets, std::vector<std::string>({"1", "2"}));
};
static_assert(std::is_same_v<decltype(Config{}.name()), const std::string &>, "ok");
static_assert(std::is_same_v<decltype(Config{}.sect().val()), int64_t>, "ok");

class BigConfig : public ConfigBase<BigConfig> {
  CONFIG_OBJ(a, Config);
  CONFIG_OBJ(b, Config, [](Config &c) { c.set_name("replaced"); });
};

TEST(TestConfig, Normal) {
  Config cfg;
  ASSERT_EQ(cfg.name(), "ing");
  ASSERT_EQ(cfg.mode(), Mode::Real);
  ASSERT_EQ(cfg.sect().val(), 100);
  ASSERT_EQ(cfg.sect().sub().path(), "/mnt/fs");

  toml::table table = toml::parse(R"(
    mode = "Local"
    threshold = 50
    targets = ["3", "4", "5"]

    [sect]
    val = 123
    score = 1
    ok = true

    [sect.sub]
    path = "/lustre"
  )");
  ASSERT_OK(cfg.update(table));
  ASSERT_EQ(cfg.mode(), Mode::Local);
  ASSERT_EQ(cfg.threshold(), 50);
  ASSERT_EQ(cfg.targets(), (std::vector<std::string>{"3", "4", "5"}));
  ASSERT_EQ(cfg.sect().val(), 123);
  ASSERT_EQ(cfg.sect().score(), 1.0);
  ASSERT_TRUE(cfg.sect().ok());
  ASSERT_EQ(cfg.sect().sub().path(), "/lustre");
  ASSERT_OK(cfg.validate());
}

TEST(TestConfig, Checker) {
  Config cfg;
  // unset threshold keeps the invalid default
  ASSERT_ERROR(cfg.validate(), StatusCode::kConfigValidateFailed);
  ASSERT_TRUE(cfg.set_threshold(80));
  ASSERT_OK(cfg.validate());

  ASSERT_FALSE(cfg.set_threshold(101));
  ASSERT_EQ(cfg.threshold(), 80);
  ASSERT_ERROR(cfg.update(toml::parse("threshold = 101")), StatusCode::kConfigValidateFailed);
  ASSERT_ERROR(cfg.update(toml::parse("[sect]\nval = 200")), StatusCode::kConfigValidateFailed);
  ASSERT_ERROR(cfg.update(toml::parse("[sect.sub]\npath = \"\"")), StatusCode::kConfigValidateFailed);
  ASSERT_EQ(cfg.sect().val(), 100);
}

TEST(TestConfig, InvalidInput) {
  Config cfg;
  ASSERT_ERROR(cfg.update(toml::parse("unknown = 1")), StatusCode::kConfigRedundantKey);
  ASSERT_ERROR(cfg.update(toml::parse("sect = 1")), StatusCode::kConfigInvalidType);
  ASSERT_ERROR(cfg.update(toml::parse("mode = \"Remote\"")), StatusCode::kConfigUpdateFailed);
  ASSERT_ERROR(cfg.update(toml::parse("[sect]\nok = 1")), StatusCode::kConfigUpdateFailed);
  ASSERT_ERROR(cfg.update(std::string_view("name = ")), StatusCode::kConfigParseError);
}

TEST(TestConfig, LaterUpdateWins) {
  Config cfg;
  ASSERT_OK(cfg.update(toml::parse("threshold = 10\nname = \"file\"\ntargets = [\"7\"]")));
  // overrides from the command line are applied after the config file
  ASSERT_OK(cfg.update(std::vector<config::KeyValue>{{"threshold", "20"}}));
  ASSERT_EQ(cfg.threshold(), 20);
  ASSERT_EQ(cfg.name(), "file");
  ASSERT_EQ(cfg.targets(), (std::vector<std::string>{"7"}));
  ASSERT_OK(cfg.update(toml::parse("[sect]\nval = 150")));
  ASSERT_EQ(cfg.sect().val(), 150);
  ASSERT_EQ(cfg.threshold(), 20);
}

TEST(TestConfig, KeyValues) {
  BigConfig cfg;
  ASSERT_EQ(cfg.a().name(), "ing");
  ASSERT_EQ(cfg.b().name(), "replaced");

  std::vector<config::KeyValue> updates = {
      {"a.name", "flag value"},
      {"b.threshold", "30"},
      {"b.sect.sub.path", "/mnt/other"},
      {"a.mode", "Local"},
  };
  ASSERT_OK(cfg.update(updates));
  ASSERT_EQ(cfg.a().name(), "flag value");
  ASSERT_EQ(cfg.a().mode(), Mode::Local);
  ASSERT_EQ(cfg.b().threshold(), 30);
  ASSERT_EQ(cfg.b().sect().sub().path(), "/mnt/other");

  ASSERT_ERROR(cfg.update(std::vector<config::KeyValue>{{"c.name", "x"}}), StatusCode::kConfigKeyNotFound);
  ASSERT_ERROR(cfg.update(std::vector<config::KeyValue>{{"a.threshold", "x"}}),
               StatusCode::kConfigParseError);
}

TEST(TestConfig, ParseFlags) {
  std::string a0 = "prog", a1 = "--config.a.name=foo", a2 = "--other", a3 = "--config.b.threshold", a4 = "20";
  char *argv[] = {a0.data(), a1.data(), a2.data(), a3.data(), a4.data()};
  int argc = 5;
  auto result = config::parseFlags("--config.", argc, argv);
  ASSERT_OK(result);
  ASSERT_EQ(argc, 2);
  ASSERT_STREQ(argv[1], "--other");
  ASSERT_EQ(result->size(), 2u);
  ASSERT_EQ((*result)[0], config::KeyValue("a.name", "foo"));
  ASSERT_EQ((*result)[1], config::KeyValue("b.threshold", "20"));

  std::string b1 = "--config.a.name";
  char *bad[] = {a0.data(), b1.data()};
  argc = 2;
  ASSERT_ERROR(config::parseFlags("--config.", argc, bad), StatusCode::kInvalidArg);
}

TEST(TestConfig, ToStringAndFile) {
  Config cfg;
  ASSERT_TRUE(cfg.set_threshold(70));
  ASSERT_TRUE(cfg.set_mode(Mode::Local));

  folly::test::TemporaryDirectory tmp;
  Path file = Path(tmp.path().string()) / "cfg.toml";
  ASSERT_OK(storeToFile(file, cfg.toString()));

  Config loaded;
  ASSERT_OK(loaded.update(file));
  ASSERT_EQ(loaded.threshold(), 70);
  ASSERT_EQ(loaded.mode(), Mode::Local);
  ASSERT_EQ(loaded.toString(), cfg.toString());

  ASSERT_ERROR(loaded.update(Path(tmp.path().string()) / "missing.toml"), StatusCode::kConfigInvalidValue);
}

}  // namespace
}  // namespace ostmig::test
