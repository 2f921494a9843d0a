#include "common/utils/ConfigBase.h"

#include <boost/filesystem.hpp>
#include <fmt/format.h>
#include <folly/init/Init.h>
#include <folly/logging/xlog.h>
#include <gflags/gflags.h>
#include <iostream>

DEFINE_string(cfg, "", "Path to .toml config file");
DEFINE_bool(dump_cfg, false, "Dump current config to stdout");
DEFINE_bool(dump_default_cfg, false, "Dump default config to stdout");

namespace ostmig::config {
namespace {

Result<Void> updateItemFromString(IItem &item, const std::string &key, std::string_view value) {
  auto toml = item.isParsedFromString() ? fmt::format(R"(v = """{}""")", value) : fmt::format("v = {}", value);

  toml::table parsed;
  try {
    parsed = toml::parse(toml);
  } catch (const toml::parse_error &e) {
    std::stringstream ss;
    ss << e;
    XLOGF(ERR, "Parse toml {} failed: {}", toml, ss.str());
    return makeError(StatusCode::kConfigParseError, ss.str());
  } catch (std::exception &e) {
    XLOGF(ERR, "Parse toml {} failed: {}", toml, e.what());
    return makeError(StatusCode::kConfigInvalidValue, e.what());
  }

  auto updateResult = item.update(*parsed["v"].node(), key);
  if (UNLIKELY(!updateResult)) {
    XLOGF(ERR, "Load config from toml {} failed: {}", toml, updateResult.error());
    return makeError(StatusCode::kConfigInvalidValue, updateResult.error().describe());
  }
  return Void{};
}

}  // namespace

Result<std::vector<KeyValue>> parseFlags(std::string_view prefix, int &argc, char *argv[]) {
  std::vector<KeyValue> result;

  int cnt = argc;
  argc = 1;
  for (int i = 1; i < cnt; ++i) {
    // parse key.
    std::string_view key = argv[i];
    if (!key.starts_with(prefix)) {
      argv[argc++] = argv[i];
      continue;
    }
    key.remove_prefix(prefix.size());

    // parse value.
    auto pos = key.find('=');
    std::string_view value;
    if (pos == std::string_view::npos) {
      if (i + 1 < cnt) {
        value = argv[++i];
      } else {
        return makeError(StatusCode::kInvalidArg, fmt::format("No value for config key {}", key));
      }
    } else {
      value = key.substr(pos + 1);
      key = key.substr(0, pos);
    }

    result.emplace_back(key, value);
  }

  return result;
}

Result<Void> IConfig::init(int *argc, char ***argv, bool follyInit /* = true */) {
  constexpr std::string_view configPrefix = "--config.";
  // 1. parse command line flags.
  auto parseFlagsResult = parseFlags(configPrefix, *argc, *argv);
  if (UNLIKELY(!parseFlagsResult)) {
    XLOGF(ERR, "Parse config from command line flags failed: {}", parseFlagsResult.error());
    return makeError(StatusCode::kConfigInvalidValue);
  }
  if (follyInit) {
    folly::init(argc, argv);
  }
  if (FLAGS_dump_default_cfg) {
    std::cout << toString() << std::endl;
    exit(0);
  }

  // 2. load config from toml file.
  if (!FLAGS_cfg.empty()) {
    RETURN_ON_ERROR(update(Path(FLAGS_cfg)));
  }

  // 3. load config from command line flags.
  RETURN_ON_ERROR(update(parseFlagsResult.value()));

  // 4. validate config.
  auto validateResult = validate();
  if (UNLIKELY(!validateResult)) {
    XLOGF(ERR, "Check config failed: {}", validateResult.error());
    RETURN_ERROR(validateResult);
  }

  if (FLAGS_dump_cfg) {
    std::cout << toString() << std::endl;
    exit(0);
  }
  return Void{};
}

Result<Void> IConfig::update(std::string_view str) {
  try {
    auto table = toml::parse(str);
    return update(table);
  } catch (const toml::parse_error &e) {
    std::stringstream ss;
    ss << e;
    XLOGF(ERR, "Parse config failed: {}", ss.str());
    return makeError(StatusCode::kConfigParseError, ss.str());
  } catch (std::exception &e) {
    XLOGF(ERR, "Parse config failed: {}", e.what());
    return makeError(StatusCode::kInvalidArg, e.what());
  }
}

Result<Void> IConfig::update(const Path &path) {
  if (UNLIKELY(!boost::filesystem::exists(path))) {
    auto msg = fmt::format("Config file {} not found", path);
    XLOG(ERR, msg);
    return makeError(StatusCode::kConfigInvalidValue, std::move(msg));
  }
  try {
    auto table = toml::parse_file(path.string());
    return update(table);
  } catch (const toml::parse_error &e) {
    std::stringstream ss;
    ss << e;
    XLOGF(ERR, "Parse config file [{}] failed: {}", path, ss.str());
    return makeError(StatusCode::kConfigParseError, ss.str());
  } catch (std::exception &e) {
    XLOGF(ERR, "Parse config file [{}] failed: {}", path, e.what());
    return makeError(StatusCode::kInvalidArg, e.what());
  }
}

Result<Void> IConfig::update(const std::vector<KeyValue> &updates) {
  for (auto &[key, value] : updates) {
    auto findResult = find(key);
    if (UNLIKELY(!findResult)) {
      XLOGF(ERR, "Item {} is not found: {}", key, findResult.error());
      return makeError(StatusCode::kConfigKeyNotFound, key);
    }
    RETURN_ON_ERROR(updateItemFromString(*findResult.value(), key, value));
  }
  return Void{};
}

}  // namespace ostmig::config
