#pragma once

#include <fmt/format.h>
#include <folly/Likely.h>
#include <functional>
#include <gflags/gflags_declare.h>
#include <magic_enum.hpp>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <toml++/toml.hpp>
#include <type_traits>
#include <utility>
#include <vector>

#include "common/utils/Path.h"
#include "common/utils/Result.h"
#include "common/utils/TypeTraits.h"

DECLARE_string(cfg);

namespace ostmig {

/*
 * ConfigBase class with macro.
 * The supported value types:
 *  - std::string
 *  - int64_t
 *  - double
 *  - bool
 *  - enum
 *  - types constructible from std::string which provide `toString()`
 *  - std::vector of above types, or of other configs
 */

#define CONFIG_OBJ(name, cls, ...) /* optional parameter: initializer */                                      \
 public:                                                                                                      \
  cls &name() { return name##_; }                                                                             \
  const cls &name() const { return name##_; }                                                                 \
                                                                                                              \
 private:                                                                                                     \
  cls name##_;                                                                                                \
  [[maybe_unused]] bool name##Insert_ = [this]() {                                                            \
    using Self = std::decay_t<decltype(*this)>;                                                               \
    ConfigBase<Self>::sections_[#name] = reinterpret_cast<::ostmig::config::IConfig Self::*>(&Self::name##_); \
    __VA_OPT__(__VA_ARGS__(name##_);)                                                                         \
    return true;                                                                                              \
  }()

#define CONFIG_SECT(name, section)                     \
 protected:                                            \
  struct T##name : public ConfigBase<T##name> section; \
  CONFIG_OBJ(name, T##name)

#define CONFIG_ITEM(name, defaultValue, ...) /* optional parameter: checker */                                   \
 private:                                                                                                     \
  using T##name = ::ostmig::config::ValueType<std::decay_t<decltype(defaultValue)>>;                          \
  using R##name = ::ostmig::config::ReturnType<T##name>;                                                      \
                                                                                                              \
 public:                                                                                                      \
  R##name name() const { return name##_.value(); }                                                            \
  bool set_##name(R##name value) { return name##_.checkAndSet(value); }                                       \
                                                                                                              \
 private:                                                                                                     \
  ::ostmig::config::Item<T##name> name##_ =                                                                   \
      ::ostmig::config::Item<T##name>(#name, defaultValue __VA_OPT__(, ) __VA_ARGS__);                        \
  [[maybe_unused]] bool name##Insert_ = [this]() {                                                            \
    using Self = std::decay_t<decltype(*this)>;                                                               \
    ConfigBase<Self>::items_[#name] = reinterpret_cast<::ostmig::config::IItem Self::*>(&Self::name##_);      \
    return true;                                                                                              \
  }()

namespace config {

struct IItem {
  virtual ~IItem() = default;
  virtual Result<Void> validate(const std::string &path) const = 0;
  virtual Result<Void> update(const toml::node &node, const std::string &path) = 0;
  virtual void toToml(toml::table &table) const = 0;
  virtual bool isParsedFromString() const = 0;
};

using KeyValue = std::pair<std::string, std::string>;

inline std::string tomlToString(const toml::node &node) {
  std::stringstream ss;
  ss << toml::toml_formatter(node, toml::toml_formatter::default_flags & ~toml::format_flags::indentation);
  return ss.str();
}

struct IConfig {
  virtual ~IConfig() = default;

  // validate configuration items one by one.
  virtual Result<Void> validate(const std::string &path = {}) const = 0;

  // validate configuration items as a whole.
  virtual Result<Void> overallValidate() const { return Void{}; }

  // update configuration.
  virtual Result<Void> update(const toml::table &table, const std::string &path = {}) = 0;

  // update configuration from a string.
  Result<Void> update(std::string_view str);

  // update configuration from a file.
  Result<Void> update(const Path &path);

  // update configuration from a series of key-values, e.g. parsed from `--config.a.b=c`.
  Result<Void> update(const std::vector<KeyValue> &updates);

  // convert configuration to TOML.
  virtual toml::table toToml() const = 0;

  // find item by a dotted key.
  virtual Result<IItem *> find(std::string_view key) = 0;

  // convert configuration to string.
  std::string toString() const { return tomlToString(toToml()); }

  // initialize config from command line and config files.
  Result<Void> init(int *argc, char ***argv, bool follyInit = true);
};

template <class T>
struct ConfigValueToTomlNode {
  template <class V>
  auto operator()(V &&v) {
    if constexpr (std::is_enum_v<T>) {
      return std::string(magic_enum::enum_name(std::forward<V>(v)));
    } else if constexpr (std::is_same_v<T, uint64_t>) {
      return static_cast<int64_t>(v);
    } else if constexpr (std::is_same_v<T, Path>) {
      return v.string();
    } else if constexpr (std::derived_from<T, IConfig>) {
      return v.toToml();
    } else if constexpr (requires { std::string(v.toString()); }) {
      return std::string(v.toString());
    } else {
      return std::forward<V>(v);
    }
  }
};

Result<std::vector<KeyValue>> parseFlags(std::string_view prefix, int &argc, char *argv[]);

template <class T>
using RemoveOptional = typename std::conditional_t<is_optional_v<T>, T, std::optional<T>>::value_type;
template <class T>
inline constexpr bool IsPrimitive = std::is_trivially_copyable_v<T> && sizeof(T) <= 8;
template <class T>
using ReturnType = std::conditional_t<IsPrimitive<T>, T, const T &>;
template <class T>
using ValueType = std::conditional_t<std::is_same_v<T, const char *>, std::string, T>;

template <typename T>
inline Result<T> tomlNodeToValue(const toml::node &node) {
  return node.visit([&](auto &&el) -> Result<T> {
    using TE = std::decay_t<decltype(el)>;
    if constexpr (!toml::is_value<TE>) {
      return makeError(StatusCode::kConfigInvalidType, fmt::format("{} isn't value", typeid(TE).name()));
    } else {
      using E = typename TE::value_type;

      if constexpr (std::is_same_v<T, E>) {
        return *el;
      } else if constexpr (std::is_same_v<T, bool>) {
        // do not allow any implicit conversion to bool
        return makeError(StatusCode::kConfigInvalidType,
                         fmt::format("implicit conversion from {} to bool is not allowed", typeid(E).name()));
      } else if constexpr (std::is_floating_point_v<T>) {
        if constexpr (std::is_same_v<E, int64_t> || std::is_floating_point_v<E>) {
          return static_cast<T>(*el);
        } else {
          return makeError(StatusCode::kConfigInvalidType,
                           fmt::format("{} is not int64_t or floating types", typeid(E).name()));
        }
      } else if constexpr (std::is_integral_v<T>) {
        if constexpr (std::is_same_v<E, int64_t>) {
          return static_cast<T>(*el);
        } else {
          return makeError(StatusCode::kConfigInvalidType, fmt::format("{} is not int64_t", typeid(E).name()));
        }
      } else if constexpr (std::is_enum_v<T>) {
        if constexpr (std::is_same_v<E, std::string>) {
          auto opt = magic_enum::enum_cast<T>(*el);
          if (opt) {
            return opt.value();
          } else {
            return makeError(StatusCode::kConfigInvalidValue, fmt::format("Value {}", *el));
          }
        } else {
          return makeError(StatusCode::kConfigInvalidType,
                           fmt::format("{} is enum but {} is not string", typeid(T).name(), typeid(E).name()));
        }
      } else if constexpr (std::is_constructible_v<T, E>) {
        try {
          return T(*el);
        } catch (const std::exception &e) {
          return makeError(StatusCode::kConfigInvalidType,
                           fmt::format("Throws when constructing T ({}), E is {}: {}",
                                       typeid(T).name(),
                                       typeid(E).name(),
                                       e.what()));
        }
      } else {
        return makeError(StatusCode::kConfigInvalidType,
                         fmt::format("T is {}, E is {}", typeid(T).name(), typeid(E).name()));
      }
    }
  });
}

template <class T>
class Item : public IItem {
 public:
  Item(std::string name, T defaultValue, std::function<bool(ReturnType<T>)> checker = nullptr)
      : value_(std::move(defaultValue)),
        name_(std::move(name)),
        checker_(checker ? std::move(checker) : [](ReturnType<T>) { return true; }) {}

  ReturnType<T> value() const { return value_; }

  bool checkAndSet(ReturnType<T> value) {
    if (checker_(value)) {
      value_ = value;
      return true;
    }
    return false;
  }

  Result<Void> update(const toml::node &node, const std::string &path) final {
    try {
      if constexpr (is_vector_v<T>) {
        return updateVector(node, path);
      } else {
        return updateNormal(node, path);
      }
    } catch (const std::exception &e) {
      return makeError(StatusCode::kConfigUpdateFailed, fmt::format("name: {}, error: {}", path, e.what()));
    }
  }

  Result<Void> validate(const std::string &path) const final {
    if (!checker_(value())) {
      return makeError(StatusCode::kConfigValidateFailed, fmt::format("Check failed: {}", path));
    }
    return Void{};
  }

  void toToml(toml::table &table) const override {
    if constexpr (is_vector_v<T>) {
      toml::array array;
      for (const auto &item : value()) {
        array.push_back(ConfigValueToTomlNode<typename T::value_type>{}(item));
      }
      table.insert_or_assign(name_, std::move(array));
    } else if constexpr (is_optional_v<T>) {
      if (value().has_value()) {
        table.insert_or_assign(name_, ConfigValueToTomlNode<RemoveOptional<T>>{}(value().value()));
      }
    } else {
      table.insert_or_assign(name_, ConfigValueToTomlNode<T>{}(value()));
    }
  }

  bool isParsedFromString() const override {
    return std::is_constructible_v<RemoveOptional<T>, std::string> || std::is_enum_v<RemoveOptional<T>>;
  }

 protected:
  Result<Void> updateNormal(const toml::node &node, const std::string &path) {
    auto res = tomlNodeToValue<RemoveOptional<T>>(node);
    if (res.hasError()) {
      return makeError(StatusCode::kConfigUpdateFailed, fmt::format("name: {}, error: {}", path, res.error()));
    }
    T newValue = std::move(res.value());
    if (!checker_(newValue)) {
      return makeError(StatusCode::kConfigValidateFailed, fmt::format("Check failed: {}", path));
    }
    value_ = std::move(newValue);
    return Void{};
  }

  Result<Void> updateVector(const toml::node &node, const std::string &path) {
    using I = typename T::value_type;

    auto arr = node.as_array();
    if (arr == nullptr) {
      return makeError(StatusCode::kConfigInvalidType, fmt::format("Not array: {}", path));
    }

    T tmp;
    for (size_t i = 0; i < arr->size(); ++i) {
      const auto &e = (*arr)[i];
      auto res = [&]() -> Result<I> {
        if constexpr (std::derived_from<I, IConfig>) {
          if (!e.is_table()) {
            return makeError(StatusCode::kConfigInvalidType, fmt::format("Not table: {}[{}]", path, i));
          }
          I v;
          RETURN_ON_ERROR(v.update(*e.as_table()));
          return v;
        } else {
          return tomlNodeToValue<I>(e);
        }
      }();
      if (res.hasError()) {
        return makeError(StatusCode::kConfigUpdateFailed, fmt::format("name: {}, error: {}", path, res.error()));
      }
      tmp.push_back(std::move(res.value()));
    }
    if (!checker_(tmp)) {
      return makeError(StatusCode::kConfigValidateFailed, fmt::format("Array check failed: {}", path));
    }
    value_ = std::move(tmp);
    return Void{};
  }

 private:
  T value_;
  std::string name_;
  std::function<bool(ReturnType<T>)> checker_;
};

inline std::string concat(const std::string &a, const std::string &b) { return a.empty() ? b : a + "." + b; }

}  // namespace config

template <class Parent>
class ConfigBase : public config::IConfig {
 protected:
  ConfigBase() = default;
  ConfigBase(const ConfigBase &o)
      : sections_(o.sections_),
        items_(o.items_) {}
  ConfigBase &operator=(const ConfigBase &) { return *this; }

 public:
  using config::IConfig::update;
  Result<Void> update(const toml::table &table, const std::string &path = {}) final {
    auto self = reinterpret_cast<Parent *>(this);

    for (auto &pair : table) {
      auto name = std::string(pair.first.str());
      auto &node = pair.second;

      if (sections_.count(name)) {
        if (!node.is_table()) {
          return makeError(StatusCode::kConfigInvalidType, fmt::format("Not table: {}", name));
        }
        RETURN_ON_ERROR(
            (self->*(sections_.at(name))).update(*node.as_table(), config::concat(path, name)));
      } else if (items_.count(name)) {
        RETURN_ON_ERROR((self->*(items_.at(name))).update(node, config::concat(path, name)));
      } else {
        return makeError(StatusCode::kConfigRedundantKey, fmt::format("Invalid key: {}", config::concat(path, name)));
      }
    }
    return overallValidate();
  }

  toml::table toToml() const final {
    auto self = reinterpret_cast<const Parent *>(this);
    toml::table table;
    for (auto &pair : items_) {
      (self->*pair.second).toToml(table);
    }
    for (auto &pair : sections_) {
      table.insert_or_assign(pair.first, (self->*pair.second).toToml());
    }
    return table;
  }

  Result<config::IItem *> find(std::string_view key) final {
    auto self = reinterpret_cast<Parent *>(this);

    auto pos = key.find('.');
    if (pos == std::string_view::npos) {
      auto it = items_.find(key);
      if (it == items_.end()) {
        return makeError(StatusCode::kConfigKeyNotFound, key);
      }
      return &(self->*(it->second));
    } else {
      auto section = key.substr(0, pos);
      key.remove_prefix(pos + 1);
      auto it = sections_.find(section);
      if (it == sections_.end()) {
        return makeError(StatusCode::kConfigKeyNotFound, section);
      }
      return (self->*(it->second)).find(key);
    }
  }

  Result<Void> validate(const std::string &path = {}) const final {
    auto self = reinterpret_cast<const Parent *>(this);
    for (auto &pair : sections_) {
      RETURN_ON_ERROR((self->*pair.second).validate(config::concat(path, pair.first)));
    }
    for (auto &pair : items_) {
      RETURN_ON_ERROR((self->*pair.second).validate(config::concat(path, pair.first)));
    }
    return overallValidate();
  }

 protected:
  // offsets of sections.
  std::map<std::string, config::IConfig Parent::*, std::less<>> sections_;
  // offsets of items.
  std::map<std::string, config::IItem Parent::*, std::less<>> items_;
};

namespace ConfigCheckers {
template <typename T>
concept Arithmetic = std::is_arithmetic_v<T>;

template <typename T>
concept Container = requires(T t) {
  t.empty();
  t.size();
};

struct CheckPositive {
  template <Arithmetic T>
  bool operator()(T val) const {
    return val > 0;
  }
};

inline constexpr CheckPositive checkPositive;

template <Arithmetic T>
inline bool checkNotNegative(T val) {
  return val >= 0;
}

struct CheckNotEmpty {
  template <Container C>
  bool operator()(const C &c) const {
    return !c.empty();
  }
};

inline constexpr CheckNotEmpty checkNotEmpty;

// percentage in [0, 100]
inline bool checkPercentage(int64_t val) { return val >= 0 && val <= 100; }
}  // namespace ConfigCheckers

}  // namespace ostmig

FMT_BEGIN_NAMESPACE

template <>
struct formatter<ostmig::config::IConfig> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const ostmig::config::IConfig &config, FormatContext &ctx) const {
    return formatter<std::string_view>::format(config.toString(), ctx);
  }
};

FMT_END_NAMESPACE
